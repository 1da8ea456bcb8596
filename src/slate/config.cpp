#include <slate/config.h>
#include <ytrace/ytrace.hpp>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <vector>

namespace slate {

namespace {

// Split a dotted path into components
std::vector<std::string> splitPath(const std::string& path) {
    std::vector<std::string> parts;
    std::istringstream ss(path);
    std::string part;
    while (std::getline(ss, part, '.')) {
        if (!part.empty()) {
            parts.push_back(part);
        }
    }
    return parts;
}

// Merge source into target; maps merge recursively, everything else replaces
void mergeNodes(YAML::Node target, const YAML::Node& source) {
    if (!source.IsMap()) return;
    for (auto it = source.begin(); it != source.end(); ++it) {
        const std::string key = it->first.as<std::string>();
        const YAML::Node& value = it->second;
        if (value.IsMap() && target[key] && target[key].IsMap()) {
            mergeNodes(target[key], value);
        } else {
            target[key] = YAML::Clone(value);
        }
    }
}

std::string pathToEnvVar(const std::string& path) {
    std::string envVar = Config::ENV_PREFIX;
    for (char c : path) {
        if (c == '.' || c == '-') envVar += '_';
        else envVar += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return envVar;
}

} // namespace

class ConfigImpl : public Config {
public:
    ConfigImpl(const std::string& configPath, const YAML::Node& cmdOverrides) noexcept
        : _configPath(configPath), _cmdOverrides(cmdOverrides) {}

    ~ConfigImpl() override = default;

    Result<void> init() noexcept {
        try {
            loadDefaults();

            std::string effectivePath = _configPath;
            if (effectivePath.empty()) {
                auto xdgPath = getXDGConfigPath();
                std::error_code ec;
                if (std::filesystem::exists(xdgPath, ec)) {
                    effectivePath = xdgPath.string();
                }
            }

            if (!effectivePath.empty()) {
                if (auto res = loadFile(effectivePath); !res) {
                    // An explicitly requested file must load
                    if (!_configPath.empty()) {
                        return Err<void>("Failed to load config file " + effectivePath, res);
                    }
                    ywarn("Failed to load config file {}: {}", effectivePath, error_msg(res));
                } else {
                    _sourcePath = effectivePath;
                    yinfo("Loaded config from: {}", effectivePath);
                }
            }

            applyEnvOverrides(_root, "");

            if (_cmdOverrides && _cmdOverrides.IsMap()) {
                mergeNodes(_root, _cmdOverrides);
            }
        } catch (const YAML::Exception& e) {
            return Err<void>(std::string("Config: ") + e.what());
        }
        return Ok();
    }

    bool has(const std::string& path) const override {
        YAML::Node node = getNode(path);
        return node.IsDefined() && !node.IsNull();
    }

    const YAML::Node& root() const override { return _root; }

    const std::string& sourcePath() const override { return _sourcePath; }

protected:
    YAML::Node getNode(const std::string& path) const override {
        // reset() rebinds; operator= would overwrite the node it refers to
        YAML::Node current;
        current.reset(_root);
        for (const auto& part : splitPath(path)) {
            if (!current.IsMap()) return YAML::Node(YAML::NodeType::Undefined);
            const YAML::Node& parent = current;
            YAML::Node next = parent[part];
            if (!next.IsDefined()) return YAML::Node(YAML::NodeType::Undefined);
            current.reset(next);
        }
        return current;
    }

private:
    void loadDefaults() {
        _root = YAML::Node(YAML::NodeType::Map);

        _root["pool"]["max-buffers-per-bucket"] = 32;
        _root["frame"]["reserve"] = 64;

        _root["persistence"]["position-debounce-ms"] = 50;
        _root["persistence"]["size-debounce-ms"] = 100;
        _root["persistence"]["content-debounce-ms"] = 300;
        _root["persistence"]["max-pending-ms"] = 2000;
        _root["persistence"]["tick-ms"] = 10;

        _root["writer"]["queue-capacity"] = 64;

        _root["store"]["path"] = (getXDGDataPath() / "canvas.db").string();
        _root["store"]["create-schema"] = true;

        _root["memory-pressure"]["enabled"] = true;
        _root["memory-pressure"]["stall-us"] = 150000;
        _root["memory-pressure"]["window-us"] = 1000000;
    }

    Result<void> loadFile(const std::string& path) {
        try {
            std::ifstream file(path);
            if (!file.is_open()) {
                return Err<void>("Cannot open config file: " + path);
            }
            YAML::Node fileConfig = YAML::Load(file);
            if (fileConfig && !fileConfig.IsNull()) {
                if (!fileConfig.IsMap()) {
                    return Err<void>("Config file root must be a map: " + path);
                }
                mergeNodes(_root, fileConfig);
            }
            return Ok();
        } catch (const YAML::Exception& e) {
            return Err<void>("YAML parse error: " + std::string(e.what()));
        }
    }

    // Override every known scalar from the environment
    void applyEnvOverrides(YAML::Node node, const std::string& prefix) {
        for (auto it = node.begin(); it != node.end(); ++it) {
            const std::string key = it->first.as<std::string>();
            const std::string fullPath = prefix.empty() ? key : prefix + "." + key;

            if (it->second.IsMap()) {
                applyEnvOverrides(it->second, fullPath);
                continue;
            }

            const std::string envVar = pathToEnvVar(fullPath);
            if (const char* val = std::getenv(envVar.c_str())) {
                // YAML scalars convert on read, so the raw string is enough
                it->second = std::string(val);
                ydebug("Config override from env: {}={}", envVar, val);
            }
        }
    }

    YAML::Node _root;
    std::string _configPath;
    std::string _sourcePath;
    YAML::Node _cmdOverrides;
};

Result<Config::Ptr> Config::createImpl(ContextType&, const std::string& configPath,
                                       const YAML::Node& cmdOverrides) noexcept {
    auto impl = Ptr(new ConfigImpl(configPath, cmdOverrides));
    if (auto res = static_cast<ConfigImpl*>(impl.get())->init(); !res) {
        return Err<Ptr>("Failed to initialize Config", res);
    }
    return Ok(std::move(impl));
}

namespace {

std::filesystem::path xdgBase(const char* envName, const char* homeFallback) {
    const char* xdg = std::getenv(envName);
    if (xdg && xdg[0] != '\0') {
        return xdg;
    }
    const char* home = std::getenv("HOME");
    if (home) {
        return std::filesystem::path(home) / homeFallback;
    }
    return "/tmp";
}

} // namespace

std::filesystem::path Config::getXDGConfigPath() {
    return xdgBase("XDG_CONFIG_HOME", ".config") / "slate" / "config.yaml";
}

std::filesystem::path Config::getXDGDataPath() {
    return xdgBase("XDG_DATA_HOME", ".local/share") / "slate";
}

} // namespace slate
