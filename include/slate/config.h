#pragma once

#include <slate/base/factory.h>
#include <slate/result.hpp>
#include <yaml-cpp/yaml.h>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace slate {

/**
 * Config - layered YAML configuration.
 *
 * Layers, later wins:
 *   1. built-in defaults
 *   2. config file (explicit path, else $XDG_CONFIG_HOME/slate/config.yaml)
 *   3. environment: SLATE_<PATH> with '.' and '-' mapped to '_'
 *      (persistence.max-pending-ms -> SLATE_PERSISTENCE_MAX_PENDING_MS)
 *   4. command-line overrides
 *
 * Keys are dotted paths: "pool.max-buffers-per-bucket".
 */
class Config : public base::ObjectFactory<Config> {
public:
    using Ptr = std::shared_ptr<Config>;

    static Result<Ptr> createImpl(ContextType&, const std::string& configPath = "",
                                  const YAML::Node& cmdOverrides = YAML::Node()) noexcept;

    virtual ~Config() = default;

    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    // Returns nullopt if the key doesn't exist or doesn't convert to T
    template<typename T>
    std::optional<T> get(const std::string& path) const;

    template<typename T>
    T get(const std::string& path, const T& defaultValue) const;

    virtual bool has(const std::string& path) const = 0;

    // Merged configuration tree
    virtual const YAML::Node& root() const = 0;

    // File the configuration was loaded from, empty if none
    virtual const std::string& sourcePath() const = 0;

    static std::filesystem::path getXDGConfigPath();
    static std::filesystem::path getXDGDataPath();

    static constexpr const char* ENV_PREFIX = "SLATE_";

    static constexpr const char* KEY_POOL_MAX_BUFFERS_PER_BUCKET = "pool.max-buffers-per-bucket";
    static constexpr const char* KEY_FRAME_RESERVE = "frame.reserve";
    static constexpr const char* KEY_POSITION_DEBOUNCE_MS = "persistence.position-debounce-ms";
    static constexpr const char* KEY_SIZE_DEBOUNCE_MS = "persistence.size-debounce-ms";
    static constexpr const char* KEY_CONTENT_DEBOUNCE_MS = "persistence.content-debounce-ms";
    static constexpr const char* KEY_MAX_PENDING_MS = "persistence.max-pending-ms";
    static constexpr const char* KEY_TICK_MS = "persistence.tick-ms";
    static constexpr const char* KEY_WRITER_QUEUE_CAPACITY = "writer.queue-capacity";
    static constexpr const char* KEY_STORE_PATH = "store.path";
    static constexpr const char* KEY_STORE_CREATE_SCHEMA = "store.create-schema";
    static constexpr const char* KEY_MEMORY_PRESSURE_ENABLED = "memory-pressure.enabled";
    static constexpr const char* KEY_MEMORY_PRESSURE_STALL_US = "memory-pressure.stall-us";
    static constexpr const char* KEY_MEMORY_PRESSURE_WINDOW_US = "memory-pressure.window-us";

protected:
    Config() = default;

    // Node at a dotted path; an undefined node if absent
    virtual YAML::Node getNode(const std::string& path) const = 0;
};

template<typename T>
std::optional<T> Config::get(const std::string& path) const {
    YAML::Node node = getNode(path);
    if (!node || node.IsNull()) {
        return std::nullopt;
    }
    try {
        return node.as<T>();
    } catch (const YAML::Exception&) {
        return std::nullopt;
    }
}

template<typename T>
T Config::get(const std::string& path, const T& defaultValue) const {
    auto value = get<T>(path);
    return value.value_or(defaultValue);
}

} // namespace slate
