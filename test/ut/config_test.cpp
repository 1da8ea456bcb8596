//=============================================================================
// Config Tests
//
// Defaults, file layering, SLATE_* environment and command-line overrides
//=============================================================================

// Standard headers before boost/ut.hpp
#include <cstddef>
#include <version>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

#include <boost/ut.hpp>
#include <slate/config.h>
#include <unistd.h>

using namespace boost::ut;
using namespace slate;

namespace {

std::filesystem::path tempPath(const std::string& name) {
    return std::filesystem::temp_directory_path() /
           ("slate-config-" + name + "-" + std::to_string(::getpid()) + ".yaml");
}

void writeFile(const std::filesystem::path& path, const std::string& text) {
    std::ofstream out(path);
    out << text;
}

// Point XDG_CONFIG_HOME somewhere empty so a user config never leaks in
struct IsolatedXdg {
    IsolatedXdg() {
        dir = std::filesystem::temp_directory_path() / ("slate-xdg-" + std::to_string(::getpid()));
        std::filesystem::create_directories(dir);
        ::setenv("XDG_CONFIG_HOME", dir.c_str(), 1);
    }
    ~IsolatedXdg() {
        ::unsetenv("XDG_CONFIG_HOME");
        std::filesystem::remove_all(dir);
    }
    std::filesystem::path dir;
};

} // namespace

suite config_tests = [] {
    "defaults"_test = [] {
        IsolatedXdg xdg;
        auto config = Config::create();
        expect(config.has_value() >> fatal);

        auto& c = **config;
        expect(c.get<int>(Config::KEY_POOL_MAX_BUFFERS_PER_BUCKET, 0) == 32_i);
        expect(c.get<int>(Config::KEY_FRAME_RESERVE, 0) == 64_i);
        expect(c.get<int>(Config::KEY_POSITION_DEBOUNCE_MS, 0) == 50_i);
        expect(c.get<int>(Config::KEY_SIZE_DEBOUNCE_MS, 0) == 100_i);
        expect(c.get<int>(Config::KEY_CONTENT_DEBOUNCE_MS, 0) == 300_i);
        expect(c.get<int>(Config::KEY_MAX_PENDING_MS, 0) == 2000_i);
        expect(c.get<int>(Config::KEY_TICK_MS, 0) == 10_i);
        expect(c.get<int>(Config::KEY_WRITER_QUEUE_CAPACITY, 0) == 64_i);
        expect(c.get<bool>(Config::KEY_STORE_CREATE_SCHEMA, false));
        expect(c.get<bool>(Config::KEY_MEMORY_PRESSURE_ENABLED, false));
        expect(c.get<int>(Config::KEY_MEMORY_PRESSURE_STALL_US, 0) == 150000_i);
        expect(c.get<int>(Config::KEY_MEMORY_PRESSURE_WINDOW_US, 0) == 1000000_i);

        auto storePath = c.get<std::string>(Config::KEY_STORE_PATH);
        expect(storePath.has_value() >> fatal);
        expect(storePath->ends_with("slate/canvas.db"));
        expect(c.sourcePath().empty());
    };

    "dotted path lookup"_test = [] {
        IsolatedXdg xdg;
        auto config = Config::create();
        expect(config.has_value() >> fatal);

        expect((*config)->has("persistence.max-pending-ms"));
        expect(!(*config)->has("persistence.nope"));
        expect(!(*config)->has("pool.max-buffers-per-bucket.deeper"));
        expect(!(*config)->get<int>("no.such.key").has_value());
        expect((*config)->get<int>("no.such.key", 7) == 7_i);
        expect((*config)->root()["persistence"].IsMap());
    };

    "wrong type yields nullopt"_test = [] {
        IsolatedXdg xdg;
        auto config = Config::create();
        expect(config.has_value() >> fatal);
        expect(!(*config)->get<int>(Config::KEY_STORE_PATH).has_value());
    };

    "file values override defaults"_test = [] {
        IsolatedXdg xdg;
        auto path = tempPath("file");
        writeFile(path,
                  "pool:\n"
                  "  max-buffers-per-bucket: 8\n"
                  "persistence:\n"
                  "  position-debounce-ms: 25\n");

        auto config = Config::create(path.string());
        std::filesystem::remove(path);
        expect(config.has_value() >> fatal);

        expect((*config)->get<int>(Config::KEY_POOL_MAX_BUFFERS_PER_BUCKET, 0) == 8_i);
        expect((*config)->get<int>(Config::KEY_POSITION_DEBOUNCE_MS, 0) == 25_i);
        expect((*config)->get<int>(Config::KEY_SIZE_DEBOUNCE_MS, 0) == 100_i) << "siblings keep their defaults";
        expect((*config)->sourcePath() == path.string());
    };

    "xdg config file is picked up"_test = [] {
        IsolatedXdg xdg;
        std::filesystem::create_directories(xdg.dir / "slate");
        writeFile(xdg.dir / "slate" / "config.yaml", "frame:\n  reserve: 16\n");

        auto config = Config::create();
        expect(config.has_value() >> fatal);
        expect((*config)->get<int>(Config::KEY_FRAME_RESERVE, 0) == 16_i);
    };

    "missing explicit file is an error"_test = [] {
        IsolatedXdg xdg;
        auto config = Config::create(std::string("/nonexistent/slate.yaml"));
        expect(!config);
    };

    "malformed file is an error"_test = [] {
        IsolatedXdg xdg;
        auto path = tempPath("bad");
        writeFile(path, "pool: [unterminated\n");
        auto config = Config::create(path.string());
        std::filesystem::remove(path);
        expect(!config);
    };

    "environment overrides file"_test = [] {
        IsolatedXdg xdg;
        auto path = tempPath("env");
        writeFile(path, "persistence:\n  max-pending-ms: 1500\n");
        ::setenv("SLATE_PERSISTENCE_MAX_PENDING_MS", "900", 1);
        ::setenv("SLATE_MEMORY_PRESSURE_ENABLED", "false", 1);

        auto config = Config::create(path.string());
        ::unsetenv("SLATE_PERSISTENCE_MAX_PENDING_MS");
        ::unsetenv("SLATE_MEMORY_PRESSURE_ENABLED");
        std::filesystem::remove(path);
        expect(config.has_value() >> fatal);

        expect((*config)->get<int>(Config::KEY_MAX_PENDING_MS, 0) == 900_i);
        expect(!(*config)->get<bool>(Config::KEY_MEMORY_PRESSURE_ENABLED, true));
    };

    "command line overrides environment"_test = [] {
        IsolatedXdg xdg;
        ::setenv("SLATE_STORE_PATH", "/tmp/from-env.db", 1);
        YAML::Node overrides;
        overrides["store"]["path"] = ":memory:";

        auto config = Config::create(std::string(), overrides);
        ::unsetenv("SLATE_STORE_PATH");
        expect(config.has_value() >> fatal);
        expect((*config)->get<std::string>(Config::KEY_STORE_PATH, "") == ":memory:");
    };

    "xdg paths"_test = [] {
        ::setenv("XDG_CONFIG_HOME", "/cfg", 1);
        ::setenv("XDG_DATA_HOME", "/data", 1);
        expect(Config::getXDGConfigPath() == std::filesystem::path("/cfg/slate/config.yaml"));
        expect(Config::getXDGDataPath() == std::filesystem::path("/data/slate"));
        ::unsetenv("XDG_CONFIG_HOME");
        ::unsetenv("XDG_DATA_HOME");
    };
};
