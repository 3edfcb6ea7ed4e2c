#include "config.hpp"
#include "constants.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>

namespace fs = std::filesystem;

class ConfigLoader {
public:
    // Overlay the keys present in `root` onto `config`. Relative paths are
    // resolved against `base_dir`.
    static void overlay(Config& config, const YAML::Node& root, const fs::path& base_dir) {
        if (!root || !root.IsMap()) return;

        if (root["lock_file"] && root["lock_file"].IsScalar()) {
            fs::path p = root["lock_file"].as<std::string>();
            config.lock_file_ = p.is_absolute() ? p : fs::absolute(base_dir / p);
        }

        if (root["server"] && root["server"].IsMap()) {
            const auto& node = root["server"];
            ServerConfig& s = config.server_;
            s.host = node["host"].as<std::string>(s.host);
            s.port = node["port"].as<int>(s.port);
            s.backlog = node["backlog"].as<int>(s.backlog);
            s.read_buffer = node["read_buffer"].as<int>(s.read_buffer);
        }

        if (root["log"] && root["log"].IsMap()) {
            config.log_.file = root["log"]["file"].as<std::string>(config.log_.file);
        }
    }

    static Result<void> validate(const Config& config) {
        const ServerConfig& s = config.server_;
        if (s.port < 0 || s.port > 65535) {
            return Result<void>::Err(fmt::format("server.port out of range: {}", s.port));
        }
        if (s.read_buffer < 1) {
            return Result<void>::Err(fmt::format("server.read_buffer must be positive: {}", s.read_buffer));
        }
        if (s.backlog < 1) {
            return Result<void>::Err(fmt::format("server.backlog must be positive: {}", s.backlog));
        }
        if (s.host.empty()) {
            return Result<void>::Err("server.host must not be empty");
        }
        return Result<void>::Ok();
    }

    static Result<Config> apply_file(Config config, const fs::path& path) {
        try {
            YAML::Node root = YAML::LoadFile(path.string());
            fs::path base = fs::absolute(path).parent_path();
            overlay(config, root, base);
        } catch (const std::exception& e) {
            return Result<Config>::Err(fmt::format("Failed to parse config {}: {}", path.string(), e.what()));
        }

        auto valid = validate(config);
        if (valid.is_err()) {
            return Result<Config>::Err(fmt::format("Invalid config {}: {}", path.string(), valid.error));
        }
        return Result<Config>::Ok(config);
    }
};

bool global_config_exists() {
    return fs::exists(get_global_config_path());
}

bool project_config_exists(const fs::path& dir) {
    return fs::exists(get_project_config_path(dir));
}

fs::path get_global_config_dir() {
    return platform::home_dir() / GLOBAL_CONFIG_DIRNAME;
}

fs::path get_global_config_path() {
    return get_global_config_dir() / GLOBAL_CONFIG_FILENAME;
}

fs::path get_project_config_path(const fs::path& dir) {
    return dir / PROJECT_CONFIG_FILENAME;
}

Config Config::defaults() {
    Config config;
    config.lock_file_ = fs::absolute(DEFAULT_LOCK_FILENAME);
    config.log_.file = (platform::temp_dir() / DEFAULT_LOG_FILENAME).string();
    return config;
}

Result<Config> Config::load_file(const fs::path& path) {
    if (!fs::exists(path)) {
        return Result<Config>::Err("Config not found at " + path.string());
    }
    return ConfigLoader::apply_file(defaults(), path);
}

Result<Config> Config::load(const fs::path& dir) {
    Config config = defaults();
    config.lock_file_ = fs::absolute(dir / DEFAULT_LOCK_FILENAME);

    if (global_config_exists()) {
        auto global_result = ConfigLoader::apply_file(config, get_global_config_path());
        if (global_result.is_err()) {
            return global_result;
        }
        config = global_result.value;
    }

    if (project_config_exists(dir)) {
        auto project_result = ConfigLoader::apply_file(config, get_project_config_path(dir));
        if (project_result.is_err()) {
            return project_result;
        }
        config = project_result.value;
    }

    return Result<Config>::Ok(config);
}
