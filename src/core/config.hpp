#pragma once

#include <string>
#include <optional>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

class Config {
public:
    // Built-in defaults: ./.lock, loopback ephemeral port, temp-dir log.
    static Config defaults();

    // Load a single YAML file on top of the defaults.
    static Result<Config> load_file(const fs::path& path);

    // Load ~/.solo/config.yaml then <dir>/solo.yaml (project overrides global).
    // Missing files are not an error; malformed ones are.
    static Result<Config> load(const fs::path& dir = fs::current_path());

    // Accessors
    const fs::path& lock_file() const { return lock_file_; }
    const ServerConfig& server() const { return server_; }
    const LogConfig& log() const { return log_; }

    void set_lock_file(const fs::path& path) { lock_file_ = fs::absolute(path); }

public:
    Config() = default;

private:
    fs::path lock_file_;
    ServerConfig server_;
    LogConfig log_;

    friend class ConfigLoader;
};

// Helper to check if configs exist
bool global_config_exists();
bool project_config_exists(const fs::path& dir = fs::current_path());

// Get paths
fs::path get_global_config_dir();
fs::path get_global_config_path();
fs::path get_project_config_path(const fs::path& dir = fs::current_path());
