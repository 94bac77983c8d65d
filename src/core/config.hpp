#pragma once

#include <string>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

class Config {
public:
    // Load from a YAML file. A missing file yields defaults rooted at its directory.
    static Result<Config> load(const fs::path& path = fs::current_path() / "jobcast.yaml");

    // Parse YAML text; relative directories resolve against base_dir.
    static Result<Config> parse(const std::string& yaml_text, const fs::path& base_dir);

    // Accessors
    const fs::path& scripts_dir() const { return scripts_dir_; }
    const fs::path& logs_dir() const { return logs_dir_; }
    const fs::path& repos_dir() const { return repos_dir_; }
    const ListenConfig& listen() const { return listen_; }
    const InterpreterConfig& interpreters() const { return interpreters_; }
    const StreamConfig& stream() const { return stream_; }
    int retention_minutes() const { return retention_minutes_; }

    // Create scripts/logs/repos directories if missing.
    Result<void> ensure_dirs() const;

public:
    Config() = default;

private:
    fs::path scripts_dir_;
    fs::path logs_dir_;
    fs::path repos_dir_;
    ListenConfig listen_;
    InterpreterConfig interpreters_;
    StreamConfig stream_;
    int retention_minutes_ = 0;  // 0 = keep finished jobs forever
};

fs::path get_default_config_path(const fs::path& dir = fs::current_path());
