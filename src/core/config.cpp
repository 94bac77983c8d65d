#include "config.hpp"
#include "constants.hpp"
#include <yaml-cpp/yaml.h>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

fs::path get_default_config_path(const fs::path& dir) {
    return dir / DEFAULT_CONFIG_FILE;
}

// Relative directories in the config are anchored at the config file's directory.
static fs::path resolve_dir(const YAML::Node& node, const char* fallback,
                            const fs::path& base_dir) {
    fs::path p = node ? node.as<std::string>(fallback) : std::string(fallback);
    if (p.is_relative()) p = base_dir / p;
    return p.lexically_normal();
}

static ListenConfig parse_listen_config(const YAML::Node& node) {
    ListenConfig listen;
    listen.host = node["host"].as<std::string>("127.0.0.1");
    listen.port = node["port"].as<int>(8765);
    return listen;
}

static InterpreterConfig parse_interpreter_config(const YAML::Node& node) {
    InterpreterConfig interp;
    interp.python = node["python"].as<std::string>("python3");
    interp.shell = node["shell"].as<std::string>("/bin/bash");
    return interp;
}

static StreamConfig parse_stream_config(const YAML::Node& node) {
    StreamConfig stream;
    stream.poll_interval_ms = node["poll_interval_ms"].as<int>(STREAM_POLL_MS);
    int cap = node["history_capacity"].as<int>(static_cast<int>(HISTORY_CAPACITY));
    if (cap <= 0) {
        throw YAML::Exception(node.Mark(), "history_capacity must be positive");
    }
    stream.history_capacity = static_cast<std::size_t>(cap);
    if (stream.poll_interval_ms <= 0) {
        throw YAML::Exception(node.Mark(), "poll_interval_ms must be positive");
    }
    return stream;
}

Result<Config> Config::parse(const std::string& yaml_text, const fs::path& base_dir) {
    try {
        YAML::Node root = YAML::Load(yaml_text);
        if (root && !root.IsNull() && !root.IsMap()) {
            return Result<Config>::Err("Config root must be a mapping");
        }

        Config config;
        config.scripts_dir_ = resolve_dir(root["scripts_dir"], DEFAULT_SCRIPTS_DIR, base_dir);
        config.logs_dir_ = resolve_dir(root["logs_dir"], DEFAULT_LOGS_DIR, base_dir);
        config.repos_dir_ = resolve_dir(root["repos_dir"], DEFAULT_REPOS_DIR, base_dir);
        config.listen_ = parse_listen_config(root["listen"] ? root["listen"] : YAML::Node());
        config.interpreters_ = parse_interpreter_config(
            root["interpreters"] ? root["interpreters"] : YAML::Node());
        config.stream_ = parse_stream_config(root["stream"] ? root["stream"] : YAML::Node());
        config.retention_minutes_ = root["retention_minutes"].as<int>(0);
        if (config.retention_minutes_ < 0) config.retention_minutes_ = 0;

        return Result<Config>::Ok(config);
    } catch (const std::exception& e) {
        return Result<Config>::Err(std::string("Failed to parse config: ") + e.what());
    }
}

Result<Config> Config::load(const fs::path& path) {
    fs::path base_dir = path.has_parent_path() ? path.parent_path() : fs::current_path();

    if (!fs::exists(path)) {
        return parse("", base_dir);
    }

    std::ifstream in(path);
    if (!in) {
        return Result<Config>::Err("Cannot read config file " + path.string());
    }
    std::stringstream ss;
    ss << in.rdbuf();
    return parse(ss.str(), base_dir);
}

Result<void> Config::ensure_dirs() const {
    for (const auto* dir : {&scripts_dir_, &logs_dir_, &repos_dir_}) {
        std::error_code ec;
        fs::create_directories(*dir, ec);
        if (ec) {
            return Result<void>::Err("Cannot create " + dir->string() + ": " + ec.message());
        }
    }
    return Result<void>::Ok();
}
