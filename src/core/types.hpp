#pragma once

#include <string>
#include <optional>
#include <vector>
#include <cstdint>

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;

    static Result<void> Ok() {
        return {true, ""};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Configuration structures
struct ListenConfig {
    std::string host = "127.0.0.1";
    int port = 8765;
};

struct InterpreterConfig {
    std::string python = "python3";
    std::string shell = "/bin/bash";
};

struct StreamConfig {
    int poll_interval_ms = 350;
    std::size_t history_capacity = 2500;
};

// A fully resolved run request: what to execute, where, and what to feed it.
struct RunRequest {
    std::string script_ref;                  // "name.py" or "repo-xxxxxxxx:rel/path.sh"
    std::string executable;                  // absolute path of the script
    std::vector<std::string> args;
    std::optional<std::string> working_dir;
    std::vector<std::string> input_vars;     // fed to stdin, newline-joined
};

// One expected input discovered in a script: input("Prompt") -> {1, "Prompt"}
struct ScriptInput {
    int index = 0;
    std::optional<std::string> prompt;
};
