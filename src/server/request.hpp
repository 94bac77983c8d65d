#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>

// One request line from a client, a YAML flow map:
//   {cmd: run, script: hello.py, input_vars: [alice, 3]}
struct ControlRequest {
    std::string cmd;
    std::string script;
    std::string repo_id;
    std::string path;
    std::string job_id;
    std::vector<std::string> args;
    std::vector<std::string> input_vars;
};

// Parse a request line. A missing/non-scalar cmd is an error; a non-list
// input_vars is treated as empty and list items are stringified.
Result<ControlRequest> parse_request(const std::string& line);

// Replies
std::string ok_reply(const std::string& payload = "");
std::string error_reply(const std::string& text);

// Flow-YAML payloads for listing replies
std::string emit_string_list(const std::vector<std::string>& items);
std::string emit_script_meta(const std::string& key, const std::string& name,
                             const std::string& type, const std::vector<ScriptInput>& inputs,
                             const std::string& repo_id = "");
