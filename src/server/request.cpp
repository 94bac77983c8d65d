#include "request.hpp"
#include <yaml-cpp/yaml.h>

static std::string scalar_field(const YAML::Node& root, const char* key) {
    const YAML::Node node = root[key];
    if (!node || !node.IsScalar()) return "";
    return node.as<std::string>("");
}

// Permissive coercion: scalars as written, null as empty, anything else as
// its flow-YAML text.
static std::string stringify(const YAML::Node& node) {
    if (node.IsScalar()) return node.as<std::string>("");
    if (node.IsNull()) return "";
    YAML::Emitter out;
    out << YAML::Flow << node;
    return out.c_str();
}

static std::vector<std::string> string_list(const YAML::Node& root, const char* key) {
    std::vector<std::string> out;
    const YAML::Node node = root[key];
    if (!node || !node.IsSequence()) return out;
    for (const auto& item : node) {
        out.push_back(stringify(item));
    }
    return out;
}

Result<ControlRequest> parse_request(const std::string& line) {
    YAML::Node root;
    try {
        root = YAML::Load(line);
    } catch (const YAML::Exception& e) {
        return Result<ControlRequest>::Err(std::string("malformed request: ") + e.what());
    }
    if (!root.IsMap()) {
        return Result<ControlRequest>::Err("malformed request: expected a map");
    }

    const YAML::Node& croot = root;
    ControlRequest req;
    req.cmd = scalar_field(croot, "cmd");
    if (req.cmd.empty()) {
        return Result<ControlRequest>::Err("malformed request: missing cmd");
    }
    req.script = scalar_field(croot, "script");
    req.repo_id = scalar_field(croot, "repo_id");
    req.path = scalar_field(croot, "path");
    req.job_id = scalar_field(croot, "job_id");
    req.args = string_list(croot, "args");
    req.input_vars = string_list(croot, "input_vars");
    return Result<ControlRequest>::Ok(req);
}

std::string ok_reply(const std::string& payload) {
    return payload.empty() ? std::string("OK") : "OK " + payload;
}

std::string error_reply(const std::string& text) {
    return "ERROR " + text;
}

std::string emit_string_list(const std::vector<std::string>& items) {
    YAML::Emitter out;
    out << YAML::Flow << YAML::BeginSeq;
    for (const auto& s : items) out << YAML::DoubleQuoted << s;
    out << YAML::EndSeq;
    return out.c_str();
}

std::string emit_script_meta(const std::string& key, const std::string& name,
                             const std::string& type, const std::vector<ScriptInput>& inputs,
                             const std::string& repo_id) {
    YAML::Emitter out;
    out << YAML::Flow << YAML::BeginMap;
    if (!repo_id.empty()) {
        out << YAML::Key << "repo_id" << YAML::Value << YAML::DoubleQuoted << repo_id;
    }
    out << YAML::Key << key << YAML::Value << YAML::DoubleQuoted << name;
    out << YAML::Key << "type" << YAML::Value << type;
    out << YAML::Key << "inputs" << YAML::Value << YAML::BeginSeq;
    for (const auto& in : inputs) {
        out << YAML::BeginMap;
        out << YAML::Key << "index" << YAML::Value << in.index;
        out << YAML::Key << "prompt" << YAML::Value;
        if (in.prompt) {
            out << YAML::DoubleQuoted << *in.prompt;
        } else {
            out << YAML::Null;
        }
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;
    out << YAML::EndMap;
    return out.c_str();
}
