#pragma once

#include <string>
#include <vector>
#include <optional>
#include <core/types.hpp>
#include <platform/process.hpp>

// Interpreter invocation for a script: {"python3", "/abs/x.py"}.
// Errors for any suffix other than .py / .sh; nothing is spawned then.
Result<std::vector<std::string>> resolve_interpreter(const std::string& script_path,
                                                     const InterpreterConfig& interpreters);

// Start the script through its interpreter, deliver the whole stdin payload
// up front and close stdin. stdin write/close failures are logged and
// dropped; the caller consumes output regardless.
class ScriptLauncher {
public:
    explicit ScriptLauncher(InterpreterConfig interpreters);

    Result<platform::ProcessHandle> launch(const std::string& script_path,
                                           const std::vector<std::string>& args,
                                           const std::optional<std::string>& working_dir,
                                           const std::vector<std::string>& stdin_payload) const;

    const InterpreterConfig& interpreters() const { return interpreters_; }

private:
    InterpreterConfig interpreters_;
};

// "a", "b" -> "a\nb\n"; empty list -> ""
std::string join_input_payload(const std::vector<std::string>& inputs);
