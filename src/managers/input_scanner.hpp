#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <core/types.hpp>

// Finds the interactive inputs a Python script asks for: every call to the
// builtin input(...), in source order. The prompt is known only when the
// first argument is a plain string literal (adjacent literals are joined).
//
// This is a lexical scan, not a parser: comments and string contents are
// skipped, method calls like obj.input(...) are ignored. Source with an
// unterminated string or unbalanced brackets reports no inputs.
std::vector<ScriptInput> scan_python_inputs(const std::string& source);

// Inputs for a script file. Only .py files are scanned; unreadable files
// and other types report none.
std::vector<ScriptInput> scan_script_inputs(const std::filesystem::path& script);
