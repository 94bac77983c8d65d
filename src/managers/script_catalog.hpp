#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <core/types.hpp>

namespace fs = std::filesystem;

// Local scripts and cloned repositories the server may run. Everything is
// resolved inside the configured directories; names and paths that could
// escape them are rejected.
class ScriptCatalog {
public:
    ScriptCatalog(fs::path scripts_dir, fs::path repos_dir);

    // Runnable top-level scripts (.py/.sh, not starting with '_'), sorted.
    std::vector<std::string> list_scripts() const;

    // Absolute path of a local script, or an error if the name is unsafe or
    // the file does not exist.
    Result<fs::path> resolve_script(const std::string& name) const;

    // Repository directories (repo-xxxxxxxx), sorted.
    std::vector<std::string> list_repos() const;

    // Directory of an existing repository.
    Result<fs::path> resolve_repo(const std::string& repo_id) const;

    // Runnable files in a repository, relative paths, sorted. Dot-files skipped.
    Result<std::vector<std::string>> list_repo_files(const std::string& repo_id) const;

    // Absolute path of a runnable file inside a repository.
    Result<fs::path> resolve_repo_file(const std::string& repo_id,
                                       const std::string& rel_path) const;

    // Script name pattern: [a-zA-Z0-9_.-]+ ending in .py or .sh
    static bool is_safe_script_name(const std::string& name);
    static bool is_valid_repo_id(const std::string& repo_id);

    const fs::path& scripts_dir() const { return scripts_dir_; }
    const fs::path& repos_dir() const { return repos_dir_; }

private:
    fs::path scripts_dir_;
    fs::path repos_dir_;
};

// Build a run request for a local script / a repository file.
Result<RunRequest> make_script_request(const ScriptCatalog& catalog, const std::string& name,
                                       std::vector<std::string> input_vars);
Result<RunRequest> make_repo_request(const ScriptCatalog& catalog, const std::string& repo_id,
                                     const std::string& rel_path,
                                     std::vector<std::string> input_vars);
