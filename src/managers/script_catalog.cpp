#include "script_catalog.hpp"
#include <algorithm>
#include <regex>

static const std::regex SAFE_NAME_RE("^[a-zA-Z0-9_.-]+\\.(py|sh)$");
static const std::regex REPO_ID_RE("^repo-[a-f0-9]{8}$");

static bool is_runnable_ext(const fs::path& p) {
    auto ext = p.extension().string();
    return ext == ".py" || ext == ".sh";
}

// True if `child` is strictly below `base` (both canonical).
static bool is_inside(const fs::path& base, const fs::path& child) {
    auto rel = child.lexically_relative(base);
    if (rel.empty() || rel == ".") return false;
    return *rel.begin() != "..";
}

static fs::path canonical_or_empty(const fs::path& p) {
    std::error_code ec;
    auto c = fs::weakly_canonical(p, ec);
    return ec ? fs::path() : c;
}

// Recursive walk below `dir`. A directory that cannot be read is skipped
// and the walk continues with its siblings. Symlinked directories are not
// followed.
static void collect_runnable_files(const fs::path& dir, const fs::path& base,
                                   std::vector<std::string>& out) {
    std::error_code ec;
    fs::directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
    for (; !ec && it != fs::directory_iterator(); it.increment(ec)) {
        const auto& entry = *it;
        std::error_code type_ec;
        if (entry.is_directory(type_ec) && !entry.is_symlink(type_ec)) {
            collect_runnable_files(entry.path(), base, out);
            continue;
        }
        if (!entry.is_regular_file(type_ec)) continue;
        std::string name = entry.path().filename().string();
        if (name.empty() || name[0] == '.') continue;
        if (!is_runnable_ext(entry.path())) continue;
        out.push_back(entry.path().lexically_relative(base).generic_string());
    }
}

ScriptCatalog::ScriptCatalog(fs::path scripts_dir, fs::path repos_dir)
    : scripts_dir_(std::move(scripts_dir)), repos_dir_(std::move(repos_dir)) {}

bool ScriptCatalog::is_safe_script_name(const std::string& name) {
    return !name.empty() && std::regex_match(name, SAFE_NAME_RE);
}

bool ScriptCatalog::is_valid_repo_id(const std::string& repo_id) {
    return !repo_id.empty() && std::regex_match(repo_id, REPO_ID_RE);
}

std::vector<std::string> ScriptCatalog::list_scripts() const {
    std::vector<std::string> out;
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(scripts_dir_, ec)) {
        if (!entry.is_regular_file()) continue;
        std::string name = entry.path().filename().string();
        if (name.empty() || name[0] == '_') continue;
        if (!is_runnable_ext(entry.path())) continue;
        out.push_back(name);
    }
    std::sort(out.begin(), out.end());
    return out;
}

Result<fs::path> ScriptCatalog::resolve_script(const std::string& name) const {
    if (!is_safe_script_name(name)) {
        return Result<fs::path>::Err("script not found");
    }
    fs::path base = canonical_or_empty(scripts_dir_);
    fs::path p = canonical_or_empty(scripts_dir_ / name);
    if (base.empty() || p.empty() || !fs::is_regular_file(p) || !is_inside(base, p)) {
        return Result<fs::path>::Err("script not found");
    }
    return Result<fs::path>::Ok(p);
}

std::vector<std::string> ScriptCatalog::list_repos() const {
    std::vector<std::string> out;
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(repos_dir_, ec)) {
        std::string name = entry.path().filename().string();
        if (entry.is_directory() && is_valid_repo_id(name)) {
            out.push_back(name);
        }
    }
    std::sort(out.begin(), out.end());
    return out;
}

Result<fs::path> ScriptCatalog::resolve_repo(const std::string& repo_id) const {
    if (!is_valid_repo_id(repo_id)) {
        return Result<fs::path>::Err("repo not found");
    }
    fs::path base = canonical_or_empty(repos_dir_);
    fs::path p = canonical_or_empty(repos_dir_ / repo_id);
    if (base.empty() || p.empty() || !fs::is_directory(p) || !is_inside(base, p)) {
        return Result<fs::path>::Err("repo not found");
    }
    return Result<fs::path>::Ok(p);
}

Result<std::vector<std::string>> ScriptCatalog::list_repo_files(const std::string& repo_id) const {
    auto base = resolve_repo(repo_id);
    if (base.is_err()) return Result<std::vector<std::string>>::Err(base.error);

    std::vector<std::string> files;
    collect_runnable_files(base.value, base.value, files);
    std::sort(files.begin(), files.end());
    return Result<std::vector<std::string>>::Ok(files);
}

Result<fs::path> ScriptCatalog::resolve_repo_file(const std::string& repo_id,
                                                  const std::string& rel_path) const {
    auto base = resolve_repo(repo_id);
    if (base.is_err()) return Result<fs::path>::Err("repo file not found");

    if (rel_path.empty() || rel_path.find("..") != std::string::npos ||
        rel_path[0] == '/' || rel_path[0] == '\\') {
        return Result<fs::path>::Err("repo file not found");
    }

    fs::path target = canonical_or_empty(base.value / rel_path);
    if (target.empty() || !fs::is_regular_file(target) ||
        !is_inside(base.value, target) || !is_runnable_ext(target)) {
        return Result<fs::path>::Err("repo file not found");
    }
    return Result<fs::path>::Ok(target);
}

Result<RunRequest> make_script_request(const ScriptCatalog& catalog, const std::string& name,
                                       std::vector<std::string> input_vars) {
    auto path = catalog.resolve_script(name);
    if (path.is_err()) return Result<RunRequest>::Err(path.error);

    RunRequest req;
    req.script_ref = name;
    req.executable = path.value.string();
    req.input_vars = std::move(input_vars);
    return Result<RunRequest>::Ok(req);
}

Result<RunRequest> make_repo_request(const ScriptCatalog& catalog, const std::string& repo_id,
                                     const std::string& rel_path,
                                     std::vector<std::string> input_vars) {
    auto target = catalog.resolve_repo_file(repo_id, rel_path);
    if (target.is_err()) return Result<RunRequest>::Err(target.error);
    auto base = catalog.resolve_repo(repo_id);

    RunRequest req;
    req.script_ref = repo_id + ":" + rel_path;
    req.executable = target.value.string();
    req.working_dir = base.value.string();
    req.input_vars = std::move(input_vars);
    return Result<RunRequest>::Ok(req);
}
