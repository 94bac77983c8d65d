#include "script_launcher.hpp"
#include "job_log.hpp"
#include <filesystem>

namespace fs = std::filesystem;

Result<std::vector<std::string>> resolve_interpreter(const std::string& script_path,
                                                     const InterpreterConfig& interpreters) {
    std::string ext = fs::path(script_path).extension().string();
    if (ext == ".py") {
        return Result<std::vector<std::string>>::Ok({interpreters.python, script_path});
    }
    if (ext == ".sh") {
        return Result<std::vector<std::string>>::Ok({interpreters.shell, script_path});
    }
    return Result<std::vector<std::string>>::Err(
        fmt::format("no interpreter for '{}' (expected .py or .sh)", script_path));
}

std::string join_input_payload(const std::vector<std::string>& inputs) {
    std::string text;
    for (const auto& v : inputs) {
        text += v;
        text += '\n';
    }
    return text;
}

ScriptLauncher::ScriptLauncher(InterpreterConfig interpreters)
    : interpreters_(std::move(interpreters)) {}

Result<platform::ProcessHandle> ScriptLauncher::launch(
        const std::string& script_path,
        const std::vector<std::string>& args,
        const std::optional<std::string>& working_dir,
        const std::vector<std::string>& stdin_payload) const {
    auto cmd = resolve_interpreter(script_path, interpreters_);
    if (cmd.is_err()) {
        return Result<platform::ProcessHandle>::Err(cmd.error);
    }

    platform::SpawnOptions opts;
    opts.program = cmd.value[0];
    opts.args.assign(cmd.value.begin() + 1, cmd.value.end());
    opts.args.insert(opts.args.end(), args.begin(), args.end());
    opts.working_dir = working_dir;

    auto spawned = platform::spawn(opts);
    if (spawned.is_err()) {
        return spawned;
    }
    platform::ProcessHandle proc = std::move(spawned.value);
    jobcast_log(fmt::format("launcher: started pid {} for {}", proc.native_handle(), script_path));

    // Best-effort: a script that exits early may close its stdin first.
    std::string payload = join_input_payload(stdin_payload);
    if (!payload.empty()) {
        auto wr = proc.write_input(payload);
        if (wr.is_err()) {
            jobcast_log(fmt::format("launcher: pid {} stdin: {}", proc.native_handle(), wr.error));
        }
    }
    auto cl = proc.close_input();
    if (cl.is_err()) {
        jobcast_log(fmt::format("launcher: pid {} stdin: {}", proc.native_handle(), cl.error));
    }

    return Result<platform::ProcessHandle>::Ok(std::move(proc));
}
