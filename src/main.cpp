#include <iostream>
#include <vector>
#include <string>
#include <csignal>
#include <pthread.h>
#include <fmt/format.h>
#include "cli/theme.hpp"
#include "cli/live_view.hpp"
#include <core/config.hpp>
#include <core/constants.hpp>
#include <platform/platform.hpp>
#include <managers/job_registry.hpp>
#include <managers/job_manager.hpp>
#include <managers/script_catalog.hpp>
#include <managers/stream_session.hpp>
#include <managers/job_log.hpp>
#include <server/control_server.hpp>

void print_usage() {
    std::cout << theme::section("Usage");
    std::cout << theme::kv("jobcast serve", "Run the job server");
    std::cout << theme::kv("jobcast run <script> [input...]", "Run a script and follow its output");
    std::cout << theme::kv("jobcast scripts", "List runnable scripts");
    std::cout << "\n";
    std::cout << theme::color::DIM
              << "    --config <file>       Config file (default ./jobcast.yaml)\n"
              << "    jobcast --version     Show version\n"
              << "    jobcast --help        Show this help"
              << theme::color::RESET << "\n\n";
}

// Pull "--config <file>" out of args; the rest stay positional.
static std::string take_config_flag(std::vector<std::string>& args) {
    std::string path;
    for (size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "--config" && i + 1 < args.size()) {
            path = args[i + 1];
            args.erase(args.begin() + static_cast<std::ptrdiff_t>(i),
                       args.begin() + static_cast<std::ptrdiff_t>(i) + 2);
            break;
        }
    }
    return path;
}

static Result<Config> load_config(const std::string& path) {
    auto config = path.empty() ? Config::load(get_default_config_path())
                               : Config::load(path);
    if (config.is_err()) return config;
    auto dirs = config.value.ensure_dirs();
    if (dirs.is_err()) return Result<Config>::Err(dirs.error);
    return config;
}

static int run_serve(const Config& config) {
    // Signals are taken synchronously by this thread; workers inherit the mask
    sigset_t sigs;
    sigemptyset(&sigs);
    sigaddset(&sigs, SIGINT);
    sigaddset(&sigs, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &sigs, nullptr);

    JobRegistry registry(config.logs_dir(), config.stream().history_capacity);
    JobManager jobs(registry, ScriptLauncher(config.interpreters()),
                    std::chrono::minutes(config.retention_minutes()));
    ScriptCatalog catalog(config.scripts_dir(), config.repos_dir());
    ControlServer server(jobs, catalog,
                         std::chrono::milliseconds(config.stream().poll_interval_ms));

    auto started = server.start(config.listen().host, config.listen().port);
    if (started.is_err()) {
        std::cout << theme::fail(started.error);
        return 1;
    }
    std::cout << theme::ok(fmt::format("Listening on {}:{}", config.listen().host, server.port()));
    std::cout << theme::info("Scripts: " + config.scripts_dir().string());
    std::cout << theme::info("Logs:    " + config.logs_dir().string());
    std::cout.flush();

    int sig = 0;
    sigwait(&sigs, &sig);
    std::cout << theme::info(fmt::format("Signal {} received, waiting for running jobs", sig));
    server.stop();
    jobs.wait_all();
    return 0;
}

static int run_once(const Config& config, const std::string& script,
                    const std::vector<std::string>& inputs) {
    ScriptCatalog catalog(config.scripts_dir(), config.repos_dir());
    auto request = make_script_request(catalog, script, inputs);
    if (request.is_err()) {
        std::cout << theme::fail(request.error + ": " + script);
        return 1;
    }

    JobRegistry registry(config.logs_dir(), config.stream().history_capacity);
    JobManager jobs(registry, ScriptLauncher(config.interpreters()));
    auto job_id = jobs.start(request.value);
    if (job_id.is_err()) {
        std::cout << theme::fail(job_id.error);
        return 1;
    }
    std::cout << theme::info("Job " + job_id.value);

    LiveView view;
    StreamSession session(registry, job_id.value,
                          std::chrono::milliseconds(config.stream().poll_interval_ms));
    session.run([&view](const std::string& msg) {
        std::cout << view.render(msg);
        std::cout.flush();
        return true;
    });
    jobs.wait_all();

    auto log = jobs.log_path(job_id.value);
    if (log.is_ok()) std::cout << theme::info("Transcript: " + log.value);
    return view.return_code() < 0 ? 1 : view.return_code();
}

int main(int argc, char** argv) {
    try {
        std::vector<std::string> args(argv + 1, argv + argc);
        std::string config_path = take_config_flag(args);

        if (args.empty() || args[0] == "--help") {
            print_usage();
            return args.empty() ? 1 : 0;
        }

        std::string cmd = args[0];
        if (cmd == "--version") {
            std::cout << theme::bold("jobcast") << theme::dim(std::string(" version ") + JOBCAST_VERSION) << "\n";
            return 0;
        }

        platform::ignore_sigpipe();

        auto config = load_config(config_path);
        if (config.is_err()) {
            std::cout << theme::fail(config.error);
            return 1;
        }
        jobcast_log(fmt::format("jobcast {} starting: {}", JOBCAST_VERSION, cmd));

        if (cmd == "serve") {
            return run_serve(config.value);
        } else if (cmd == "run") {
            if (args.size() < 2) {
                std::cout << theme::fail("Missing script name.");
                std::cout << theme::info("Usage: jobcast run <script> [input...]");
                return 1;
            }
            std::vector<std::string> inputs(args.begin() + 2, args.end());
            return run_once(config.value, args[1], inputs);
        } else if (cmd == "scripts") {
            ScriptCatalog catalog(config.value.scripts_dir(), config.value.repos_dir());
            for (const auto& name : catalog.list_scripts()) {
                std::cout << "  " << name << "\n";
            }
            return 0;
        } else {
            std::cout << theme::fail("Unknown command: " + cmd);
            print_usage();
            return 1;
        }
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}
