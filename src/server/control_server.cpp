#include "control_server.hpp"
#include <managers/job_log.hpp>
#include <managers/stream_session.hpp>
#include <managers/input_scanner.hpp>
#include <core/constants.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <sys/socket.h>
#include <filesystem>

namespace fs = std::filesystem;

// ── Lifecycle ───────────────────────────────────────────────

ControlServer::ControlServer(JobManager& jobs, const ScriptCatalog& catalog,
                             std::chrono::milliseconds poll_interval)
    : jobs_(jobs), catalog_(catalog), poll_interval_(poll_interval) {}

ControlServer::~ControlServer() {
    stop();
}

Result<void> ControlServer::start(const std::string& host, int port) {
    if (running_) return Result<void>::Ok();

    auto sock = platform::listen_tcp(host, port);
    if (sock.is_err()) {
        return Result<void>::Err(fmt::format("cannot listen on {}:{}: {}", host, port, sock.error));
    }
    listen_sock_ = sock.value;
    port_ = platform::local_port(listen_sock_);

    running_ = true;
    accept_thread_ = std::thread(&ControlServer::accept_loop, this);
    jobcast_log(fmt::format("server: listening on {}:{}", host, port_));
    return Result<void>::Ok();
}

void ControlServer::stop() {
    if (!running_.exchange(false)) return;

    if (accept_thread_.joinable()) accept_thread_.join();
    platform::close_socket(listen_sock_);
    listen_sock_ = JOBCAST_INVALID_SOCKET;

    // Wake connection threads blocked on their sockets
    std::vector<Connection> local;
    {
        std::lock_guard<std::mutex> lock(conn_mutex_);
        for (socket_t s : open_sockets_) ::shutdown(s, SHUT_RDWR);
        local.swap(connections_);
    }
    for (auto& c : local) {
        if (c.thread.joinable()) c.thread.join();
    }
    jobcast_log("server: stopped");
}

// ── Accept loop ─────────────────────────────────────────────

void ControlServer::accept_loop() {
    while (running_) {
        int ev = platform::poll_socket(listen_sock_, POLLIN, ACCEPT_POLL_MS);
        if (!running_) break;
        if (!(ev & POLLIN)) continue;

        socket_t client = ::accept4(listen_sock_, nullptr, nullptr, SOCK_CLOEXEC);
        if (client < 0) continue;

        reap_connections();

        Connection c;
        c.finished = std::make_shared<std::atomic<bool>>(false);
        auto finished = c.finished;
        std::lock_guard<std::mutex> lock(conn_mutex_);
        open_sockets_.insert(client);
        c.thread = std::thread([this, client, finished]() {
            handle_connection(client);
            {
                std::lock_guard<std::mutex> lk(conn_mutex_);
                open_sockets_.erase(client);
            }
            platform::close_socket(client);
            finished->store(true);
        });
        connections_.push_back(std::move(c));
    }
}

void ControlServer::reap_connections() {
    std::lock_guard<std::mutex> lock(conn_mutex_);
    for (auto it = connections_.begin(); it != connections_.end();) {
        if (it->finished->load()) {
            if (it->thread.joinable()) it->thread.join();
            it = connections_.erase(it);
        } else {
            ++it;
        }
    }
}

void ControlServer::handle_connection(socket_t sock) {
    std::string pending, line;
    if (!platform::recv_line(sock, pending, line, MAX_REQUEST_LINE)) {
        return;
    }

    auto req = parse_request(line);
    if (req.is_err()) {
        send_line(sock, error_reply(req.error));
        return;
    }
    dispatch(req.value, sock);
}

bool ControlServer::send_line(socket_t sock, const std::string& line) {
    return platform::send_all(sock, line + "\n");
}

// ── Dispatch ────────────────────────────────────────────────

void ControlServer::dispatch(const ControlRequest& req, socket_t sock) {
    const std::string& cmd = req.cmd;
    if (cmd == "run") do_run(req, sock);
    else if (cmd == "run_repo") do_run_repo(req, sock);
    else if (cmd == "watch") do_watch(req, sock);
    else if (cmd == "log") do_log(req, sock);
    else if (cmd == "log_path") do_log_path(req, sock);
    else if (cmd == "jobs") do_jobs(sock);
    else if (cmd == "scripts") do_scripts(sock);
    else if (cmd == "repos") do_repos(sock);
    else if (cmd == "repo_files") do_repo_files(req, sock);
    else if (cmd == "meta") do_meta(req, sock);
    else if (cmd == "repo_meta") do_repo_meta(req, sock);
    else send_line(sock, error_reply("unknown command: " + cmd));
}

void ControlServer::do_run(const ControlRequest& req, socket_t sock) {
    auto run = make_script_request(catalog_, req.script, req.input_vars);
    if (run.is_err()) {
        send_line(sock, error_reply(run.error));
        return;
    }
    run.value.args = req.args;

    auto id = jobs_.start(run.value);
    if (id.is_err()) {
        send_line(sock, error_reply(id.error));
        return;
    }
    send_line(sock, ok_reply("job_id=" + id.value));
}

void ControlServer::do_run_repo(const ControlRequest& req, socket_t sock) {
    auto run = make_repo_request(catalog_, req.repo_id, req.path, req.input_vars);
    if (run.is_err()) {
        send_line(sock, error_reply(run.error));
        return;
    }
    run.value.args = req.args;

    auto id = jobs_.start(run.value);
    if (id.is_err()) {
        send_line(sock, error_reply(id.error));
        return;
    }
    send_line(sock, ok_reply("job_id=" + id.value));
}

void ControlServer::do_watch(const ControlRequest& req, socket_t sock) {
    StreamSession session(jobs_.registry(), req.job_id, poll_interval_);
    auto outcome = session.run([this, sock](const std::string& msg) {
        return running_.load() && send_line(sock, msg);
    });
    if (outcome == StreamSession::Outcome::Disconnected) {
        jobcast_log(fmt::format("server: viewer of {} left at line {}", req.job_id, session.cursor()));
    }
}

void ControlServer::do_log(const ControlRequest& req, socket_t sock) {
    auto text = jobs_.read_log(req.job_id);
    if (text.is_err()) {
        send_line(sock, error_reply(text.error));
        return;
    }
    if (send_line(sock, ok_reply())) {
        platform::send_all(sock, text.value);
    }
}

void ControlServer::do_log_path(const ControlRequest& req, socket_t sock) {
    auto path = jobs_.log_path(req.job_id);
    if (path.is_err()) {
        send_line(sock, error_reply(path.error));
        return;
    }
    YAML::Emitter out;
    out << YAML::Flow << YAML::BeginMap
        << YAML::Key << "log_file" << YAML::Value << YAML::DoubleQuoted << path.value
        << YAML::EndMap;
    send_line(sock, ok_reply(out.c_str()));
}

void ControlServer::do_jobs(socket_t sock) {
    YAML::Emitter out;
    out << YAML::Flow << YAML::BeginSeq;
    for (const auto& j : jobs_.registry().list()) {
        out << YAML::BeginMap;
        out << YAML::Key << "job_id" << YAML::Value << j.job_id;
        out << YAML::Key << "script" << YAML::Value << YAML::DoubleQuoted << j.script_ref;
        out << YAML::Key << "percent" << YAML::Value << j.percent;
        out << YAML::Key << "status" << YAML::Value << to_string(j.status);
        out << YAML::Key << "step" << YAML::Value << YAML::DoubleQuoted << j.step;
        out << YAML::Key << "done" << YAML::Value << j.done;
        out << YAML::Key << "rc" << YAML::Value;
        if (j.return_code) out << *j.return_code; else out << YAML::Null;
        out << YAML::Key << "created_at" << YAML::Value << j.created_at;
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;
    send_line(sock, ok_reply(out.c_str()));
}

void ControlServer::do_scripts(socket_t sock) {
    send_line(sock, ok_reply(emit_string_list(catalog_.list_scripts())));
}

void ControlServer::do_repos(socket_t sock) {
    send_line(sock, ok_reply(emit_string_list(catalog_.list_repos())));
}

void ControlServer::do_repo_files(const ControlRequest& req, socket_t sock) {
    auto files = catalog_.list_repo_files(req.repo_id);
    if (files.is_err()) {
        send_line(sock, error_reply(files.error));
        return;
    }
    send_line(sock, ok_reply(emit_string_list(files.value)));
}

void ControlServer::do_meta(const ControlRequest& req, socket_t sock) {
    auto path = catalog_.resolve_script(req.script);
    if (path.is_err()) {
        send_line(sock, error_reply(path.error));
        return;
    }
    std::string type = path.value.extension().string().substr(1);
    send_line(sock, ok_reply(emit_script_meta("script", req.script, type,
                                              scan_script_inputs(path.value))));
}

void ControlServer::do_repo_meta(const ControlRequest& req, socket_t sock) {
    auto path = catalog_.resolve_repo_file(req.repo_id, req.path);
    if (path.is_err()) {
        send_line(sock, error_reply("file not found"));
        return;
    }
    std::string type = path.value.extension().string().substr(1);
    send_line(sock, ok_reply(emit_script_meta("path", req.path, type,
                                              scan_script_inputs(path.value), req.repo_id)));
}
