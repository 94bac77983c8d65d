#pragma once

#include <string>
#include <vector>
#include <set>
#include <memory>
#include <mutex>
#include <thread>
#include <atomic>
#include <chrono>
#include <core/types.hpp>
#include <platform/socket_util.hpp>
#include <managers/job_manager.hpp>
#include <managers/script_catalog.hpp>
#include "request.hpp"

// TCP front door. Each connection sends one request line and gets either a
// one-shot reply or, for `watch`, the live channel of a job until it ends.
// One thread per connection.
class ControlServer {
public:
    ControlServer(JobManager& jobs, const ScriptCatalog& catalog,
                  std::chrono::milliseconds poll_interval);
    ~ControlServer();

    ControlServer(const ControlServer&) = delete;
    ControlServer& operator=(const ControlServer&) = delete;

    // Bind and start accepting. Port 0 picks a free port (see port()).
    Result<void> start(const std::string& host, int port);

    // Stop accepting, drop open connections, join all threads.
    void stop();

    int port() const { return port_; }
    bool running() const { return running_.load(); }

private:
    struct Connection {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> finished;
    };

    void accept_loop();
    void handle_connection(socket_t sock);
    void reap_connections();
    void dispatch(const ControlRequest& req, socket_t sock);

    void do_run(const ControlRequest& req, socket_t sock);
    void do_run_repo(const ControlRequest& req, socket_t sock);
    void do_watch(const ControlRequest& req, socket_t sock);
    void do_log(const ControlRequest& req, socket_t sock);
    void do_log_path(const ControlRequest& req, socket_t sock);
    void do_jobs(socket_t sock);
    void do_scripts(socket_t sock);
    void do_repos(socket_t sock);
    void do_repo_files(const ControlRequest& req, socket_t sock);
    void do_meta(const ControlRequest& req, socket_t sock);
    void do_repo_meta(const ControlRequest& req, socket_t sock);

    static bool send_line(socket_t sock, const std::string& line);

    JobManager& jobs_;
    const ScriptCatalog& catalog_;
    std::chrono::milliseconds poll_interval_;

    socket_t listen_sock_ = JOBCAST_INVALID_SOCKET;
    int port_ = -1;
    std::atomic<bool> running_{false};
    std::thread accept_thread_;

    std::mutex conn_mutex_;
    std::vector<Connection> connections_;
    std::set<socket_t> open_sockets_;
};
