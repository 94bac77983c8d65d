#include "socket_util.hpp"
#include <core/constants.hpp>

#include <sys/socket.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <arpa/inet.h>
#include <poll.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

namespace platform {

static Result<sockaddr_in> make_addr(const std::string& host, int port) {
    sockaddr_in addr = {};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(port));
    std::string h = (host.empty() || host == "localhost") ? "127.0.0.1" : host;
    if (inet_pton(AF_INET, h.c_str(), &addr.sin_addr) != 1) {
        return Result<sockaddr_in>::Err("invalid IPv4 address: " + host);
    }
    return Result<sockaddr_in>::Ok(addr);
}

Result<socket_t> listen_tcp(const std::string& host, int port, int backlog) {
    auto addr = make_addr(host, port);
    if (addr.is_err()) return Result<socket_t>::Err(addr.error);

    socket_t sock = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (sock < 0) {
        return Result<socket_t>::Err(std::string("socket failed: ") + std::strerror(errno));
    }

    int one = 1;
    setsockopt(sock, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

    if (::bind(sock, reinterpret_cast<sockaddr*>(&addr.value), sizeof(addr.value)) != 0) {
        int err = errno;
        close(sock);
        return Result<socket_t>::Err(std::string("bind failed: ") + std::strerror(err));
    }
    if (::listen(sock, backlog) != 0) {
        int err = errno;
        close(sock);
        return Result<socket_t>::Err(std::string("listen failed: ") + std::strerror(err));
    }
    return Result<socket_t>::Ok(sock);
}

Result<socket_t> connect_tcp(const std::string& host, int port) {
    auto addr = make_addr(host, port);
    if (addr.is_err()) return Result<socket_t>::Err(addr.error);

    socket_t sock = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (sock < 0) {
        return Result<socket_t>::Err(std::string("socket failed: ") + std::strerror(errno));
    }
    if (::connect(sock, reinterpret_cast<sockaddr*>(&addr.value), sizeof(addr.value)) != 0) {
        int err = errno;
        close(sock);
        return Result<socket_t>::Err(std::string("connect failed: ") + std::strerror(err));
    }
    int one = 1;
    setsockopt(sock, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
    return Result<socket_t>::Ok(sock);
}

int local_port(socket_t sock) {
    sockaddr_in addr = {};
    socklen_t len = sizeof(addr);
    if (getsockname(sock, reinterpret_cast<sockaddr*>(&addr), &len) != 0) return -1;
    return ntohs(addr.sin_port);
}

int poll_socket(socket_t sock, short events, int timeout_ms) {
    struct pollfd pfd;
    pfd.fd = sock;
    pfd.events = events;
    pfd.revents = 0;
    int ret = poll(&pfd, 1, timeout_ms);
    return (ret > 0) ? pfd.revents : 0;
}

bool send_all(socket_t sock, const std::string& data) {
    size_t off = 0;
    while (off < data.size()) {
        ssize_t n = ::send(sock, data.data() + off, data.size() - off, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        off += static_cast<size_t>(n);
    }
    return true;
}

bool recv_line(socket_t sock, std::string& pending, std::string& line, size_t max_len) {
    char buf[SOCKET_READ_BUF_SIZE];
    while (true) {
        auto nl = pending.find('\n');
        if (nl != std::string::npos) {
            line = pending.substr(0, nl);
            pending.erase(0, nl + 1);
            if (!line.empty() && line.back() == '\r') line.pop_back();
            return true;
        }
        if (pending.size() > max_len) return false;

        ssize_t n = ::recv(sock, buf, sizeof(buf), 0);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;
        pending.append(buf, static_cast<size_t>(n));
    }
}

void close_socket(socket_t sock) {
    close(sock);
}

} // namespace platform
