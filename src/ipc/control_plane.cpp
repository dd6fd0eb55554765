#include "ipc/control_plane.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <iostream>

#ifdef __linux__
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>
#endif

namespace vdcam::ipc {

namespace {

constexpr std::size_t kMaxRequestBytes = 1024;

}  // namespace

UnixControlServer::~UnixControlServer() {
    stop();
}

bool UnixControlServer::start(const std::string& socket_path, Handler handler, std::string& error) {
    stop();
#ifdef __linux__
    sockaddr_un addr{};
    if (socket_path.empty() || socket_path.size() >= sizeof(addr.sun_path)) {
        error = "invalid control socket path: " + socket_path;
        return false;
    }

    const int fd = socket(AF_UNIX, SOCK_STREAM, 0);
    if (fd < 0) {
        error = std::string("socket failed: ") + std::strerror(errno);
        return false;
    }

    ::unlink(socket_path.c_str());
    addr.sun_family = AF_UNIX;
    std::snprintf(addr.sun_path, sizeof(addr.sun_path), "%s", socket_path.c_str());
    if (bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        error = std::string("bind failed: ") + std::strerror(errno);
        close(fd);
        return false;
    }
    if (listen(fd, 4) < 0) {
        error = std::string("listen failed: ") + std::strerror(errno);
        close(fd);
        ::unlink(socket_path.c_str());
        return false;
    }

    listen_fd_ = fd;
    socket_path_ = socket_path;
    handler_ = std::move(handler);
    running_.store(true);
    thread_ = std::thread(&UnixControlServer::serveLoop, this);
    error.clear();
    return true;
#else
    (void)socket_path;
    (void)handler;
    error = "UnixControlServer requires Linux";
    return false;
#endif
}

void UnixControlServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }
#ifdef __linux__
    if (listen_fd_ >= 0) {
        shutdown(listen_fd_, SHUT_RDWR);
    }
#endif
    if (thread_.joinable()) {
        thread_.join();
    }
#ifdef __linux__
    if (listen_fd_ >= 0) {
        close(listen_fd_);
        listen_fd_ = -1;
    }
    ::unlink(socket_path_.c_str());
#endif
}

void UnixControlServer::serveLoop() {
#ifdef __linux__
    while (running_.load()) {
        const int client_fd = accept(listen_fd_, nullptr, nullptr);
        if (client_fd < 0) {
            if (running_.load() && errno == EINTR) {
                continue;
            }
            break;
        }

        std::string request;
        char buf[256];
        while (request.size() < kMaxRequestBytes && request.find('\n') == std::string::npos) {
            const ssize_t n = recv(client_fd, buf, sizeof(buf), 0);
            if (n <= 0) {
                break;
            }
            request.append(buf, static_cast<std::size_t>(n));
        }

        std::string reply = "ERR empty\n";
        if (!request.empty()) {
            try {
                reply = handler_ ? handler_(request) : "ERR no-handler\n";
            } catch (const std::exception& e) {
                reply = std::string("ERR ") + e.what() + "\n";
            }
        }
        if (send(client_fd, reply.data(), reply.size(), MSG_NOSIGNAL) < 0) {
            std::cerr << "control: reply failed: " << std::strerror(errno) << '\n';
        }
        close(client_fd);
    }
#endif
}

bool unixControlRequest(const std::string& socket_path, const std::string& request, std::string& response, std::string& error) {
#ifdef __linux__
    const int fd = socket(AF_UNIX, SOCK_STREAM, 0);
    if (fd < 0) {
        error = "socket failed";
        return false;
    }
    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    std::snprintf(addr.sun_path, sizeof(addr.sun_path), "%s", socket_path.c_str());
    if (connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        error = "connect failed";
        close(fd);
        return false;
    }
    if (send(fd, request.data(), request.size(), MSG_NOSIGNAL) < 0) {
        error = "send failed";
        close(fd);
        return false;
    }
    response.clear();
    char buf[2048];
    while (true) {
        const ssize_t n = recv(fd, buf, sizeof(buf), 0);
        if (n < 0) {
            error = "recv failed";
            close(fd);
            return false;
        }
        if (n == 0) {
            break;
        }
        response.append(buf, static_cast<std::size_t>(n));
    }
    close(fd);
    error.clear();
    return true;
#else
    (void)socket_path;
    (void)request;
    (void)response;
    error = "unixControlRequest requires Linux";
    return false;
#endif
}

}  // namespace vdcam::ipc
