#include "api_ipc.h"
#include "command_registry.h"

#include <sys/socket.h>
#include <sys/un.h>
#include <fcntl.h>
#include <unistd.h>
#include <errno.h>

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <sstream>

// Implemented in termdeck_app.cpp.
extern void api_project_changed(TTermDeckApp& app, int projectId);

std::string percent_decode(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '%' && i + 2 < s.size()) {
            char hi = s[i+1], lo = s[i+2];
            auto hexval = [](char c) -> int {
                if (c >= '0' && c <= '9') return c - '0';
                if (c >= 'a' && c <= 'f') return 10 + c - 'a';
                if (c >= 'A' && c <= 'F') return 10 + c - 'A';
                return -1;
            };
            int h = hexval(hi), l = hexval(lo);
            if (h >= 0 && l >= 0) {
                out += static_cast<char>((h << 4) | l);
                i += 2;
                continue;
            }
        }
        out += s[i];
    }
    return out;
}

bool parse_ipc_line(const std::string& raw, std::string& cmd,
                    std::map<std::string, std::string>& kv) {
    std::string line = raw;
    while (!line.empty() && (line.back()=='\n' || line.back()=='\r' || line.back()==' ')) line.pop_back();
    cmd.clear();
    kv.clear();
    std::istringstream iss(line);
    std::string tok;
    while (iss >> tok) {
        if (tok.rfind("cmd:", 0) == 0) {
            cmd = tok.substr(4);
        } else {
            auto eq = tok.find('=');
            if (eq != std::string::npos) {
                kv[tok.substr(0, eq)] = percent_decode(tok.substr(eq+1));
            }
        }
    }
    return !cmd.empty();
}

static int connect_unix(const std::string& path) {
    int fd = ::socket(AF_UNIX, SOCK_STREAM, 0);
    if (fd < 0)
        return -1;
    struct sockaddr_un addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;
    std::snprintf(addr.sun_path, sizeof(addr.sun_path), "%s", path.c_str());
    if (::connect(fd, (struct sockaddr*)&addr, sizeof(addr)) < 0) {
        ::close(fd);
        return -1;
    }
    return fd;
}

bool ipc_send_command(const std::string& path, const std::string& line, std::string* reply) {
    int fd = connect_unix(path);
    if (fd < 0)
        return false;
    std::string out = line;
    if (out.empty() || out.back() != '\n')
        out += '\n';
    bool ok = ::send(fd, out.data(), out.size(), MSG_NOSIGNAL) == (ssize_t)out.size();
    if (ok && reply) {
        reply->clear();
        char buf[4096];
        ssize_t n;
        while ((n = ::read(fd, buf, sizeof(buf))) > 0) {
            reply->append(buf, n);
            if (reply->find('\n') != std::string::npos)
                break;
        }
        while (!reply->empty() && (reply->back() == '\n' || reply->back() == '\r'))
            reply->pop_back();
    }
    ::close(fd);
    return ok;
}

ApiIpcServer::ApiIpcServer(TTermDeckApp* app) : app_(app) {}

ApiIpcServer::~ApiIpcServer() { stop(); }

bool ApiIpcServer::start(const std::string& path) {
    // Another instance owns the socket: leave it alone.
    int existing = connect_unix(path);
    if (existing >= 0) {
        ::close(existing);
        fprintf(stderr, "[ipc] %s is served by another instance\n", path.c_str());
        return false;
    }
    sock_path_ = path;
    // Clean up any stale socket.
    ::unlink(sock_path_.c_str());
    fd_listen_ = ::socket(AF_UNIX, SOCK_STREAM, 0);
    if (fd_listen_ < 0)
        return false;
    // Non-blocking
    int flags = ::fcntl(fd_listen_, F_GETFL, 0);
    ::fcntl(fd_listen_, F_SETFL, flags | O_NONBLOCK);
    ::fcntl(fd_listen_, F_SETFD, FD_CLOEXEC);

    struct sockaddr_un addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;
    std::snprintf(addr.sun_path, sizeof(addr.sun_path), "%s", sock_path_.c_str());
    if (::bind(fd_listen_, (struct sockaddr*)&addr, sizeof(addr)) < 0) {
        ::close(fd_listen_);
        fd_listen_ = -1;
        sock_path_.clear();
        return false;
    }
    if (::listen(fd_listen_, 4) < 0) {
        ::close(fd_listen_);
        fd_listen_ = -1;
        ::unlink(sock_path_.c_str());
        sock_path_.clear();
        return false;
    }
    return true;
}

void ApiIpcServer::poll() {
    if (fd_listen_ < 0 || !app_) return;
    int fd = ::accept(fd_listen_, nullptr, nullptr);
    if (fd < 0) {
        return; // EAGAIN expected in non-blocking mode
    }
    ::fcntl(fd, F_SETFD, FD_CLOEXEC);
    // Read a single line command.
    char buf[4096];
    ssize_t n = ::read(fd, buf, sizeof(buf)-1);
    if (n <= 0) {
        ::close(fd);
        return;
    }
    buf[n] = 0;

    std::string cmd;
    std::map<std::string, std::string> kv;
    std::string resp;
    bool keep_open = false;
    if (!parse_ipc_line(std::string(buf, n), cmd, kv)) {
        resp = "err missing cmd\n";
    } else {
        resp = handle_command(cmd, kv, keep_open);
    }
    ssize_t w = ::send(fd, resp.data(), resp.size(), MSG_NOSIGNAL);
    if (w < 0)
        fprintf(stderr, "[ipc] reply to %s failed: %s\n", cmd.c_str(), std::strerror(errno));
    if (keep_open && w >= 0) {
        int flags = ::fcntl(fd, F_GETFL, 0);
        ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
        event_subscribers_.push_back(fd);
        fprintf(stderr, "[ipc] subscriber added (%zu total)\n", event_subscribers_.size());
    } else {
        ::close(fd);
    }
}

std::string ApiIpcServer::handle_command(const std::string& cmd,
                                         const std::map<std::string, std::string>& kv,
                                         bool& keep_open) {
    if (cmd == "get_capabilities")
        return get_command_capabilities_json() + "\n";
    if (cmd == "subscribe") {
        keep_open = true;
        return "ok\n";
    }
    if (cmd == "project_changed") {
        // Relayed by an instance that does not own the socket.
        auto it = kv.find("id");
        if (it == kv.end() || it->second.empty())
            return "err missing id\n";
        int id = std::atoi(it->second.c_str());
        api_project_changed(*app_, id);
        projectChanged(id);
        return "ok\n";
    }
    std::string resp = exec_registry_command(*app_, cmd, kv);
    fprintf(stderr, "[ipc] %s -> %s\n", cmd.c_str(), resp.substr(0, 60).c_str());
    return resp + "\n";
}

void ApiIpcServer::publish_event(const char* event_type, const JsonValue& payload) {
    if (event_subscribers_.empty())
        return;
    JsonValue event = JsonValue::object();
    event.set("type", JsonValue::string(event_type));
    event.set("seq", JsonValue::number(double(next_event_seq_++)));
    for (const auto& member : payload.members())
        event.set(member.first, member.second);
    std::string line = event.dump() + "\n";

    auto it = event_subscribers_.begin();
    while (it != event_subscribers_.end()) {
        ssize_t n = ::send(*it, line.data(), line.size(), MSG_NOSIGNAL | MSG_DONTWAIT);
        if (n < 0 && errno != EAGAIN && errno != EWOULDBLOCK) {
            ::close(*it);
            it = event_subscribers_.erase(it);
            continue;
        }
        ++it;
    }
}

void ApiIpcServer::projectChanged(int projectId) {
    JsonValue payload = JsonValue::object();
    payload.set("projectId", JsonValue::number(projectId));
    publish_event("project_changed", payload);
}

void ApiIpcServer::stop() {
    for (int fd : event_subscribers_)
        ::close(fd);
    event_subscribers_.clear();
    if (fd_listen_ >= 0) {
        ::close(fd_listen_);
        fd_listen_ = -1;
    }
    if (!sock_path_.empty()) {
        ::unlink(sock_path_.c_str());
        sock_path_.clear();
    }
}
