#include "project_listener.h"
#include "api_ipc.h"
#include "workspace/json_value.h"

#include <sys/socket.h>
#include <sys/un.h>
#include <fcntl.h>
#include <unistd.h>
#include <errno.h>

#include <cstdio>
#include <cstring>

ProjectChangeListener::ProjectChangeListener(const std::string& socketPath)
    : path_(socketPath) {}

ProjectChangeListener::~ProjectChangeListener() { disconnect(); }

bool ProjectChangeListener::connect() {
    disconnect();
    int fd = ::socket(AF_UNIX, SOCK_STREAM, 0);
    if (fd < 0)
        return false;
    struct sockaddr_un addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;
    std::snprintf(addr.sun_path, sizeof(addr.sun_path), "%s", path_.c_str());
    if (::connect(fd, (struct sockaddr*)&addr, sizeof(addr)) < 0) {
        ::close(fd);
        return false;
    }
    static const char request[] = "cmd:subscribe\n";
    if (::send(fd, request, sizeof(request) - 1, MSG_NOSIGNAL) != (ssize_t)(sizeof(request) - 1)) {
        ::close(fd);
        return false;
    }
    int flags = ::fcntl(fd, F_GETFL, 0);
    ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    ::fcntl(fd, F_SETFD, FD_CLOEXEC);
    fd_ = fd;
    buffer_.clear();
    fprintf(stderr, "[ipc] subscribed to %s\n", path_.c_str());
    return true;
}

void ProjectChangeListener::disconnect() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

void ProjectChangeListener::poll() {
    if (fd_ < 0) {
        auto now = std::chrono::steady_clock::now();
        if (now < nextAttempt_)
            return;
        nextAttempt_ = now + std::chrono::seconds(2);
        if (!connect())
            return;
    }
    char buf[4096];
    for (;;) {
        ssize_t n = ::read(fd_, buf, sizeof(buf));
        if (n > 0) {
            consume(std::string(buf, n));
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR))
            return;
        fprintf(stderr, "[ipc] event stream from %s closed\n", path_.c_str());
        disconnect();
        return;
    }
}

void ProjectChangeListener::consume(const std::string& bytes) {
    buffer_ += bytes;
    size_t nl;
    while ((nl = buffer_.find('\n')) != std::string::npos) {
        std::string line = buffer_.substr(0, nl);
        buffer_.erase(0, nl + 1);
        if (line.empty() || line[0] != '{')
            continue; // subscription acknowledgement
        JsonValue event;
        if (!JsonValue::parse(line, event)) {
            fprintf(stderr, "[ipc] ignoring malformed event: %s\n", line.c_str());
            continue;
        }
        if (event.get("type").asString() != "project_changed" || !event.get("projectId").isInt())
            continue;
        if (handler_)
            handler_(event.get("projectId").asInt());
    }
}

void RelayChangeNotifier::projectChanged(int projectId) {
    std::string line = "cmd:project_changed id=" + std::to_string(projectId);
    if (!ipc_send_command(path_, line))
        fprintf(stderr, "[ipc] cannot relay change of project %d to %s\n", projectId, path_.c_str());
}
