// Client side of project change notification: subscribes to the instance
// that owns the IPC socket and reports project_changed events.
#pragma once

#include "workspace/project_store.h"

#include <chrono>
#include <functional>
#include <string>

class ProjectChangeListener {
public:
    using Handler = std::function<void(int projectId)>;

    explicit ProjectChangeListener(const std::string& socketPath);
    ~ProjectChangeListener();

    void setHandler(Handler handler) { handler_ = std::move(handler); }

    bool connect();
    // Non-blocking; dispatches every complete event line received so far.
    // Reconnects periodically after the server went away.
    void poll();
    void disconnect();
    bool connected() const { return fd_ >= 0; }

    // Feeds raw bytes as if read from the socket.
    void consume(const std::string& bytes);

private:
    std::string path_;
    int fd_ = -1;
    std::string buffer_;
    Handler handler_;
    std::chrono::steady_clock::time_point nextAttempt_{};
};

// Used by an instance that could not claim the socket: forwards its own
// store writes to the owning instance, which republishes them.
class RelayChangeNotifier : public ProjectChangeNotifier {
public:
    explicit RelayChangeNotifier(const std::string& socketPath) : path_(socketPath) {}
    void projectChanged(int projectId) override;

private:
    std::string path_;
};
