// Unix domain socket IPC server.
// Protocol: cmd:<name> [key=value ...]\n, values percent-encoded.
// One command per connection, except cmd:subscribe which keeps the
// connection open and receives newline-delimited JSON events.
#pragma once

#include "workspace/json_value.h"
#include "workspace/project_store.h"

#include <cstdint>
#include <map>
#include <string>
#include <vector>

class TTermDeckApp;

class ApiIpcServer : public ProjectChangeNotifier {
public:
    explicit ApiIpcServer(TTermDeckApp* app);
    ~ApiIpcServer();

    // Start listening on a Unix socket path. Returns false on failure,
    // including when another live instance already serves `path`.
    bool start(const std::string& path);
    // Poll for new connections and handle a single command per connection.
    void poll();
    // Stop and clean up.
    void stop();

    // Push a newline-delimited JSON event {"type":<event_type>, ...payload}
    // to all active subscribers. Disconnected subscribers are dropped.
    void publish_event(const char* event_type, const JsonValue& payload = JsonValue::object());

    // ProjectChangeNotifier
    void projectChanged(int projectId) override;

    bool listening() const { return fd_listen_ >= 0; }

private:
    TTermDeckApp* app_ = nullptr;
    int fd_listen_ = -1;
    std::string sock_path_;

    std::vector<int> event_subscribers_;
    uint64_t next_event_seq_ = 1;

    std::string handle_command(const std::string& cmd,
                               const std::map<std::string, std::string>& kv, bool& keep_open);
};

// Parses "cmd:<name> k=v ..." into a command name and decoded values.
bool parse_ipc_line(const std::string& line, std::string& cmd,
                    std::map<std::string, std::string>& kv);
std::string percent_decode(const std::string& s);

// Sends one command to a running instance and returns its reply line.
// False when nothing listens on `path`.
bool ipc_send_command(const std::string& path, const std::string& line, std::string* reply = nullptr);
