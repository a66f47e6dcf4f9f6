/*---------------------------------------------------------*/
/*                                                         */
/*   pty_gateway.h - Pseudo-terminal session backend       */
/*                                                         */
/*   Sessions are addressed by id. Output for every        */
/*   session arrives through one handler, tagged with the  */
/*   session id, in arrival order per session.             */
/*                                                         */
/*---------------------------------------------------------*/

#pragma once

#include <functional>
#include <stdexcept>
#include <string>

class SessionCreateError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class SessionNotFound : public std::runtime_error {
public:
    explicit SessionNotFound(const std::string& sessionId)
        : std::runtime_error("session not found: " + sessionId), sessionId_(sessionId) {}

    const std::string& sessionId() const { return sessionId_; }

private:
    std::string sessionId_;
};

// Opaque reference to one live PTY process.
struct SessionHandle {
    std::string sessionId;
    int rows = 0;
    int cols = 0;

    bool valid() const { return !sessionId.empty(); }
};

class PtyGateway {
public:
    using OutputHandler = std::function<void(const std::string& sessionId, const std::string& bytes)>;
    using ExitHandler = std::function<void(const std::string& sessionId, int status)>;

    virtual ~PtyGateway() = default;

    // Throws SessionCreateError when the process cannot be spawned.
    virtual std::string createSession(int rows, int cols, const std::string& workingDirectory) = 0;
    // Both throw SessionNotFound once the session is gone.
    virtual void writeToSession(const std::string& sessionId, const std::string& bytes) = 0;
    virtual void resizeSession(const std::string& sessionId, int rows, int cols) = 0;
    // Idempotent.
    virtual void killSession(const std::string& sessionId) = 0;

    // Ctrl-C to the foreground process.
    void sendInterrupt(const std::string& sessionId) { writeToSession(sessionId, "\x03"); }

    void setOutputHandler(OutputHandler handler) { outputHandler_ = std::move(handler); }
    void setExitHandler(ExitHandler handler) { exitHandler_ = std::move(handler); }

protected:
    void emitOutput(const std::string& sessionId, const std::string& bytes) {
        if (outputHandler_) outputHandler_(sessionId, bytes);
    }
    void emitExit(const std::string& sessionId, int status) {
        if (exitHandler_) exitHandler_(sessionId, status);
    }

private:
    OutputHandler outputHandler_;
    ExitHandler exitHandler_;
};
