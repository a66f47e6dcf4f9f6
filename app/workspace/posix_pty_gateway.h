/*---------------------------------------------------------*/
/*                                                         */
/*   posix_pty_gateway.h - forkpty() session backend       */
/*                                                         */
/*   Master fds are non-blocking; poll() is called from    */
/*   the application's idle loop and pushes whatever each  */
/*   session has produced. Input the terminal cannot take  */
/*   yet is queued and flushed by later poll() calls.      */
/*                                                         */
/*---------------------------------------------------------*/

#pragma once

#include "pty_gateway.h"

#include <map>
#include <string>

#include <sys/types.h>

class PosixPtyGateway : public PtyGateway {
public:
    explicit PosixPtyGateway(const std::string& shell = "/bin/sh");
    ~PosixPtyGateway() override;

    PosixPtyGateway(const PosixPtyGateway&) = delete;
    PosixPtyGateway& operator=(const PosixPtyGateway&) = delete;

    std::string createSession(int rows, int cols, const std::string& workingDirectory) override;
    void writeToSession(const std::string& sessionId, const std::string& bytes) override;
    void resizeSession(const std::string& sessionId, int rows, int cols) override;
    void killSession(const std::string& sessionId) override;

    // Flushes queued input and reads pending output from every session.
    // Returns true if any output arrived.
    bool poll();

    size_t sessionCount() const { return sessions_.size(); }
    // Input accepted by writeToSession() but not yet taken by the terminal.
    size_t queuedInput(const std::string& sessionId) const;

private:
    struct Session {
        int masterFd = -1;
        pid_t pid = -1;
        std::string queued;
    };

    std::string shell_;
    std::map<std::string, Session> sessions_;
    unsigned nextId_ = 1;

    Session& lookup(const std::string& sessionId);
    static int reap(pid_t pid, bool wait);
    static bool flush(Session& session);
};
