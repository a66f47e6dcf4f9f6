/*---------------------------------------------------------*/
/*                                                         */
/*   posix_pty_gateway.cpp - forkpty() session backend     */
/*                                                         */
/*---------------------------------------------------------*/

#include "posix_pty_gateway.h"

#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <vector>

#include <fcntl.h>
#include <sys/ioctl.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>
#ifdef __APPLE__
#include <util.h>
#else
#include <pty.h>
#endif

PosixPtyGateway::PosixPtyGateway(const std::string& shell)
    : shell_(shell.empty() ? std::string("/bin/sh") : shell)
{
}

PosixPtyGateway::~PosixPtyGateway()
{
    std::vector<std::string> ids;
    for (const auto& entry : sessions_)
        ids.push_back(entry.first);
    for (const auto& id : ids)
        killSession(id);
}

PosixPtyGateway::Session& PosixPtyGateway::lookup(const std::string& sessionId)
{
    auto it = sessions_.find(sessionId);
    if (it == sessions_.end())
        throw SessionNotFound(sessionId);
    return it->second;
}

std::string PosixPtyGateway::createSession(int rows, int cols, const std::string& workingDirectory)
{
    if (!workingDirectory.empty()) {
        struct stat st;
        if (stat(workingDirectory.c_str(), &st) != 0 || !S_ISDIR(st.st_mode))
            throw SessionCreateError("working directory not found: " + workingDirectory);
        if (access(workingDirectory.c_str(), X_OK) != 0)
            throw SessionCreateError("working directory not accessible: " + workingDirectory);
    }

    struct winsize ws;
    std::memset(&ws, 0, sizeof(ws));
    ws.ws_row = static_cast<unsigned short>(rows > 0 ? rows : 24);
    ws.ws_col = static_cast<unsigned short>(cols > 0 ? cols : 80);

    int masterFd = -1;
    pid_t pid = forkpty(&masterFd, nullptr, nullptr, &ws);
    if (pid < 0)
        throw SessionCreateError(std::string("forkpty failed: ") + std::strerror(errno));

    if (pid == 0) {
        // ---- child ----
        if (!workingDirectory.empty() && chdir(workingDirectory.c_str()) != 0)
            _exit(126);
        setenv("TERM", "xterm-256color", 1);
        setenv("COLORTERM", "truecolor", 1);
        setenv("TERMDECK", "1", 1);
        execlp(shell_.c_str(), shell_.c_str(), static_cast<char*>(nullptr));
        _exit(127);
    }

    int flags = fcntl(masterFd, F_GETFL);
    if (flags != -1)
        fcntl(masterFd, F_SETFL, flags | O_NONBLOCK);
    fcntl(masterFd, F_SETFD, FD_CLOEXEC);

    std::string id = "s" + std::to_string(nextId_++);
    sessions_[id] = Session{masterFd, pid};
    fprintf(stderr, "[pty] session %s pid=%d %dx%d cwd=%s\n", id.c_str(), int(pid),
            int(ws.ws_col), int(ws.ws_row),
            workingDirectory.empty() ? "." : workingDirectory.c_str());
    return id;
}

void PosixPtyGateway::writeToSession(const std::string& sessionId, const std::string& bytes)
{
    Session& session = lookup(sessionId);
    session.queued += bytes;
    if (!flush(session))
        throw SessionNotFound(sessionId);
}

// Writes as much queued input as the terminal takes without blocking.
// False when the terminal is gone.
bool PosixPtyGateway::flush(Session& session)
{
    size_t written = 0;
    bool ok = true;
    while (written < session.queued.size()) {
        ssize_t n = ::write(session.masterFd, session.queued.data() + written,
                            session.queued.size() - written);
        if (n < 0) {
            if (errno == EINTR)
                continue;
            ok = errno == EAGAIN || errno == EWOULDBLOCK;
            break;
        }
        written += static_cast<size_t>(n);
    }
    session.queued.erase(0, written);
    if (!ok)
        session.queued.clear();
    return ok;
}

size_t PosixPtyGateway::queuedInput(const std::string& sessionId) const
{
    auto it = sessions_.find(sessionId);
    return it == sessions_.end() ? 0 : it->second.queued.size();
}

void PosixPtyGateway::resizeSession(const std::string& sessionId, int rows, int cols)
{
    Session& session = lookup(sessionId);
    struct winsize ws;
    std::memset(&ws, 0, sizeof(ws));
    ws.ws_row = static_cast<unsigned short>(rows);
    ws.ws_col = static_cast<unsigned short>(cols);
    if (ioctl(session.masterFd, TIOCSWINSZ, &ws) != 0)
        throw SessionNotFound(sessionId);
}

int PosixPtyGateway::reap(pid_t pid, bool wait)
{
    int status = 0;
    pid_t r = waitpid(pid, &status, wait ? 0 : WNOHANG);
    if (r == pid)
        return WIFEXITED(status) ? WEXITSTATUS(status) : 128 + WTERMSIG(status);
    return -1;
}

void PosixPtyGateway::killSession(const std::string& sessionId)
{
    auto it = sessions_.find(sessionId);
    if (it == sessions_.end())
        return;
    Session session = it->second;
    sessions_.erase(it);

    if (session.pid > 0) {
        ::kill(session.pid, SIGHUP);
        // Short grace period, then force.
        bool exited = false;
        for (int i = 0; i < 10 && !exited; ++i) {
            if (reap(session.pid, false) >= 0)
                exited = true;
            else
                usleep(5000);
        }
        if (!exited) {
            ::kill(session.pid, SIGKILL);
            reap(session.pid, true);
        }
    }
    if (session.masterFd >= 0)
        close(session.masterFd);
    fprintf(stderr, "[pty] session %s killed\n", sessionId.c_str());
}

bool PosixPtyGateway::poll()
{
    std::vector<std::pair<std::string, std::string>> output;
    std::vector<std::string> closed;
    char buf[4096];

    for (auto& entry : sessions_) {
        Session& session = entry.second;
        if (!session.queued.empty() && !flush(session))
            fprintf(stderr, "[pty] session %s stopped taking input\n", entry.first.c_str());
        std::string chunk;
        bool eof = false;
        while (true) {
            ssize_t n = ::read(session.masterFd, buf, sizeof(buf));
            if (n > 0) {
                chunk.append(buf, static_cast<size_t>(n));
                if (chunk.size() >= 64 * 1024)
                    break;
                continue;
            }
            if (n < 0 && errno == EINTR)
                continue;
            // EOF, or EIO once the slave side is closed.
            if (n == 0 || (errno != EAGAIN && errno != EWOULDBLOCK))
                eof = true;
            break;
        }
        if (!chunk.empty())
            output.push_back({entry.first, chunk});
        if (eof)
            closed.push_back(entry.first);
    }

    // Handlers run after the scan since they may kill sessions.
    for (const auto& o : output)
        emitOutput(o.first, o.second);

    for (const auto& id : closed) {
        auto it = sessions_.find(id);
        if (it == sessions_.end())
            continue;
        Session session = it->second;
        sessions_.erase(it);
        int status = reap(session.pid, false);
        if (status < 0) {
            ::kill(session.pid, SIGHUP);
            status = reap(session.pid, true);
        }
        close(session.masterFd);
        fprintf(stderr, "[pty] session %s exited status=%d\n", id.c_str(), status);
        emitExit(id, status);
    }
    return !output.empty();
}
