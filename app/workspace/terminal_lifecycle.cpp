/*---------------------------------------------------------*/
/*                                                         */
/*   terminal_lifecycle.cpp - Widget and session binding   */
/*                                                         */
/*---------------------------------------------------------*/

#include "terminal_lifecycle.h"
#include "invariant.h"

#include <algorithm>
#include <cstdio>

namespace {

// Up-arrow then Enter: re-run the shell's previous history entry.
const char kRecallPrevious[] = "\x1b[A\n";

void popUtf8(std::string& s)
{
    while (!s.empty()) {
        unsigned char c = static_cast<unsigned char>(s.back());
        s.pop_back();
        if ((c & 0xC0) != 0x80)
            break;
    }
}

std::string trimmed(const std::string& s)
{
    size_t b = s.find_first_not_of(" \t");
    if (b == std::string::npos)
        return std::string();
    size_t e = s.find_last_not_of(" \t");
    return s.substr(b, e - b + 1);
}

} // namespace

TerminalLifecycleManager::TerminalLifecycleManager(PtyGateway& gateway,
                                                   TerminalWidgetFactory& widgets,
                                                   WorkspaceRegistry& registry)
    : gateway_(gateway), widgets_(widgets), registry_(registry)
{
}

void TerminalLifecycleManager::attachWidget(LeafBinding& binding, PaneSurface& surface,
                                            const std::string& replay)
{
    binding.widget = widgets_.create(surface, scrollbackLimit_);
    binding.surface = &surface;
    if (!binding.widget) {
        reportInvariantViolation("attachWidget", "widget factory failed for " + binding.paneId);
        return;
    }
    if (!replay.empty())
        binding.widget->feed(replay);

    std::string paneId = binding.paneId;
    binding.widget->setInputHandler([this, paneId](const std::string& bytes) {
        PaneNode* leaf = resolveLeaf_ ? resolveLeaf_(paneId) : nullptr;
        if (leaf)
            onUserInput(*leaf, bytes);
    });
}

void TerminalLifecycleManager::bind(PaneNode& leaf, PaneSurface& surface)
{
    LeafBinding& binding = registry_.ensureBinding(leaf.id, leaf.command.id);
    if (binding.widget) {
        rebind(leaf, surface);
        return;
    }
    attachWidget(binding, surface, registry_.takeRenderState(leaf.command.id));
    if (!binding.session.valid())
        startSession(leaf, binding);
}

void TerminalLifecycleManager::rebind(PaneNode& leaf, PaneSurface& newSurface)
{
    LeafBinding* binding = registry_.binding(leaf.id);
    if (!binding) {
        bind(leaf, newSurface);
        return;
    }
    std::string scrollback;
    if (binding->widget) {
        scrollback = binding->widget->captureScrollback();
        binding->widget.reset();
    } else {
        scrollback = registry_.takeRenderState(leaf.command.id);
    }
    binding->surface = nullptr;
    attachWidget(*binding, newSurface, scrollback);
    onResize(leaf);
}

void TerminalLifecycleManager::unbind(const std::string& paneId)
{
    LeafBinding* binding = registry_.binding(paneId);
    if (!binding || !binding->widget)
        return;
    registry_.stashRenderState(binding->commandId, binding->widget->captureScrollback(),
                               scrollbackLimit_);
    binding->widget.reset();
    binding->surface = nullptr;
}

void TerminalLifecycleManager::closePane(const std::string& paneId, int commandId)
{
    pendingRestarts_.erase(
        std::remove_if(pendingRestarts_.begin(), pendingRestarts_.end(),
                       [&](const PendingRestart& r) { return r.paneId == paneId; }),
        pendingRestarts_.end());

    SessionHandle session = registry_.detachSession(paneId);
    registry_.eraseBinding(paneId);
    registry_.dropRenderState(commandId);
    if (session.valid())
        gateway_.killSession(session.sessionId);
}

void TerminalLifecycleManager::transferPanes(const std::map<std::string, std::string>& moves)
{
    for (const auto& session : registry_.transferSessions(moves))
        gateway_.killSession(session.sessionId);
    for (auto& pending : pendingRestarts_) {
        auto move = moves.find(pending.paneId);
        if (move != moves.end())
            pending.paneId = move->second;
    }
}

void TerminalLifecycleManager::startSession(PaneNode& leaf, LeafBinding& binding)
{
    int rows = 24, cols = 80;
    if (binding.widget)
        binding.widget->gridSize(rows, cols);

    SessionHandle session;
    try {
        session.sessionId = gateway_.createSession(rows, cols, leaf.command.workingDirectory);
    } catch (const SessionCreateError& e) {
        fprintf(stderr, "[workspace] pane %s: %s\n", leaf.id.c_str(), e.what());
        showDiagnostic(binding, std::string("cannot start session: ") + e.what());
        return;
    }
    session.rows = rows;
    session.cols = cols;
    registry_.attachSession(leaf.id, session);
    binding.pendingLine.clear();
    binding.escapeState = 0;

    if (!leaf.command.commandText.empty())
        writeOrReport(binding, leaf.command.commandText + "\n");
}

void TerminalLifecycleManager::writeOrReport(LeafBinding& binding, const std::string& bytes)
{
    if (!binding.session.valid())
        return;
    try {
        gateway_.writeToSession(binding.session.sessionId, bytes);
    } catch (const SessionNotFound& e) {
        fprintf(stderr, "[workspace] pane %s: %s\n", binding.paneId.c_str(), e.what());
        showDiagnostic(binding, std::string("input dropped: ") + e.what());
    }
}

void TerminalLifecycleManager::showDiagnostic(LeafBinding& binding, const std::string& message)
{
    std::string line = "\r\n\x1b[1;31m[termdeck] " + message + "\x1b[0m\r\n";
    if (binding.widget)
        binding.widget->feed(line);
    else
        registry_.appendRenderState(binding.commandId, line, scrollbackLimit_);
}

void TerminalLifecycleManager::onResize(const PaneNode& leaf)
{
    LeafBinding* binding = registry_.binding(leaf.id);
    if (!binding || !binding->widget || !binding->session.valid())
        return;
    int rows = 0, cols = 0;
    binding->widget->gridSize(rows, cols);
    if (rows <= 0 || cols <= 0)
        return;
    if (rows == binding->session.rows && cols == binding->session.cols)
        return;
    try {
        gateway_.resizeSession(binding->session.sessionId, rows, cols);
        binding->session.rows = rows;
        binding->session.cols = cols;
    } catch (const SessionNotFound&) {
        // Geometry change raced a kill; nothing left to resize.
    }
}

void TerminalLifecycleManager::onUserInput(PaneNode& leaf, const std::string& bytes)
{
    LeafBinding* binding = registry_.binding(leaf.id);
    if (!binding)
        return;
    if (binding->exited) {
        restart(leaf);
        return;
    }
    if (!binding->session.valid())
        return;
    if (leaf.command.commandText.empty())
        captureFirstLine(leaf, *binding, bytes);
    writeOrReport(*binding, bytes);
}

void TerminalLifecycleManager::captureFirstLine(PaneNode& leaf, LeafBinding& binding,
                                                const std::string& bytes)
{
    for (unsigned char c : bytes) {
        // Skip escape sequences (cursor keys and the like).
        if (binding.escapeState == 1) {
            binding.escapeState = (c == '[' || c == 'O') ? 2 : 0;
            continue;
        }
        if (binding.escapeState == 2) {
            if (c >= 0x40 && c <= 0x7E)
                binding.escapeState = 0;
            continue;
        }
        if (c == 0x1B) {
            binding.escapeState = 1;
            continue;
        }
        if (c == '\r' || c == '\n') {
            std::string line = trimmed(binding.pendingLine);
            binding.pendingLine.clear();
            if (line.empty())
                continue;
            leaf.command.commandText = line;
            fprintf(stderr, "[workspace] pane %s captured command: %s\n", leaf.id.c_str(),
                    line.c_str());
            if (onCaptured_)
                onCaptured_(leaf);
            return;
        }
        if (c == 0x7F || c == 0x08) {
            popUtf8(binding.pendingLine);
            continue;
        }
        if (c == 0x03 || c == 0x15) {
            // Ctrl-C / Ctrl-U discard the line.
            binding.pendingLine.clear();
            continue;
        }
        if (c < 0x20)
            continue;
        binding.pendingLine += static_cast<char>(c);
    }
}

void TerminalLifecycleManager::restart(PaneNode& leaf, Clock::time_point now)
{
    LeafBinding& binding = registry_.ensureBinding(leaf.id, leaf.command.id);

    if (!binding.session.valid() || binding.exited) {
        registry_.detachSession(leaf.id);
        binding.exited = false;
        if (binding.widget)
            binding.widget->feed("\r\n");
        startSession(leaf, binding);
        return;
    }

    fprintf(stderr, "[workspace] restarting pane %s\n", leaf.id.c_str());
    try {
        gateway_.sendInterrupt(binding.session.sessionId);
    } catch (const SessionNotFound& e) {
        fprintf(stderr, "[workspace] pane %s: %s\n", leaf.id.c_str(), e.what());
        return;
    }
    for (auto& pending : pendingRestarts_) {
        if (pending.paneId == leaf.id) {
            pending.due = now + restartDelay_;
            return;
        }
    }
    pendingRestarts_.push_back({leaf.id, now + restartDelay_});
}

void TerminalLifecycleManager::tick(Clock::time_point now)
{
    std::vector<PendingRestart> due;
    auto it = pendingRestarts_.begin();
    while (it != pendingRestarts_.end()) {
        if (it->due <= now) {
            due.push_back(*it);
            it = pendingRestarts_.erase(it);
        } else {
            ++it;
        }
    }
    for (const auto& r : due) {
        LeafBinding* binding = registry_.binding(r.paneId);
        PaneNode* leaf = resolveLeaf_ ? resolveLeaf_(r.paneId) : nullptr;
        if (!binding || !leaf)
            continue;
        if (!leaf->command.commandText.empty())
            writeOrReport(*binding, leaf->command.commandText + "\n");
        else
            writeOrReport(*binding, kRecallPrevious);
    }
}

void TerminalLifecycleManager::dispatchOutput(const std::string& sessionId, const std::string& bytes)
{
    LeafBinding* owner = registry_.ownerOfSession(sessionId);
    if (!owner) {
        fprintf(stderr, "[workspace] dropping %zu bytes for unowned session %s\n", bytes.size(),
                sessionId.c_str());
        return;
    }
    if (owner->widget)
        owner->widget->feed(bytes);
    else
        registry_.appendRenderState(owner->commandId, bytes, scrollbackLimit_);
}

void TerminalLifecycleManager::handleExit(const std::string& sessionId, int status)
{
    LeafBinding* owner = registry_.ownerOfSession(sessionId);
    if (!owner)
        return;
    owner->exited = true;
    fprintf(stderr, "[workspace] session %s exited with status %d\n", sessionId.c_str(), status);
    const std::string notice = "\r\n[process exited]\r\n";
    if (owner->widget)
        owner->widget->feed(notice);
    else
        registry_.appendRenderState(owner->commandId, notice, scrollbackLimit_);
}

void TerminalLifecycleManager::shutdown()
{
    pendingRestarts_.clear();
    for (const auto& session : registry_.sessions())
        gateway_.killSession(session.sessionId);
    for (const auto& paneId : registry_.paneIds())
        registry_.eraseBinding(paneId);
}
