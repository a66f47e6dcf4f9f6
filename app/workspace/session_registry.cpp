#include "session_registry.h"
#include "invariant.h"

LeafBinding* WorkspaceRegistry::binding(const std::string& paneId)
{
    auto it = bindings_.find(paneId);
    return it == bindings_.end() ? nullptr : &it->second;
}

const LeafBinding* WorkspaceRegistry::binding(const std::string& paneId) const
{
    auto it = bindings_.find(paneId);
    return it == bindings_.end() ? nullptr : &it->second;
}

LeafBinding& WorkspaceRegistry::ensureBinding(const std::string& paneId, int commandId)
{
    LeafBinding& b = bindings_[paneId];
    b.paneId = paneId;
    b.commandId = commandId;
    return b;
}

void WorkspaceRegistry::eraseBinding(const std::string& paneId)
{
    auto it = bindings_.find(paneId);
    if (it == bindings_.end())
        return;
    if (it->second.session.valid())
        sessionOwners_.erase(it->second.session.sessionId);
    bindings_.erase(it);
}

void WorkspaceRegistry::attachSession(const std::string& paneId, const SessionHandle& session)
{
    LeafBinding* b = binding(paneId);
    if (!b) {
        reportInvariantViolation("attachSession", "no binding for pane " + paneId);
        return;
    }
    auto owner = sessionOwners_.find(session.sessionId);
    if (owner != sessionOwners_.end() && owner->second != paneId) {
        reportInvariantViolation("attachSession",
                                 session.sessionId + " already owned by " + owner->second);
        return;
    }
    if (b->session.valid())
        sessionOwners_.erase(b->session.sessionId);
    b->session = session;
    b->exited = false;
    sessionOwners_[session.sessionId] = paneId;
}

std::vector<SessionHandle> WorkspaceRegistry::transferSessions(
    const std::map<std::string, std::string>& moves)
{
    // Destinations still held by a pane that is not moving away.
    std::vector<SessionHandle> displaced;
    for (const auto& move : moves) {
        if (move.first == move.second || !bindings_.count(move.first))
            continue;
        auto held = bindings_.find(move.second);
        if (held == bindings_.end() || moves.count(move.second))
            continue;
        reportInvariantViolation("transferSessions", "pane " + move.second + " is still bound");
        if (held->second.session.valid())
            displaced.push_back(held->second.session);
        eraseBinding(move.second);
    }

    std::vector<LeafBinding> lifted;
    for (const auto& move : moves) {
        if (move.first == move.second)
            continue;
        auto it = bindings_.find(move.first);
        if (it == bindings_.end())
            continue;
        LeafBinding b = std::move(it->second);
        bindings_.erase(it);
        if (b.session.valid())
            sessionOwners_.erase(b.session.sessionId);
        b.paneId = move.second;
        lifted.push_back(std::move(b));
    }
    for (auto& b : lifted) {
        std::string paneId = b.paneId;
        if (b.session.valid())
            sessionOwners_[b.session.sessionId] = paneId;
        bindings_[paneId] = std::move(b);
    }
    return displaced;
}

SessionHandle WorkspaceRegistry::detachSession(const std::string& paneId)
{
    LeafBinding* b = binding(paneId);
    if (!b || !b->session.valid())
        return SessionHandle();
    SessionHandle session = b->session;
    sessionOwners_.erase(session.sessionId);
    b->session = SessionHandle();
    return session;
}

LeafBinding* WorkspaceRegistry::ownerOfSession(const std::string& sessionId)
{
    auto it = sessionOwners_.find(sessionId);
    if (it == sessionOwners_.end())
        return nullptr;
    return binding(it->second);
}

void WorkspaceRegistry::stashRenderState(int commandId, const std::string& bytes, size_t limit)
{
    auto it = renderStates_.find(commandId);
    if (it == renderStates_.end())
        it = renderStates_.emplace(commandId, TerminalRenderState(limit)).first;
    it->second.assign(bytes);
}

void WorkspaceRegistry::appendRenderState(int commandId, const std::string& bytes, size_t limit)
{
    auto it = renderStates_.find(commandId);
    if (it == renderStates_.end())
        it = renderStates_.emplace(commandId, TerminalRenderState(limit)).first;
    it->second.append(bytes);
}

std::string WorkspaceRegistry::takeRenderState(int commandId)
{
    auto it = renderStates_.find(commandId);
    if (it == renderStates_.end())
        return std::string();
    std::string bytes = it->second.bytes();
    renderStates_.erase(it);
    return bytes;
}

bool WorkspaceRegistry::hasRenderState(int commandId) const
{
    return renderStates_.count(commandId) != 0;
}

void WorkspaceRegistry::dropRenderState(int commandId)
{
    renderStates_.erase(commandId);
}

std::vector<std::string> WorkspaceRegistry::paneIds() const
{
    std::vector<std::string> ids;
    for (const auto& entry : bindings_)
        ids.push_back(entry.first);
    return ids;
}

std::vector<SessionHandle> WorkspaceRegistry::sessions() const
{
    std::vector<SessionHandle> out;
    for (const auto& entry : bindings_) {
        if (entry.second.session.valid())
            out.push_back(entry.second.session);
    }
    return out;
}
