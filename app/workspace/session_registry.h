/*---------------------------------------------------------*/
/*                                                         */
/*   session_registry.h - Live resources of a workspace    */
/*                                                         */
/*   Owned by one workspace instance. Maps pane ids to     */
/*   their session and widget, session ids back to panes   */
/*   (output routing), and command ids to stashed render   */
/*   state. Every ownership change goes through one of the */
/*   handoff calls below so all maps move together.        */
/*                                                         */
/*---------------------------------------------------------*/

#pragma once

#include "pty_gateway.h"
#include "terminal_widget.h"

#include <map>
#include <memory>
#include <string>
#include <vector>

struct LeafBinding {
    std::string paneId;
    int commandId = 0;
    SessionHandle session;
    bool exited = false;
    std::unique_ptr<TerminalWidget> widget;
    PaneSurface* surface = nullptr;

    // First-line capture for panes started without a command.
    std::string pendingLine;
    int escapeState = 0;
};

class WorkspaceRegistry {
public:
    LeafBinding* binding(const std::string& paneId);
    const LeafBinding* binding(const std::string& paneId) const;
    LeafBinding& ensureBinding(const std::string& paneId, int commandId);
    // Drops the binding; the caller has already killed or detached its session.
    void eraseBinding(const std::string& paneId);

    void attachSession(const std::string& paneId, const SessionHandle& session);
    // Moves bindings (session, widget, capture state) from old pane ids to new
    // ones in a single step, so ids may be swapped or rotated. A binding left
    // under a destination id that is not itself moving is displaced; its
    // session is returned for the caller to kill.
    std::vector<SessionHandle> transferSessions(const std::map<std::string, std::string>& moves);
    SessionHandle detachSession(const std::string& paneId);
    LeafBinding* ownerOfSession(const std::string& sessionId);

    void stashRenderState(int commandId, const std::string& bytes, size_t limit);
    void appendRenderState(int commandId, const std::string& bytes, size_t limit);
    std::string takeRenderState(int commandId);
    bool hasRenderState(int commandId) const;
    void dropRenderState(int commandId);

    std::vector<std::string> paneIds() const;
    std::vector<SessionHandle> sessions() const;
    size_t sessionCount() const { return sessionOwners_.size(); }

private:
    std::map<std::string, LeafBinding> bindings_;
    std::map<std::string, std::string> sessionOwners_;
    std::map<int, TerminalRenderState> renderStates_;
};
