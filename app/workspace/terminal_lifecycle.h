/*---------------------------------------------------------*/
/*                                                         */
/*   terminal_lifecycle.h - Widget and session binding     */
/*                                                         */
/*   Keeps one live widget per visible leaf. Widgets come  */
/*   and go with the view tree; sessions only end when a   */
/*   pane is closed or the workspace shuts down.           */
/*                                                         */
/*---------------------------------------------------------*/

#pragma once

#include "pane_tree.h"
#include "pty_gateway.h"
#include "session_registry.h"
#include "terminal_widget.h"

#include <chrono>
#include <functional>
#include <map>
#include <string>
#include <vector>

class TerminalLifecycleManager {
public:
    using Clock = std::chrono::steady_clock;
    // Resolves a pane id to its leaf in the current tree (null once gone).
    using LeafResolver = std::function<PaneNode*(const std::string& paneId)>;
    // A blank pane's first typed line became its command.
    using CommandCapturedHandler = std::function<void(PaneNode& leaf)>;

    TerminalLifecycleManager(PtyGateway& gateway, TerminalWidgetFactory& widgets,
                             WorkspaceRegistry& registry);

    void setLeafResolver(LeafResolver resolver) { resolveLeaf_ = std::move(resolver); }
    void setCommandCapturedHandler(CommandCapturedHandler handler) { onCaptured_ = std::move(handler); }
    void setRestartDelay(std::chrono::milliseconds delay) { restartDelay_ = delay; }
    void setScrollbackLimit(size_t bytes) { scrollbackLimit_ = bytes; }

    // Creates a widget on `surface`. Starts a session sized to the widget when
    // the leaf has none and auto-runs the leaf's command.
    void bind(PaneNode& leaf, PaneSurface& surface);
    // Moves the leaf's widget to a rebuilt surface, carrying the scrollback
    // over. The session is left alone.
    void rebind(PaneNode& leaf, PaneSurface& newSurface);
    // Disposes the widget only; its scrollback is stashed under the command id.
    void unbind(const std::string& paneId);
    // Kills the session and forgets the pane.
    void closePane(const std::string& paneId, int commandId);
    // Re-keys live panes whose ids changed (old id -> new id). Widgets still
    // need a rebind onto the surfaces of their new ids.
    void transferPanes(const std::map<std::string, std::string>& moves);

    void onResize(const PaneNode& leaf);
    void onUserInput(PaneNode& leaf, const std::string& bytes);

    // Interrupts the foreground process, then re-sends the command after the
    // restart delay. A pane whose process has exited gets a fresh session.
    void restart(PaneNode& leaf, Clock::time_point now = Clock::now());
    // Runs restart replays that are due.
    void tick(Clock::time_point now = Clock::now());
    bool hasPendingRestarts() const { return !pendingRestarts_.empty(); }

    // Gateway callbacks.
    void dispatchOutput(const std::string& sessionId, const std::string& bytes);
    void handleExit(const std::string& sessionId, int status);

    // Kills every session. Returns once all kills have completed.
    void shutdown();

private:
    struct PendingRestart {
        std::string paneId;
        Clock::time_point due;
    };

    PtyGateway& gateway_;
    TerminalWidgetFactory& widgets_;
    WorkspaceRegistry& registry_;
    LeafResolver resolveLeaf_;
    CommandCapturedHandler onCaptured_;
    std::chrono::milliseconds restartDelay_{300};
    size_t scrollbackLimit_ = TerminalRenderState::kDefaultLimit;
    std::vector<PendingRestart> pendingRestarts_;

    void attachWidget(LeafBinding& binding, PaneSurface& surface, const std::string& replay);
    void startSession(PaneNode& leaf, LeafBinding& binding);
    void writeOrReport(LeafBinding& binding, const std::string& bytes);
    void showDiagnostic(LeafBinding& binding, const std::string& message);
    void captureFirstLine(PaneNode& leaf, LeafBinding& binding, const std::string& bytes);
};
