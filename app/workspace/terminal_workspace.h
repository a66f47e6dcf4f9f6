/*---------------------------------------------------------*/
/*                                                         */
/*   terminal_workspace.h - One project's pane workspace   */
/*                                                         */
/*   Owns the pane tree of one project and keeps views,    */
/*   widgets, sessions and the stored record in step with  */
/*   it. Independent instances never share state.          */
/*                                                         */
/*---------------------------------------------------------*/

#pragma once

#include "drag_controller.h"
#include "layout_ops.h"
#include "pane_tree.h"
#include "project_store.h"
#include "pty_gateway.h"
#include "reconcile.h"
#include "session_registry.h"
#include "terminal_lifecycle.h"
#include "terminal_widget.h"

#include <deque>
#include <functional>
#include <map>
#include <string>

struct WorkspaceSettings {
    int edgeThreshold = 1;
    int restartDelayMs = 300;
    size_t scrollbackBytes = TerminalRenderState::kDefaultLimit;
};

// View tree the workspace renders into.
class WorkspaceView {
public:
    virtual ~WorkspaceView() = default;

    // Rebuilds the views for `root` (null: empty workspace). Views of leaves
    // in plan.keep are reused. Views being replaced must stay alive until
    // releaseDetachedViews() so their widgets can still be read.
    virtual void applyLayout(const PaneNode* root, const ReconcilePlan& plan) = 0;
    virtual PaneSurface* surfaceFor(const std::string& paneId) = 0;
    virtual void releaseDetachedViews() = 0;
};

class TerminalWorkspace {
public:
    TerminalWorkspace(PtyGateway& gateway, TerminalWidgetFactory& widgets, ProjectStore& store,
                      const WorkspaceSettings& settings = WorkspaceSettings());
    ~TerminalWorkspace();

    TerminalWorkspace(const TerminalWorkspace&) = delete;
    TerminalWorkspace& operator=(const TerminalWorkspace&) = delete;

    // Set before open(); may be null for a workspace without views.
    void setView(WorkspaceView* view) { view_ = view; }
    void setCommandCapturedHandler(std::function<void(const PaneNode&)> handler) {
        onCommandCaptured_ = std::move(handler);
    }

    void open(const Project& project);
    bool openFromStore(int projectId);

    // Adds a command and a pane for it next to `afterPaneId` (the last pane
    // when empty). Returns the new pane id.
    std::string addTerminal(const std::string& commandText, const std::string& workingDirectory,
                            const std::string& afterPaneId = std::string());
    // Applies a drop intent from the drag controller or the IPC surface.
    bool dropPane(const std::string& sourceId, const DropIntent& intent);
    // Removes the pane, its command and its session.
    bool closePane(const std::string& paneId);
    bool restartPane(const std::string& paneId);

    bool persist();
    // Re-reads the stored record after another writer changed it.
    bool reloadFromStore();
    // Kills every session. The workspace is unusable afterwards.
    void shutdown();

    bool beginDrag(const std::string& paneId);
    const DropIntent& updateDrag(const CellRect& area, int x, int y, const PaneHitTester& hits);
    bool releaseDrag();
    void cancelDrag() { drag_.cancel(); }
    const DragController& drag() const { return drag_; }

    // Output and exit routing from the process-wide gateway. False when the
    // session belongs to another workspace.
    bool routeOutput(const std::string& sessionId, const std::string& bytes);
    bool routeExit(const std::string& sessionId, int status);

    // Called by the view whenever a pane's cell geometry changed.
    void paneResized(const std::string& paneId);
    void tick() { lifecycle_.tick(); }

    void setWindowState(const WindowState& state);

    const Project& project() const { return project_; }
    int projectId() const { return project_.id; }
    const PaneNode* root() const { return root_.get(); }
    PaneNode* findPane(const std::string& paneId) { return findNode(root_.get(), paneId); }
    WorkspaceRegistry& registry() { return registry_; }
    TerminalLifecycleManager& lifecycle() { return lifecycle_; }
    bool isOpen() const { return opened_ && !closed_; }

private:
    PtyGateway& gateway_;
    ProjectStore& store_;
    WorkspaceSettings settings_;
    WorkspaceRegistry registry_;
    TerminalLifecycleManager lifecycle_;
    DragController drag_;
    PaneIdGenerator ids_;
    WorkspaceView* view_ = nullptr;
    std::function<void(const PaneNode&)> onCommandCaptured_;

    Project project_;
    PanePtr root_;
    std::string lastPersisted_;
    bool opened_ = false;
    bool closed_ = false;

    bool mutating_ = false;
    bool treeApplied_ = false;
    std::deque<std::function<void()>> pending_;

    void runMutation(std::function<void()> mutation);
    void applyTree(PanePtr newRoot, const std::map<std::string, std::string>& before,
                   const std::vector<std::string>& forceRebind = std::vector<std::string>());
    void commandCaptured(PaneNode& leaf);
    void removeCommand(int commandId);
};
