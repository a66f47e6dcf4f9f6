/*---------------------------------------------------------*/
/*                                                         */
/*   workspace_window.h - Window hosting one workspace     */
/*                                                         */
/*---------------------------------------------------------*/

#ifndef WORKSPACE_WINDOW_H
#define WORKSPACE_WINDOW_H

#define Uses_TWindow
#define Uses_TRect
#define Uses_TEvent
#include <tvision/tv.h>

#include "pane_views.h"
#include "workspace/terminal_workspace.h"

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

// Commands understood by a workspace window.
const ushort
    cmSaveLayout   = 210,
    cmRestartPane  = 211,
    cmClosePane    = 212,
    cmNextPane     = 213;

class TWorkspaceWindow : public TWindow,
                         public WorkspaceView,
                         public PaneHitTester,
                         public PaneViewHost
{
public:
    TWorkspaceWindow(const TRect &bounds, const std::string &title,
                     std::unique_ptr<TerminalWorkspace> workspace);

    void handleEvent(TEvent &event) override;
    void close() override;
    void shutDown() override;
    void sizeLimits(TPoint &min, TPoint &max) override;

    // WorkspaceView
    void applyLayout(const PaneNode *root, const ReconcilePlan &plan) override;
    PaneSurface *surfaceFor(const std::string &paneId) override;
    void releaseDetachedViews() override;

    // PaneHitTester, in window-local cells.
    bool paneAt(int x, int y, std::string &paneId, CellRect &bounds) const override;

    // PaneViewHost
    void paneTitlePressed(const std::string &paneId, TEvent &event) override;
    void paneGeometryChanged(const std::string &paneId) override;

    TerminalWorkspace &workspace() { return *ws; }
    std::string focusedPaneId() const;
    WindowState windowState() const;
    bool saveLayout();

    std::function<void(TWorkspaceWindow *)> onClosed;

private:
    std::unique_ptr<TerminalWorkspace> ws;
    TView *paneRoot {nullptr};
    std::map<std::string, TTerminalPaneView *> leafViews;
    std::vector<TView *> detached;
    bool dropPending {false};

    CellRect paneArea() const;
    void showDropHints(const DropIntent &intent, const CellRect &area);
    void clearDropHints();
    void focusPane(const std::string &paneId);
};

#endif // WORKSPACE_WINDOW_H
