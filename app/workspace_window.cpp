/*---------------------------------------------------------*/
/*                                                         */
/*   workspace_window.cpp - Window hosting one workspace   */
/*                                                         */
/*---------------------------------------------------------*/

#define Uses_TWindow
#define Uses_TRect
#define Uses_TEvent
#define Uses_TKeys
#define Uses_TGroup
#include <tvision/tv.h>

#include "workspace_window.h"

#include <cstdio>

TWorkspaceWindow::TWorkspaceWindow(const TRect &bounds, const std::string &title,
                                   std::unique_ptr<TerminalWorkspace> workspace) :
    TWindowInit(&TWindow::initFrame),
    TWindow(bounds, title.c_str(), wnNoNumber),
    ws(std::move(workspace))
{
    options |= ofTileable;
    ws->setView(this);
    ws->setCommandCapturedHandler([this](const PaneNode &leaf) {
        auto it = leafViews.find(leaf.id);
        if (it != leafViews.end())
            it->second->setTitle(leaf.command.commandText);
    });
}

void TWorkspaceWindow::sizeLimits(TPoint &min, TPoint &max)
{
    TWindow::sizeLimits(min, max);
    min.x = 20;
    min.y = 6;
}

CellRect TWorkspaceWindow::paneArea() const
{
    TRect r = getExtent();
    r.grow(-1, -1);
    return CellRect {r.a.x, r.a.y, r.b.x - r.a.x, r.b.y - r.a.y};
}

void TWorkspaceWindow::applyLayout(const PaneNode *root, const ReconcilePlan &plan)
{
    std::string focused = focusedPaneId();
    lock();

    std::map<std::string, TTerminalPaneView *> reuse;
    for (const auto &id : plan.keep)
    {
        auto it = leafViews.find(id);
        if (it == leafViews.end())
            continue;
        TTerminalPaneView *view = it->second;
        if (view->owner)
            view->owner->remove(view);
        reuse[id] = view;
    }
    // A kept root leaf has just been taken out above.
    if (paneRoot && paneRoot->owner)
    {
        remove(paneRoot);
        detached.push_back(paneRoot);
    }
    paneRoot = nullptr;
    leafViews.clear();

    if (root)
    {
        CellRect area = paneArea();
        TRect r(area.x, area.y, area.x + area.w, area.y + area.h);
        paneRoot = buildPaneView(*root, r, *this, reuse, leafViews);
        paneRoot->growMode = gfGrowHiX | gfGrowHiY;
        insert(paneRoot);
    }
    for (auto &entry : reuse)
    {
        fprintf(stderr, "[workspace] pane view %s not placed in new layout\n", entry.first.c_str());
        detached.push_back(entry.second);
    }

    unlock();
    if (!focused.empty() && leafViews.count(focused))
        focusPane(focused);
    else if (!leafViews.empty())
        focusPane(leafViews.begin()->first);
}

PaneSurface *TWorkspaceWindow::surfaceFor(const std::string &paneId)
{
    auto it = leafViews.find(paneId);
    return it != leafViews.end() ? it->second : nullptr;
}

void TWorkspaceWindow::releaseDetachedViews()
{
    std::vector<TView *> views;
    views.swap(detached);
    for (TView *view : views)
        TObject::destroy(view);
}

bool TWorkspaceWindow::paneAt(int x, int y, std::string &paneId, CellRect &bounds) const
{
    auto *self = const_cast<TWorkspaceWindow *>(this);
    for (const auto &entry : leafViews)
    {
        TTerminalPaneView *view = entry.second;
        TPoint origin = self->makeLocal(view->makeGlobal(TPoint {0, 0}));
        CellRect r {origin.x, origin.y, view->size.x, view->size.y};
        if (r.contains(x, y))
        {
            paneId = entry.first;
            bounds = r;
            return true;
        }
    }
    return false;
}

void TWorkspaceWindow::showDropHints(const DropIntent &intent, const CellRect &area)
{
    for (const auto &entry : leafViews)
    {
        TTerminalPaneView *view = entry.second;
        bool show = false;
        if (intent.kind == DropIntentKind::Pane)
            show = entry.first == intent.targetId;
        else if (intent.kind == DropIntentKind::OuterEdge)
        {
            // Highlight every pane touching the chosen window edge.
            TPoint o = makeLocal(view->makeGlobal(TPoint {0, 0}));
            switch (intent.edge)
            {
                case DropEdge::Left:   show = o.x == area.x; break;
                case DropEdge::Right:  show = o.x + view->size.x == area.x + area.w; break;
                case DropEdge::Top:    show = o.y == area.y; break;
                case DropEdge::Bottom: show = o.y + view->size.y == area.y + area.h; break;
            }
        }
        view->setDropHint(show, intent.edge);
    }
}

void TWorkspaceWindow::clearDropHints()
{
    for (const auto &entry : leafViews)
        entry.second->setDropHint(false);
}

void TWorkspaceWindow::paneTitlePressed(const std::string &paneId, TEvent &event)
{
    if (!ws->beginDrag(paneId))
        return;
    CellRect area = paneArea();
    do
    {
        TPoint p = makeLocal(event.mouse.where);
        showDropHints(ws->updateDrag(area, p.x, p.y, *this), area);
    } while (mouseEvent(event, evMouseMove));
    TPoint p = makeLocal(event.mouse.where);
    ws->updateDrag(area, p.x, p.y, *this);
    clearDropHints();
    // Applied from handleEvent once the pane's own handler has returned,
    // since the drop may destroy that pane's view.
    dropPending = true;
}

void TWorkspaceWindow::paneGeometryChanged(const std::string &paneId)
{
    ws->paneResized(paneId);
}

std::string TWorkspaceWindow::focusedPaneId() const
{
    // Follow the chain of current views down to a leaf.
    TView *v = current;
    while (v)
    {
        if (auto *leaf = dynamic_cast<TTerminalPaneView *>(v))
            return leaf->paneId();
        auto *group = dynamic_cast<TGroup *>(v);
        v = group ? group->current : nullptr;
    }
    return std::string();
}

void TWorkspaceWindow::focusPane(const std::string &paneId)
{
    auto it = leafViews.find(paneId);
    if (it != leafViews.end())
        it->second->focus();
}

WindowState TWorkspaceWindow::windowState() const
{
    WindowState s;
    s.x = origin.x;
    s.y = origin.y;
    s.width = size.x;
    s.height = size.y;
    return s;
}

bool TWorkspaceWindow::saveLayout()
{
    ws->setWindowState(windowState());
    return ws->persist();
}

void TWorkspaceWindow::handleEvent(TEvent &event)
{
    TWindow::handleEvent(event);

    if (dropPending)
    {
        dropPending = false;
        ws->releaseDrag();
    }

    if (event.what == evCommand)
    {
        std::string pane = focusedPaneId();
        switch (event.message.command)
        {
            case cmSaveLayout:
                saveLayout();
                clearEvent(event);
                break;
            case cmRestartPane:
                if (!pane.empty())
                    ws->restartPane(pane);
                clearEvent(event);
                break;
            case cmClosePane:
                if (!pane.empty())
                    ws->closePane(pane);
                clearEvent(event);
                break;
            case cmNextPane:
            {
                std::vector<const PaneNode *> leaves = allLeaves(ws->root());
                for (size_t i = 0; i < leaves.size(); ++i)
                {
                    if (leaves[i]->id == pane)
                    {
                        focusPane(leaves[(i + 1) % leaves.size()]->id);
                        break;
                    }
                }
                clearEvent(event);
                break;
            }
            default:
                break;
        }
    }
}

void TWorkspaceWindow::close()
{
    if (valid(cmClose))
        saveLayout();
    TWindow::close();
}

void TWorkspaceWindow::shutDown()
{
    // Sessions and widgets go first; the views they draw into go after.
    ws->shutdown();
    releaseDetachedViews();
    leafViews.clear();
    paneRoot = nullptr;
    if (onClosed)
        onClosed(this);
    TWindow::shutDown();
}
