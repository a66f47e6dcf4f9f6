/*---------------------------------------------------------*/
/*                                                         */
/*   pane_views.h - Recursive split-pane views             */
/*                                                         */
/*   One TPaneContainerView per container, one             */
/*   TTerminalPaneView per leaf, built by a builder that   */
/*   calls itself for container children.                  */
/*                                                         */
/*---------------------------------------------------------*/

#ifndef PANE_VIEWS_H
#define PANE_VIEWS_H

#define Uses_TView
#define Uses_TGroup
#define Uses_TRect
#define Uses_TEvent
#include <tvision/tv.h>

#include "workspace/drag_controller.h"
#include "workspace/pane_tree.h"
#include "workspace/terminal_widget.h"

#include <map>
#include <string>
#include <vector>

class TTermWidget;

// Implemented by the window that owns the pane views.
class PaneViewHost
{
public:
    virtual ~PaneViewHost() = default;
    virtual void paneTitlePressed(const std::string &paneId, TEvent &event) = 0;
    virtual void paneGeometryChanged(const std::string &paneId) = 0;
};

class TTerminalPaneView : public TView, public PaneSurface
{
public:
    TTerminalPaneView(const TRect &bounds, const std::string &paneId, PaneViewHost &host);
    ~TTerminalPaneView();

    void draw() override;
    void handleEvent(TEvent &event) override;
    void changeBounds(const TRect &bounds) override;
    void setState(ushort aState, Boolean enable) override;

    void surfaceSize(int &rows, int &cols) const override;
    TPoint terminalSize() const { return TPoint {size.x, size.y - 1}; }

    void attachWidget(TTermWidget *widget);
    void detachWidget(TTermWidget *widget);

    const std::string &paneId() const { return id; }
    void setTitle(const std::string &aTitle);
    // Drop-zone highlight drawn over the pane while a drag hovers it.
    void setDropHint(bool show, DropEdge edge = DropEdge::Left);

private:
    std::string id;
    std::string title;
    PaneViewHost &host;
    TTermWidget *widget {nullptr};
    bool hintShown {false};
    DropEdge hintEdge {DropEdge::Left};

    void drawDropHint();
};

// Line between two siblings of a container.
class TPaneSeparator : public TView
{
public:
    TPaneSeparator(const TRect &bounds, SplitDirection direction);
    void draw() override;

private:
    SplitDirection direction;
};

class TPaneContainerView : public TGroup
{
public:
    TPaneContainerView(const TRect &bounds, const std::string &paneId, SplitDirection direction);

    void changeBounds(const TRect &bounds) override;

    // Children and separators in visual order.
    void addChild(TView *child);
    void layoutChildren();

    const std::string &paneId() const { return id; }
    SplitDirection splitDirection() const { return direction; }

private:
    std::string id;
    SplitDirection direction;
    std::vector<TView *> children;
    std::vector<TPaneSeparator *> separators;
};

// Builds the view for `node` and, recursively, its children. Leaf views
// found in `reuse` are moved into the new tree instead of being recreated;
// every leaf view of the result ends up in `leafViews`.
TView *buildPaneView(const PaneNode &node, const TRect &bounds, PaneViewHost &host,
                     std::map<std::string, TTerminalPaneView *> &reuse,
                     std::map<std::string, TTerminalPaneView *> &leafViews);

// Splits `length` cells among `count` children separated by one-cell lines.
void splitExtent(int length, int count, std::vector<int> &sizes);

#endif // PANE_VIEWS_H
