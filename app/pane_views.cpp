#define Uses_TView
#define Uses_TGroup
#define Uses_TRect
#define Uses_TEvent
#define Uses_TKeys
#define Uses_TDrawBuffer
#include <tvision/tv.h>

#include "pane_views.h"
#include "term_widget.h"

#include <algorithm>

namespace {

const TColorAttr cTitle = 0x70;
const TColorAttr cTitleFocused = 0x1F;
const TColorAttr cBody = 0x07;
const TColorAttr cSeparator = 0x08;
const TColorAttr cDropHint = 0x2F;

} // namespace

/*---------------------------------------------------------*/
/* TTerminalPaneView                                       */
/*---------------------------------------------------------*/

TTerminalPaneView::TTerminalPaneView(const TRect &bounds, const std::string &paneId,
                                     PaneViewHost &aHost) :
    TView(bounds),
    id(paneId),
    title(paneId),
    host(aHost)
{
    options |= ofSelectable | ofFirstClick;
    eventMask |= evMouseMove;
}

TTerminalPaneView::~TTerminalPaneView()
{
    if (widget)
        widget->surfaceGone();
}

void TTerminalPaneView::attachWidget(TTermWidget *aWidget)
{
    if (widget && widget != aWidget)
        widget->surfaceGone();
    widget = aWidget;
    drawView();
}

void TTerminalPaneView::detachWidget(TTermWidget *aWidget)
{
    if (widget == aWidget)
    {
        widget = nullptr;
        hideCursor();
        drawView();
    }
}

void TTerminalPaneView::setTitle(const std::string &aTitle)
{
    if (title != aTitle)
    {
        title = aTitle;
        drawView();
    }
}

void TTerminalPaneView::setDropHint(bool show, DropEdge edge)
{
    if (hintShown == show && (!show || hintEdge == edge))
        return;
    hintShown = show;
    hintEdge = edge;
    drawView();
}

void TTerminalPaneView::surfaceSize(int &rows, int &cols) const
{
    rows = std::max(size.y - 1, 1);
    cols = std::max(size.x, 1);
}

void TTerminalPaneView::draw()
{
    TDrawBuffer b;
    TColorAttr titleColor = (state & sfFocused) ? cTitleFocused : cTitle;
    b.moveChar(0, ' ', titleColor, size.x);
    b.moveStr(1, title.c_str(), titleColor);
    writeLine(0, 0, size.x, 1, b);

    // The emulator surface may lag behind a resize; blank what it won't cover.
    b.moveChar(0, ' ', cBody, size.x);
    if (size.y > 1)
        writeLine(0, 1, size.x, size.y - 1, b);

    if (widget)
    {
        widget->paint(*this, 1);
        if (widget->cursorVisible() && (state & sfFocused))
        {
            TPoint c = widget->cursorPos();
            setCursor(c.x, c.y + 1);
            showCursor();
        }
        else
            hideCursor();
    }

    if (hintShown)
        drawDropHint();
}

void TTerminalPaneView::drawDropHint()
{
    TDrawBuffer b;
    switch (hintEdge)
    {
        case DropEdge::Top:
            b.moveChar(0, '\xDF', cDropHint, size.x);
            writeLine(0, 0, size.x, 1, b);
            break;
        case DropEdge::Bottom:
            b.moveChar(0, '\xDC', cDropHint, size.x);
            writeLine(0, size.y - 1, size.x, 1, b);
            break;
        case DropEdge::Left:
            b.moveChar(0, '\xDD', cDropHint, 1);
            writeLine(0, 0, 1, size.y, b);
            break;
        case DropEdge::Right:
            b.moveChar(0, '\xDE', cDropHint, 1);
            writeLine(size.x - 1, 0, 1, size.y, b);
            break;
    }
}

void TTerminalPaneView::handleEvent(TEvent &event)
{
    TView::handleEvent(event);
    if (event.what == evMouseDown)
    {
        TPoint p = makeLocal(event.mouse.where);
        if (p.y == 0 && (event.mouse.buttons & mbLeftButton))
        {
            // Title row is the drag handle.
            host.paneTitlePressed(id, event);
            clearEvent(event);
        }
        else
            clearEvent(event);
    }
    else if (event.what == evKeyDown && (state & sfFocused) && widget)
    {
        widget->handleKey(event.keyDown);
        clearEvent(event);
    }
}

void TTerminalPaneView::changeBounds(const TRect &bounds)
{
    setBounds(bounds);
    if (widget)
        widget->resize(terminalSize());
    drawView();
    host.paneGeometryChanged(id);
}

void TTerminalPaneView::setState(ushort aState, Boolean enable)
{
    TView::setState(aState, enable);
    if (aState & sfFocused)
        drawView();
}

/*---------------------------------------------------------*/
/* TPaneSeparator / TPaneContainerView                     */
/*---------------------------------------------------------*/

TPaneSeparator::TPaneSeparator(const TRect &bounds, SplitDirection aDirection) :
    TView(bounds),
    direction(aDirection)
{
}

void TPaneSeparator::draw()
{
    TDrawBuffer b;
    if (direction == SplitDirection::Horizontal)
    {
        b.moveChar(0, '\xB3', cSeparator, 1);
        writeLine(0, 0, 1, size.y, b);
    }
    else
    {
        b.moveChar(0, '\xC4', cSeparator, size.x);
        writeLine(0, 0, size.x, 1, b);
    }
}

TPaneContainerView::TPaneContainerView(const TRect &bounds, const std::string &paneId,
                                       SplitDirection aDirection) :
    TGroup(bounds),
    id(paneId),
    direction(aDirection)
{
    options |= ofSelectable;
}

void TPaneContainerView::addChild(TView *child)
{
    if (!children.empty())
    {
        auto *line = new TPaneSeparator(TRect(0, 0, 1, 1), direction);
        separators.push_back(line);
        insert(line);
    }
    children.push_back(child);
    insert(child);
}

void TPaneContainerView::layoutChildren()
{
    TRect extent = getExtent();
    bool horizontal = direction == SplitDirection::Horizontal;
    std::vector<int> sizes;
    splitExtent(horizontal ? extent.b.x : extent.b.y, int(children.size()), sizes);

    lock();
    int pos = 0;
    for (size_t i = 0; i < children.size(); ++i)
    {
        if (i > 0)
        {
            TRect line = horizontal ? TRect(pos, 0, pos + 1, extent.b.y)
                                    : TRect(0, pos, extent.b.x, pos + 1);
            separators[i - 1]->changeBounds(line);
            ++pos;
        }
        TRect r = horizontal ? TRect(pos, 0, pos + sizes[i], extent.b.y)
                             : TRect(0, pos, extent.b.x, pos + sizes[i]);
        children[i]->changeBounds(r);
        pos += sizes[i];
    }
    unlock();
}

void TPaneContainerView::changeBounds(const TRect &bounds)
{
    setBounds(bounds);
    layoutChildren();
    drawView();
}

void splitExtent(int length, int count, std::vector<int> &sizes)
{
    sizes.assign(count, 0);
    if (count <= 0)
        return;
    int available = std::max(length - (count - 1), 0);
    int each = available / count;
    int extra = available % count;
    for (int i = 0; i < count; ++i)
        sizes[i] = each + (i < extra ? 1 : 0);
}

TView *buildPaneView(const PaneNode &node, const TRect &bounds, PaneViewHost &host,
                     std::map<std::string, TTerminalPaneView *> &reuse,
                     std::map<std::string, TTerminalPaneView *> &leafViews)
{
    if (node.isLeaf())
    {
        TTerminalPaneView *view = nullptr;
        auto it = reuse.find(node.id);
        if (it != reuse.end())
        {
            view = it->second;
            reuse.erase(it);
            view->changeBounds(bounds);
        }
        else
            view = new TTerminalPaneView(bounds, node.id, host);
        view->setTitle(node.command.commandText.empty() ? std::string("shell")
                                                        : node.command.commandText);
        leafViews[node.id] = view;
        return view;
    }

    auto *group = new TPaneContainerView(bounds, node.id, node.direction);
    TRect extent = group->getExtent();
    for (const auto &child : node.children)
        group->addChild(buildPaneView(*child, extent, host, reuse, leafViews));
    group->layoutChildren();
    return group;
}
