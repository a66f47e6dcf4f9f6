#include "drag_controller.h"

#include <cstdio>

DropEdge classifyPaneEdge(const CellRect& pane, int px, int py)
{
    // Measure from cell centres so narrow panes split symmetrically.
    double relX = pane.w > 0 ? (px - pane.x + 0.5) / pane.w : 0.5;
    double relY = pane.h > 0 ? (py - pane.y + 0.5) / pane.h : 0.5;
    if (relX < 0.25)
        return DropEdge::Left;
    if (relX > 0.75)
        return DropEdge::Right;
    return relY < 0.5 ? DropEdge::Top : DropEdge::Bottom;
}

bool classifyOuterEdge(const CellRect& area, int px, int py, int threshold, DropEdge& out)
{
    if (threshold <= 0 || !area.contains(px, py))
        return false;
    if (px - area.x < threshold) { out = DropEdge::Left; return true; }
    if (area.x + area.w - 1 - px < threshold) { out = DropEdge::Right; return true; }
    if (py - area.y < threshold) { out = DropEdge::Top; return true; }
    if (area.y + area.h - 1 - py < threshold) { out = DropEdge::Bottom; return true; }
    return false;
}

DragController::DragController(int edgeThreshold)
    : edgeThreshold_(edgeThreshold < 0 ? 0 : edgeThreshold)
{
}

bool DragController::begin(const PaneNode* root, const std::string& paneId)
{
    intent_ = DropIntent();
    sourceId_.clear();
    const PaneNode* node = findNode(root, paneId);
    if (!node || !node->isLeaf()) {
        state_ = State::Cancelled;
        return false;
    }
    sourceId_ = paneId;
    state_ = State::Dragging;
    return true;
}

const DropIntent& DragController::update(const CellRect& area, int x, int y,
                                         const PaneHitTester& hits)
{
    if (state_ != State::Dragging)
        return intent_;

    intent_ = DropIntent();
    DropEdge edge;
    if (classifyOuterEdge(area, x, y, edgeThreshold_, edge)) {
        intent_.kind = DropIntentKind::OuterEdge;
        intent_.edge = edge;
        return intent_;
    }

    std::string paneId;
    CellRect bounds;
    if (!hits.paneAt(x, y, paneId, bounds) || paneId == sourceId_)
        return intent_;

    intent_.kind = DropIntentKind::Pane;
    intent_.targetId = paneId;
    intent_.edge = classifyPaneEdge(bounds, x, y);
    return intent_;
}

DropIntent DragController::release(const PaneNode* root)
{
    if (state_ != State::Dragging)
        return DropIntent();

    DropIntent result = intent_;
    bool valid = !result.isNone() && findNode(root, sourceId_) != nullptr;
    if (valid && result.kind == DropIntentKind::Pane)
        valid = findNode(root, result.targetId) != nullptr;

    intent_ = DropIntent();
    if (!valid) {
        state_ = State::Cancelled;
        return DropIntent();
    }
    state_ = State::Dropped;
    return result;
}

void DragController::cancel()
{
    if (state_ == State::Dragging)
        fprintf(stderr, "[layout] drag of %s cancelled\n", sourceId_.c_str());
    state_ = State::Cancelled;
    intent_ = DropIntent();
}
