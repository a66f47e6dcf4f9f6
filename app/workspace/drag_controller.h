/*---------------------------------------------------------*/
/*                                                         */
/*   drag_controller.h - Pane drag & drop state machine    */
/*                                                         */
/*   Idle -> Dragging -> (Dropped | Cancelled)             */
/*   Turns pointer positions (in cells) into drop intents; */
/*   nothing is mutated until the caller applies the       */
/*   intent returned by release().                         */
/*                                                         */
/*---------------------------------------------------------*/

#pragma once

#include "layout_ops.h"
#include "pane_tree.h"

#include <string>

struct CellRect {
    int x = 0;
    int y = 0;
    int w = 0;
    int h = 0;

    bool contains(int px, int py) const {
        return px >= x && px < x + w && py >= y && py < y + h;
    }
};

enum class DropIntentKind { None, Pane, OuterEdge };

struct DropIntent {
    DropIntentKind kind = DropIntentKind::None;
    std::string targetId;             // Pane only
    DropEdge edge = DropEdge::Right;

    bool isNone() const { return kind == DropIntentKind::None; }
};

// Quadrant of `pane` under the point: the outer quarters of the width pick
// left/right, the middle half picks top/bottom by vertical half.
DropEdge classifyPaneEdge(const CellRect& pane, int px, int py);

// True when the point lies within `threshold` cells of one of the area's
// borders; checked left, right, top, bottom.
bool classifyOuterEdge(const CellRect& area, int px, int py, int threshold, DropEdge& out);

// Implemented by the view layer.
class PaneHitTester {
public:
    virtual ~PaneHitTester() = default;
    // Topmost leaf pane under the point, with its bounds in the same space.
    virtual bool paneAt(int x, int y, std::string& paneId, CellRect& bounds) const = 0;
};

class DragController {
public:
    enum class State { Idle, Dragging, Dropped, Cancelled };

    explicit DragController(int edgeThreshold = 1);

    // Starts a drag of `paneId`. Containers and unknown panes cannot be
    // dragged; the gesture ends Cancelled and false is returned.
    bool begin(const PaneNode* root, const std::string& paneId);

    // Re-evaluates the intent for a pointer move over `area` (the whole layout).
    const DropIntent& update(const CellRect& area, int x, int y, const PaneHitTester& hits);

    // Ends the gesture. A None result means it was cancelled: no intent, or
    // the source or target vanished from `root` meanwhile.
    DropIntent release(const PaneNode* root);

    void cancel();

    State state() const { return state_; }
    bool isDragging() const { return state_ == State::Dragging; }
    const std::string& sourceId() const { return sourceId_; }
    const DropIntent& intent() const { return intent_; }
    int edgeThreshold() const { return edgeThreshold_; }
    void setEdgeThreshold(int cells) { edgeThreshold_ = cells < 0 ? 0 : cells; }

private:
    State state_ = State::Idle;
    std::string sourceId_;
    DropIntent intent_;
    int edgeThreshold_;
};
