/*---------------------------------------------------------*/
/*                                                         */
/*   layout_ops.h - Structural edits on the pane tree      */
/*                                                         */
/*   Every operation takes the root by value and returns   */
/*   the new root; results always satisfy isMinimal().     */
/*                                                         */
/*---------------------------------------------------------*/

#pragma once

#include "pane_tree.h"

#include <string>

enum class DropEdge { Left, Right, Top, Bottom };

const char* edgeToString(DropEdge edge);
bool parseEdge(const std::string& str, DropEdge& out);

// left/right split horizontally, top/bottom vertically.
SplitDirection directionForEdge(DropEdge edge);
// left/top insert before the target, right/bottom after it.
bool edgeInsertsBefore(DropEdge edge);

// Places `node` beside `targetId`. Splices into the target's parent when the
// parent already runs in the edge's direction, otherwise wraps target and node
// in a new container that takes the target's slot (or becomes the root).
PanePtr insertBeside(PanePtr root, const std::string& targetId, PanePtr node,
                     DropEdge edge, PaneIdGenerator& ids);

// Wraps the whole tree and `node` in a container of the edge's direction,
// with `node` first for left/top and last for right/bottom.
PanePtr insertAtEdge(PanePtr root, PanePtr node, DropEdge edge, PaneIdGenerator& ids);

// Structural move: the moved subtree keeps its ids. Dropping a pane on itself,
// on one of its own descendants, or on a pane that no longer exists leaves the
// tree untouched. Dropping on the two-child container the pane leaves places
// it beside the sibling that replaces that container.
PanePtr moveNode(PanePtr root, const std::string& sourceId, const std::string& targetId,
                 DropEdge edge, PaneIdGenerator& ids);
PanePtr moveNodeToEdge(PanePtr root, const std::string& sourceId, DropEdge edge,
                       PaneIdGenerator& ids);

struct SplitResult {
    PanePtr root;
    PaneNode* newLeaf = nullptr;
    // True when the existing leaf had to be wrapped in a new container, which
    // means its view is rebuilt.
    bool rewrapped = false;
};

// Adds `newLeaf` right after (or below) `afterId`.
SplitResult splitExisting(PanePtr root, const std::string& afterId, PanePtr newLeaf,
                          PaneIdGenerator& ids,
                          SplitDirection direction = SplitDirection::Horizontal);
