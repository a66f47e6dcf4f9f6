/*---------------------------------------------------------*/
/*                                                         */
/*   layout_ops.cpp - Structural edits on the pane tree    */
/*                                                         */
/*---------------------------------------------------------*/

#include "layout_ops.h"
#include "invariant.h"

#include <cstdio>

const char* edgeToString(DropEdge edge)
{
    switch (edge) {
        case DropEdge::Left: return "left";
        case DropEdge::Right: return "right";
        case DropEdge::Top: return "top";
        case DropEdge::Bottom: return "bottom";
    }
    return "right";
}

bool parseEdge(const std::string& str, DropEdge& out)
{
    if (str == "left") { out = DropEdge::Left; return true; }
    if (str == "right") { out = DropEdge::Right; return true; }
    if (str == "top") { out = DropEdge::Top; return true; }
    if (str == "bottom") { out = DropEdge::Bottom; return true; }
    return false;
}

SplitDirection directionForEdge(DropEdge edge)
{
    return (edge == DropEdge::Left || edge == DropEdge::Right)
        ? SplitDirection::Horizontal
        : SplitDirection::Vertical;
}

bool edgeInsertsBefore(DropEdge edge)
{
    return edge == DropEdge::Left || edge == DropEdge::Top;
}

static PanePtr wrapPair(PanePtr existing, PanePtr node, DropEdge edge, PaneIdGenerator& ids)
{
    std::vector<PanePtr> children;
    if (edgeInsertsBefore(edge)) {
        children.push_back(std::move(node));
        children.push_back(std::move(existing));
    } else {
        children.push_back(std::move(existing));
        children.push_back(std::move(node));
    }
    return makeContainer(ids.next(), directionForEdge(edge), std::move(children));
}

PanePtr insertBeside(PanePtr root, const std::string& targetId, PanePtr node,
                     DropEdge edge, PaneIdGenerator& ids)
{
    if (!node)
        return root;
    if (!root) {
        reportInvariantViolation("insertBeside", "empty tree, target " + targetId);
        return root;
    }
    if (root->id == targetId)
        return wrapPair(std::move(root), std::move(node), edge, ids);

    ParentSlot slot;
    if (!findParent(root.get(), targetId, slot)) {
        reportInvariantViolation("insertBeside", "unknown target " + targetId);
        return root;
    }

    PaneNode* parent = slot.parent;
    if (parent->direction == directionForEdge(edge)) {
        size_t at = edgeInsertsBefore(edge) ? slot.index : slot.index + 1;
        parent->children.insert(parent->children.begin() + at, std::move(node));
        return root;
    }

    PanePtr target = std::move(parent->children[slot.index]);
    parent->children[slot.index] = wrapPair(std::move(target), std::move(node), edge, ids);
    return root;
}

PanePtr insertAtEdge(PanePtr root, PanePtr node, DropEdge edge, PaneIdGenerator& ids)
{
    if (!node)
        return root;
    if (!root)
        return node;
    return wrapPair(std::move(root), std::move(node), edge, ids);
}

PanePtr moveNode(PanePtr root, const std::string& sourceId, const std::string& targetId,
                 DropEdge edge, PaneIdGenerator& ids)
{
    if (!root || sourceId == targetId)
        return root;
    PaneNode* source = findNode(root.get(), sourceId);
    if (!source || !findNode(root.get(), targetId))
        return root;
    if (findNode(source, targetId)) {
        // Target lives inside the dragged subtree.
        return root;
    }

    // Taking the source out of a two-child parent collapses that parent; when
    // it is the target, the surviving sibling stands in for it.
    std::string anchorId = targetId;
    ParentSlot slot;
    if (findParent(root.get(), sourceId, slot) && slot.parent->id == targetId &&
        slot.parent->children.size() == 2)
        anchorId = slot.parent->children[1 - slot.index]->id;

    PanePtr moved;
    root = removeNode(std::move(root), sourceId, &moved);
    if (!moved)
        return root;
    fprintf(stderr, "[layout] move %s -> %s (%s)\n", sourceId.c_str(), anchorId.c_str(),
            edgeToString(edge));
    return insertBeside(std::move(root), anchorId, std::move(moved), edge, ids);
}

PanePtr moveNodeToEdge(PanePtr root, const std::string& sourceId, DropEdge edge,
                       PaneIdGenerator& ids)
{
    if (!root || root->id == sourceId || !findNode(root.get(), sourceId))
        return root;

    PanePtr moved;
    root = removeNode(std::move(root), sourceId, &moved);
    if (!moved)
        return root;
    fprintf(stderr, "[layout] move %s -> outer %s\n", sourceId.c_str(), edgeToString(edge));
    return insertAtEdge(std::move(root), std::move(moved), edge, ids);
}

SplitResult splitExisting(PanePtr root, const std::string& afterId, PanePtr newLeaf,
                          PaneIdGenerator& ids, SplitDirection direction)
{
    SplitResult result;
    result.newLeaf = newLeaf.get();
    DropEdge edge = direction == SplitDirection::Horizontal ? DropEdge::Right : DropEdge::Bottom;

    if (!root) {
        result.root = std::move(newLeaf);
        return result;
    }
    if (!findNode(root.get(), afterId)) {
        reportInvariantViolation("splitExisting", "unknown pane " + afterId);
        result.newLeaf = nullptr;
        result.root = std::move(root);
        return result;
    }

    ParentSlot slot;
    bool hasParent = findParent(root.get(), afterId, slot);
    result.rewrapped = !hasParent || slot.parent->direction != direction;
    result.root = insertBeside(std::move(root), afterId, std::move(newLeaf), edge, ids);
    return result;
}
