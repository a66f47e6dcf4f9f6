/*---------------------------------------------------------*/
/*                                                         */
/*   pane_tree.cpp - Split layout model for a workspace    */
/*                                                         */
/*---------------------------------------------------------*/

#include "pane_tree.h"
#include "invariant.h"

#include <cstdlib>

const char* directionToString(SplitDirection direction)
{
    switch (direction) {
        case SplitDirection::Horizontal: return "horizontal";
        case SplitDirection::Vertical: return "vertical";
    }
    return "horizontal";
}

bool parseDirection(const std::string& str, SplitDirection& out)
{
    if (str == "horizontal") { out = SplitDirection::Horizontal; return true; }
    if (str == "vertical") { out = SplitDirection::Vertical; return true; }
    return false;
}

PanePtr makeLeaf(const std::string& id, const LogicalCommand& command)
{
    PanePtr node(new PaneNode);
    node->kind = PaneNode::Kind::Leaf;
    node->id = id;
    node->command = command;
    return node;
}

PanePtr makeContainer(const std::string& id, SplitDirection direction,
                      std::vector<PanePtr> children)
{
    PanePtr node(new PaneNode);
    node->kind = PaneNode::Kind::Container;
    node->id = id;
    node->direction = direction;
    node->children = std::move(children);
    return node;
}

PaneNode* findNode(PaneNode* root, const std::string& id)
{
    if (!root)
        return nullptr;
    if (root->id == id)
        return root;
    for (auto& child : root->children) {
        if (PaneNode* hit = findNode(child.get(), id))
            return hit;
    }
    return nullptr;
}

const PaneNode* findNode(const PaneNode* root, const std::string& id)
{
    return findNode(const_cast<PaneNode*>(root), id);
}

bool findParent(PaneNode* root, const std::string& id, ParentSlot& out)
{
    if (!root || root->isLeaf())
        return false;
    for (size_t i = 0; i < root->children.size(); ++i) {
        if (root->children[i]->id == id) {
            out.parent = root;
            out.index = i;
            return true;
        }
        if (findParent(root->children[i].get(), id, out))
            return true;
    }
    return false;
}

template <class Node, class Out>
static void collectLeaves(Node* node, Out& out)
{
    if (!node)
        return;
    if (node->isLeaf()) {
        out.push_back(node);
        return;
    }
    for (const auto& child : node->children)
        collectLeaves(static_cast<Node*>(child.get()), out);
}

std::vector<PaneNode*> allLeaves(PaneNode* root)
{
    std::vector<PaneNode*> out;
    collectLeaves(root, out);
    return out;
}

std::vector<const PaneNode*> allLeaves(const PaneNode* root)
{
    std::vector<const PaneNode*> out;
    collectLeaves(root, out);
    return out;
}

// Restores the two-children rule at `container` after one of its children
// was detached, walking upwards while containers keep degenerating.
static PanePtr collapseUpwards(PanePtr root, PaneNode* container)
{
    if (container->children.size() >= 2)
        return root;

    PanePtr survivor;
    if (!container->children.empty())
        survivor = std::move(container->children.front());

    if (container == root.get())
        return survivor;

    ParentSlot slot;
    if (!findParent(root.get(), container->id, slot)) {
        reportInvariantViolation("removeNode", "container " + container->id + " lost its parent");
        return root;
    }
    PaneNode* grandParent = slot.parent;
    if (survivor) {
        grandParent->children[slot.index] = std::move(survivor);
        return root;
    }
    grandParent->children.erase(grandParent->children.begin() + slot.index);
    return collapseUpwards(std::move(root), grandParent);
}

PanePtr removeNode(PanePtr root, const std::string& id, PanePtr* removed)
{
    if (!root) {
        reportInvariantViolation("removeNode", "empty tree, id " + id);
        return root;
    }
    if (root->id == id) {
        if (removed)
            *removed = std::move(root);
        return nullptr;
    }

    ParentSlot slot;
    if (!findParent(root.get(), id, slot)) {
        reportInvariantViolation("removeNode", "unknown pane " + id);
        return root;
    }

    PaneNode* parent = slot.parent;
    PanePtr detached = std::move(parent->children[slot.index]);
    parent->children.erase(parent->children.begin() + slot.index);
    if (removed)
        *removed = std::move(detached);

    return collapseUpwards(std::move(root), parent);
}

PanePtr cloneTree(const PaneNode* root)
{
    if (!root)
        return nullptr;
    PanePtr copy(new PaneNode);
    copy->kind = root->kind;
    copy->id = root->id;
    copy->command = root->command;
    copy->direction = root->direction;
    for (const auto& child : root->children)
        copy->children.push_back(cloneTree(child.get()));
    return copy;
}

bool isMinimal(const PaneNode* root)
{
    if (!root)
        return true;
    if (root->isLeaf())
        return root->children.empty();
    if (root->children.size() < 2)
        return false;
    for (const auto& child : root->children) {
        if (!isMinimal(child.get()))
            return false;
    }
    return true;
}

std::string describeTree(const PaneNode* root)
{
    if (!root)
        return "-";
    if (root->isLeaf())
        return std::to_string(root->command.id);
    std::string out = root->direction == SplitDirection::Horizontal ? "H[" : "V[";
    for (size_t i = 0; i < root->children.size(); ++i) {
        if (i > 0) out += ",";
        out += describeTree(root->children[i].get());
    }
    out += "]";
    return out;
}

static void collectParents(const PaneNode* node, const std::string& parentId,
                           std::map<std::string, std::string>& out)
{
    if (node->isLeaf()) {
        out[node->id] = parentId;
        return;
    }
    for (const auto& child : node->children)
        collectParents(child.get(), node->id, out);
}

std::map<std::string, std::string> leafParents(const PaneNode* root)
{
    std::map<std::string, std::string> out;
    if (root)
        collectParents(root, "", out);
    return out;
}

std::string PaneIdGenerator::next()
{
    return "pane-" + std::to_string(++counter_);
}

void PaneIdGenerator::observe(const std::string& id)
{
    static const std::string prefix = "pane-";
    if (id.compare(0, prefix.size(), prefix) != 0 || id.size() == prefix.size())
        return;
    const char* digits = id.c_str() + prefix.size();
    char* end = nullptr;
    long n = std::strtol(digits, &end, 10);
    if (end && *end == '\0' && n > counter_)
        counter_ = int(n);
}

void PaneIdGenerator::observeTree(const PaneNode* root)
{
    if (!root)
        return;
    observe(root->id);
    for (const auto& child : root->children)
        observeTree(child.get());
}
