/*---------------------------------------------------------*/
/*                                                         */
/*   pane_tree.h - Split layout model for a workspace      */
/*                                                         */
/*   Leaves hold one terminal each; containers hold two or */
/*   more children split along one axis.                   */
/*                                                         */
/*---------------------------------------------------------*/

#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

enum class SplitDirection {
    Horizontal,   // children laid out left to right
    Vertical      // children laid out top to bottom
};

const char* directionToString(SplitDirection direction);
bool parseDirection(const std::string& str, SplitDirection& out);

// A user-defined unit of work shown in one pane.
struct LogicalCommand {
    int id = 0;
    std::string commandText;
    std::string workingDirectory;
};

using CommandMap = std::map<int, LogicalCommand>;

struct PaneNode;
using PanePtr = std::unique_ptr<PaneNode>;

struct PaneNode {
    enum class Kind { Leaf, Container };

    Kind kind = Kind::Leaf;
    std::string id;

    // Leaf
    LogicalCommand command;

    // Container
    SplitDirection direction = SplitDirection::Horizontal;
    std::vector<PanePtr> children;

    bool isLeaf() const { return kind == Kind::Leaf; }
    bool isContainer() const { return kind == Kind::Container; }
};

PanePtr makeLeaf(const std::string& id, const LogicalCommand& command);
PanePtr makeContainer(const std::string& id, SplitDirection direction,
                      std::vector<PanePtr> children);

// Depth-first, first match wins.
PaneNode* findNode(PaneNode* root, const std::string& id);
const PaneNode* findNode(const PaneNode* root, const std::string& id);

struct ParentSlot {
    PaneNode* parent = nullptr;
    size_t index = 0;
};

// Returns false when `id` is the root or is not in the tree.
bool findParent(PaneNode* root, const std::string& id, ParentSlot& out);

// Leaves in visual order: left to right, top to bottom.
std::vector<PaneNode*> allLeaves(PaneNode* root);
std::vector<const PaneNode*> allLeaves(const PaneNode* root);

// Removes `id` and collapses any container left with a single child into that
// child; a container left empty is removed from its own parent in turn.
// Returns the new root, or null when the tree became empty. The detached
// subtree is handed back through `removed` when it is non-null.
PanePtr removeNode(PanePtr root, const std::string& id, PanePtr* removed = nullptr);

PanePtr cloneTree(const PaneNode* root);

// True when every container has at least two children.
bool isMinimal(const PaneNode* root);

// Compact shape using command ids, e.g. "H[1,V[1,3],2]".
std::string describeTree(const PaneNode* root);

// Leaf pane id -> id of the enclosing container ("" for a root leaf).
std::map<std::string, std::string> leafParents(const PaneNode* root);

// Issues "pane-<N>" ids that never collide with ids already in a layout.
class PaneIdGenerator {
public:
    std::string next();
    void observe(const std::string& id);
    void observeTree(const PaneNode* root);

private:
    int counter_ = 0;
};
