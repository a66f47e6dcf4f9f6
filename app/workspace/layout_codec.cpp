/*---------------------------------------------------------*/
/*                                                         */
/*   layout_codec.cpp - Persisted form of the pane tree    */
/*                                                         */
/*---------------------------------------------------------*/

#include "layout_codec.h"
#include "layout_ops.h"

#include <cstdio>
#include <set>

PersistedLayout serializeLayout(const PaneNode& root)
{
    PersistedLayout out;
    out.id = root.id;
    if (root.isLeaf()) {
        out.type = PersistedLayout::Type::Terminal;
        out.commandId = root.command.id;
        return out;
    }
    out.type = PersistedLayout::Type::Container;
    out.direction = root.direction;
    for (const auto& child : root.children)
        out.children.push_back(serializeLayout(*child));
    return out;
}

namespace {

struct RestoreContext {
    const CommandMap& commands;
    PaneIdGenerator* ids;
    std::set<std::string> seenPanes;
    std::set<int> seenCommands;
};

std::string claimId(const std::string& id, RestoreContext& ctx)
{
    if (!id.empty() && ctx.seenPanes.insert(id).second)
        return id;
    if (!ctx.ids)
        return id;
    std::string fresh = ctx.ids->next();
    fprintf(stderr, "[layout] pane id '%s' reassigned to %s\n", id.c_str(), fresh.c_str());
    ctx.seenPanes.insert(fresh);
    return fresh;
}

PanePtr restoreNode(const PersistedLayout& layout, RestoreContext& ctx)
{
    if (layout.type == PersistedLayout::Type::Terminal) {
        auto it = ctx.commands.find(layout.commandId);
        if (it == ctx.commands.end()) {
            fprintf(stderr, "[layout] dropping pane %s: command %d no longer exists\n",
                    layout.id.c_str(), layout.commandId);
            return nullptr;
        }
        if (!ctx.seenCommands.insert(layout.commandId).second) {
            fprintf(stderr, "[layout] dropping pane %s: command %d already has a pane\n",
                    layout.id.c_str(), layout.commandId);
            return nullptr;
        }
        return makeLeaf(claimId(layout.id, ctx), it->second);
    }

    std::vector<PanePtr> children;
    for (const auto& child : layout.children) {
        PanePtr node = restoreNode(child, ctx);
        if (node)
            children.push_back(std::move(node));
    }
    if (children.empty())
        return nullptr;
    if (children.size() == 1)
        return std::move(children.front());
    return makeContainer(claimId(layout.id, ctx), layout.direction, std::move(children));
}

} // namespace

PanePtr deserializeLayout(const PersistedLayout& layout, const CommandMap& commandsById,
                          PaneIdGenerator* ids)
{
    RestoreContext ctx{commandsById, ids, {}, {}};
    return restoreNode(layout, ctx);
}

PanePtr createInitialLayout(const std::vector<LogicalCommand>& commands, PaneIdGenerator& ids)
{
    if (commands.empty())
        return nullptr;
    if (commands.size() == 1)
        return makeLeaf(ids.next(), commands.front());

    std::vector<PanePtr> children;
    for (const auto& command : commands)
        children.push_back(makeLeaf(ids.next(), command));
    return makeContainer(ids.next(), SplitDirection::Horizontal, std::move(children));
}

PanePtr restoreLayout(const PersistedLayout* layout, const std::vector<LogicalCommand>& commands,
                      PaneIdGenerator& ids)
{
    CommandMap byId;
    for (const auto& command : commands)
        byId[command.id] = command;

    PanePtr root;
    if (layout) {
        // Reserve every persisted id before any fresh one is handed out.
        std::vector<const PersistedLayout*> stack{layout};
        while (!stack.empty()) {
            const PersistedLayout* node = stack.back();
            stack.pop_back();
            ids.observe(node->id);
            for (const auto& child : node->children)
                stack.push_back(&child);
        }
        root = deserializeLayout(*layout, byId, &ids);
    }
    if (!root) {
        if (layout)
            fprintf(stderr, "[layout] saved layout unusable, building default\n");
        return createInitialLayout(commands, ids);
    }

    std::set<int> placed;
    for (const PaneNode* leaf : allLeaves(static_cast<const PaneNode*>(root.get())))
        placed.insert(leaf->command.id);
    for (const auto& command : commands) {
        if (placed.count(command.id))
            continue;
        fprintf(stderr, "[layout] command %d missing from layout, appending\n", command.id);
        root = insertAtEdge(std::move(root), makeLeaf(ids.next(), command), DropEdge::Right, ids);
    }
    return root;
}

JsonValue layoutToJson(const PersistedLayout& layout)
{
    JsonValue json = JsonValue::object();
    json.set("id", JsonValue::string(layout.id));
    if (layout.type == PersistedLayout::Type::Terminal) {
        json.set("type", JsonValue::string("terminal"));
        json.set("commandId", JsonValue::number(layout.commandId));
        return json;
    }
    json.set("type", JsonValue::string("container"));
    json.set("direction", JsonValue::string(directionToString(layout.direction)));
    JsonValue children = JsonValue::array();
    for (const auto& child : layout.children)
        children.push(layoutToJson(child));
    json.set("children", children);
    return json;
}

bool layoutFromJson(const JsonValue& json, PersistedLayout& out, std::string* error)
{
    if (!json.isObject()) {
        if (error) *error = "layout node is not an object";
        return false;
    }
    out = PersistedLayout();
    out.id = json.get("id").asString();
    const std::string& type = json.get("type").asString();

    if (type == "terminal") {
        if (!json.get("commandId").isInt()) {
            if (error) *error = "terminal " + out.id + " has no valid commandId";
            return false;
        }
        out.type = PersistedLayout::Type::Terminal;
        out.commandId = json.get("commandId").asInt();
        return true;
    }
    if (type != "container") {
        if (error) *error = "unknown node type '" + type + "'";
        return false;
    }

    out.type = PersistedLayout::Type::Container;
    if (!parseDirection(json.get("direction").asString(), out.direction)) {
        if (error) *error = "container " + out.id + " has no valid direction";
        return false;
    }
    const JsonValue& children = json.get("children");
    for (size_t i = 0; i < children.size(); ++i) {
        PersistedLayout child;
        std::string childError;
        if (!layoutFromJson(children.at(i), child, &childError)) {
            // A bad child is skipped; deserializeLayout collapses what is left.
            fprintf(stderr, "[layout] skipping malformed node: %s\n", childError.c_str());
            continue;
        }
        out.children.push_back(std::move(child));
    }
    return true;
}
