#include "command_registry.h"

#include "workspace/json_value.h"
#include "workspace/layout_ops.h"

#include <cstdlib>

// Implemented in termdeck_app.cpp. projectId < 0 targets the focused workspace.
extern std::string api_add_terminal(TTermDeckApp& app, int projectId, const std::string& command,
                                    const std::string& cwd, const std::string& after);
extern std::string api_move_pane(TTermDeckApp& app, int projectId, const std::string& source,
                                 const std::string& target, DropEdge edge);
extern std::string api_move_pane_outer(TTermDeckApp& app, int projectId, const std::string& source,
                                       DropEdge edge);
extern std::string api_close_pane(TTermDeckApp& app, int projectId, const std::string& id);
extern std::string api_restart_pane(TTermDeckApp& app, int projectId, const std::string& id);
extern std::string api_save_layout(TTermDeckApp& app, int projectId);
extern std::string api_get_layout(TTermDeckApp& app, int projectId);
extern std::string api_open_project(TTermDeckApp& app, int projectId);
extern std::string api_list_projects(TTermDeckApp& app);

const std::vector<CommandCapability>& get_command_capabilities() {
    static const std::vector<CommandCapability> capabilities = {
        {"add_terminal", "Add a terminal pane for a new command", "command cwd after project"},
        {"move_pane", "Move a pane beside another pane or to an outer edge", "source target edge outer project"},
        {"close_pane", "Close a pane and kill its session", "id project"},
        {"restart_pane", "Interrupt and re-run a pane's command", "id project"},
        {"save_layout", "Persist the current layout", "project"},
        {"get_layout", "Return the persisted layout as JSON", "project"},
        {"open_project", "Open a stored project in a new window", "id"},
        {"list_projects", "List stored project ids", ""},
    };
    return capabilities;
}

std::string get_command_capabilities_json() {
    JsonValue root = JsonValue::object();
    root.set("version", JsonValue::string("v1"));
    JsonValue commands = JsonValue::array();
    for (const auto& cap : get_command_capabilities()) {
        JsonValue entry = JsonValue::object();
        entry.set("name", JsonValue::string(cap.name));
        entry.set("description", JsonValue::string(cap.description));
        entry.set("params", JsonValue::string(cap.params));
        commands.push(entry);
    }
    root.set("commands", commands);
    return root.dump();
}

static bool parse_int(const std::string& s, int& out) {
    if (s.empty())
        return false;
    char* end = nullptr;
    long v = std::strtol(s.c_str(), &end, 10);
    if (!end || *end != '\0')
        return false;
    out = int(v);
    return true;
}

static std::string value_of(const std::map<std::string, std::string>& kv, const char* key) {
    auto it = kv.find(key);
    return it == kv.end() ? std::string() : it->second;
}

std::string exec_registry_command(
    TTermDeckApp& app,
    const std::string& name,
    const std::map<std::string, std::string>& kv) {
    int project = -1;
    std::string projectArg = value_of(kv, "project");
    if (!projectArg.empty() && !parse_int(projectArg, project))
        return "err bad project";

    if (name == "add_terminal") {
        return api_add_terminal(app, project, value_of(kv, "command"), value_of(kv, "cwd"),
                                value_of(kv, "after"));
    }
    if (name == "move_pane") {
        std::string source = value_of(kv, "source");
        if (source.empty())
            return "err missing source";
        DropEdge edge;
        std::string outer = value_of(kv, "outer");
        if (!outer.empty()) {
            if (!parseEdge(outer, edge))
                return "err bad edge";
            return api_move_pane_outer(app, project, source, edge);
        }
        std::string target = value_of(kv, "target");
        if (target.empty())
            return "err missing target";
        if (!parseEdge(value_of(kv, "edge"), edge))
            return "err bad edge";
        return api_move_pane(app, project, source, target, edge);
    }
    if (name == "close_pane" || name == "restart_pane") {
        std::string id = value_of(kv, "id");
        if (id.empty())
            return "err missing id";
        return name == "close_pane" ? api_close_pane(app, project, id)
                                    : api_restart_pane(app, project, id);
    }
    if (name == "save_layout") {
        return api_save_layout(app, project);
    }
    if (name == "get_layout") {
        return api_get_layout(app, project);
    }
    if (name == "open_project") {
        int id = 0;
        if (!parse_int(value_of(kv, "id"), id))
            return "err missing id";
        return api_open_project(app, id);
    }
    if (name == "list_projects") {
        return api_list_projects(app);
    }
    return "err unknown command";
}
