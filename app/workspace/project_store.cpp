/*---------------------------------------------------------*/
/*                                                         */
/*   project_store.cpp - Project records on disk           */
/*                                                         */
/*---------------------------------------------------------*/

#include "project_store.h"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iterator>

#include <dirent.h>
#include <sys/stat.h>

LogicalCommand* Project::findCommand(int commandId)
{
    for (auto& command : commands) {
        if (command.id == commandId)
            return &command;
    }
    return nullptr;
}

int Project::nextCommandId() const
{
    int maxId = 0;
    for (const auto& command : commands)
        maxId = std::max(maxId, command.id);
    return maxId + 1;
}

CommandMap Project::commandMap() const
{
    CommandMap map;
    for (const auto& command : commands)
        map[command.id] = command;
    return map;
}

JsonValue projectToJson(const Project& project)
{
    JsonValue json = JsonValue::object();
    json.set("id", JsonValue::number(project.id));
    json.set("name", JsonValue::string(project.name));

    JsonValue commands = JsonValue::array();
    for (const auto& command : project.commands) {
        JsonValue entry = JsonValue::object();
        entry.set("id", JsonValue::number(command.id));
        entry.set("commandText", JsonValue::string(command.commandText));
        entry.set("workingDirectory", JsonValue::string(command.workingDirectory));
        commands.push(entry);
    }
    json.set("commands", commands);

    json.set("layout", project.hasLayout ? layoutToJson(project.layout) : JsonValue());

    if (project.hasWindowState) {
        JsonValue ws = JsonValue::object();
        ws.set("width", JsonValue::number(project.windowState.width));
        ws.set("height", JsonValue::number(project.windowState.height));
        ws.set("x", JsonValue::number(project.windowState.x));
        ws.set("y", JsonValue::number(project.windowState.y));
        json.set("windowState", ws);
    } else {
        json.set("windowState", JsonValue());
    }
    return json;
}

bool projectFromJson(const JsonValue& json, Project& out, std::string* error)
{
    if (!json.isObject() || !json.get("id").isInt()) {
        if (error) *error = "project record has no valid id";
        return false;
    }
    out = Project();
    out.id = json.get("id").asInt();
    out.name = json.get("name").asString();

    const JsonValue& commands = json.get("commands");
    for (size_t i = 0; i < commands.size(); ++i) {
        const JsonValue& entry = commands.at(i);
        if (!entry.get("id").isInt()) {
            fprintf(stderr, "[store] project %d: skipping command without a valid id\n", out.id);
            continue;
        }
        LogicalCommand command;
        command.id = entry.get("id").asInt();
        command.commandText = entry.get("commandText").asString();
        command.workingDirectory = entry.get("workingDirectory").asString();
        if (out.findCommand(command.id)) {
            fprintf(stderr, "[store] project %d: duplicate command id %d\n", out.id, command.id);
            continue;
        }
        out.commands.push_back(command);
    }

    const JsonValue& layout = json.get("layout");
    if (!layout.isNull()) {
        std::string layoutError;
        if (layoutFromJson(layout, out.layout, &layoutError)) {
            out.hasLayout = true;
        } else {
            // Structural damage is recovered by falling back to the default layout.
            fprintf(stderr, "[store] project %d: ignoring layout: %s\n", out.id, layoutError.c_str());
        }
    }

    const JsonValue& ws = json.get("windowState");
    if (ws.isObject() && ws.get("width").isInt() && ws.get("height").isInt() &&
        ws.get("x").isInt() && ws.get("y").isInt()) {
        out.hasWindowState = true;
        out.windowState.width = ws.get("width").asInt();
        out.windowState.height = ws.get("height").asInt();
        out.windowState.x = ws.get("x").asInt();
        out.windowState.y = ws.get("y").asInt();
    }
    return true;
}

ProjectStore::ProjectStore(const std::string& directory)
    : directory_(directory.empty() ? std::string(".") : directory)
{
}

std::string ProjectStore::pathFor(int projectId) const
{
    return directory_ + "/project_" + std::to_string(projectId) + ".json";
}

bool ProjectStore::ensureDirectory() const
{
    if (mkdir(directory_.c_str(), 0755) == 0 || errno == EEXIST)
        return true;
    fprintf(stderr, "[store] cannot create %s: %s\n", directory_.c_str(), std::strerror(errno));
    return false;
}

bool ProjectStore::load(int projectId, Project& out) const
{
    std::string path = pathFor(projectId);
    std::ifstream in(path);
    if (!in)
        return false;
    std::string data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

    JsonValue json;
    std::string error;
    if (!JsonValue::parse(data, json, &error)) {
        fprintf(stderr, "[store] %s is not valid JSON: %s\n", path.c_str(), error.c_str());
        return false;
    }
    if (!projectFromJson(json, out, &error)) {
        fprintf(stderr, "[store] %s: %s\n", path.c_str(), error.c_str());
        return false;
    }
    if (out.id != projectId) {
        fprintf(stderr, "[store] %s holds project %d\n", path.c_str(), out.id);
        return false;
    }
    return true;
}

bool ProjectStore::save(const Project& project)
{
    if (!ensureDirectory())
        return false;

    std::string path = pathFor(project.id);
    std::string tmpPath = path + ".tmp";
    std::ofstream out(tmpPath.c_str(), std::ios::out | std::ios::trunc);
    if (!out) {
        fprintf(stderr, "[store] cannot open %s for writing\n", tmpPath.c_str());
        return false;
    }
    out << projectToJson(project).dump(2) << "\n";
    out.close();
    if (!out.good()) {
        fprintf(stderr, "[store] error writing %s\n", tmpPath.c_str());
        std::remove(tmpPath.c_str());
        return false;
    }
    if (std::rename(tmpPath.c_str(), path.c_str()) != 0) {
        fprintf(stderr, "[store] rename %s failed: %s\n", tmpPath.c_str(), std::strerror(errno));
        std::remove(tmpPath.c_str());
        return false;
    }
    fprintf(stderr, "[store] saved project %d to %s\n", project.id, path.c_str());
    if (notifier_)
        notifier_->projectChanged(project.id);
    return true;
}

bool ProjectStore::remove(int projectId)
{
    std::string path = pathFor(projectId);
    if (std::remove(path.c_str()) != 0)
        return false;
    if (notifier_)
        notifier_->projectChanged(projectId);
    return true;
}

std::vector<int> ProjectStore::list() const
{
    std::vector<int> ids;
    DIR* dir = opendir(directory_.c_str());
    if (!dir)
        return ids;
    static const char prefix[] = "project_";
    static const char suffix[] = ".json";
    while (struct dirent* entry = readdir(dir)) {
        std::string name = entry->d_name;
        if (name.size() <= sizeof(prefix) - 1 + sizeof(suffix) - 1)
            continue;
        if (name.compare(0, sizeof(prefix) - 1, prefix) != 0)
            continue;
        if (name.compare(name.size() - (sizeof(suffix) - 1), std::string::npos, suffix) != 0)
            continue;
        std::string digits = name.substr(sizeof(prefix) - 1,
                                         name.size() - (sizeof(prefix) - 1) - (sizeof(suffix) - 1));
        char* end = nullptr;
        long id = std::strtol(digits.c_str(), &end, 10);
        if (end && *end == '\0')
            ids.push_back(int(id));
    }
    closedir(dir);
    std::sort(ids.begin(), ids.end());
    return ids;
}
