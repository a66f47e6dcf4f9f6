/*---------------------------------------------------------*/
/*                                                         */
/*   project_store.h - Project records on disk             */
/*                                                         */
/*   One JSON file per project, replaced atomically.       */
/*   Last writer wins; readers reload when notified.       */
/*                                                         */
/*---------------------------------------------------------*/

#pragma once

#include "json_value.h"
#include "layout_codec.h"
#include "pane_tree.h"

#include <string>
#include <vector>

struct WindowState {
    int width = 0;
    int height = 0;
    int x = 0;
    int y = 0;
};

struct Project {
    int id = 0;
    std::string name;
    std::vector<LogicalCommand> commands;
    bool hasLayout = false;
    PersistedLayout layout;
    bool hasWindowState = false;
    WindowState windowState;

    LogicalCommand* findCommand(int commandId);
    int nextCommandId() const;
    CommandMap commandMap() const;
};

JsonValue projectToJson(const Project& project);
bool projectFromJson(const JsonValue& json, Project& out, std::string* error = nullptr);

class ProjectChangeNotifier {
public:
    virtual ~ProjectChangeNotifier() = default;
    virtual void projectChanged(int projectId) = 0;
};

class ProjectStore {
public:
    explicit ProjectStore(const std::string& directory);

    void setNotifier(ProjectChangeNotifier* notifier) { notifier_ = notifier; }

    // False when the record is missing or unreadable (logged).
    bool load(int projectId, Project& out) const;
    // Writes <dir>/project_<id>.json via a temp file and rename, then notifies.
    bool save(const Project& project);
    bool remove(int projectId);
    std::vector<int> list() const;

    std::string pathFor(int projectId) const;
    const std::string& directory() const { return directory_; }

private:
    std::string directory_;
    ProjectChangeNotifier* notifier_ = nullptr;

    bool ensureDirectory() const;
};
