/*---------------------------------------------------------*/
/*   project_store_test.cpp - ctest for project records    */
/*---------------------------------------------------------*/

#include "project_store.h"
#include "test_support.h"

#include <cstdio>
#include <cstdlib>
#include <fstream>

#include <unistd.h>

class CountingNotifier : public ProjectChangeNotifier {
public:
    std::vector<int> changed;
    void projectChanged(int projectId) override { changed.push_back(projectId); }
};

static bool fileExists(const std::string& path) {
    return access(path.c_str(), F_OK) == 0;
}

static Project sampleProject(int id) {
    Project p;
    p.id = id;
    p.name = "proj " + std::to_string(id);
    p.commands.push_back(cmd(1, "npm run dev", "/srv/app"));
    p.commands.push_back(cmd(2, "npm test", "/srv/app"));
    return p;
}

int main() {
    std::cout << "=== Project Store Tests ===\n\n";

    char dirTemplate[] = "/tmp/termdeck_store_XXXXXX";
    if (!mkdtemp(dirTemplate)) {
        std::cerr << "cannot create temp dir\n";
        return 1;
    }
    std::string dir = std::string(dirTemplate) + "/projects";

    std::cout << "[project helpers]\n";
    {
        Project p = sampleProject(1);
        check("findCommand hit", p.findCommand(2) && p.findCommand(2)->commandText == "npm test");
        check("findCommand miss", p.findCommand(9) == nullptr);
        check("nextCommandId after max", p.nextCommandId() == 3);
        check("commandMap keyed by id", p.commandMap().size() == 2 && p.commandMap()[1].commandText == "npm run dev");
        check("first id in an empty project", Project().nextCommandId() == 1);
    }

    std::cout << "\n[save / load]\n";
    ProjectStore store(dir);
    CountingNotifier notifier;
    store.setNotifier(&notifier);
    {
        Project p = sampleProject(4);
        PaneIdGenerator ids;
        PanePtr root = createInitialLayout(p.commands, ids);
        p.layout = serializeLayout(*root);
        p.hasLayout = true;
        p.hasWindowState = true;
        p.windowState.width = 100;
        p.windowState.height = 30;
        p.windowState.x = 2;
        p.windowState.y = 1;

        check("save creates the directory", store.save(p));
        check("record written", fileExists(store.pathFor(4)));
        check("no temp file left behind", !fileExists(store.pathFor(4) + ".tmp"));
        check("save notifies", notifier.changed.size() == 1 && notifier.changed[0] == 4);

        Project back;
        check("load succeeds", store.load(4, back));
        check("name", back.name == "proj 4");
        check("commands", back.commands.size() == 2 && back.commands[1].workingDirectory == "/srv/app");
        check("layout present", back.hasLayout && back.layout.children.size() == 2);
        check("window state", back.hasWindowState && back.windowState.width == 100 &&
                                  back.windowState.x == 2);

        Project missing;
        check("missing record", !store.load(99, missing));
    }
    {
        Project p = sampleProject(5);
        store.save(p);
        Project back;
        store.load(5, back);
        check("no layout stays absent", !back.hasLayout && !back.hasWindowState);
        check("null layout serialized explicitly", projectToJson(p).has("layout") &&
                                                        projectToJson(p).get("layout").isNull());
    }
    {
        Project p = sampleProject(4);
        p.name = "renamed";
        store.save(p);
        Project back;
        store.load(4, back);
        check("last writer wins", back.name == "renamed" && !back.hasLayout);
    }

    std::cout << "\n[list / remove]\n";
    {
        std::ofstream(dir + "/notes.txt") << "ignore me";
        std::ofstream(dir + "/project_x.json") << "{}";
        std::vector<int> ids = store.list();
        check("list finds records only", ids.size() == 2 && ids[0] == 4 && ids[1] == 5);

        size_t before = notifier.changed.size();
        check("remove existing", store.remove(5));
        check("remove notifies", notifier.changed.size() == before + 1);
        check("remove missing fails", !store.remove(5));
        check("list after remove", store.list().size() == 1);
    }

    std::cout << "\n[damaged records]\n";
    {
        std::ofstream(store.pathFor(7)) << "{ not json";
        Project p;
        check("invalid JSON rejected", !store.load(7, p));

        std::ofstream(store.pathFor(8)) << "{\"id\": 9, \"name\": \"wrong\", \"commands\": []}";
        check("record with the wrong id rejected", !store.load(8, p));

        std::ofstream(store.pathFor(10))
            << "{\"id\": 10, \"name\": \"x\", \"commands\": [{\"id\": 1, \"commandText\": \"a\"},"
               " {\"commandText\": \"no id\"}, {\"id\": 1, \"commandText\": \"dup\"}],"
               " \"layout\": {\"type\": \"banana\"}, \"windowState\": null}";
        check("damaged parts are skipped", store.load(10, p));
        check("bad and duplicate commands dropped", p.commands.size() == 1 && p.commands[0].commandText == "a");
        check("bad layout ignored", !p.hasLayout);

        std::ofstream(store.pathFor(11))
            << "{\"id\": 11, \"name\": \"big\", \"commands\": [{\"id\": 1, \"commandText\": \"a\"},"
               " {\"id\": 4294967297, \"commandText\": \"wraps\"}],"
               " \"windowState\": {\"width\": 1e12, \"height\": 30, \"x\": 0, \"y\": 0}}";
        check("record with huge values loads", store.load(11, p));
        check("out-of-range command id dropped", p.commands.size() == 1 && p.commands[0].commandText == "a");
        check("out-of-range window state ignored", !p.hasWindowState);

        std::ofstream(store.pathFor(12)) << "{\"id\": 4294967308, \"name\": \"x\", \"commands\": []}";
        check("out-of-range project id rejected", !store.load(12, p));
    }

    for (int id : store.list())
        std::remove(store.pathFor(id).c_str());
    std::remove((dir + "/notes.txt").c_str());
    std::remove((dir + "/project_x.json").c_str());
    rmdir(dir.c_str());
    rmdir(dirTemplate);

    std::cout << "\n=== Results: " << (failures == 0 ? "ALL PASSED" : "FAILURES") << " ===\n";
    return failures;
}
