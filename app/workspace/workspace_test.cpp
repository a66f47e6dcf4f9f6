/*---------------------------------------------------------*/
/*   workspace_test.cpp - ctest for TerminalWorkspace      */
/*---------------------------------------------------------*/

#include "layout_codec.h"
#include "project_store.h"
#include "terminal_workspace.h"
#include "test_support.h"

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <functional>
#include <stdexcept>

#include <unistd.h>

static std::string makeTempDir() {
    char dirTemplate[] = "/tmp/termdeck_ws_XXXXXX";
    if (!mkdtemp(dirTemplate))
        return "/tmp";
    return dirTemplate;
}

static Project project(int id, std::initializer_list<const char*> commandTexts) {
    Project p;
    p.id = id;
    p.name = "p" + std::to_string(id);
    int next = 1;
    for (const char* text : commandTexts)
        p.commands.push_back(cmd(next++, text, "/tmp"));
    return p;
}

// Calls a hook from inside the first layout pass after it is armed.
class HookedView : public FakeView {
public:
    std::function<void()> hook;
    void applyLayout(const PaneNode* root, const ReconcilePlan& plan) override {
        FakeView::applyLayout(root, plan);
        if (hook) {
            std::function<void()> h = std::move(hook);
            hook = nullptr;
            h();
        }
    }
};

class GridHits : public PaneHitTester {
public:
    std::map<std::string, CellRect> panes;
    bool paneAt(int x, int y, std::string& paneId, CellRect& bounds) const override {
        for (const auto& entry : panes) {
            if (entry.second.contains(x, y)) {
                paneId = entry.first;
                bounds = entry.second;
                return true;
            }
        }
        return false;
    }
};

struct Rig {
    std::string dir;
    FakeGateway gateway;
    FakeWidgetFactory widgets;
    HookedView view;
    ProjectStore store;
    std::unique_ptr<TerminalWorkspace> ws;

    explicit Rig(const WorkspaceSettings& settings = WorkspaceSettings())
        : dir(makeTempDir()), store(dir) {
        ws.reset(new TerminalWorkspace(gateway, widgets, store, settings));
        ws->setView(&view);
        gateway.setOutputHandler([this](const std::string& sid, const std::string& bytes) {
            ws->routeOutput(sid, bytes);
        });
        gateway.setExitHandler([this](const std::string& sid, int status) {
            ws->routeExit(sid, status);
        });
    }
    ~Rig() {
        ws.reset();
        for (int id : store.list())
            std::remove(store.pathFor(id).c_str());
        rmdir(dir.c_str());
    }

    std::string shape() const { return describeTree(ws->root()); }
    std::string sessionOf(const std::string& paneId) {
        LeafBinding* b = ws->registry().binding(paneId);
        return b ? b->session.sessionId : std::string();
    }
};

static bool contains(const std::vector<std::string>& v, const std::string& s) {
    return std::find(v.begin(), v.end(), s) != v.end();
}

int main() {
    std::cout << "=== Terminal Workspace Tests ===\n\n";

    std::cout << "[open]\n";
    {
        Rig rig;
        rig.ws->open(project(1, {"npm run dev", "npm test"}));
        check("default layout", rig.shape() == "H[1,2]");
        check("one layout pass", rig.view.applyCount == 1);
        check("a session per pane", rig.gateway.created.size() == 2);
        check("commands auto-run", rig.gateway.written["s1"] == "npm run dev\n" &&
                                       rig.gateway.written["s2"] == "npm test\n");
        check("widgets bound", rig.widgets.alive == 2);
        check("open does not write the record", rig.store.list().empty());
    }
    {
        Rig rig;
        check("opening a missing record fails", !rig.ws->openFromStore(7));
        Project saved = project(7, {"make"});
        rig.store.save(saved);
        check("opening a stored record", rig.ws->openFromStore(7) && rig.ws->projectId() == 7);
    }

    std::cout << "\n[addTerminal]\n";
    {
        Rig rig;
        rig.ws->open(project(1, {"a", "b"}));
        std::string added = rig.ws->addTerminal("c", "/work");
        check("new pane id returned", added == "pane-4");
        check("appended to the row", rig.shape() == "H[1,2,3]");
        check("new leaf bound", contains(rig.view.lastPlan.bind, added));
        check("existing leaves kept", contains(rig.view.lastPlan.keep, "pane-1") &&
                                          contains(rig.view.lastPlan.keep, "pane-2"));
        check("kept leaves keep their widgets", rig.widgets.createdCount == 3);
        check("session in the given directory", rig.gateway.created.size() == 3 &&
                                                    rig.gateway.created[2].cwd == "/work");
        check("command runs", rig.gateway.written["s3"] == "c\n");

        Project stored;
        check("record persisted", rig.store.load(1, stored));
        check("stored commands", stored.commands.size() == 3 && stored.commands[2].commandText == "c");
        check("stored layout", stored.hasLayout && stored.layout.children.size() == 3);
    }
    {
        Rig rig;
        rig.ws->open(project(1, {"a"}));
        std::string added = rig.ws->addTerminal("b", "");
        check("single pane wrapped", rig.shape() == "H[1,2]");
        check("wrapped pane rebound", contains(rig.view.lastPlan.rebind, "pane-1"));
        check("wrapped pane keeps its session", rig.sessionOf("pane-1") == "s1" &&
                                                    rig.gateway.created.size() == 2);
        check("no widget leaked", rig.widgets.alive == 2);

        std::string third = rig.ws->addTerminal("c", "", "pane-1");
        check("insert after a chosen pane", rig.shape() == "H[1,3,2]");
        (void)added;
        (void)third;
    }
    {
        Rig rig;
        rig.ws->open(project(1, {}));
        check("empty project has no tree", rig.ws->root() == nullptr);
        std::string added = rig.ws->addTerminal("", "");
        check("first pane becomes the root", rig.ws->root() && rig.ws->root()->id == added);
        check("blank pane still gets a shell", rig.gateway.created.size() == 1);
    }

    std::cout << "\n[dropPane]\n";
    {
        Rig rig;
        rig.ws->open(project(1, {"a", "b", "c"}));
        rig.gateway.output("s3", "hello from c");
        int createdBefore = rig.widgets.createdCount;

        DropIntent intent;
        intent.kind = DropIntentKind::Pane;
        intent.targetId = "pane-1";
        intent.edge = DropEdge::Bottom;
        check("drop accepted", rig.ws->dropPane("pane-3", intent));
        check("dropped below the target", rig.shape() == "H[V[1,3],2]");
        check("moved pane rebound", contains(rig.view.lastPlan.rebind, "pane-3"));
        check("re-parented target rebound", contains(rig.view.lastPlan.rebind, "pane-1"));
        check("untouched pane kept", contains(rig.view.lastPlan.keep, "pane-2"));
        check("only rebound panes get new widgets", rig.widgets.createdCount == createdBefore + 2);
        check("scrollback survives the move",
              rig.widgets.widgetFor("pane-3")->screen == "hello from c");
        check("no session restarted", rig.gateway.created.size() == 3 && rig.gateway.killed.empty());
        check("widget count stable", rig.widgets.alive == 3);

        Project stored;
        rig.store.load(1, stored);
        PanePtr reloaded = deserializeLayout(stored.layout, stored.commandMap());
        check("move persisted", describeTree(reloaded.get()) == "H[V[1,3],2]");

        DropIntent self = intent;
        self.targetId = "pane-3";
        check("drop on itself rejected", !rig.ws->dropPane("pane-3", self));
        self.targetId = "pane-404";
        check("drop on a missing pane rejected", !rig.ws->dropPane("pane-3", self));
        check("empty intent rejected", !rig.ws->dropPane("pane-3", DropIntent()));

        DropIntent outer;
        outer.kind = DropIntentKind::OuterEdge;
        outer.edge = DropEdge::Top;
        check("outer edge drop", rig.ws->dropPane("pane-2", outer));
        check("outer edge wraps the layout", rig.shape() == "V[2,V[1,3]]");
        check("sessions still untouched", rig.gateway.created.size() == 3);
    }
    {
        Rig rig;
        rig.ws->open(project(1, {"a", "b", "c"}));
        DropIntent below;
        below.kind = DropIntentKind::Pane;
        below.targetId = "pane-2";
        below.edge = DropEdge::Bottom;
        rig.ws->dropPane("pane-3", below);
        check("column built", rig.shape() == "H[1,V[2,3]]");

        DropIntent onColumn;
        onColumn.kind = DropIntentKind::Pane;
        onColumn.targetId = leafParents(rig.ws->root())["pane-2"];
        onColumn.edge = DropEdge::Right;
        check("drop on a container refused", !rig.ws->dropPane("pane-2", onColumn));
        check("layout untouched", rig.shape() == "H[1,V[2,3]]");
        check("every session still has a pane", rig.ws->registry().sessionCount() == 3 &&
                                                    allLeaves(rig.ws->root()).size() == 3);
    }
    {
        Rig rig;
        rig.ws->open(project(1, {"a", "b"}));
        GridHits hits;
        CellRect left, right, area;
        left.w = 40; left.h = 24;
        right.x = 40; right.w = 40; right.h = 24;
        area.w = 80; area.h = 24;
        hits.panes["pane-1"] = left;
        hits.panes["pane-2"] = right;

        check("drag starts on a leaf", rig.ws->beginDrag("pane-1"));
        check("container drag refused", !rig.ws->beginDrag("pane-3"));
        rig.ws->beginDrag("pane-1");
        rig.ws->updateDrag(area, 60, 20, hits);
        check("release applies the drop", rig.ws->releaseDrag());
        check("pane dropped below its neighbour", rig.shape() == "V[2,1]");

        rig.ws->beginDrag("pane-1");
        rig.ws->updateDrag(area, 20, 20, hits);
        rig.ws->cancelDrag();
        check("cancelled drag changes nothing", !rig.ws->releaseDrag() && rig.shape() == "V[2,1]");
    }

    std::cout << "\n[closePane]\n";
    {
        Rig rig;
        rig.ws->open(project(1, {"a", "b", "c"}));
        check("close accepted", rig.ws->closePane("pane-2"));
        check("pane removed", rig.shape() == "H[1,3]");
        check("session killed", rig.gateway.killed.size() == 1 && rig.gateway.killed[0] == "s2");
        check("command removed", rig.ws->project().commands.size() == 2);
        check("widget disposed", rig.widgets.alive == 2);
        check("others kept", rig.view.lastPlan.keep.size() == 2 && rig.view.lastPlan.rebind.empty());

        Project stored;
        rig.store.load(1, stored);
        check("removal persisted", stored.commands.size() == 2 && stored.layout.children.size() == 2);

        rig.gateway.output("s2", "late");
        check("late output of a closed pane is dropped", rig.ws->registry().ownerOfSession("s2") == nullptr);

        check("closing a container refused", !rig.ws->closePane("pane-4"));
        check("closing an unknown pane refused", !rig.ws->closePane("pane-404"));

        rig.ws->closePane("pane-1");
        check("last container collapses", rig.shape() == "3" && rig.ws->root()->id == "pane-3");
        rig.ws->closePane("pane-3");
        check("closing everything leaves an empty workspace", rig.ws->root() == nullptr);
        Project empty;
        rig.store.load(1, empty);
        check("empty layout persisted", !empty.hasLayout && empty.commands.empty());
    }

    std::cout << "\n[restartPane]\n";
    {
        Rig rig;
        rig.ws->open(project(1, {"watch"}));
        rig.gateway.written["s1"].clear();
        check("restart accepted", rig.ws->restartPane("pane-1"));
        check("interrupt sent", rig.gateway.written["s1"] == "\x03");
        check("restart of unknown pane refused", !rig.ws->restartPane("pane-9"));
    }

    std::cout << "\n[command capture]\n";
    {
        Rig rig;
        std::string capturedPane;
        rig.ws->setCommandCapturedHandler([&](const PaneNode& leaf) { capturedPane = leaf.id; });
        rig.ws->open(project(1, {""}));
        rig.widgets.widgetFor("pane-1")->type("htop\r");
        check("project command updated", rig.ws->project().commands[0].commandText == "htop");
        check("handler told", capturedPane == "pane-1");
        Project stored;
        rig.store.load(1, stored);
        check("captured command persisted", stored.commands.size() == 1 &&
                                                stored.commands[0].commandText == "htop");
    }

    std::cout << "\n[reloadFromStore]\n";
    {
        Rig rig;
        rig.ws->open(project(1, {"a", "b", "c"}));
        rig.ws->persist();
        int passes = rig.view.applyCount;
        check("own write is not reapplied", rig.ws->reloadFromStore() && rig.view.applyCount == passes);

        ProjectStore other(rig.dir);
        Project ext;
        other.load(1, ext);
        ext.commands.pop_back();
        PersistedLayout col;
        col.type = PersistedLayout::Type::Container;
        col.id = "pane-4";
        col.direction = SplitDirection::Vertical;
        PersistedLayout t2; t2.id = "pane-2"; t2.commandId = 2;
        PersistedLayout t1; t1.id = "pane-1"; t1.commandId = 1;
        PersistedLayout t3; t3.id = "pane-3"; t3.commandId = 3;
        col.children = {t2, t1, t3};
        ext.layout = col;
        ext.hasLayout = true;
        other.save(ext);

        check("external change applied", rig.ws->reloadFromStore());
        check("new shape", rig.shape() == "V[2,1]");
        check("removed command's session killed", rig.gateway.killed.size() == 1 &&
                                                      rig.gateway.killed[0] == "s3");
        check("remaining sessions survive", rig.sessionOf("pane-1") == "s1" && rig.sessionOf("pane-2") == "s2" &&
                                                rig.gateway.created.size() == 3);
        check("widgets follow the tree", rig.widgets.alive == 2);
        check("project replaced", rig.ws->project().commands.size() == 2);

        passes = rig.view.applyCount;
        check("unchanged record is a no-op", rig.ws->reloadFromStore() && rig.view.applyCount == passes);
    }
    {
        Rig rig;
        rig.ws->open(project(1, {"a", "b"}));
        rig.gateway.output("s1", "before");
        ProjectStore other(rig.dir);
        Project ext = rig.ws->project();
        PersistedLayout row;
        row.type = PersistedLayout::Type::Container;
        row.id = "pane-3";
        PersistedLayout t1; t1.id = "pane-9"; t1.commandId = 1;
        PersistedLayout t2; t2.id = "pane-2"; t2.commandId = 2;
        row.children = {t1, t2};
        ext.layout = row;
        ext.hasLayout = true;
        other.save(ext);

        rig.ws->reloadFromStore();
        check("renamed pane takes over the session", rig.sessionOf("pane-9") == "s1");
        check("old pane id forgotten", rig.ws->registry().binding("pane-1") == nullptr);
        check("no session restarted", rig.gateway.created.size() == 2 && rig.gateway.killed.empty());
        check("scrollback moved along", rig.widgets.widgetFor("pane-9") &&
                                            rig.widgets.widgetFor("pane-9")->screen == "before");
        rig.gateway.output("s1", "+after");
        check("output routed to the new pane id",
              rig.widgets.widgetFor("pane-9")->screen == "before+after");
        check("later panes do not reuse the id", rig.ws->addTerminal("x", "") == "pane-10");
    }

    {
        Rig rig;
        rig.ws->open(project(1, {"a", "b"}));
        rig.gateway.output("s1", "one");
        rig.gateway.output("s2", "two");
        ProjectStore other(rig.dir);
        Project ext = rig.ws->project();
        PersistedLayout row;
        row.type = PersistedLayout::Type::Container;
        row.id = "pane-3";
        PersistedLayout t1; t1.id = "pane-2"; t1.commandId = 1;
        PersistedLayout t2; t2.id = "pane-1"; t2.commandId = 2;
        row.children = {t1, t2};
        ext.layout = row;
        ext.hasLayout = true;
        other.save(ext);

        rig.ws->reloadFromStore();
        check("swapped ids applied", rig.ws->findPane("pane-2")->command.id == 1 &&
                                         rig.ws->findPane("pane-1")->command.id == 2);
        check("command 1 keeps its session", rig.sessionOf("pane-2") == "s1");
        check("command 2 keeps its session", rig.sessionOf("pane-1") == "s2");
        check("bindings carry their command", rig.ws->registry().binding("pane-2")->commandId == 1);
        check("nothing restarted", rig.gateway.created.size() == 2 && rig.gateway.killed.empty());
        check("scrollback follows the command", rig.widgets.widgetFor("pane-2")->screen == "one" &&
                                                    rig.widgets.widgetFor("pane-1")->screen == "two");
        check("no widget leaked", rig.widgets.alive == 2);
        rig.gateway.output("s1", "+");
        check("output follows the command", rig.widgets.widgetFor("pane-2")->screen == "one+");
    }

    std::cout << "\n[failing mutation]\n";
    {
        Rig rig;
        rig.ws->open(project(1, {"a", "b"}));
        rig.view.hook = [&]() {
            rig.ws->closePane("pane-2");
            throw std::runtime_error("view rebuild failed");
        };
        bool thrown = false;
        try {
            rig.ws->addTerminal("c", "");
        } catch (const std::runtime_error&) {
            thrown = true;
        }
        check("error reaches the caller", thrown);
        check("applied tree kept", rig.shape() == "H[1,2,3]");
        check("queued work after the failure dropped", rig.ws->findPane("pane-2") != nullptr);
        check("later mutations run at once", rig.ws->closePane("pane-1") && rig.shape() == "H[2,3]");
    }

    std::cout << "\n[queued mutations]\n";
    {
        Rig rig;
        rig.ws->open(project(1, {"a", "b"}));
        bool accepted = false;
        rig.view.hook = [&]() {
            accepted = rig.ws->closePane("pane-1");
            check("nested mutation waits for the current one", rig.ws->findPane("pane-1") != nullptr);
        };
        rig.ws->addTerminal("c", "");
        check("nested close accepted", accepted);
        check("queued close ran afterwards", rig.shape() == "H[2,3]");
        check("its session killed", rig.gateway.killed.size() == 1 && rig.gateway.killed[0] == "s1");
    }

    std::cout << "\n[routing and shutdown]\n";
    {
        FakeGateway gateway;
        FakeWidgetFactory widgetsA, widgetsB;
        FakeView viewA, viewB;
        std::string dir = makeTempDir();
        ProjectStore store(dir);
        {
            TerminalWorkspace a(gateway, widgetsA, store);
            TerminalWorkspace b(gateway, widgetsB, store);
            a.setView(&viewA);
            b.setView(&viewB);
            gateway.setOutputHandler([&](const std::string& sid, const std::string& bytes) {
                if (!a.routeOutput(sid, bytes))
                    b.routeOutput(sid, bytes);
            });
            a.open(project(1, {"a"}));
            b.open(project(2, {"b"}));
            gateway.output("s2", "for b");
            check("output reaches the owning workspace", widgetsB.widgetFor("pane-1")->screen == "for b");
            check("other workspace untouched", widgetsA.widgetFor("pane-1")->screen.empty());
            check("foreign session not routed", !a.routeOutput("s2", "x") && !a.routeExit("s2", 0));

            a.shutdown();
            check("shutdown kills only its own sessions", gateway.killed.size() == 1 && gateway.killed[0] == "s1");
            check("closed workspace refuses work", !a.isOpen() && a.addTerminal("x", "").empty());
            gateway.setOutputHandler(nullptr);
        }
        check("destructor shuts the other workspace down", gateway.killed.size() == 2);
        rmdir(dir.c_str());
    }

    std::cout << "\n=== Results: " << (failures == 0 ? "ALL PASSED" : "FAILURES") << " ===\n";
    return failures;
}
