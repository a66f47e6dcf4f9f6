/*---------------------------------------------------------*/
/*   lifecycle_test.cpp - ctest for widget/session binding */
/*---------------------------------------------------------*/

#include "terminal_lifecycle.h"
#include "test_support.h"

#include <chrono>

using Clock = TerminalLifecycleManager::Clock;

struct Rig {
    FakeGateway gateway;
    FakeWidgetFactory widgets;
    WorkspaceRegistry registry;
    TerminalLifecycleManager lifecycle{gateway, widgets, registry};
    PanePtr root;
    std::vector<std::string> captured;

    Rig() {
        lifecycle.setLeafResolver([this](const std::string& paneId) -> PaneNode* {
            PaneNode* node = findNode(root.get(), paneId);
            return node && node->isLeaf() ? node : nullptr;
        });
        lifecycle.setCommandCapturedHandler([this](PaneNode& leaf) {
            captured.push_back(leaf.command.commandText);
        });
        gateway.setOutputHandler([this](const std::string& sid, const std::string& bytes) {
            lifecycle.dispatchOutput(sid, bytes);
        });
        gateway.setExitHandler([this](const std::string& sid, int status) {
            lifecycle.handleExit(sid, status);
        });
    }

    PaneNode& leaf(const std::string& id) { return *findNode(root.get(), id); }
    std::string sessionOf(const std::string& id) {
        LeafBinding* b = registry.binding(id);
        return b ? b->session.sessionId : std::string();
    }
};

int main() {
    std::cout << "=== Terminal Lifecycle Tests ===\n\n";

    std::cout << "[bind]\n";
    {
        Rig rig;
        rig.root = makeLeaf("pane-1", cmd(1, "npm run dev", "/srv"));
        FakeSurface surface("pane-1", 30, 100);
        rig.lifecycle.bind(rig.leaf("pane-1"), surface);

        check("one session created", rig.gateway.created.size() == 1);
        check("session sized to the widget", rig.gateway.created[0].rows == 30 &&
                                                 rig.gateway.created[0].cols == 100);
        check("session in the command's directory", rig.gateway.created[0].cwd == "/srv");
        check("command auto-runs", rig.gateway.written["s1"] == "npm run dev\n");
        check("registry owns the session", rig.registry.ownerOfSession("s1") &&
                                               rig.registry.ownerOfSession("s1")->paneId == "pane-1");

        rig.gateway.output("s1", "hello");
        check("output reaches the widget", rig.widgets.widgetFor("pane-1")->screen == "hello");

        rig.lifecycle.bind(rig.leaf("pane-1"), surface);
        check("binding again does not start a second session", rig.gateway.created.size() == 1);
        check("binding again replaces the widget", rig.widgets.alive == 1);
    }
    {
        Rig rig;
        rig.root = makeLeaf("pane-1", cmd(1));
        FakeSurface surface("pane-1");
        rig.lifecycle.bind(rig.leaf("pane-1"), surface);
        check("blank command writes nothing", rig.gateway.written["s1"].empty());
    }

    std::cout << "\n[rebind / unbind]\n";
    {
        Rig rig;
        rig.root = makeLeaf("pane-1", cmd(1, "top"));
        FakeSurface first("pane-1", 24, 80);
        rig.lifecycle.bind(rig.leaf("pane-1"), first);
        rig.gateway.output("s1", "\x1b[31mred\x1b[0m line");

        FakeSurface second("pane-1", 10, 40);
        rig.lifecycle.rebind(rig.leaf("pane-1"), second);
        FakeWidget* w = rig.widgets.widgetFor("pane-1");
        check("new widget on the new surface", w && &w->surface == &second);
        check("scrollback carried with formatting", w && w->screen == "\x1b[31mred\x1b[0m line");
        check("old widget disposed", rig.widgets.alive == 1);
        check("session untouched", rig.gateway.created.size() == 1 && rig.gateway.killed.empty());
        check("session resized to the new surface", rig.gateway.sizes["s1"] == std::make_pair(10, 40));

        rig.lifecycle.unbind("pane-1");
        check("unbind disposes the widget", rig.widgets.alive == 0);
        check("unbind stashes the render state", rig.registry.hasRenderState(1));
        check("unbind keeps the session", rig.gateway.live.count("s1") == 1);

        rig.gateway.output("s1", "+more");
        check("output while unbound is buffered", rig.registry.hasRenderState(1));

        FakeSurface third("pane-1");
        rig.lifecycle.bind(rig.leaf("pane-1"), third);
        w = rig.widgets.widgetFor("pane-1");
        check("rebound widget replays buffered output",
              w && w->screen == "\x1b[31mred\x1b[0m line+more");
        check("still one session", rig.gateway.created.size() == 1);
        check("stash consumed", !rig.registry.hasRenderState(1));
    }

    std::cout << "\n[resize]\n";
    {
        Rig rig;
        rig.root = makeLeaf("pane-1", cmd(1));
        FakeSurface surface("pane-1", 24, 80);
        rig.lifecycle.bind(rig.leaf("pane-1"), surface);
        surface.rows = 12;
        rig.lifecycle.onResize(rig.leaf("pane-1"));
        check("resize forwarded", rig.gateway.sizes["s1"] == std::make_pair(12, 80));

        surface.rows = 0;
        rig.lifecycle.onResize(rig.leaf("pane-1"));
        check("degenerate size ignored", rig.gateway.sizes["s1"] == std::make_pair(12, 80));

        rig.gateway.live.erase("s1");
        surface.rows = 20;
        rig.lifecycle.onResize(rig.leaf("pane-1"));
        check("resize of a vanished session is swallowed", rig.gateway.sizes["s1"] == std::make_pair(12, 80));
    }

    std::cout << "\n[first-line capture]\n";
    {
        Rig rig;
        rig.root = makeLeaf("pane-1", cmd(1));
        FakeSurface surface("pane-1");
        rig.lifecycle.bind(rig.leaf("pane-1"), surface);
        FakeWidget* w = rig.widgets.widgetFor("pane-1");

        w->type("lz");
        w->type("\x7f");
        w->type("s -la \x1b[D");
        w->type("  \r");
        check("typed bytes forwarded", rig.gateway.written["s1"] == "lz\x7fs -la \x1b[D  \r");
        check("captured line", rig.leaf("pane-1").command.commandText == "ls -la");
        check("capture handler called once", rig.captured.size() == 1 && rig.captured[0] == "ls -la");

        w->type("pwd\r");
        check("only the first line is captured", rig.leaf("pane-1").command.commandText == "ls -la" &&
                                                     rig.captured.size() == 1);
    }
    {
        Rig rig;
        rig.root = makeLeaf("pane-1", cmd(1));
        FakeSurface surface("pane-1");
        rig.lifecycle.bind(rig.leaf("pane-1"), surface);
        FakeWidget* w = rig.widgets.widgetFor("pane-1");

        w->type("\r");
        check("empty line is not captured", rig.captured.empty());
        w->type("oops\x03");
        w->type("caf\xc3\xa9\x7f" "e\n");
        check("ctrl-c discards, backspace removes a whole code point",
              rig.leaf("pane-1").command.commandText == "cafe");
    }

    std::cout << "\n[restart]\n";
    {
        Rig rig;
        rig.root = makeLeaf("pane-1", cmd(1, "make watch"));
        rig.lifecycle.setRestartDelay(std::chrono::milliseconds(300));
        FakeSurface surface("pane-1");
        rig.lifecycle.bind(rig.leaf("pane-1"), surface);
        rig.gateway.written["s1"].clear();

        Clock::time_point t0 = Clock::now();
        rig.lifecycle.restart(rig.leaf("pane-1"), t0);
        check("restart interrupts first", rig.gateway.written["s1"] == "\x03");
        check("replay pending", rig.lifecycle.hasPendingRestarts());

        rig.lifecycle.tick(t0 + std::chrono::milliseconds(100));
        check("nothing replayed before the delay", rig.gateway.written["s1"] == "\x03");

        rig.lifecycle.tick(t0 + std::chrono::milliseconds(300));
        check("command re-sent after the delay", rig.gateway.written["s1"] == "\x03make watch\n");
        check("same session kept", rig.gateway.created.size() == 1);
        check("no pending replay left", !rig.lifecycle.hasPendingRestarts());
    }
    {
        Rig rig;
        rig.root = makeLeaf("pane-1", cmd(1));
        FakeSurface surface("pane-1");
        rig.lifecycle.bind(rig.leaf("pane-1"), surface);
        Clock::time_point t0 = Clock::now();
        rig.lifecycle.restart(rig.leaf("pane-1"), t0);
        rig.lifecycle.tick(t0 + std::chrono::seconds(1));
        check("blank pane recalls the previous history entry",
              rig.gateway.written["s1"] == "\x03\x1b[A\n");
    }
    {
        Rig rig;
        rig.root = makeLeaf("pane-1", cmd(1, "build"));
        FakeSurface surface("pane-1");
        rig.lifecycle.bind(rig.leaf("pane-1"), surface);
        Clock::time_point t0 = Clock::now();
        rig.lifecycle.restart(rig.leaf("pane-1"), t0);
        rig.lifecycle.closePane("pane-1", 1);
        rig.lifecycle.tick(t0 + std::chrono::seconds(1));
        check("closing cancels a pending replay", !rig.lifecycle.hasPendingRestarts() &&
                                                      rig.gateway.written["s1"] == "build\n\x03");
        check("closing kills the session", rig.gateway.killed.size() == 1 && rig.gateway.killed[0] == "s1");
        check("binding forgotten", rig.registry.binding("pane-1") == nullptr);
        check("widget disposed", rig.widgets.alive == 0);
    }

    std::cout << "\n[exit]\n";
    {
        Rig rig;
        rig.root = makeLeaf("pane-1", cmd(1, "make"));
        FakeSurface surface("pane-1");
        rig.lifecycle.bind(rig.leaf("pane-1"), surface);
        rig.gateway.exit("s1", 0);
        FakeWidget* w = rig.widgets.widgetFor("pane-1");
        check("exit notice shown", w->screen.find("[process exited]") != std::string::npos);
        check("binding marked exited", rig.registry.binding("pane-1")->exited);

        w->type("x");
        check("a key on an exited pane starts a fresh session", rig.gateway.created.size() == 2);
        check("new session owned by the pane", rig.sessionOf("pane-1") == "s2");
        check("old session no longer routed", rig.registry.ownerOfSession("s1") == nullptr);
        check("command re-run in the new session", rig.gateway.written["s2"] == "make\n");
        check("the key itself is not forwarded", rig.gateway.written["s2"].find('x') == std::string::npos);
    }

    std::cout << "\n[errors]\n";
    {
        Rig rig;
        rig.root = makeLeaf("pane-1", cmd(1, "ls", "/does/not/exist"));
        rig.gateway.failCreate = true;
        FakeSurface surface("pane-1");
        rig.lifecycle.bind(rig.leaf("pane-1"), surface);
        FakeWidget* w = rig.widgets.widgetFor("pane-1");
        check("widget still created", w != nullptr);
        check("error shown inline", w && w->screen.find("cannot start session") != std::string::npos &&
                                        w->screen.find("/does/not/exist") != std::string::npos);
        check("no session registered", rig.sessionOf("pane-1").empty());

        rig.gateway.failCreate = false;
        rig.lifecycle.restart(rig.leaf("pane-1"));
        check("restart retries the spawn", rig.sessionOf("pane-1") == "s1");
    }
    {
        Rig rig;
        rig.root = makeLeaf("pane-1", cmd(1));
        FakeSurface surface("pane-1");
        rig.lifecycle.bind(rig.leaf("pane-1"), surface);
        rig.gateway.live.erase("s1");
        rig.widgets.widgetFor("pane-1")->type("ls\r");
        check("write after kill is dropped", rig.gateway.written["s1"].empty());
        std::string screen = rig.widgets.widgetFor("pane-1")->screen;
        check("write after kill reported in the pane",
              screen.find("input dropped: session not found: s1") != std::string::npos);

        rig.gateway.output("s99", "stray");
        check("unowned output ignored", rig.widgets.widgetFor("pane-1")->screen == screen);
    }

    std::cout << "\n[shutdown]\n";
    {
        Rig rig;
        std::vector<PanePtr> two;
        two.push_back(makeLeaf("pane-1", cmd(1, "a")));
        two.push_back(makeLeaf("pane-2", cmd(2, "b")));
        rig.root = makeContainer("pane-3", SplitDirection::Horizontal, std::move(two));
        FakeSurface s1("pane-1"), s2("pane-2");
        rig.lifecycle.bind(rig.leaf("pane-1"), s1);
        rig.lifecycle.bind(rig.leaf("pane-2"), s2);
        rig.lifecycle.shutdown();
        check("every session killed", rig.gateway.killed.size() == 2 && rig.gateway.live.empty());
        check("every widget disposed", rig.widgets.alive == 0);
        check("registry empty", rig.registry.sessionCount() == 0 && rig.registry.paneIds().empty());
    }

    std::cout << "\n=== Results: " << (failures == 0 ? "ALL PASSED" : "FAILURES") << " ===\n";
    return failures;
}
