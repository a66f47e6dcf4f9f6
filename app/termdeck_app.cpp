/*---------------------------------------------------------*/
/*                                                         */
/*   termdeck_app.cpp - Split-pane terminal workspaces    */
/*   One window per project, panes rearranged by drag     */
/*                                                         */
/*---------------------------------------------------------*/

#define Uses_TKeys
#define Uses_TApplication
#define Uses_TEvent
#define Uses_TRect
#define Uses_TDialog
#define Uses_TStaticText
#define Uses_TButton
#define Uses_TMenuBar
#define Uses_TSubMenu
#define Uses_TMenuItem
#define Uses_TMenu
#define Uses_TStatusLine
#define Uses_TStatusItem
#define Uses_TStatusDef
#define Uses_TDeskTop
#define Uses_TWindow
#define Uses_TInputLine
#define Uses_TLabel
#define Uses_MsgBox
#define Uses_cmTile
#define Uses_cmCascade
#include <tvision/tv.h>

#include "api_ipc.h"
#include "command_registry.h"
#include "project_listener.h"
#include "term_widget.h"
#include "termdeck_config.h"
#include "workspace_window.h"
#include "workspace/layout_codec.h"
#include "workspace/posix_pty_gateway.h"
#include "workspace/project_store.h"

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <string>
#include <vector>

#include <locale.h>

const ushort
    cmNewTerminal  = 200,
    cmOpenProject  = 201;

class TTermDeckApp : public TApplication, public ProjectChangeNotifier
{
public:
    explicit TTermDeckApp(const TermDeckConfig &config);
    ~TTermDeckApp();

    void handleEvent(TEvent &event) override;
    void idle() override;
    static TMenuBar *initMenuBar(TRect);
    static TStatusLine *initStatusLine(TRect);
    static TDeskTop *initDeskTop(TRect);

    // ProjectChangeNotifier
    void projectChanged(int projectId) override;

    TWorkspaceWindow *openProject(int projectId, const std::string &name = std::string());
    // projectId < 0: the focused workspace window.
    TWorkspaceWindow *findWorkspace(int projectId);
    void reloadProject(int projectId);
    ProjectStore &projectStore() { return store; }

private:
    TermDeckConfig config;
    ProjectStore store;
    PosixPtyGateway gateway;
    TTermWidgetFactory widgets;
    ApiIpcServer ipcServer;
    ProjectChangeListener listener;
    RelayChangeNotifier relay;
    std::vector<TWorkspaceWindow *> windows;

    TRect boundsFor(const Project &project) const;
    void newTerminalDialog();
    void openProjectDialog();
    void forgetWindow(TWorkspaceWindow *window);
};

TTermDeckApp::TTermDeckApp(const TermDeckConfig &aConfig) :
    TProgInit(&TTermDeckApp::initStatusLine,
              &TTermDeckApp::initMenuBar,
              &TTermDeckApp::initDeskTop),
    config(aConfig),
    store(aConfig.storeDir),
    gateway(aConfig.shell),
    ipcServer(this),
    listener(aConfig.socketPath),
    relay(aConfig.socketPath)
{
    store.setNotifier(this);

    gateway.setOutputHandler([this](const std::string &sessionId, const std::string &bytes) {
        for (TWorkspaceWindow *w : windows)
            if (w->workspace().routeOutput(sessionId, bytes))
                return;
    });
    gateway.setExitHandler([this](const std::string &sessionId, int status) {
        for (TWorkspaceWindow *w : windows)
            if (w->workspace().routeExit(sessionId, status))
                return;
    });

    if (ipcServer.start(config.socketPath)) {
        fprintf(stderr, "[termdeck] IPC server started on %s\n", config.socketPath.c_str());
    } else {
        // Another instance owns the socket: follow its change events instead.
        fprintf(stderr, "[termdeck] IPC server not started; subscribing to %s\n",
                config.socketPath.c_str());
        listener.setHandler([this](int projectId) { reloadProject(projectId); });
        listener.connect();
    }
}

TTermDeckApp::~TTermDeckApp()
{
    store.setNotifier(nullptr);
}

void TTermDeckApp::projectChanged(int projectId)
{
    // Sibling windows in this process first, then everyone else.
    reloadProject(projectId);
    if (ipcServer.listening())
        ipcServer.projectChanged(projectId);
    else
        relay.projectChanged(projectId);
}

void TTermDeckApp::reloadProject(int projectId)
{
    std::vector<TWorkspaceWindow *> targets = windows;
    for (TWorkspaceWindow *w : targets)
        if (w->workspace().projectId() == projectId)
            w->workspace().reloadFromStore();
}

TRect TTermDeckApp::boundsFor(const Project &project) const
{
    TRect desk = deskTop->getExtent();
    if (project.hasWindowState && project.windowState.width >= 20 && project.windowState.height >= 6)
    {
        const WindowState &ws = project.windowState;
        TRect r(ws.x, ws.y, ws.x + ws.width, ws.y + ws.height);
        r.intersect(desk);
        if (r.b.x - r.a.x >= 20 && r.b.y - r.a.y >= 6)
            return r;
    }
    TRect r = desk;
    int offset = int(windows.size()) % 8;
    r.a.x += offset;
    r.a.y += offset;
    return r;
}

TWorkspaceWindow *TTermDeckApp::openProject(int projectId, const std::string &name)
{
    if (TWorkspaceWindow *existing = findWorkspace(projectId))
    {
        existing->select();
        return existing;
    }

    Project project;
    if (!store.load(projectId, project))
    {
        project = Project();
        project.id = projectId;
        project.name = name.empty() ? "project " + std::to_string(projectId) : name;
        fprintf(stderr, "[termdeck] creating project %d (%s)\n", projectId, project.name.c_str());
    }

    std::unique_ptr<TerminalWorkspace> ws(
        new TerminalWorkspace(gateway, widgets, store, config.workspaceSettings()));
    TerminalWorkspace *raw = ws.get();
    auto *window = new TWorkspaceWindow(boundsFor(project), project.name, std::move(ws));
    window->onClosed = [this](TWorkspaceWindow *w) { forgetWindow(w); };
    windows.push_back(window);
    deskTop->insert(window);
    raw->open(project);
    return window;
}

TWorkspaceWindow *TTermDeckApp::findWorkspace(int projectId)
{
    if (projectId < 0)
    {
        auto *current = dynamic_cast<TWorkspaceWindow *>(deskTop->current);
        if (current)
            return current;
        return windows.empty() ? nullptr : windows.back();
    }
    for (TWorkspaceWindow *w : windows)
        if (w->workspace().projectId() == projectId)
            return w;
    return nullptr;
}

void TTermDeckApp::forgetWindow(TWorkspaceWindow *window)
{
    windows.erase(std::remove(windows.begin(), windows.end(), window), windows.end());
}

static std::string trimField(const char *buf)
{
    std::string s(buf);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\0'))
        s.pop_back();
    while (!s.empty() && s.front() == ' ')
        s.erase(s.begin());
    return s;
}

void TTermDeckApp::newTerminalDialog()
{
    TWorkspaceWindow *target = findWorkspace(-1);
    if (!target)
    {
        messageBox("Open a project first.", mfInformation | mfOKButton);
        return;
    }

    TRect dlgRect(0, 0, 60, 11);
    dlgRect.move((deskTop->size.x - 60) / 2, (deskTop->size.y - 11) / 2);
    TDialog *dlg = new TDialog(dlgRect, "New Terminal");

    TInputLine *command = new TInputLine(TRect(3, 3, 57, 4), 256);
    dlg->insert(command);
    dlg->insert(new TLabel(TRect(2, 2, 57, 3), "~C~ommand (empty: type it into the pane)", command));
    TInputLine *cwd = new TInputLine(TRect(3, 6, 57, 7), 256);
    dlg->insert(cwd);
    dlg->insert(new TLabel(TRect(2, 5, 57, 6), "~W~orking directory", cwd));
    dlg->insert(new TButton(TRect(15, 8, 27, 10), "~O~K", cmOK, bfDefault));
    dlg->insert(new TButton(TRect(33, 8, 45, 10), "Cancel", cmCancel, bfNormal));
    dlg->selectNext(False);

    if (deskTop->execView(dlg) == cmOK)
    {
        char commandBuf[256];
        char cwdBuf[256];
        command->getData(commandBuf);
        cwd->getData(cwdBuf);
        target->workspace().addTerminal(trimField(commandBuf), trimField(cwdBuf),
                                        target->focusedPaneId());
    }
    TObject::destroy(dlg);
}

void TTermDeckApp::openProjectDialog()
{
    TRect dlgRect(0, 0, 50, 11);
    dlgRect.move((deskTop->size.x - 50) / 2, (deskTop->size.y - 11) / 2);
    TDialog *dlg = new TDialog(dlgRect, "Open Project");

    TInputLine *idInput = new TInputLine(TRect(3, 3, 15, 4), 12);
    dlg->insert(idInput);
    dlg->insert(new TLabel(TRect(2, 2, 40, 3), "Project ~i~d", idInput));
    TInputLine *nameInput = new TInputLine(TRect(3, 6, 47, 7), 128);
    dlg->insert(nameInput);
    dlg->insert(new TLabel(TRect(2, 5, 47, 6), "~N~ame (new projects only)", nameInput));
    dlg->insert(new TButton(TRect(10, 8, 22, 10), "~O~K", cmOK, bfDefault));
    dlg->insert(new TButton(TRect(28, 8, 40, 10), "Cancel", cmCancel, bfNormal));
    dlg->selectNext(False);

    if (deskTop->execView(dlg) == cmOK)
    {
        char idBuf[12];
        char nameBuf[128];
        idInput->getData(idBuf);
        nameInput->getData(nameBuf);
        std::string idText = trimField(idBuf);
        char *end = nullptr;
        long id = std::strtol(idText.c_str(), &end, 10);
        if (idText.empty() || *end != '\0' || id <= 0)
            messageBox("Project id must be a positive number.", mfError | mfOKButton);
        else
            openProject(int(id), trimField(nameBuf));
    }
    TObject::destroy(dlg);
}

void TTermDeckApp::handleEvent(TEvent &event)
{
    if (event.what == evCommand && event.message.command == cmQuit)
    {
        for (TWorkspaceWindow *w : windows)
            w->saveLayout();
    }
    TApplication::handleEvent(event);

    if (event.what == evCommand)
    {
        switch (event.message.command)
        {
            case cmNewTerminal:
                newTerminalDialog();
                clearEvent(event);
                break;
            case cmOpenProject:
                openProjectDialog();
                clearEvent(event);
                break;
            case cmTile:
                deskTop->tile(deskTop->getExtent());
                clearEvent(event);
                break;
            case cmCascade:
                deskTop->cascade(deskTop->getExtent());
                clearEvent(event);
                break;
            default:
                break;
        }
    }
}

TMenuBar *TTermDeckApp::initMenuBar(TRect r)
{
    r.b.y = r.a.y + 1;

    return new TMenuBar(r,
        *new TSubMenu("~F~ile", kbAltF) +
            *new TMenuItem("~O~pen Project...", cmOpenProject, kbCtrlO) +
            *new TMenuItem("~S~ave Layout", cmSaveLayout, kbCtrlS) +
            newLine() +
            *new TMenuItem("E~x~it", cmQuit, cmQuit, hcNoContext, "Alt-X") +
        *new TSubMenu("~T~erminal", kbAltT) +
            *new TMenuItem("~N~ew Terminal...", cmNewTerminal, kbCtrlN) +
            *new TMenuItem("~R~estart Pane", cmRestartPane, kbCtrlR) +
            *new TMenuItem("~C~lose Pane", cmClosePane, kbCtrlW) +
            newLine() +
            *new TMenuItem("Ne~x~t Pane", cmNextPane, kbF6) +
        *new TSubMenu("~W~indow", kbAltW) +
            *new TMenuItem("~T~ile", cmTile, kbNoKey) +
            *new TMenuItem("C~a~scade", cmCascade, kbNoKey) +
            *new TMenuItem("~C~lose Window", cmClose, kbAltF3, hcNoContext, "Alt-F3")
    );
}

TStatusLine *TTermDeckApp::initStatusLine(TRect r)
{
    r.a.y = r.b.y - 1;
    return new TStatusLine(r,
        *new TStatusDef(0, 0xFFFF) +
            *new TStatusItem("~Alt-X~ Exit", kbAltX, cmQuit) +
            *new TStatusItem("~Ctrl-N~ New", kbCtrlN, cmNewTerminal) +
            *new TStatusItem("~Ctrl-R~ Restart", kbCtrlR, cmRestartPane) +
            *new TStatusItem("~Ctrl-W~ Close Pane", kbCtrlW, cmClosePane) +
            *new TStatusItem("~F6~ Next", kbF6, cmNextPane) +
            *new TStatusItem("~F10~ Menu", kbF10, cmMenu)
    );
}

TDeskTop *TTermDeckApp::initDeskTop(TRect r)
{
    r.a.y = 1;
    r.b.y--;
    return new TDeskTop(r);
}

void TTermDeckApp::idle()
{
    TApplication::idle();
    gateway.poll();
    std::vector<TWorkspaceWindow *> targets = windows;
    for (TWorkspaceWindow *w : targets)
        w->workspace().tick();
    if (ipcServer.listening())
        ipcServer.poll();
    else
        listener.poll();
}

int main(int argc, char **argv)
{
    setlocale(LC_ALL, "");

    TermDeckConfig config;
    if (!config.load())
        fprintf(stderr, "[termdeck] config problems, continuing with defaults\n");

    // The UI owns the terminal; diagnostics go to the log file.
    if (!config.logPath.empty() && !std::freopen(config.logPath.c_str(), "a", stderr))
        std::fprintf(stdout, "termdeck: cannot open log %s\n", config.logPath.c_str());
    setvbuf(stderr, nullptr, _IOLBF, 0);
    fprintf(stderr, "[termdeck] starting, store=%s socket=%s shell=%s\n", config.storeDir.c_str(),
            config.socketPath.c_str(), config.shell.c_str());

    TTermDeckApp app(config);

    std::vector<int> ids;
    for (int i = 1; i < argc; ++i)
    {
        char *end = nullptr;
        long id = std::strtol(argv[i], &end, 10);
        if (*end == '\0' && id > 0)
            ids.push_back(int(id));
        else
            fprintf(stderr, "[termdeck] ignoring argument %s\n", argv[i]);
    }
    if (ids.empty())
        ids = app.projectStore().list();
    if (ids.empty())
    {
        // First run: one project with a blank shell.
        Project project;
        project.id = 1;
        project.name = "default";
        LogicalCommand shell;
        shell.id = 1;
        project.commands.push_back(shell);
        app.projectStore().save(project);
        ids.push_back(1);
    }
    for (int id : ids)
        app.openProject(id);

    app.run();
    app.shutDown();
    return 0;
}

// ---- IPC API helper functions ----

static std::string noWorkspace(int projectId)
{
    return projectId < 0 ? "err no workspace open" : "err project " + std::to_string(projectId) + " not open";
}

std::string api_add_terminal(TTermDeckApp &app, int projectId, const std::string &command,
                             const std::string &cwd, const std::string &after)
{
    TWorkspaceWindow *w = app.findWorkspace(projectId);
    if (!w)
        return noWorkspace(projectId);
    std::string paneId = w->workspace().addTerminal(command, cwd, after);
    return paneId.empty() ? "err workspace closed" : "ok " + paneId;
}

std::string api_move_pane(TTermDeckApp &app, int projectId, const std::string &source,
                          const std::string &target, DropEdge edge)
{
    TWorkspaceWindow *w = app.findWorkspace(projectId);
    if (!w)
        return noWorkspace(projectId);
    DropIntent intent;
    intent.kind = DropIntentKind::Pane;
    intent.targetId = target;
    intent.edge = edge;
    return w->workspace().dropPane(source, intent) ? "ok" : "err invalid move";
}

std::string api_move_pane_outer(TTermDeckApp &app, int projectId, const std::string &source,
                                DropEdge edge)
{
    TWorkspaceWindow *w = app.findWorkspace(projectId);
    if (!w)
        return noWorkspace(projectId);
    DropIntent intent;
    intent.kind = DropIntentKind::OuterEdge;
    intent.edge = edge;
    return w->workspace().dropPane(source, intent) ? "ok" : "err invalid move";
}

std::string api_close_pane(TTermDeckApp &app, int projectId, const std::string &id)
{
    TWorkspaceWindow *w = app.findWorkspace(projectId);
    if (!w)
        return noWorkspace(projectId);
    return w->workspace().closePane(id) ? "ok" : "err unknown pane";
}

std::string api_restart_pane(TTermDeckApp &app, int projectId, const std::string &id)
{
    TWorkspaceWindow *w = app.findWorkspace(projectId);
    if (!w)
        return noWorkspace(projectId);
    return w->workspace().restartPane(id) ? "ok" : "err unknown pane";
}

std::string api_save_layout(TTermDeckApp &app, int projectId)
{
    TWorkspaceWindow *w = app.findWorkspace(projectId);
    if (!w)
        return noWorkspace(projectId);
    return w->saveLayout() ? "ok" : "err save failed";
}

std::string api_get_layout(TTermDeckApp &app, int projectId)
{
    TWorkspaceWindow *w = app.findWorkspace(projectId);
    if (!w)
        return noWorkspace(projectId);
    const PaneNode *root = w->workspace().root();
    return root ? layoutToJson(serializeLayout(*root)).dump() : std::string("null");
}

std::string api_open_project(TTermDeckApp &app, int projectId)
{
    if (projectId <= 0)
        return "err bad id";
    return app.openProject(projectId) ? "ok" : "err open failed";
}

std::string api_list_projects(TTermDeckApp &app)
{
    JsonValue ids = JsonValue::array();
    for (int id : app.projectStore().list())
        ids.push(JsonValue::number(id));
    return ids.dump();
}

void api_project_changed(TTermDeckApp &app, int projectId)
{
    app.reloadProject(projectId);
}
