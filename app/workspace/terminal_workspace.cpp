/*---------------------------------------------------------*/
/*                                                         */
/*   terminal_workspace.cpp - One project's pane workspace */
/*                                                         */
/*---------------------------------------------------------*/

#include "terminal_workspace.h"
#include "layout_codec.h"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <set>
#include <stdexcept>

TerminalWorkspace::TerminalWorkspace(PtyGateway& gateway, TerminalWidgetFactory& widgets,
                                     ProjectStore& store, const WorkspaceSettings& settings)
    : gateway_(gateway),
      store_(store),
      settings_(settings),
      lifecycle_(gateway, widgets, registry_),
      drag_(settings.edgeThreshold)
{
    lifecycle_.setRestartDelay(std::chrono::milliseconds(settings_.restartDelayMs));
    lifecycle_.setScrollbackLimit(settings_.scrollbackBytes);
    lifecycle_.setLeafResolver([this](const std::string& paneId) {
        return findNode(root_.get(), paneId);
    });
    lifecycle_.setCommandCapturedHandler([this](PaneNode& leaf) { commandCaptured(leaf); });
}

TerminalWorkspace::~TerminalWorkspace()
{
    if (opened_ && !closed_)
        shutdown();
}

void TerminalWorkspace::runMutation(std::function<void()> mutation)
{
    if (closed_)
        return;
    if (mutating_) {
        pending_.push_back(std::move(mutation));
        return;
    }
    mutating_ = true;
    pending_.push_front(std::move(mutation));
    while (!pending_.empty() && !closed_) {
        std::function<void()> next = std::move(pending_.front());
        pending_.pop_front();
        // Mutations take the tree by value; a throw before applyTree leaves it empty.
        PanePtr snapshot = cloneTree(root_.get());
        treeApplied_ = false;
        try {
            next();
        } catch (const std::exception& e) {
            fprintf(stderr, "[workspace] mutation of project %d failed: %s\n", project_.id, e.what());
            if (!treeApplied_)
                root_ = std::move(snapshot);
            pending_.clear();
            mutating_ = false;
            throw;
        }
    }
    pending_.clear();
    mutating_ = false;
}

void TerminalWorkspace::applyTree(PanePtr newRoot, const std::map<std::string, std::string>& before,
                                  const std::vector<std::string>& forceRebind)
{
    ReconcilePlan plan = planReconcile(before, newRoot.get());
    for (const auto& id : forceRebind) {
        auto it = std::find(plan.keep.begin(), plan.keep.end(), id);
        if (it != plan.keep.end()) {
            plan.keep.erase(it);
            plan.rebind.push_back(id);
        }
    }

    // Old views are still attached here, so widgets can be read one last time.
    for (const auto& id : plan.unbind)
        lifecycle_.unbind(id);

    root_ = std::move(newRoot);
    treeApplied_ = true;
    if (!view_)
        return;

    view_->applyLayout(root_.get(), plan);
    for (const auto& id : plan.rebind) {
        PaneNode* leaf = findNode(root_.get(), id);
        PaneSurface* surface = view_->surfaceFor(id);
        if (leaf && surface)
            lifecycle_.rebind(*leaf, *surface);
    }
    for (const auto& id : plan.bind) {
        PaneNode* leaf = findNode(root_.get(), id);
        PaneSurface* surface = view_->surfaceFor(id);
        if (leaf && surface)
            lifecycle_.bind(*leaf, *surface);
    }
    for (const auto& id : plan.keep) {
        if (const PaneNode* leaf = findNode(root_.get(), id))
            lifecycle_.onResize(*leaf);
    }
    view_->releaseDetachedViews();
}

void TerminalWorkspace::open(const Project& project)
{
    if (opened_) {
        fprintf(stderr, "[workspace] project %d is already open\n", project_.id);
        return;
    }
    project_ = project;
    opened_ = true;
    lastPersisted_ = projectToJson(project_).dump();
    fprintf(stderr, "[workspace] opening project %d (%s) with %zu commands\n", project_.id,
            project_.name.c_str(), project_.commands.size());
    runMutation([this]() {
        PanePtr root = restoreLayout(project_.hasLayout ? &project_.layout : nullptr,
                                     project_.commands, ids_);
        applyTree(std::move(root), std::map<std::string, std::string>());
    });
}

bool TerminalWorkspace::openFromStore(int projectId)
{
    Project project;
    if (!store_.load(projectId, project)) {
        fprintf(stderr, "[workspace] project %d not found in %s\n", projectId,
                store_.directory().c_str());
        return false;
    }
    open(project);
    return true;
}

std::string TerminalWorkspace::addTerminal(const std::string& commandText,
                                           const std::string& workingDirectory,
                                           const std::string& afterPaneId)
{
    if (!isOpen())
        return std::string();

    LogicalCommand command;
    command.id = project_.nextCommandId();
    command.commandText = commandText;
    command.workingDirectory = workingDirectory;
    project_.commands.push_back(command);

    std::string paneId = ids_.next();
    runMutation([this, command, paneId, afterPaneId]() {
        auto before = leafParents(root_.get());
        PanePtr leaf = makeLeaf(paneId, command);
        if (!root_) {
            applyTree(std::move(leaf), before);
        } else {
            std::string after = afterPaneId;
            const PaneNode* anchor = findNode(root_.get(), after);
            if (!anchor || !anchor->isLeaf()) {
                std::vector<const PaneNode*> leaves = allLeaves(static_cast<const PaneNode*>(root_.get()));
                after = leaves.back()->id;
            }
            SplitResult split = splitExisting(std::move(root_), after, std::move(leaf), ids_);
            std::vector<std::string> rebuilt;
            if (split.rewrapped)
                rebuilt.push_back(after);
            applyTree(std::move(split.root), before, rebuilt);
        }
        persist();
    });
    fprintf(stderr, "[workspace] added pane %s for command %d\n", paneId.c_str(), command.id);
    return paneId;
}

bool TerminalWorkspace::dropPane(const std::string& sourceId, const DropIntent& intent)
{
    if (!isOpen() || intent.isNone())
        return false;
    const PaneNode* source = findNode(root_.get(), sourceId);
    if (!source || !source->isLeaf())
        return false;
    if (intent.kind == DropIntentKind::Pane) {
        // Containers are not drop targets, same as for the drag controller.
        const PaneNode* target = findNode(root_.get(), intent.targetId);
        if (intent.targetId == sourceId || !target || !target->isLeaf())
            return false;
    }

    runMutation([this, sourceId, intent]() {
        // Re-check: an earlier queued mutation may have removed either pane.
        if (!findNode(root_.get(), sourceId))
            return;
        if (intent.kind == DropIntentKind::Pane) {
            const PaneNode* target = findNode(root_.get(), intent.targetId);
            if (!target || !target->isLeaf())
                return;
        }
        auto before = leafParents(root_.get());
        std::string shapeBefore = describeTree(root_.get());
        PanePtr next = intent.kind == DropIntentKind::Pane
            ? moveNode(std::move(root_), sourceId, intent.targetId, intent.edge, ids_)
            : moveNodeToEdge(std::move(root_), sourceId, intent.edge, ids_);
        if (describeTree(next.get()) == shapeBefore && leafParents(next.get()) == before) {
            root_ = std::move(next);
            return;
        }
        // The moved leaf's view is always rebuilt.
        applyTree(std::move(next), before, std::vector<std::string>{sourceId});
        fprintf(stderr, "[workspace] moved pane %s (%s %s)\n", sourceId.c_str(),
                intent.kind == DropIntentKind::Pane ? intent.targetId.c_str() : "outer",
                edgeToString(intent.edge));
        persist();
    });
    return true;
}

void TerminalWorkspace::removeCommand(int commandId)
{
    project_.commands.erase(
        std::remove_if(project_.commands.begin(), project_.commands.end(),
                       [commandId](const LogicalCommand& c) { return c.id == commandId; }),
        project_.commands.end());
}

bool TerminalWorkspace::closePane(const std::string& paneId)
{
    if (!isOpen())
        return false;
    const PaneNode* leaf = findNode(root_.get(), paneId);
    if (!leaf || !leaf->isLeaf())
        return false;

    runMutation([this, paneId]() {
        const PaneNode* node = findNode(root_.get(), paneId);
        if (!node)
            return;
        int commandId = node->command.id;
        auto before = leafParents(root_.get());
        lifecycle_.closePane(paneId, commandId);
        before.erase(paneId);
        PanePtr next = removeNode(std::move(root_), paneId);
        removeCommand(commandId);
        applyTree(std::move(next), before);
        fprintf(stderr, "[workspace] closed pane %s (command %d)\n", paneId.c_str(), commandId);
        persist();
    });
    return true;
}

bool TerminalWorkspace::restartPane(const std::string& paneId)
{
    if (!isOpen())
        return false;
    PaneNode* leaf = findNode(root_.get(), paneId);
    if (!leaf || !leaf->isLeaf())
        return false;
    lifecycle_.restart(*leaf);
    return true;
}

bool TerminalWorkspace::persist()
{
    if (!opened_)
        return false;
    project_.hasLayout = root_ != nullptr;
    if (root_)
        project_.layout = serializeLayout(*root_);
    else
        project_.layout = PersistedLayout();
    std::string record = projectToJson(project_).dump();
    lastPersisted_ = record;
    if (!store_.save(project_)) {
        fprintf(stderr, "[workspace] saving project %d failed\n", project_.id);
        return false;
    }
    return true;
}

bool TerminalWorkspace::reloadFromStore()
{
    if (!isOpen())
        return false;
    Project loaded;
    if (!store_.load(project_.id, loaded))
        return false;
    std::string record = projectToJson(loaded).dump();
    if (record == lastPersisted_)
        return true;
    lastPersisted_ = record;

    runMutation([this, loaded]() {
        fprintf(stderr, "[workspace] reloading project %d after external change\n", project_.id);
        auto parents = leafParents(root_.get());

        // Where each command is shown now, and under which container.
        std::map<int, std::string> paneOfCommand;
        std::map<int, std::string> parentOfCommand;
        for (const PaneNode* leaf : allLeaves(static_cast<const PaneNode*>(root_.get()))) {
            paneOfCommand[leaf->command.id] = leaf->id;
            parentOfCommand[leaf->command.id] = parents[leaf->id];
        }

        // Commands that no longer exist lose their sessions.
        std::set<int> kept;
        for (const auto& command : loaded.commands)
            kept.insert(command.id);
        for (const auto& entry : paneOfCommand) {
            if (kept.count(entry.first) == 0)
                lifecycle_.closePane(entry.second, entry.first);
        }

        project_ = loaded;
        PanePtr next = restoreLayout(project_.hasLayout ? &project_.layout : nullptr,
                                     project_.commands, ids_);

        // Sessions and scrollback follow the command, whatever pane id it has now.
        std::map<std::string, std::string> before;
        std::map<std::string, std::string> moves;
        std::vector<std::string> moved;
        for (const PaneNode* leaf : allLeaves(static_cast<const PaneNode*>(next.get()))) {
            auto old = paneOfCommand.find(leaf->command.id);
            if (old == paneOfCommand.end())
                continue;
            before[leaf->id] = parentOfCommand[leaf->command.id];
            if (old->second != leaf->id) {
                moves[old->second] = leaf->id;
                moved.push_back(leaf->id);
            }
        }
        lifecycle_.transferPanes(moves);
        applyTree(std::move(next), before, moved);
    });
    return true;
}

void TerminalWorkspace::shutdown()
{
    if (closed_)
        return;
    drag_.cancel();
    pending_.clear();
    lifecycle_.shutdown();
    closed_ = true;
    fprintf(stderr, "[workspace] project %d closed\n", project_.id);
}

bool TerminalWorkspace::beginDrag(const std::string& paneId)
{
    if (!isOpen())
        return false;
    return drag_.begin(root_.get(), paneId);
}

const DropIntent& TerminalWorkspace::updateDrag(const CellRect& area, int x, int y,
                                                const PaneHitTester& hits)
{
    return drag_.update(area, x, y, hits);
}

bool TerminalWorkspace::releaseDrag()
{
    DropIntent intent = drag_.release(root_.get());
    if (intent.isNone())
        return false;
    return dropPane(drag_.sourceId(), intent);
}

bool TerminalWorkspace::routeOutput(const std::string& sessionId, const std::string& bytes)
{
    if (!registry_.ownerOfSession(sessionId))
        return false;
    lifecycle_.dispatchOutput(sessionId, bytes);
    return true;
}

bool TerminalWorkspace::routeExit(const std::string& sessionId, int status)
{
    if (!registry_.ownerOfSession(sessionId))
        return false;
    lifecycle_.handleExit(sessionId, status);
    return true;
}

void TerminalWorkspace::paneResized(const std::string& paneId)
{
    if (const PaneNode* leaf = findNode(root_.get(), paneId))
        lifecycle_.onResize(*leaf);
}

void TerminalWorkspace::setWindowState(const WindowState& state)
{
    project_.hasWindowState = true;
    project_.windowState = state;
}

void TerminalWorkspace::commandCaptured(PaneNode& leaf)
{
    if (LogicalCommand* command = project_.findCommand(leaf.command.id))
        command->commandText = leaf.command.commandText;
    persist();
    if (onCommandCaptured_)
        onCommandCaptured_(leaf);
}
