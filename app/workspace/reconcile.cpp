#include "reconcile.h"

#include <algorithm>

bool ReconcilePlan::keeps(const std::string& paneId) const
{
    return std::find(keep.begin(), keep.end(), paneId) != keep.end();
}

ReconcilePlan planReconcile(const std::map<std::string, std::string>& before, const PaneNode* after)
{
    ReconcilePlan plan;
    std::map<std::string, std::string> now = leafParents(after);

    // Visual order for the new tree.
    for (const PaneNode* leaf : allLeaves(after)) {
        auto old = before.find(leaf->id);
        if (old == before.end())
            plan.bind.push_back(leaf->id);
        else if (old->second != now[leaf->id])
            plan.rebind.push_back(leaf->id);
        else
            plan.keep.push_back(leaf->id);
    }
    for (const auto& entry : before) {
        if (now.find(entry.first) == now.end())
            plan.unbind.push_back(entry.first);
    }
    return plan;
}
