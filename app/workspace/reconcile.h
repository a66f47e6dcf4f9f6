/*---------------------------------------------------------*/
/*                                                         */
/*   reconcile.h - Widget work implied by a tree change    */
/*                                                         */
/*---------------------------------------------------------*/

#pragma once

#include "pane_tree.h"

#include <map>
#include <string>
#include <vector>

// Leaf pane ids sorted by what the lifecycle manager must do after a
// mutation. A leaf whose enclosing container is unchanged keeps its view;
// one whose container changed (wrapped, collapsed away, moved) has its view
// rebuilt and must be rebound.
struct ReconcilePlan {
    std::vector<std::string> bind;
    std::vector<std::string> rebind;
    std::vector<std::string> keep;
    std::vector<std::string> unbind;

    bool keeps(const std::string& paneId) const;
};

// `before` is leafParents() of the old tree.
ReconcilePlan planReconcile(const std::map<std::string, std::string>& before, const PaneNode* after);
