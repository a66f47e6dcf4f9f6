/*---------------------------------------------------------*/
/*                                                         */
/*   layout_codec.h - Persisted form of the pane tree      */
/*                                                         */
/*   Storage-safe mirror of PaneNode: commands become      */
/*   commandId references, live resources are omitted and  */
/*   pane ids are kept so running sessions can re-bind.    */
/*                                                         */
/*---------------------------------------------------------*/

#pragma once

#include "json_value.h"
#include "pane_tree.h"

#include <string>
#include <vector>

struct PersistedLayout {
    enum class Type { Terminal, Container };

    Type type = Type::Terminal;
    std::string id;
    int commandId = 0;                                     // Terminal
    SplitDirection direction = SplitDirection::Horizontal; // Container
    std::vector<PersistedLayout> children;                 // Container
};

PersistedLayout serializeLayout(const PaneNode& root);

// Inverse of serializeLayout. Terminals whose command is missing from
// `commandsById` are dropped, and containers left with one child collapse to
// it (none: dropped), following removeNode. Returns null when nothing is left.
// With `ids`, empty or duplicate pane ids are replaced by fresh ones.
PanePtr deserializeLayout(const PersistedLayout& layout, const CommandMap& commandsById,
                          PaneIdGenerator* ids = nullptr);

// One leaf for a single command, otherwise a horizontal row of all commands in
// definition order. Null for an empty command list.
PanePtr createInitialLayout(const std::vector<LogicalCommand>& commands, PaneIdGenerator& ids);

// Deserializes `layout` (may be null) and falls back to createInitialLayout
// when that yields nothing. Commands the layout does not mention are appended
// to the right so every command gets a pane.
PanePtr restoreLayout(const PersistedLayout* layout, const std::vector<LogicalCommand>& commands,
                      PaneIdGenerator& ids);

JsonValue layoutToJson(const PersistedLayout& layout);
bool layoutFromJson(const JsonValue& json, PersistedLayout& out, std::string* error = nullptr);
