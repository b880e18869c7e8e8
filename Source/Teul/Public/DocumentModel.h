#pragma once

#include "Teul/Core/Tree.h"
#include "Teul/Public/Types.h"
#include <set>

namespace Teul
{
    // The unit of persistence and of undo/redo.
    struct DocumentModel
    {
        SchemaVersion schemaVersion = currentSchemaVersion();
        Core::Tree tree;
        Viewport viewport;
        std::set<NodeId> collapsedIds;
        juce::Time lastUpdatedOn;
    };

    struct EditorStateModel
    {
        std::optional<NodeId> selection;
    };
}
