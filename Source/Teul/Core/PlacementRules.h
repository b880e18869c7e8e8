#pragma once

#include "Teul/Core/Cursor.h"

namespace Teul::Core::PlacementRules
{
    // Document, Page, Row, Column, TextColumn and Radio.
    bool isContainer(NodeType type) noexcept;

    bool canContain(NodeType container, NodeType candidate) noexcept;
    bool canBeSibling(NodeType neighbour, NodeType candidate) noexcept;

    // Appends into a container, otherwise lands after the focused node's parent.
    // With no parent the root is the anchor, and since a sibling insert at the
    // root is a no-op the cursor comes back unchanged in that case.
    Cursor insert(Tree subtree, const Cursor& cursor);
}
