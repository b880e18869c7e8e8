#pragma once

#include "Teul/Core/IdGenerator.h"
#include "Teul/Core/NodeTypes.h"
#include "Teul/Core/PlacementRules.h"

namespace Teul::Core::Templates
{
    // Prototype subtree for a node type. All ids are the placeholder id.
    Tree templateFor(NodeType type);

    // Insertable prototypes in library order (everything except Document).
    std::vector<Tree> library();

    StampedTree instantiate(const Tree& prototype, Seed seed);

    // Document root holding one empty page, already stamped.
    StampedTree emptyDocument(Seed seed);
}
