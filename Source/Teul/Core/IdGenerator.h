#pragma once

#include "Teul/Core/Tree.h"

namespace Teul::Core
{
    // Explicit generator state. Every call that needs a fresh id takes a Seed and
    // hands back the next one; nothing is kept in globals.
    struct Seed
    {
        juce::int64 value = 0;

        static Seed fromWords(juce::uint32 w0, juce::uint32 w1, juce::uint32 w2, juce::uint32 w3) noexcept;

        bool operator==(const Seed& other) const noexcept { return value == other.value; }
        bool operator!=(const Seed& other) const noexcept { return value != other.value; }
    };

    struct GeneratedId
    {
        NodeId id;
        Seed next;
    };

    GeneratedId generateId(Seed seed);

    struct StampedTree
    {
        Tree tree;
        Seed next;
    };

    // Gives every node of the subtree a new id, pre-order, and returns the
    // seed that follows the last one.
    StampedTree stampFreshIds(const Tree& subtree, Seed seed);
}
