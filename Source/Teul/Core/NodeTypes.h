#pragma once

#include "Teul/Public/Types.h"

namespace Teul::Core::NodeTypes
{
    // Stable key used in JSON ("textColumn", "textFieldMultiline", ...).
    juce::String typeKey(NodeType type);
    std::optional<NodeType> typeFromKey(const juce::String& key);

    // Default node name shown in the outline and the template library.
    juce::String displayName(NodeType type);
}
