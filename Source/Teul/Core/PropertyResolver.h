#pragma once

#include "Teul/Core/Cursor.h"

namespace Teul::Core::PropertyResolver
{
    // Walks from the focus towards the root and returns the first Local value.
    // Nothing is cached, so a reparent or a local edit is picked up on the next call.
    template <typename Value>
    Value resolve(const Cursor& cursor, Inheritable<Value> Node::*attribute, const Value& fallback)
    {
        const auto& setting = cursor.node().*attribute;
        if (setting.isLocal())
            return *setting.local;

        if (const auto parent = cursor.parent())
            return resolve(*parent, attribute, fallback);

        return fallback;
    }

    juce::String resolveFontFamily(const Cursor& cursor, const juce::String& fallback);
    int resolveFontSize(const Cursor& cursor, int fallback);
    juce::Colour resolveFontColor(const Cursor& cursor, juce::Colour fallback);

    struct TextStyle
    {
        juce::String fontFamily;
        int fontSize = 16;
        juce::Colour fontColor = juce::Colours::black;
    };

    TextStyle resolveTextStyle(const Cursor& cursor, const TextStyle& defaults);
}
