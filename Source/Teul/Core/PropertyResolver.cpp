#include "Teul/Core/PropertyResolver.h"

namespace Teul::Core::PropertyResolver
{
    juce::String resolveFontFamily(const Cursor& cursor, const juce::String& fallback)
    {
        return resolve(cursor, &Node::fontFamily, fallback);
    }

    int resolveFontSize(const Cursor& cursor, int fallback)
    {
        return resolve(cursor, &Node::fontSize, fallback);
    }

    juce::Colour resolveFontColor(const Cursor& cursor, juce::Colour fallback)
    {
        return resolve(cursor, &Node::fontColor, fallback);
    }

    TextStyle resolveTextStyle(const Cursor& cursor, const TextStyle& defaults)
    {
        TextStyle style;
        style.fontFamily = resolveFontFamily(cursor, defaults.fontFamily);
        style.fontSize = resolveFontSize(cursor, defaults.fontSize);
        style.fontColor = resolveFontColor(cursor, defaults.fontColor);
        return style;
    }
}
