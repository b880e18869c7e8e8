#include "Teul/Core/PropertyInput.h"

#include <cmath>
#include <cstdlib>
#include <limits>

namespace
{
    float floatFromText(const juce::String& text, float minValue, float maxValue, float fallback)
    {
        float parsed = 0.0f;
        if (!Teul::Core::PropertyInput::parseStrictFloat(text, parsed))
            return fallback;

        return juce::jlimit(minValue, maxValue, parsed);
    }
}

namespace Teul::Core::PropertyInput
{
    bool parseStrictInt(const juce::String& text, int& valueOut)
    {
        const auto trimmed = text.trim();
        if (trimmed.isEmpty())
            return false;

        auto utf8 = trimmed.toRawUTF8();
        char* end = nullptr;
        const auto parsed = std::strtoll(utf8, &end, 10);
        if (end == utf8 || *end != '\0')
            return false;

        // strtoll saturates on overflow, so huge text still clamps at the caller.
        valueOut = static_cast<int>(juce::jlimit<long long>(std::numeric_limits<int>::min(),
                                                           std::numeric_limits<int>::max(),
                                                           parsed));
        return true;
    }

    bool parseStrictFloat(const juce::String& text, float& valueOut)
    {
        const auto trimmed = text.trim();
        if (trimmed.isEmpty())
            return false;

        auto utf8 = trimmed.toRawUTF8();
        char* end = nullptr;
        const auto parsed = std::strtod(utf8, &end);
        if (end == utf8 || *end != '\0')
            return false;
        if (std::isnan(parsed))
            return false;

        valueOut = static_cast<float>(juce::jlimit(-1.0e30, 1.0e30, parsed));
        return true;
    }

    int lengthFromText(const juce::String& text)
    {
        int parsed = 0;
        if (!parseStrictInt(text, parsed))
            return 0;

        return juce::jlimit(kMinLength, kMaxLength, parsed);
    }

    int insetFromText(const juce::String& text)
    {
        int parsed = 0;
        if (!parseStrictInt(text, parsed) || parsed < 0)
            return 0;

        return juce::jmin(parsed, kMaxLength);
    }

    std::optional<int> boundFromText(const juce::String& text)
    {
        if (text.trim().isEmpty())
            return std::nullopt;

        return lengthFromText(text);
    }

    Node applyWidth(Node node, const juce::String& text)
    {
        node.width.kind = LengthKind::fixed;
        node.width.px = lengthFromText(text);
        return node;
    }

    Node applyHeight(Node node, const juce::String& text)
    {
        node.height.kind = LengthKind::fixed;
        node.height.px = lengthFromText(text);
        return node;
    }

    Node applyWidthMin(Node node, const juce::String& text)
    {
        node.width.min = boundFromText(text);
        return node;
    }

    Node applyWidthMax(Node node, const juce::String& text)
    {
        node.width.max = boundFromText(text);
        return node;
    }

    Node applyHeightMin(Node node, const juce::String& text)
    {
        node.height.min = boundFromText(text);
        return node;
    }

    Node applyHeightMax(Node node, const juce::String& text)
    {
        node.height.max = boundFromText(text);
        return node;
    }

    EdgeInsets withEdge(EdgeInsets insets, Edge edge, int value) noexcept
    {
        if (insets.locked)
        {
            insets.top = insets.right = insets.bottom = insets.left = value;
            return insets;
        }

        switch (edge)
        {
            case Edge::top: insets.top = value; break;
            case Edge::right: insets.right = value; break;
            case Edge::bottom: insets.bottom = value; break;
            case Edge::left: insets.left = value; break;
        }

        return insets;
    }

    CornerRadius withCorner(CornerRadius radius, Corner corner, int value) noexcept
    {
        if (radius.locked)
        {
            radius.topLeft = radius.topRight = radius.bottomRight = radius.bottomLeft = value;
            return radius;
        }

        switch (corner)
        {
            case Corner::topLeft: radius.topLeft = value; break;
            case Corner::topRight: radius.topRight = value; break;
            case Corner::bottomRight: radius.bottomRight = value; break;
            case Corner::bottomLeft: radius.bottomLeft = value; break;
        }

        return radius;
    }

    Node applySpacing(Node node, Edge edge, const juce::String& text)
    {
        node.spacing = withEdge(node.spacing, edge, insetFromText(text));
        return node;
    }

    Node applyPadding(Node node, Edge edge, const juce::String& text)
    {
        node.padding = withEdge(node.padding, edge, insetFromText(text));
        return node;
    }

    Node applyBorderWidth(Node node, Edge edge, const juce::String& text)
    {
        node.borders.width = withEdge(node.borders.width, edge, insetFromText(text));
        return node;
    }

    Node applyCornerRadius(Node node, Corner corner, const juce::String& text)
    {
        node.borders.corner = withCorner(node.borders.corner, corner, insetFromText(text));
        return node;
    }

    Node applyOffsetX(Node node, const juce::String& text)
    {
        node.transformation.offsetX = floatFromText(text, -kMaxOffset, kMaxOffset, 0.0f);
        return node;
    }

    Node applyOffsetY(Node node, const juce::String& text)
    {
        node.transformation.offsetY = floatFromText(text, -kMaxOffset, kMaxOffset, 0.0f);
        return node;
    }

    Node applyRotation(Node node, const juce::String& text)
    {
        node.transformation.rotation = floatFromText(text, -kMaxRotation, kMaxRotation, 0.0f);
        return node;
    }

    Node applyScale(Node node, const juce::String& text)
    {
        node.transformation.scale = floatFromText(text, 0.0f, kMaxScale, 1.0f);
        return node;
    }

    Node applyShadowOffsetX(Node node, const juce::String& text)
    {
        node.shadow.offsetX = floatFromText(text, -kMaxOffset, kMaxOffset, 0.0f);
        return node;
    }

    Node applyShadowOffsetY(Node node, const juce::String& text)
    {
        node.shadow.offsetY = floatFromText(text, -kMaxOffset, kMaxOffset, 0.0f);
        return node;
    }

    Node applyShadowSize(Node node, const juce::String& text)
    {
        node.shadow.size = floatFromText(text, 0.0f, static_cast<float>(kMaxLength), 0.0f);
        return node;
    }

    Node applyShadowBlur(Node node, const juce::String& text)
    {
        node.shadow.blur = floatFromText(text, 0.0f, static_cast<float>(kMaxLength), 0.0f);
        return node;
    }

    Node applyFontSize(Node node, const juce::String& text)
    {
        if (text.trim().isEmpty())
        {
            node.fontSize = Inheritable<int>::inherit();
            return node;
        }

        int parsed = 0;
        if (!parseStrictInt(text, parsed))
            parsed = 0;

        node.fontSize = Inheritable<int>::localValue(juce::jlimit(kMinFontSize, kMaxFontSize, parsed));
        return node;
    }

    Node applyText(Node node, Field field, const juce::String& text, Edge edge, Corner corner)
    {
        switch (field)
        {
            case Field::width: return applyWidth(std::move(node), text);
            case Field::height: return applyHeight(std::move(node), text);
            case Field::widthMin: return applyWidthMin(std::move(node), text);
            case Field::widthMax: return applyWidthMax(std::move(node), text);
            case Field::heightMin: return applyHeightMin(std::move(node), text);
            case Field::heightMax: return applyHeightMax(std::move(node), text);
            case Field::spacing: return applySpacing(std::move(node), edge, text);
            case Field::padding: return applyPadding(std::move(node), edge, text);
            case Field::offsetX: return applyOffsetX(std::move(node), text);
            case Field::offsetY: return applyOffsetY(std::move(node), text);
            case Field::rotation: return applyRotation(std::move(node), text);
            case Field::scale: return applyScale(std::move(node), text);
            case Field::borderWidth: return applyBorderWidth(std::move(node), edge, text);
            case Field::cornerRadius: return applyCornerRadius(std::move(node), corner, text);
            case Field::shadowOffsetX: return applyShadowOffsetX(std::move(node), text);
            case Field::shadowOffsetY: return applyShadowOffsetY(std::move(node), text);
            case Field::shadowSize: return applyShadowSize(std::move(node), text);
            case Field::shadowBlur: return applyShadowBlur(std::move(node), text);
            case Field::fontSize: return applyFontSize(std::move(node), text);
        }

        return node;
    }
}
