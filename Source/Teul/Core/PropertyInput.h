#pragma once

#include "Teul/Public/Types.h"

namespace Teul::Core::PropertyInput
{
    // Inspector text is clamped into range instead of being rejected. Text that does
    // not parse falls back to a neutral value (see the table in each function).

    enum class Field
    {
        width,
        height,
        widthMin,
        widthMax,
        heightMin,
        heightMax,
        spacing,
        padding,
        offsetX,
        offsetY,
        rotation,
        scale,
        borderWidth,
        cornerRadius,
        shadowOffsetX,
        shadowOffsetY,
        shadowSize,
        shadowBlur,
        fontSize
    };

    constexpr float kMaxOffset = 9999.0f;
    constexpr float kMaxRotation = 360.0f;
    constexpr float kMaxScale = 10.0f;
    constexpr int kMinFontSize = 1;
    constexpr int kMaxFontSize = 999;

    bool parseStrictInt(const juce::String& text, int& valueOut);
    bool parseStrictFloat(const juce::String& text, float& valueOut);

    // [0, 9999], unparseable -> 0
    int lengthFromText(const juce::String& text);
    // [0, 9999], unparseable or negative -> 0
    int insetFromText(const juce::String& text);
    // empty -> no bound, otherwise lengthFromText
    std::optional<int> boundFromText(const juce::String& text);

    Node applyWidth(Node node, const juce::String& text);
    Node applyHeight(Node node, const juce::String& text);
    Node applyWidthMin(Node node, const juce::String& text);
    Node applyWidthMax(Node node, const juce::String& text);
    Node applyHeightMin(Node node, const juce::String& text);
    Node applyHeightMax(Node node, const juce::String& text);

    // A locked inset group takes the value on all four edges.
    EdgeInsets withEdge(EdgeInsets insets, Edge edge, int value) noexcept;
    CornerRadius withCorner(CornerRadius radius, Corner corner, int value) noexcept;

    Node applySpacing(Node node, Edge edge, const juce::String& text);
    Node applyPadding(Node node, Edge edge, const juce::String& text);
    Node applyBorderWidth(Node node, Edge edge, const juce::String& text);
    Node applyCornerRadius(Node node, Corner corner, const juce::String& text);

    Node applyOffsetX(Node node, const juce::String& text);
    Node applyOffsetY(Node node, const juce::String& text);
    Node applyRotation(Node node, const juce::String& text);
    Node applyScale(Node node, const juce::String& text);

    Node applyShadowOffsetX(Node node, const juce::String& text);
    Node applyShadowOffsetY(Node node, const juce::String& text);
    Node applyShadowSize(Node node, const juce::String& text);
    Node applyShadowBlur(Node node, const juce::String& text);

    // Empty text switches the node back to Inherit.
    Node applyFontSize(Node node, const juce::String& text);

    // edge/corner are ignored by fields that do not have one.
    Node applyText(Node node, Field field, const juce::String& text, Edge edge = Edge::top, Corner corner = Corner::topLeft);
}
