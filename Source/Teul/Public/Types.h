#pragma once

#include <juce_core/juce_core.h>
#include <juce_graphics/juce_graphics.h>
#include <cstdint>
#include <optional>
#include <set>
#include <type_traits>
#include <variant>
#include <vector>

namespace Teul
{
    using NodeId = juce::Uuid;

    // Templates carry the null id until they are stamped.
    inline NodeId placeholderId() noexcept
    {
        return juce::Uuid::null();
    }

    constexpr int kMinLength = 0;
    constexpr int kMaxLength = 9999;

    // -----------------------------------------------------------------------------
    //  Node payloads
    //
    //  One struct per node kind. The variant index is the type tag; NodeType below
    //  mirrors it so the placement switches stay exhaustive.
    // -----------------------------------------------------------------------------

    struct DocumentData
    {
        bool operator==(const DocumentData&) const noexcept { return true; }
    };

    struct PageData
    {
        bool operator==(const PageData&) const noexcept { return true; }
    };

    struct RowData
    {
        bool wrapped = false;

        bool operator==(const RowData& other) const noexcept { return wrapped == other.wrapped; }
    };

    struct ColumnData
    {
        bool operator==(const ColumnData&) const noexcept { return true; }
    };

    struct TextColumnData
    {
        bool operator==(const TextColumnData&) const noexcept { return true; }
    };

    struct HeadingData
    {
        juce::String text;
        int level = 1;

        bool operator==(const HeadingData& other) const noexcept
        {
            return text == other.text && level == other.level;
        }
    };

    struct ParagraphData
    {
        juce::String text;

        bool operator==(const ParagraphData& other) const noexcept { return text == other.text; }
    };

    struct TextData
    {
        juce::String text;

        bool operator==(const TextData& other) const noexcept { return text == other.text; }
    };

    struct ImageData
    {
        juce::String src;
        juce::String description;

        bool operator==(const ImageData& other) const noexcept
        {
            return src == other.src && description == other.description;
        }
    };

    struct ButtonData
    {
        juce::String text;

        bool operator==(const ButtonData& other) const noexcept { return text == other.text; }
    };

    struct CheckboxData
    {
        juce::String text;
        bool checked = false;

        bool operator==(const CheckboxData& other) const noexcept
        {
            return text == other.text && checked == other.checked;
        }
    };

    struct TextFieldData
    {
        juce::String text;
        juce::String placeholder;

        bool operator==(const TextFieldData& other) const noexcept
        {
            return text == other.text && placeholder == other.placeholder;
        }
    };

    struct TextFieldMultilineData
    {
        juce::String text;
        juce::String placeholder;

        bool operator==(const TextFieldMultilineData& other) const noexcept
        {
            return text == other.text && placeholder == other.placeholder;
        }
    };

    struct RadioData
    {
        juce::String text;

        bool operator==(const RadioData& other) const noexcept { return text == other.text; }
    };

    struct OptionData
    {
        juce::String text;
        bool selected = false;

        bool operator==(const OptionData& other) const noexcept
        {
            return text == other.text && selected == other.selected;
        }
    };

    using NodeData = std::variant<
        DocumentData,
        PageData,
        RowData,
        ColumnData,
        TextColumnData,
        HeadingData,
        ParagraphData,
        TextData,
        ImageData,
        ButtonData,
        CheckboxData,
        TextFieldData,
        TextFieldMultilineData,
        RadioData,
        OptionData>;

    enum class NodeType
    {
        document,
        page,
        row,
        column,
        textColumn,
        heading,
        paragraph,
        text,
        image,
        button,
        checkbox,
        textField,
        textFieldMultiline,
        radio,
        option
    };

    static_assert(std::variant_size_v<NodeData> == 15,
                  "NodeData and NodeType must list the same fifteen node kinds");

    // -----------------------------------------------------------------------------
    //  Style attributes
    // -----------------------------------------------------------------------------

    enum class LengthKind
    {
        fixed,
        fill,
        fit
    };

    struct Length
    {
        LengthKind kind = LengthKind::fit;
        int px = 0;                           // used when kind == fixed
        std::optional<int> min;
        std::optional<int> max;

        bool operator==(const Length& other) const noexcept
        {
            return kind == other.kind && px == other.px && min == other.min && max == other.max;
        }
    };

    struct EdgeInsets
    {
        int top = 0;
        int right = 0;
        int bottom = 0;
        int left = 0;
        bool locked = false;

        bool operator==(const EdgeInsets& other) const noexcept
        {
            return top == other.top && right == other.right && bottom == other.bottom
                && left == other.left && locked == other.locked;
        }
    };

    enum class Edge
    {
        top,
        right,
        bottom,
        left
    };

    struct CornerRadius
    {
        int topLeft = 0;
        int topRight = 0;
        int bottomRight = 0;
        int bottomLeft = 0;
        bool locked = false;

        bool operator==(const CornerRadius& other) const noexcept
        {
            return topLeft == other.topLeft && topRight == other.topRight
                && bottomRight == other.bottomRight && bottomLeft == other.bottomLeft
                && locked == other.locked;
        }
    };

    enum class Corner
    {
        topLeft,
        topRight,
        bottomRight,
        bottomLeft
    };

    struct Transformation
    {
        float offsetX = 0.0f;
        float offsetY = 0.0f;
        float rotation = 0.0f;
        float scale = 1.0f;

        bool operator==(const Transformation& other) const noexcept
        {
            return offsetX == other.offsetX && offsetY == other.offsetY
                && rotation == other.rotation && scale == other.scale;
        }
    };

    enum class BorderStyle
    {
        solid,
        dashed,
        dotted
    };

    struct Borders
    {
        juce::Colour color = juce::Colours::black;
        BorderStyle style = BorderStyle::solid;
        EdgeInsets width;
        CornerRadius corner;

        bool operator==(const Borders& other) const noexcept
        {
            return color == other.color && style == other.style
                && width == other.width && corner == other.corner;
        }
    };

    enum class ShadowType
    {
        outer,
        inner
    };

    struct Shadow
    {
        float offsetX = 0.0f;
        float offsetY = 0.0f;
        float size = 0.0f;
        float blur = 0.0f;
        juce::Colour color = juce::Colours::black;
        ShadowType type = ShadowType::outer;

        bool operator==(const Shadow& other) const noexcept
        {
            return offsetX == other.offsetX && offsetY == other.offsetY && size == other.size
                && blur == other.blur && color == other.color && type == other.type;
        }
    };

    enum class BackgroundKind
    {
        none,
        solid,
        image
    };

    struct Background
    {
        BackgroundKind kind = BackgroundKind::none;
        juce::Colour color;
        juce::String imageUrl;

        bool operator==(const Background& other) const noexcept
        {
            return kind == other.kind && color == other.color && imageUrl == other.imageUrl;
        }
    };

    // Local(value) when set, Inherit when empty.
    template <typename Value>
    struct Inheritable
    {
        std::optional<Value> local;

        static Inheritable inherit() { return {}; }
        static Inheritable localValue(Value value) { return { std::optional<Value>(std::move(value)) }; }

        bool isLocal() const noexcept { return local.has_value(); }

        bool operator==(const Inheritable& other) const { return local == other.local; }
        bool operator!=(const Inheritable& other) const { return !(*this == other); }
    };

    enum class Align
    {
        none,
        start,
        center,
        end,
        stretch
    };

    struct Alignment
    {
        Align x = Align::none;
        Align y = Align::none;

        bool operator==(const Alignment& other) const noexcept
        {
            return x == other.x && y == other.y;
        }
    };

    enum class Position
    {
        normal,
        inFront
    };

    // -----------------------------------------------------------------------------
    //  Node
    // -----------------------------------------------------------------------------

    struct Node
    {
        NodeId id = placeholderId();
        juce::String name;
        NodeData data;

        Length width;
        Length height;
        EdgeInsets spacing;
        EdgeInsets padding;
        Transformation transformation;
        Borders borders;
        Shadow shadow;
        Background background;
        Inheritable<juce::String> fontFamily;
        Inheritable<int> fontSize;
        Inheritable<juce::Colour> fontColor;
        Alignment alignment;
        Position position = Position::normal;
    };

    inline NodeType typeOf(const NodeData& data) noexcept
    {
        return static_cast<NodeType>(data.index());
    }

    inline NodeType typeOf(const Node& node) noexcept
    {
        return typeOf(node.data);
    }

    // -----------------------------------------------------------------------------
    //  Document
    // -----------------------------------------------------------------------------

    struct SchemaVersion
    {
        int major = 1;
        int minor = 1;
        int patch = 0;
    };

    inline SchemaVersion currentSchemaVersion() noexcept
    {
        return {};
    }

    inline int compareSchemaVersion(const SchemaVersion& lhs, const SchemaVersion& rhs) noexcept
    {
        if (lhs.major != rhs.major)
            return lhs.major < rhs.major ? -1 : 1;
        if (lhs.minor != rhs.minor)
            return lhs.minor < rhs.minor ? -1 : 1;
        if (lhs.patch != rhs.patch)
            return lhs.patch < rhs.patch ? -1 : 1;
        return 0;
    }

    enum class ViewportKind
    {
        fluid,
        device
    };

    enum class Orientation
    {
        portrait,
        landscape
    };

    struct Viewport
    {
        ViewportKind kind = ViewportKind::fluid;
        juce::String deviceName;
        int width = 0;
        int height = 0;
        Orientation orientation = Orientation::portrait;

        bool operator==(const Viewport& other) const noexcept
        {
            return kind == other.kind && deviceName == other.deviceName && width == other.width
                && height == other.height && orientation == other.orientation;
        }
    };

    enum class DropPosition
    {
        before,
        after,
        inside
    };
}
