#include "Teul/Core/NodeTypes.h"

#include <array>

namespace
{
    struct TypeDescriptor
    {
        Teul::NodeType type;
        const char* key;
        const char* displayName;
    };

    constexpr std::array<TypeDescriptor, 15> kTypeDescriptors { {
        { Teul::NodeType::document, "document", "Document" },
        { Teul::NodeType::page, "page", "Page" },
        { Teul::NodeType::row, "row", "Row" },
        { Teul::NodeType::column, "column", "Column" },
        { Teul::NodeType::textColumn, "textColumn", "Text Column" },
        { Teul::NodeType::heading, "heading", "Heading" },
        { Teul::NodeType::paragraph, "paragraph", "Paragraph" },
        { Teul::NodeType::text, "text", "Text" },
        { Teul::NodeType::image, "image", "Image" },
        { Teul::NodeType::button, "button", "Button" },
        { Teul::NodeType::checkbox, "checkbox", "Checkbox" },
        { Teul::NodeType::textField, "textField", "Text Field" },
        { Teul::NodeType::textFieldMultiline, "textFieldMultiline", "Multiline Field" },
        { Teul::NodeType::radio, "radio", "Radio Selection" },
        { Teul::NodeType::option, "option", "Option" }
    } };
}

namespace Teul::Core::NodeTypes
{
    juce::String typeKey(NodeType type)
    {
        for (const auto& descriptor : kTypeDescriptors)
        {
            if (descriptor.type == type)
                return descriptor.key;
        }

        jassertfalse;
        return {};
    }

    std::optional<NodeType> typeFromKey(const juce::String& key)
    {
        const auto normalized = key.trim();
        for (const auto& descriptor : kTypeDescriptors)
        {
            if (normalized == descriptor.key)
                return descriptor.type;
        }

        return std::nullopt;
    }

    juce::String displayName(NodeType type)
    {
        for (const auto& descriptor : kTypeDescriptors)
        {
            if (descriptor.type == type)
                return descriptor.displayName;
        }

        jassertfalse;
        return {};
    }
}
