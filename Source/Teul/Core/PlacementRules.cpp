#include "Teul/Core/PlacementRules.h"

namespace Teul::Core::PlacementRules
{
    bool isContainer(NodeType type) noexcept
    {
        switch (type)
        {
            case NodeType::document:
            case NodeType::page:
            case NodeType::row:
            case NodeType::column:
            case NodeType::textColumn:
            case NodeType::radio:
                return true;

            case NodeType::heading:
            case NodeType::paragraph:
            case NodeType::text:
            case NodeType::image:
            case NodeType::button:
            case NodeType::checkbox:
            case NodeType::textField:
            case NodeType::textFieldMultiline:
            case NodeType::option:
                return false;
        }

        return false;
    }

    bool canContain(NodeType container, NodeType candidate) noexcept
    {
        switch (container)
        {
            case NodeType::radio:
                return candidate == NodeType::option;

            case NodeType::document:
            case NodeType::page:
            case NodeType::row:
            case NodeType::column:
            case NodeType::textColumn:
                return candidate != NodeType::option;

            case NodeType::heading:
            case NodeType::paragraph:
            case NodeType::text:
            case NodeType::image:
            case NodeType::button:
            case NodeType::checkbox:
            case NodeType::textField:
            case NodeType::textFieldMultiline:
            case NodeType::option:
                return false;
        }

        return false;
    }

    bool canBeSibling(NodeType neighbour, NodeType candidate) noexcept
    {
        switch (neighbour)
        {
            case NodeType::option:
                return candidate == NodeType::option;

            case NodeType::page:
                return candidate == NodeType::page;

            case NodeType::document:
            case NodeType::row:
            case NodeType::column:
            case NodeType::textColumn:
            case NodeType::heading:
            case NodeType::paragraph:
            case NodeType::text:
            case NodeType::image:
            case NodeType::button:
            case NodeType::checkbox:
            case NodeType::textField:
            case NodeType::textFieldMultiline:
            case NodeType::radio:
                return candidate != NodeType::option && candidate != NodeType::page;
        }

        return false;
    }

    Cursor insert(Tree subtree, const Cursor& cursor)
    {
        if (isContainer(typeOf(cursor.node())))
            return cursor.appendChild(std::move(subtree));

        const auto anchor = cursor.parent().value_or(cursor.root());
        return anchor.insertAfter(std::move(subtree));
    }
}
