#include "Teul/Core/Templates.h"

namespace
{
    using namespace Teul;

    Length fill()
    {
        Length length;
        length.kind = LengthKind::fill;
        return length;
    }

    Length fixed(int px)
    {
        Length length;
        length.kind = LengthKind::fixed;
        length.px = px;
        return length;
    }

    EdgeInsets uniform(int value)
    {
        EdgeInsets insets;
        insets.top = insets.right = insets.bottom = insets.left = value;
        insets.locked = true;
        return insets;
    }

    Node makeNode(NodeType type, NodeData data)
    {
        Node node;
        node.name = Core::NodeTypes::displayName(type);
        node.data = std::move(data);
        return node;
    }

    Node option(const juce::String& text)
    {
        OptionData data;
        data.text = text;
        return makeNode(NodeType::option, data);
    }

    Node labelled(NodeType type, NodeData data)
    {
        auto node = makeNode(type, std::move(data));
        node.width = fill();
        node.spacing = uniform(10);
        return node;
    }
}

namespace Teul::Core::Templates
{
    Tree templateFor(NodeType type)
    {
        switch (type)
        {
            case NodeType::document:
                return Tree(makeNode(type, DocumentData {}));

            case NodeType::page:
            {
                auto node = makeNode(type, PageData {});
                node.width = fill();
                node.height = fill();
                node.padding = uniform(20);
                node.spacing = uniform(20);
                node.background.kind = BackgroundKind::solid;
                node.background.color = juce::Colours::white;
                return Tree(std::move(node));
            }

            case NodeType::row:
            {
                auto node = makeNode(type, RowData {});
                node.width = fill();
                node.spacing = uniform(20);
                return Tree(std::move(node));
            }

            case NodeType::column:
            {
                auto node = makeNode(type, ColumnData {});
                node.width = fill();
                node.spacing = uniform(20);
                return Tree(std::move(node));
            }

            case NodeType::textColumn:
            {
                auto node = makeNode(type, TextColumnData {});
                node.width = fill();
                node.spacing = uniform(10);
                return Tree(std::move(node));
            }

            case NodeType::heading:
            {
                HeadingData data;
                data.text = "Heading";
                auto node = makeNode(type, data);
                node.fontSize = Inheritable<int>::localValue(28);
                return Tree(std::move(node));
            }

            case NodeType::paragraph:
            {
                ParagraphData data;
                data.text = "Lorem ipsum dolor sit amet, consectetur adipiscing elit.";
                auto node = makeNode(type, data);
                node.spacing = uniform(5);
                return Tree(std::move(node));
            }

            case NodeType::text:
            {
                TextData data;
                data.text = "Text";
                return Tree(makeNode(type, data));
            }

            case NodeType::image:
            {
                auto node = makeNode(type, ImageData {});
                node.width = fixed(200);
                node.height = fixed(150);
                return Tree(std::move(node));
            }

            case NodeType::button:
            {
                ButtonData data;
                data.text = "Button";
                auto node = makeNode(type, data);
                node.padding = uniform(10);
                node.borders.width = uniform(1);
                node.borders.corner.topLeft = node.borders.corner.topRight = 4;
                node.borders.corner.bottomRight = node.borders.corner.bottomLeft = 4;
                node.borders.corner.locked = true;
                return Tree(std::move(node));
            }

            case NodeType::checkbox:
            {
                CheckboxData data;
                data.text = "Checkbox";
                return Tree(labelled(type, data));
            }

            case NodeType::textField:
            {
                TextFieldData data;
                data.text = "Label";
                auto node = labelled(type, data);
                node.padding = uniform(10);
                node.borders.width = uniform(1);
                return Tree(std::move(node));
            }

            case NodeType::textFieldMultiline:
            {
                TextFieldMultilineData data;
                data.text = "Label";
                auto node = labelled(type, data);
                node.height = fixed(120);
                node.padding = uniform(10);
                node.borders.width = uniform(1);
                return Tree(std::move(node));
            }

            case NodeType::radio:
            {
                RadioData data;
                data.text = "Radio Selection";
                return Tree(labelled(type, data),
                            { Tree(option("Option 1")),
                              Tree(option("Option 2")),
                              Tree(option("Option 3")) });
            }

            case NodeType::option:
                return Tree(option("Option"));
        }

        jassertfalse;
        return Tree(makeNode(NodeType::text, TextData {}));
    }

    std::vector<Tree> library()
    {
        static constexpr NodeType kLibraryOrder[] {
            NodeType::page,
            NodeType::row,
            NodeType::column,
            NodeType::textColumn,
            NodeType::heading,
            NodeType::paragraph,
            NodeType::text,
            NodeType::image,
            NodeType::button,
            NodeType::checkbox,
            NodeType::textField,
            NodeType::textFieldMultiline,
            NodeType::radio,
            NodeType::option
        };

        std::vector<Tree> prototypes;
        for (const auto type : kLibraryOrder)
            prototypes.push_back(templateFor(type));
        return prototypes;
    }

    StampedTree instantiate(const Tree& prototype, Seed seed)
    {
        return stampFreshIds(prototype, seed);
    }

    StampedTree emptyDocument(Seed seed)
    {
        auto pageLabel = templateFor(NodeType::page).label();
        pageLabel.name = "Page 1";

        return stampFreshIds(templateFor(NodeType::document).withChildren({ Tree(std::move(pageLabel)) }), seed);
    }
}
