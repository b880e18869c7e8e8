#include "Teul/Serialization/DocumentJson.h"

#include "Teul/Core/NodeTypes.h"
#include "Teul/Core/PropertyInput.h"
#include "Teul/Core/TreeValidator.h"
#include <cmath>
#include <memory>

namespace
{
    using Teul::Core::Tree;

    bool isNumericVar(const juce::var& value) noexcept
    {
        return value.isInt() || value.isInt64() || value.isDouble();
    }

    using Teul::Core::PropertyInput::kMaxFontSize;
    using Teul::Core::PropertyInput::kMaxOffset;
    using Teul::Core::PropertyInput::kMaxRotation;
    using Teul::Core::PropertyInput::kMaxScale;
    using Teul::Core::PropertyInput::kMinFontSize;

    constexpr auto kMaxLengthF = static_cast<float>(Teul::kMaxLength);

    // Numbers are clamped as doubles; int64 and out-of-range doubles never reach a narrowing cast.
    int readInt(const juce::NamedValueSet& props, const juce::Identifier& key, int minValue, int maxValue, int fallback)
    {
        const auto& value = props[key];
        if (!isNumericVar(value))
            return fallback;

        const auto number = static_cast<double>(value);
        if (std::isnan(number))
            return fallback;

        return static_cast<int>(juce::jlimit(static_cast<double>(minValue), static_cast<double>(maxValue), number));
    }

    float readFloat(const juce::NamedValueSet& props, const juce::Identifier& key, float minValue, float maxValue, float fallback)
    {
        const auto& value = props[key];
        if (!isNumericVar(value))
            return fallback;

        const auto number = static_cast<double>(value);
        if (std::isnan(number))
            return fallback;

        return static_cast<float>(juce::jlimit(static_cast<double>(minValue), static_cast<double>(maxValue), number));
    }

    bool readBool(const juce::NamedValueSet& props, const juce::Identifier& key, bool fallback)
    {
        const auto& value = props[key];
        if (value.isBool() || isNumericVar(value))
            return static_cast<bool>(value);
        return fallback;
    }

    juce::String readString(const juce::NamedValueSet& props, const juce::Identifier& key)
    {
        const auto& value = props[key];
        return value.isString() ? value.toString() : juce::String();
    }

    std::optional<int> readOptionalInt(const juce::NamedValueSet& props, const juce::Identifier& key, int minValue, int maxValue)
    {
        if (!isNumericVar(props[key]))
            return std::nullopt;
        return readInt(props, key, minValue, maxValue, minValue);
    }

    const juce::NamedValueSet* objectProps(const juce::var& value)
    {
        const auto* object = value.getDynamicObject();
        return object != nullptr ? &object->getProperties() : nullptr;
    }

    juce::var colourToVar(juce::Colour colour)
    {
        return colour.toString();
    }

    std::optional<juce::Colour> colourFromVar(const juce::var& value)
    {
        if (!value.isString())
            return std::nullopt;

        const auto text = value.toString().trim();
        if (text.isEmpty() || !text.containsOnly("0123456789abcdefABCDEF") || text.length() > 8)
            return std::nullopt;

        return juce::Colour::fromString(text);
    }

    std::optional<Teul::NodeId> idFromString(const juce::String& value)
    {
        const auto hex = value.trim().removeCharacters("-");
        if (hex.length() != 32 || !hex.containsOnly("0123456789abcdefABCDEF"))
            return std::nullopt;

        return Teul::NodeId(hex);
    }

    // -----------------------------------------------------------------------------
    //  Enum keys
    // -----------------------------------------------------------------------------

    juce::String lengthKindToString(Teul::LengthKind kind)
    {
        switch (kind)
        {
            case Teul::LengthKind::fixed: return "fixed";
            case Teul::LengthKind::fill: return "fill";
            case Teul::LengthKind::fit: return "fit";
        }

        return {};
    }

    Teul::LengthKind lengthKindFromString(const juce::String& value)
    {
        if (value == "fixed") return Teul::LengthKind::fixed;
        if (value == "fill") return Teul::LengthKind::fill;
        return Teul::LengthKind::fit;
    }

    juce::String borderStyleToString(Teul::BorderStyle style)
    {
        switch (style)
        {
            case Teul::BorderStyle::solid: return "solid";
            case Teul::BorderStyle::dashed: return "dashed";
            case Teul::BorderStyle::dotted: return "dotted";
        }

        return {};
    }

    Teul::BorderStyle borderStyleFromString(const juce::String& value)
    {
        if (value == "dashed") return Teul::BorderStyle::dashed;
        if (value == "dotted") return Teul::BorderStyle::dotted;
        return Teul::BorderStyle::solid;
    }

    juce::String backgroundKindToString(Teul::BackgroundKind kind)
    {
        switch (kind)
        {
            case Teul::BackgroundKind::none: return "none";
            case Teul::BackgroundKind::solid: return "solid";
            case Teul::BackgroundKind::image: return "image";
        }

        return {};
    }

    Teul::BackgroundKind backgroundKindFromString(const juce::String& value)
    {
        if (value == "solid") return Teul::BackgroundKind::solid;
        if (value == "image") return Teul::BackgroundKind::image;
        return Teul::BackgroundKind::none;
    }

    juce::String alignToString(Teul::Align align)
    {
        switch (align)
        {
            case Teul::Align::none: return "none";
            case Teul::Align::start: return "start";
            case Teul::Align::center: return "center";
            case Teul::Align::end: return "end";
            case Teul::Align::stretch: return "stretch";
        }

        return {};
    }

    Teul::Align alignFromString(const juce::String& value)
    {
        if (value == "start") return Teul::Align::start;
        if (value == "center") return Teul::Align::center;
        if (value == "end") return Teul::Align::end;
        if (value == "stretch") return Teul::Align::stretch;
        return Teul::Align::none;
    }

    // -----------------------------------------------------------------------------
    //  Style records
    // -----------------------------------------------------------------------------

    juce::var serializeLength(const Teul::Length& length)
    {
        auto object = std::make_unique<juce::DynamicObject>();
        object->setProperty("kind", lengthKindToString(length.kind));
        object->setProperty("px", length.px);
        if (length.min.has_value())
            object->setProperty("min", *length.min);
        if (length.max.has_value())
            object->setProperty("max", *length.max);
        return juce::var(object.release());
    }

    Teul::Length parseLength(const juce::var& value)
    {
        Teul::Length length;
        const auto* props = objectProps(value);
        if (props == nullptr)
            return length;

        length.kind = lengthKindFromString(readString(*props, "kind"));
        length.px = readInt(*props, "px", Teul::kMinLength, Teul::kMaxLength, 0);
        length.min = readOptionalInt(*props, "min", Teul::kMinLength, Teul::kMaxLength);
        length.max = readOptionalInt(*props, "max", Teul::kMinLength, Teul::kMaxLength);
        return length;
    }

    juce::var serializeInsets(const Teul::EdgeInsets& insets)
    {
        auto object = std::make_unique<juce::DynamicObject>();
        object->setProperty("top", insets.top);
        object->setProperty("right", insets.right);
        object->setProperty("bottom", insets.bottom);
        object->setProperty("left", insets.left);
        object->setProperty("locked", insets.locked);
        return juce::var(object.release());
    }

    Teul::EdgeInsets parseInsets(const juce::var& value)
    {
        Teul::EdgeInsets insets;
        const auto* props = objectProps(value);
        if (props == nullptr)
            return insets;

        const auto edge = [props](const char* key)
        {
            return readInt(*props, key, 0, Teul::kMaxLength, 0);
        };

        insets.top = edge("top");
        insets.right = edge("right");
        insets.bottom = edge("bottom");
        insets.left = edge("left");
        insets.locked = readBool(*props, "locked", false);
        return insets;
    }

    juce::var serializeCorners(const Teul::CornerRadius& radius)
    {
        auto object = std::make_unique<juce::DynamicObject>();
        object->setProperty("topLeft", radius.topLeft);
        object->setProperty("topRight", radius.topRight);
        object->setProperty("bottomRight", radius.bottomRight);
        object->setProperty("bottomLeft", radius.bottomLeft);
        object->setProperty("locked", radius.locked);
        return juce::var(object.release());
    }

    Teul::CornerRadius parseCorners(const juce::var& value)
    {
        Teul::CornerRadius radius;
        const auto* props = objectProps(value);
        if (props == nullptr)
            return radius;

        const auto corner = [props](const char* key)
        {
            return readInt(*props, key, 0, Teul::kMaxLength, 0);
        };

        radius.topLeft = corner("topLeft");
        radius.topRight = corner("topRight");
        radius.bottomRight = corner("bottomRight");
        radius.bottomLeft = corner("bottomLeft");
        radius.locked = readBool(*props, "locked", false);
        return radius;
    }

    juce::var serializeTransformation(const Teul::Transformation& transformation)
    {
        auto object = std::make_unique<juce::DynamicObject>();
        object->setProperty("offsetX", transformation.offsetX);
        object->setProperty("offsetY", transformation.offsetY);
        object->setProperty("rotation", transformation.rotation);
        object->setProperty("scale", transformation.scale);
        return juce::var(object.release());
    }

    Teul::Transformation parseTransformation(const juce::var& value)
    {
        Teul::Transformation transformation;
        if (const auto* props = objectProps(value))
        {
            transformation.offsetX = readFloat(*props, "offsetX", -kMaxOffset, kMaxOffset, 0.0f);
            transformation.offsetY = readFloat(*props, "offsetY", -kMaxOffset, kMaxOffset, 0.0f);
            transformation.rotation = readFloat(*props, "rotation", -kMaxRotation, kMaxRotation, 0.0f);
            transformation.scale = readFloat(*props, "scale", 0.0f, kMaxScale, 1.0f);
        }

        return transformation;
    }

    juce::var serializeBorders(const Teul::Borders& borders)
    {
        auto object = std::make_unique<juce::DynamicObject>();
        object->setProperty("color", colourToVar(borders.color));
        object->setProperty("style", borderStyleToString(borders.style));
        object->setProperty("width", serializeInsets(borders.width));
        object->setProperty("corner", serializeCorners(borders.corner));
        return juce::var(object.release());
    }

    Teul::Borders parseBorders(const juce::var& value)
    {
        Teul::Borders borders;
        if (const auto* props = objectProps(value))
        {
            borders.color = colourFromVar((*props)["color"]).value_or(borders.color);
            borders.style = borderStyleFromString(readString(*props, "style"));
            borders.width = parseInsets((*props)["width"]);
            borders.corner = parseCorners((*props)["corner"]);
        }

        return borders;
    }

    juce::var serializeShadow(const Teul::Shadow& shadow)
    {
        auto object = std::make_unique<juce::DynamicObject>();
        object->setProperty("offsetX", shadow.offsetX);
        object->setProperty("offsetY", shadow.offsetY);
        object->setProperty("size", shadow.size);
        object->setProperty("blur", shadow.blur);
        object->setProperty("color", colourToVar(shadow.color));
        object->setProperty("type", shadow.type == Teul::ShadowType::inner ? "inner" : "outer");
        return juce::var(object.release());
    }

    Teul::Shadow parseShadow(const juce::var& value)
    {
        Teul::Shadow shadow;
        if (const auto* props = objectProps(value))
        {
            shadow.offsetX = readFloat(*props, "offsetX", -kMaxOffset, kMaxOffset, 0.0f);
            shadow.offsetY = readFloat(*props, "offsetY", -kMaxOffset, kMaxOffset, 0.0f);
            shadow.size = readFloat(*props, "size", 0.0f, kMaxLengthF, 0.0f);
            shadow.blur = readFloat(*props, "blur", 0.0f, kMaxLengthF, 0.0f);
            shadow.color = colourFromVar((*props)["color"]).value_or(shadow.color);
            shadow.type = readString(*props, "type") == "inner" ? Teul::ShadowType::inner : Teul::ShadowType::outer;
        }

        return shadow;
    }

    juce::var serializeBackground(const Teul::Background& background)
    {
        auto object = std::make_unique<juce::DynamicObject>();
        object->setProperty("kind", backgroundKindToString(background.kind));
        object->setProperty("color", colourToVar(background.color));
        object->setProperty("imageUrl", background.imageUrl);
        return juce::var(object.release());
    }

    Teul::Background parseBackground(const juce::var& value)
    {
        Teul::Background background;
        if (const auto* props = objectProps(value))
        {
            background.kind = backgroundKindFromString(readString(*props, "kind"));
            background.color = colourFromVar((*props)["color"]).value_or(background.color);
            background.imageUrl = readString(*props, "imageUrl");
        }

        return background;
    }

    // -----------------------------------------------------------------------------
    //  Payloads
    // -----------------------------------------------------------------------------

    void serializePayload(const Teul::NodeData& data, juce::DynamicObject& object)
    {
        std::visit([&object](const auto& payload)
                   {
                       using T = std::decay_t<decltype(payload)>;

                       if constexpr (std::is_same_v<T, Teul::RowData>)
                       {
                           object.setProperty("wrapped", payload.wrapped);
                       }
                       else if constexpr (std::is_same_v<T, Teul::HeadingData>)
                       {
                           object.setProperty("text", payload.text);
                           object.setProperty("level", payload.level);
                       }
                       else if constexpr (std::is_same_v<T, Teul::ImageData>)
                       {
                           object.setProperty("src", payload.src);
                           object.setProperty("description", payload.description);
                       }
                       else if constexpr (std::is_same_v<T, Teul::CheckboxData>)
                       {
                           object.setProperty("text", payload.text);
                           object.setProperty("checked", payload.checked);
                       }
                       else if constexpr (std::is_same_v<T, Teul::TextFieldData>
                                          || std::is_same_v<T, Teul::TextFieldMultilineData>)
                       {
                           object.setProperty("text", payload.text);
                           object.setProperty("placeholder", payload.placeholder);
                       }
                       else if constexpr (std::is_same_v<T, Teul::OptionData>)
                       {
                           object.setProperty("text", payload.text);
                           object.setProperty("selected", payload.selected);
                       }
                       else if constexpr (std::is_same_v<T, Teul::ParagraphData>
                                          || std::is_same_v<T, Teul::TextData>
                                          || std::is_same_v<T, Teul::ButtonData>
                                          || std::is_same_v<T, Teul::RadioData>)
                       {
                           object.setProperty("text", payload.text);
                       }
                       else
                       {
                           juce::ignoreUnused(payload);
                       }
                   },
                   data);
    }

    Teul::NodeData parsePayload(Teul::NodeType type, const juce::NamedValueSet& props)
    {
        const auto text = readString(props, "text");

        switch (type)
        {
            case Teul::NodeType::document: return Teul::DocumentData {};
            case Teul::NodeType::page: return Teul::PageData {};
            case Teul::NodeType::row:
            {
                Teul::RowData data;
                data.wrapped = readBool(props, "wrapped", false);
                return data;
            }
            case Teul::NodeType::column: return Teul::ColumnData {};
            case Teul::NodeType::textColumn: return Teul::TextColumnData {};
            case Teul::NodeType::heading:
            {
                Teul::HeadingData data;
                data.text = text;
                data.level = readInt(props, "level", 1, 6, 1);
                return data;
            }
            case Teul::NodeType::paragraph:
            {
                Teul::ParagraphData data;
                data.text = text;
                return data;
            }
            case Teul::NodeType::text:
            {
                Teul::TextData data;
                data.text = text;
                return data;
            }
            case Teul::NodeType::image:
            {
                Teul::ImageData data;
                data.src = readString(props, "src");
                data.description = readString(props, "description");
                return data;
            }
            case Teul::NodeType::button:
            {
                Teul::ButtonData data;
                data.text = text;
                return data;
            }
            case Teul::NodeType::checkbox:
            {
                Teul::CheckboxData data;
                data.text = text;
                data.checked = readBool(props, "checked", false);
                return data;
            }
            case Teul::NodeType::textField:
            {
                Teul::TextFieldData data;
                data.text = text;
                data.placeholder = readString(props, "placeholder");
                return data;
            }
            case Teul::NodeType::textFieldMultiline:
            {
                Teul::TextFieldMultilineData data;
                data.text = text;
                data.placeholder = readString(props, "placeholder");
                return data;
            }
            case Teul::NodeType::radio:
            {
                Teul::RadioData data;
                data.text = text;
                return data;
            }
            case Teul::NodeType::option:
            {
                Teul::OptionData data;
                data.text = text;
                data.selected = readBool(props, "selected", false);
                return data;
            }
        }

        return Teul::TextData {};
    }

    // -----------------------------------------------------------------------------
    //  Nodes
    // -----------------------------------------------------------------------------

    juce::var serializeTree(const Tree& tree)
    {
        const auto& node = tree.label();

        auto object = std::make_unique<juce::DynamicObject>();
        object->setProperty("id", node.id.toDashedString());
        object->setProperty("type", Teul::Core::NodeTypes::typeKey(Teul::typeOf(node)));
        object->setProperty("name", node.name);
        serializePayload(node.data, *object);

        object->setProperty("width", serializeLength(node.width));
        object->setProperty("height", serializeLength(node.height));
        object->setProperty("spacing", serializeInsets(node.spacing));
        object->setProperty("padding", serializeInsets(node.padding));
        object->setProperty("transformation", serializeTransformation(node.transformation));
        object->setProperty("borders", serializeBorders(node.borders));
        object->setProperty("shadow", serializeShadow(node.shadow));
        object->setProperty("background", serializeBackground(node.background));

        // Inherit is written as an absent key.
        if (node.fontFamily.isLocal())
            object->setProperty("fontFamily", *node.fontFamily.local);
        if (node.fontSize.isLocal())
            object->setProperty("fontSize", *node.fontSize.local);
        if (node.fontColor.isLocal())
            object->setProperty("fontColor", colourToVar(*node.fontColor.local));

        auto alignment = std::make_unique<juce::DynamicObject>();
        alignment->setProperty("x", alignToString(node.alignment.x));
        alignment->setProperty("y", alignToString(node.alignment.y));
        object->setProperty("alignment", juce::var(alignment.release()));
        object->setProperty("position", node.position == Teul::Position::inFront ? "inFront" : "normal");

        juce::Array<juce::var> children;
        for (const auto& child : tree.children())
            children.add(serializeTree(child));
        object->setProperty("children", juce::var(children));

        return juce::var(object.release());
    }

    juce::Result parseTree(const juce::var& value, std::optional<Tree>& treeOut)
    {
        const auto* props = objectProps(value);
        if (props == nullptr)
            return juce::Result::fail("node must be object");

        const auto id = idFromString(readString(*props, "id"));
        if (!id.has_value())
            return juce::Result::fail("node.id must be a UUID string");

        const auto typeKey = readString(*props, "type");
        const auto type = Teul::Core::NodeTypes::typeFromKey(typeKey);
        if (!type.has_value())
            return juce::Result::fail("Unknown node type: " + typeKey);

        Teul::Node node;
        node.id = *id;
        node.name = readString(*props, "name");
        node.data = parsePayload(*type, *props);
        node.width = parseLength((*props)["width"]);
        node.height = parseLength((*props)["height"]);
        node.spacing = parseInsets((*props)["spacing"]);
        node.padding = parseInsets((*props)["padding"]);
        node.transformation = parseTransformation((*props)["transformation"]);
        node.borders = parseBorders((*props)["borders"]);
        node.shadow = parseShadow((*props)["shadow"]);
        node.background = parseBackground((*props)["background"]);

        if ((*props)["fontFamily"].isString())
            node.fontFamily = Teul::Inheritable<juce::String>::localValue((*props)["fontFamily"].toString());
        if (const auto fontSize = readOptionalInt(*props, "fontSize", kMinFontSize, kMaxFontSize))
            node.fontSize = Teul::Inheritable<int>::localValue(*fontSize);
        if (const auto fontColor = colourFromVar((*props)["fontColor"]))
            node.fontColor = Teul::Inheritable<juce::Colour>::localValue(*fontColor);

        if (const auto* alignment = objectProps((*props)["alignment"]))
        {
            node.alignment.x = alignFromString(readString(*alignment, "x"));
            node.alignment.y = alignFromString(readString(*alignment, "y"));
        }

        node.position = readString(*props, "position") == "inFront" ? Teul::Position::inFront : Teul::Position::normal;

        std::vector<Tree> children;
        const auto& childrenVar = (*props)["children"];
        if (!childrenVar.isVoid())
        {
            const auto* childArray = childrenVar.getArray();
            if (childArray == nullptr)
                return juce::Result::fail("node.children must be array");

            children.reserve(static_cast<size_t>(childArray->size()));
            for (const auto& childValue : *childArray)
            {
                std::optional<Tree> child;
                const auto childResult = parseTree(childValue, child);
                if (childResult.failed())
                    return childResult;
                children.push_back(std::move(*child));
            }
        }

        treeOut.emplace(std::move(node), std::move(children));
        return juce::Result::ok();
    }

    // -----------------------------------------------------------------------------
    //  Document envelope
    // -----------------------------------------------------------------------------

    juce::var serializeSchemaVersion(const Teul::SchemaVersion& version)
    {
        auto object = std::make_unique<juce::DynamicObject>();
        object->setProperty("major", version.major);
        object->setProperty("minor", version.minor);
        object->setProperty("patch", version.patch);
        return juce::var(object.release());
    }

    std::optional<Teul::SchemaVersion> parseSchemaVersion(const juce::var& value)
    {
        const auto* props = objectProps(value);
        if (props == nullptr)
            return std::nullopt;

        if (!props->contains("major") || !props->contains("minor") || !props->contains("patch"))
            return std::nullopt;
        if (!isNumericVar((*props)["major"]) || !isNumericVar((*props)["minor"]) || !isNumericVar((*props)["patch"]))
            return std::nullopt;

        Teul::SchemaVersion version;
        version.major = static_cast<int>((*props)["major"]);
        version.minor = static_cast<int>((*props)["minor"]);
        version.patch = static_cast<int>((*props)["patch"]);
        return version;
    }

    juce::var serializeViewport(const Teul::Viewport& viewport)
    {
        auto object = std::make_unique<juce::DynamicObject>();
        object->setProperty("kind", viewport.kind == Teul::ViewportKind::device ? "device" : "fluid");
        object->setProperty("deviceName", viewport.deviceName);
        object->setProperty("width", viewport.width);
        object->setProperty("height", viewport.height);
        object->setProperty("orientation", viewport.orientation == Teul::Orientation::landscape ? "landscape" : "portrait");
        return juce::var(object.release());
    }

    Teul::Viewport parseViewport(const juce::var& value)
    {
        Teul::Viewport viewport;
        if (const auto* props = objectProps(value))
        {
            viewport.kind = readString(*props, "kind") == "device" ? Teul::ViewportKind::device : Teul::ViewportKind::fluid;
            viewport.deviceName = readString(*props, "deviceName");
            viewport.width = readInt(*props, "width", 0, Teul::kMaxLength, 0);
            viewport.height = readInt(*props, "height", 0, Teul::kMaxLength, 0);
            viewport.orientation = readString(*props, "orientation") == "landscape" ? Teul::Orientation::landscape
                                                                                    : Teul::Orientation::portrait;
        }

        return viewport;
    }

    juce::Result verifySchemaCompatibility(const Teul::SchemaVersion& loaded)
    {
        const auto current = Teul::currentSchemaVersion();

        if (loaded.major != current.major)
            return juce::Result::fail("Unsupported schema major version");

        if (Teul::compareSchemaVersion(loaded, current) > 0)
            return juce::Result::fail("Document schema is newer than runtime");

        return juce::Result::ok();
    }

    // 1.0 kept the root under "tree" and had no viewport or collapsed ids.
    void migrateFrom_1_0(juce::DynamicObject& root)
    {
        if (!root.hasProperty("document") && root.hasProperty("tree"))
        {
            const auto tree = root.getProperty("tree");
            root.setProperty("document", tree);
            root.removeProperty("tree");
        }

        if (!root.hasProperty("viewport"))
            root.setProperty("viewport", serializeViewport({}));
        if (!root.hasProperty("collapsed"))
            root.setProperty("collapsed", juce::var(juce::Array<juce::var>()));
    }

    void migrateToCurrent(juce::DynamicObject& root, const Teul::SchemaVersion& loaded)
    {
        if (loaded.minor < 1)
        {
            DBG("[Teul] migrating document schema "
                + juce::String(loaded.major) + "." + juce::String(loaded.minor) + "." + juce::String(loaded.patch)
                + " -> 1.1.0");
            migrateFrom_1_0(root);
        }
    }
}

namespace Teul::Serialization
{
    juce::Result serializeDocumentToJsonString(const DocumentModel& document, juce::String& jsonOut)
    {
        const auto documentCheck = Core::TreeValidator::validateDocument(document);
        if (documentCheck.failed())
            return documentCheck;

        auto root = std::make_unique<juce::DynamicObject>();
        root->setProperty("version", serializeSchemaVersion(document.schemaVersion));
        root->setProperty("document", serializeTree(document.tree));
        root->setProperty("viewport", serializeViewport(document.viewport));

        juce::Array<juce::var> collapsed;
        for (const auto& id : Core::TreeValidator::pruneCollapsedIds(document.collapsedIds, document.tree))
            collapsed.add(id.toDashedString());
        root->setProperty("collapsed", juce::var(collapsed));

        root->setProperty("updatedOn", document.lastUpdatedOn.toMilliseconds());

        jsonOut = juce::JSON::toString(juce::var(root.release()), true);
        return juce::Result::ok();
    }

    juce::Result parseDocumentFromJsonString(const juce::String& json, std::optional<DocumentModel>& documentOut)
    {
        juce::var rootVar;
        const auto parseResult = juce::JSON::parse(json, rootVar);
        if (parseResult.failed())
            return juce::Result::fail("JSON parse error: " + parseResult.getErrorMessage());

        auto* rootObject = rootVar.getDynamicObject();
        if (rootObject == nullptr)
            return juce::Result::fail("Root must be object");

        if (!rootObject->hasProperty("version"))
            return juce::Result::fail("Document requires a version field");

        const auto parsedVersion = parseSchemaVersion(rootObject->getProperty("version"));
        if (!parsedVersion.has_value())
            return juce::Result::fail("Invalid version field");

        const auto versionCheck = verifySchemaCompatibility(*parsedVersion);
        if (versionCheck.failed())
            return versionCheck;

        migrateToCurrent(*rootObject, *parsedVersion);

        const auto& rootProps = rootObject->getProperties();
        if (!rootProps.contains("document"))
            return juce::Result::fail("Document requires a document tree");

        std::optional<Tree> tree;
        const auto treeResult = parseTree(rootProps["document"], tree);
        if (treeResult.failed())
            return treeResult;

        const auto* collapsedArray = rootProps["collapsed"].getArray();
        if (collapsedArray == nullptr)
            return juce::Result::fail("collapsed must be array");

        std::set<NodeId> collapsedIds;
        for (const auto& idValue : *collapsedArray)
        {
            const auto id = idFromString(idValue.toString());
            if (!id.has_value())
                return juce::Result::fail("collapsed ids must be UUID strings");
            collapsedIds.insert(*id);
        }

        DocumentModel nextDocument { currentSchemaVersion(), std::move(*tree), parseViewport(rootProps["viewport"]), {}, {} };
        nextDocument.collapsedIds = Core::TreeValidator::pruneCollapsedIds(collapsedIds, nextDocument.tree);

        const auto& updatedOn = rootProps["updatedOn"];
        if (isNumericVar(updatedOn))
            nextDocument.lastUpdatedOn = juce::Time(static_cast<juce::int64>(updatedOn));

        const auto documentCheck = Core::TreeValidator::validateDocument(nextDocument);
        if (documentCheck.failed())
            return documentCheck;

        documentOut = std::move(nextDocument);
        return juce::Result::ok();
    }

    juce::String serializeSubtreeToJsonString(const Core::Tree& subtree)
    {
        return juce::JSON::toString(serializeTree(subtree), true);
    }

    juce::Result parseSubtreeFromJsonString(const juce::String& json, std::optional<Core::Tree>& subtreeOut)
    {
        juce::var rootVar;
        const auto parseResult = juce::JSON::parse(json, rootVar);
        if (parseResult.failed())
            return juce::Result::fail("JSON parse error: " + parseResult.getErrorMessage());

        return parseTree(rootVar, subtreeOut);
    }

    juce::Result saveDocumentToFile(const juce::File& file, const DocumentModel& document)
    {
        juce::String json;
        const auto serializeResult = serializeDocumentToJsonString(document, json);
        if (serializeResult.failed())
            return serializeResult;

        if (!file.replaceWithText(json))
            return juce::Result::fail("Failed to write JSON file: " + file.getFullPathName());

        return juce::Result::ok();
    }

    juce::Result loadDocumentFromFile(const juce::File& file, std::optional<DocumentModel>& documentOut)
    {
        if (!file.existsAsFile())
            return juce::Result::fail("File not found: " + file.getFullPathName());

        return parseDocumentFromJsonString(file.loadFileAsString(), documentOut);
    }
}
