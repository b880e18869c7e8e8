#pragma once

#include "Teul/Core/NodeTypes.h"
#include "Teul/Core/PlacementRules.h"
#include "Teul/Public/DocumentModel.h"
#include <set>

namespace Teul::Core::TreeValidator
{
    namespace detail
    {
        inline juce::Result describeFailure(const Node& node, const juce::String& message)
        {
            return juce::Result::fail(message + " (" + NodeTypes::typeKey(typeOf(node))
                                      + " '" + node.name + "' " + node.id.toDashedString() + ")");
        }

        inline juce::Result validateChildren(const Tree& tree, std::set<NodeId>& seenIds)
        {
            const auto& node = tree.label();
            const auto type = typeOf(node);

            if (node.id.isNull())
                return describeFailure(node, "node id must not be the placeholder id");
            if (!seenIds.insert(node.id).second)
                return describeFailure(node, "node ids must be unique");

            if (tree.hasChildren() && !PlacementRules::isContainer(type))
                return describeFailure(node, "only container nodes may have children");

            const auto& children = tree.children();
            for (size_t i = 0; i < children.size(); ++i)
            {
                const auto childType = typeOf(children[i].label());

                if (childType == NodeType::document)
                    return describeFailure(children[i].label(), "document node must be the root");

                if ((type == NodeType::document) != (childType == NodeType::page))
                    return describeFailure(children[i].label(), "pages live directly under the document and nowhere else");

                if (!PlacementRules::canContain(type, childType))
                    return describeFailure(children[i].label(), "node type is not accepted by its parent");

                if (i > 0 && !PlacementRules::canBeSibling(typeOf(children[i - 1].label()), childType))
                    return describeFailure(children[i].label(), "node type is not accepted next to its sibling");

                const auto childResult = validateChildren(children[i], seenIds);
                if (childResult.failed())
                    return childResult;
            }

            return juce::Result::ok();
        }
    }

    inline juce::Result validateSchemaVersion(const SchemaVersion& version)
    {
        const auto current = currentSchemaVersion();
        if (version.major != current.major)
            return juce::Result::fail("schema.major mismatch");

        if (compareSchemaVersion(version, current) > 0)
            return juce::Result::fail("schema is newer than runtime");

        return juce::Result::ok();
    }

    inline juce::Result validateTree(const Tree& tree)
    {
        if (typeOf(tree.label()) != NodeType::document)
            return juce::Result::fail("tree root must be a document node");

        std::set<NodeId> seenIds;
        return detail::validateChildren(tree, seenIds);
    }

    inline juce::Result validateViewport(const Viewport& viewport)
    {
        if (viewport.kind == ViewportKind::fluid)
            return juce::Result::ok();

        if (viewport.width <= 0 || viewport.height <= 0)
            return juce::Result::fail("device viewport needs a positive width and height");
        if (viewport.width > kMaxLength || viewport.height > kMaxLength)
            return juce::Result::fail("device viewport is larger than 9999px");

        return juce::Result::ok();
    }

    inline juce::Result validateDocument(const DocumentModel& document)
    {
        const auto schemaCheck = validateSchemaVersion(document.schemaVersion);
        if (schemaCheck.failed())
            return schemaCheck;

        const auto treeCheck = validateTree(document.tree);
        if (treeCheck.failed())
            return treeCheck;

        return validateViewport(document.viewport);
    }

    // Collapsed ids of removed nodes are dropped instead of failing validation.
    inline std::set<NodeId> pruneCollapsedIds(const std::set<NodeId>& collapsedIds, const Tree& tree)
    {
        std::set<NodeId> kept;
        for (const auto& id : collapsedIds)
        {
            if (containsId(tree, id))
                kept.insert(id);
        }

        return kept;
    }
}
