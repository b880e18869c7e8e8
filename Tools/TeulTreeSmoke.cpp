#include "Teul/Core/Cursor.h"
#include "Teul/Core/IdGenerator.h"
#include "Teul/Core/NodeTypes.h"
#include "Teul/Core/PlacementRules.h"
#include "Teul/Core/PropertyInput.h"
#include "Teul/Core/PropertyResolver.h"
#include "Teul/Core/Templates.h"

#include <functional>
#include <iostream>
#include <set>
#include <vector>

namespace
{
    using Teul::Core::Cursor;
    using Teul::Core::Tree;
    using Teul::NodeType;

    Teul::Core::Seed testSeed()
    {
        return Teul::Core::Seed::fromWords(0x1234u, 0xabcdu, 0x55aa55aau, 0x0badf00du);
    }

    Tree stamped(NodeType type, Teul::Core::Seed& seed)
    {
        auto result = Teul::Core::Templates::instantiate(Teul::Core::Templates::templateFor(type), seed);
        seed = result.next;
        return result.tree;
    }

    // document > page > row > (heading, column > (text, button))
    Tree buildSampleTree(Teul::Core::Seed& seed)
    {
        auto column = stamped(NodeType::column, seed)
                          .withChildren({ stamped(NodeType::text, seed), stamped(NodeType::button, seed) });
        auto row = stamped(NodeType::row, seed).withChildren({ stamped(NodeType::heading, seed), column });
        auto page = stamped(NodeType::page, seed).withChildren({ row });
        return stamped(NodeType::document, seed).withChildren({ page });
    }

    juce::Result testCursorNavigation()
    {
        auto seed = testSeed();
        const Cursor root(buildSampleTree(seed));

        if (!root.isRoot() || root.parent().has_value())
            return juce::Result::fail("root cursor must have no parent");
        if (root.nextSibling().has_value() || root.previousSibling().has_value())
            return juce::Result::fail("root cursor must have no siblings");

        const auto page = root.firstChild();
        const auto row = page ? page->firstChild() : std::nullopt;
        const auto heading = row ? row->firstChild() : std::nullopt;
        if (!heading.has_value() || Teul::typeOf(heading->node()) != NodeType::heading)
            return juce::Result::fail("firstChild chain did not reach the heading");

        if (heading->previousSibling().has_value())
            return juce::Result::fail("first child must have no previous sibling");

        const auto column = heading->nextSibling();
        if (!column.has_value() || Teul::typeOf(column->node()) != NodeType::column)
            return juce::Result::fail("nextSibling did not reach the column");
        if (column->nextSibling().has_value())
            return juce::Result::fail("last child must have no next sibling");

        const auto button = column->lastChild();
        if (!button.has_value() || Teul::typeOf(button->node()) != NodeType::button)
            return juce::Result::fail("lastChild did not reach the button");
        if (button->firstChild().has_value())
            return juce::Result::fail("leaf must have no children");
        if (button->depth() != 4 || button->indexInParent() != 1)
            return juce::Result::fail("button depth/index mismatch");

        const auto back = button->previousSibling();
        if (!back.has_value() || Teul::typeOf(back->node()) != NodeType::text)
            return juce::Result::fail("previousSibling did not reach the text node");

        const auto up = back->parent();
        if (!up.has_value() || up->node().id != column->node().id)
            return juce::Result::fail("parent did not return to the column");

        if (button->path().size() != 5 || button->path().front() != root.node().id)
            return juce::Result::fail("path must run from the root to the focus");

        if (!Teul::Core::structurallyEqual(button->toTree(), root.focus()))
            return juce::Result::fail("navigation alone must not change the tree");
        if (!button->root().focus().sharesStorageWith(root.focus()))
            return juce::Result::fail("unmodified cursor must hand back the original root storage");

        return juce::Result::ok();
    }

    juce::Result testFindByIdAfterAppend()
    {
        auto seed = testSeed();
        const auto tree = buildSampleTree(seed);
        const auto fresh = stamped(NodeType::paragraph, seed);
        const auto freshId = fresh.label().id;

        for (const auto& id : Teul::Core::collectIds(tree))
        {
            const auto target = Cursor(tree).findById(id);
            if (!target.has_value())
                return juce::Result::fail("findById missed an existing node");

            if (!Teul::Core::PlacementRules::isContainer(Teul::typeOf(target->node())))
                continue;

            const auto appended = target->appendChild(fresh);
            if (appended.node().id != freshId)
                return juce::Result::fail("appendChild must focus the new child");

            const auto found = Cursor(appended.toTree()).findById(freshId);
            if (!found.has_value() || found->node().id != freshId)
                return juce::Result::fail("findById did not locate the appended node");
            if (found->parent()->node().id != id)
                return juce::Result::fail("appended node landed under the wrong parent");
        }

        if (Cursor(tree).findById(juce::Uuid()).has_value())
            return juce::Result::fail("findById must signal not found for an unknown id");

        return juce::Result::ok();
    }

    juce::Result testRemoveAfterAppendRestoresTree()
    {
        auto seed = testSeed();
        const auto tree = buildSampleTree(seed);
        const auto fresh = stamped(NodeType::image, seed);

        for (const auto& id : Teul::Core::collectIds(tree))
        {
            const auto target = Cursor(tree).findById(id);
            if (!Teul::Core::PlacementRules::isContainer(Teul::typeOf(target->node())))
                continue;

            const auto removed = target->appendChild(fresh).remove();
            if (removed.node().id != id)
                return juce::Result::fail("remove must move the cursor to the parent");
            if (!Teul::Core::structurallyEqual(removed.toTree(), tree))
                return juce::Result::fail("remove(appendChild(T, n)) must equal T");
        }

        const Cursor root(tree);
        if (!Teul::Core::structurallyEqual(root.remove().toTree(), tree))
            return juce::Result::fail("removing the root must be a no-op");
        if (!root.remove().isRoot())
            return juce::Result::fail("removing the root must leave the cursor at the root");

        return juce::Result::ok();
    }

    juce::Result testCopyOnWrite()
    {
        auto seed = testSeed();
        const auto tree = buildSampleTree(seed);
        const auto before = Teul::Core::countNodes(tree);

        const auto heading = Cursor(tree).findById(tree.children()[0].children()[0].children()[0].label().id);
        if (!heading.has_value())
            return juce::Result::fail("heading lookup failed");

        const auto renamed = heading->mapNode([](const Teul::Node& node)
                                              {
                                                  auto next = node;
                                                  next.name = "Title";
                                                  return next;
                                              });
        if (renamed.node().name != "Title" || renamed.node().id != heading->node().id)
            return juce::Result::fail("mapNode must keep the position and apply the transform");

        const auto edited = renamed.insertBefore(stamped(NodeType::text, seed)).toTree();
        if (Teul::Core::countNodes(tree) != before)
            return juce::Result::fail("original tree changed after a mutation");
        if (tree.children()[0].children()[0].children()[0].label().name == "Title")
            return juce::Result::fail("original label changed after mapNode");
        if (Teul::Core::countNodes(edited) != before + 1)
            return juce::Result::fail("insertBefore did not add a node");

        // The column subtree was never touched, so it must be shared.
        const auto& originalColumn = tree.children()[0].children()[0].children()[1];
        const auto& editedColumn = edited.children()[0].children()[0].children()[2];
        if (!originalColumn.sharesStorageWith(editedColumn))
            return juce::Result::fail("untouched subtree was copied instead of shared");

        const Cursor root(tree);
        if (root.insertAfter(stamped(NodeType::page, seed)).toTree().children().size() != 1)
            return juce::Result::fail("sibling insert at the root must be a no-op");

        return juce::Result::ok();
    }

    juce::Result testFoldTree()
    {
        auto seed = testSeed();
        const auto tree = buildSampleTree(seed);

        const auto count = Teul::Core::foldTree<size_t>(tree,
                                                        [](const Teul::Node&, std::vector<size_t> children)
                                                        {
                                                            size_t total = 1;
                                                            for (const auto child : children)
                                                                total += child;
                                                            return total;
                                                        });
        if (count != Teul::Core::countNodes(tree) || count != 7)
            return juce::Result::fail("fold count must match countNodes");

        const auto outline = Teul::Core::foldTree<juce::String>(tree,
                                                                [](const Teul::Node& node, std::vector<juce::String> children)
                                                                {
                                                                    auto text = Teul::Core::NodeTypes::typeKey(Teul::typeOf(node));
                                                                    if (children.empty())
                                                                        return text;

                                                                    juce::StringArray parts;
                                                                    for (const auto& child : children)
                                                                        parts.add(child);
                                                                    return text + "(" + parts.joinIntoString(",") + ")";
                                                                });
        if (outline != "document(page(row(heading,column(text,button))))")
            return juce::Result::fail("fold must see children in document order: " + outline);

        const auto rebuilt = Teul::Core::foldTree<Tree>(tree,
                                                        [](const Teul::Node& node, std::vector<Tree> children)
                                                        {
                                                            return Tree(node, std::move(children));
                                                        });
        if (!Teul::Core::structurallyEqual(rebuilt, tree) || rebuilt.sharesStorageWith(tree))
            return juce::Result::fail("rebuilding fold must produce an equal, separate tree");

        return juce::Result::ok();
    }

    juce::Result testReplaceFocus()
    {
        auto seed = testSeed();
        const auto tree = buildSampleTree(seed);
        const auto columnId = tree.children()[0].children()[0].children()[1].label().id;

        const auto column = Cursor(tree).findById(columnId);
        const auto image = stamped(NodeType::image, seed);
        const auto replaced = column->replaceFocus(image);

        if (replaced.node().id != image.label().id || replaced.indexInParent() != 1)
            return juce::Result::fail("replaceFocus must keep the position and focus the new subtree");

        const auto edited = replaced.toTree();
        if (Teul::Core::containsId(edited, columnId) || !Teul::Core::containsId(edited, image.label().id))
            return juce::Result::fail("replaceFocus must swap the whole subtree");
        if (Teul::Core::countNodes(edited) != Teul::Core::countNodes(tree) - 2)
            return juce::Result::fail("column and its two children must be replaced by one node");
        if (!Teul::Core::containsId(tree, columnId))
            return juce::Result::fail("original tree changed after replaceFocus");

        return juce::Result::ok();
    }

    juce::Result testTemplateLibrary()
    {
        const auto prototypes = Teul::Core::Templates::library();
        const std::vector<NodeType> expected { NodeType::page, NodeType::row, NodeType::column, NodeType::textColumn,
                                               NodeType::heading, NodeType::paragraph, NodeType::text, NodeType::image,
                                               NodeType::button, NodeType::checkbox, NodeType::textField,
                                               NodeType::textFieldMultiline, NodeType::radio, NodeType::option };

        if (prototypes.size() != expected.size())
            return juce::Result::fail("library must list every type except document");

        for (size_t i = 0; i < prototypes.size(); ++i)
        {
            if (Teul::typeOf(prototypes[i].label()) != expected[i])
                return juce::Result::fail("library order mismatch at " + juce::String(static_cast<int>(i)));
            if (prototypes[i].label().name != Teul::Core::NodeTypes::displayName(expected[i]))
                return juce::Result::fail("prototype must carry its display name");

            for (const auto& id : Teul::Core::collectIds(prototypes[i]))
            {
                if (!id.isNull())
                    return juce::Result::fail("prototypes must hold placeholder ids only");
            }
        }

        if (Teul::Core::countNodes(prototypes[12]) != 4)
            return juce::Result::fail("radio prototype must carry three options");

        return juce::Result::ok();
    }

    juce::Result testPlacementTables()
    {
        using Teul::Core::PlacementRules::canBeSibling;
        using Teul::Core::PlacementRules::canContain;

        if (!canContain(NodeType::radio, NodeType::option))
            return juce::Result::fail("radio must accept option");
        if (canContain(NodeType::row, NodeType::option))
            return juce::Result::fail("row must reject option");
        if (!canContain(NodeType::column, NodeType::heading))
            return juce::Result::fail("column must accept heading");

        for (int i = 0; i < 15; ++i)
        {
            const auto candidate = static_cast<NodeType>(i);
            if (canContain(NodeType::button, candidate))
                return juce::Result::fail("button must accept nothing");
            if (canContain(NodeType::radio, candidate) != (candidate == NodeType::option))
                return juce::Result::fail("radio accepts options only");
            if (canContain(NodeType::textColumn, candidate) == (candidate == NodeType::option))
                return juce::Result::fail("text column accepts every non-option type");
        }

        if (!canBeSibling(NodeType::page, NodeType::page))
            return juce::Result::fail("page beside page");
        if (canBeSibling(NodeType::page, NodeType::row))
            return juce::Result::fail("row must not sit beside a page");
        if (!canBeSibling(NodeType::option, NodeType::option))
            return juce::Result::fail("option beside option");
        if (canBeSibling(NodeType::option, NodeType::row))
            return juce::Result::fail("row must not sit beside an option");
        if (!canBeSibling(NodeType::heading, NodeType::radio))
            return juce::Result::fail("heading and radio are compatible");
        if (canBeSibling(NodeType::heading, NodeType::page))
            return juce::Result::fail("page must not sit beside a heading");

        for (const auto type : { NodeType::document, NodeType::page, NodeType::row, NodeType::column,
                                 NodeType::textColumn, NodeType::radio })
        {
            if (!Teul::Core::PlacementRules::isContainer(type))
                return juce::Result::fail("container set mismatch");
        }

        if (Teul::Core::PlacementRules::isContainer(NodeType::option))
            return juce::Result::fail("option is not a container");

        for (int i = 0; i < 15; ++i)
        {
            const auto type = static_cast<NodeType>(i);
            if (Teul::Core::NodeTypes::typeFromKey(Teul::Core::NodeTypes::typeKey(type)) != type)
                return juce::Result::fail("type key lookup mismatch");
        }

        return juce::Result::ok();
    }

    juce::Result testCombinedInsert()
    {
        auto seed = testSeed();
        const auto tree = buildSampleTree(seed);
        const auto column = Cursor(tree).findById(tree.children()[0].children()[0].children()[1].label().id);

        const auto intoContainer = Teul::Core::PlacementRules::insert(stamped(NodeType::text, seed), *column);
        if (intoContainer.parent()->node().id != column->node().id || intoContainer.indexInParent() != 2)
            return juce::Result::fail("insert into a container must append");

        const auto button = column->lastChild();
        const auto besideParent = Teul::Core::PlacementRules::insert(stamped(NodeType::image, seed), *button);
        const auto row = column->parent();
        if (besideParent.parent()->node().id != row->node().id || besideParent.indexInParent() != 2)
            return juce::Result::fail("insert at a leaf must land after the leaf's parent");

        // A non-container root has no parent; the root anchors and the sibling insert is refused.
        const Cursor lonely(stamped(NodeType::button, seed));
        const auto fallback = Teul::Core::PlacementRules::insert(stamped(NodeType::text, seed), lonely);
        if (!fallback.isRoot() || Teul::Core::countNodes(fallback.toTree()) != 1)
            return juce::Result::fail("root fallback must leave the tree unchanged");

        return juce::Result::ok();
    }

    juce::Result testIdGeneration()
    {
        const auto seed = testSeed();
        const auto first = Teul::Core::generateId(seed);
        const auto again = Teul::Core::generateId(seed);
        if (first.id != again.id || first.next != again.next)
            return juce::Result::fail("generateId must be deterministic");
        if (first.next == seed)
            return juce::Result::fail("generateId must advance the seed");
        if (first.id.isNull())
            return juce::Result::fail("generated id must not be the placeholder");

        std::set<Teul::NodeId> ids;
        auto current = seed;
        for (int i = 0; i < 1000; ++i)
        {
            const auto generated = Teul::Core::generateId(current);
            if (!ids.insert(generated.id).second)
                return juce::Result::fail("generateId repeated an id within 1000 draws");
            current = generated.next;
        }

        return juce::Result::ok();
    }

    juce::Result testDuplicateGetsFreshIds()
    {
        auto seed = testSeed();
        const auto tree = buildSampleTree(seed);
        const auto& row = tree.children()[0].children()[0];
        if (Teul::Core::countNodes(row) != 5)
            return juce::Result::fail("sample row must hold five nodes");

        const auto copy = Teul::Core::stampFreshIds(row, seed);
        const auto originalIds = Teul::Core::collectIds(tree);
        const std::set<Teul::NodeId> existing(originalIds.begin(), originalIds.end());

        const auto copyIds = Teul::Core::collectIds(copy.tree);
        const std::set<Teul::NodeId> unique(copyIds.begin(), copyIds.end());
        if (copyIds.size() != 5 || unique.size() != 5)
            return juce::Result::fail("duplicate must carry five distinct ids");

        for (const auto& id : copyIds)
        {
            if (existing.count(id) != 0)
                return juce::Result::fail("duplicate reused an id from the original tree");
        }

        if (!Teul::Core::structurallyEqual(copy.tree, row, false))
            return juce::Result::fail("duplicate must keep the content apart from ids");
        if (copy.next == seed)
            return juce::Result::fail("stamping must advance the seed");

        const auto radio = Teul::Core::Templates::instantiate(Teul::Core::Templates::templateFor(NodeType::radio), seed);
        for (const auto& id : Teul::Core::collectIds(radio.tree))
        {
            if (id.isNull())
                return juce::Result::fail("instantiate left a placeholder id behind");
        }

        return juce::Result::ok();
    }

    juce::Result testFontInheritance()
    {
        auto seed = testSeed();
        auto tree = buildSampleTree(seed);

        auto root = tree.label();
        root.fontColor = Teul::Inheritable<juce::Colour>::localValue(juce::Colours::red);
        tree = tree.withLabel(root);

        // document > page > row > heading: three levels of Inherit above the heading's own.
        const auto headingId = tree.children()[0].children()[0].children()[0].label().id;
        const auto heading = Cursor(tree).findById(headingId);
        if (Teul::Core::PropertyResolver::resolveFontColor(*heading, juce::Colours::black) != juce::Colours::red)
            return juce::Result::fail("inherited font colour must resolve to the root's red");

        const auto blue = heading->mapNode([](const Teul::Node& node)
                                           {
                                               auto next = node;
                                               next.fontColor = Teul::Inheritable<juce::Colour>::localValue(juce::Colours::blue);
                                               return next;
                                           });
        if (Teul::Core::PropertyResolver::resolveFontColor(blue, juce::Colours::black) != juce::Colours::blue)
            return juce::Result::fail("local font colour must win over ancestors");

        const auto text = Cursor(tree).findById(tree.children()[0].children()[0].children()[1].children()[0].label().id);
        if (Teul::Core::PropertyResolver::resolveFontSize(*text, 16) != 16)
            return juce::Result::fail("unset font size must fall back to the caller default");
        if (Teul::Core::PropertyResolver::resolveFontSize(*heading, 16) != 28)
            return juce::Result::fail("heading template carries a local font size");

        // An ancestor edit is picked up without touching the text node itself.
        const auto column = text->parent()->mapNode([](const Teul::Node& node)
                                                    {
                                                        auto next = node;
                                                        next.fontFamily = Teul::Inheritable<juce::String>::localValue("Inter");
                                                        return next;
                                                    });
        const auto restyledText = column.firstChild();
        if (Teul::Core::PropertyResolver::resolveFontFamily(*restyledText, "System") != "Inter")
            return juce::Result::fail("font family must follow the new ancestor setting");
        if (Teul::Core::PropertyResolver::resolveFontFamily(*text, "System") != "System")
            return juce::Result::fail("original tree must keep resolving to the default family");

        const auto style = Teul::Core::PropertyResolver::resolveTextStyle(*restyledText, {});
        if (style.fontFamily != "Inter" || style.fontColor != juce::Colours::red || style.fontSize != 16)
            return juce::Result::fail("resolveTextStyle must combine all three resolutions");

        return juce::Result::ok();
    }

    juce::Result testPropertyInputClamps()
    {
        using Teul::Core::PropertyInput::Field;
        using Teul::Core::PropertyInput::applyText;

        const Teul::Node base;

        auto node = applyText(base, Field::widthMin, "99999");
        if (node.width.min != 9999)
            return juce::Result::fail("width min must clamp to 9999");

        node = applyText(base, Field::widthMin, "");
        if (node.width.min.has_value())
            return juce::Result::fail("empty width min must clear the bound");

        node = applyText(base, Field::spacing, "-5", Teul::Edge::left);
        if (node.spacing.left != 0)
            return juce::Result::fail("negative spacing must fall back to 0");

        node = applyText(base, Field::padding, "abc", Teul::Edge::top);
        if (node.padding.top != 0)
            return juce::Result::fail("unparseable padding must fall back to 0");

        auto locked = base;
        locked.padding.locked = true;
        locked = applyText(locked, Field::padding, "12", Teul::Edge::bottom);
        if (locked.padding.top != 12 || locked.padding.right != 12 || locked.padding.left != 12)
            return juce::Result::fail("locked padding must set every edge");

        node = applyText(base, Field::width, "320");
        if (node.width.kind != Teul::LengthKind::fixed || node.width.px != 320)
            return juce::Result::fail("width text must set a fixed length");

        node = applyText(base, Field::rotation, "725");
        if (node.transformation.rotation != 360.0f)
            return juce::Result::fail("rotation must clamp to 360");

        node = applyText(base, Field::scale, "nope");
        if (node.transformation.scale != 1.0f)
            return juce::Result::fail("unparseable scale must fall back to 1");

        node = applyText(base, Field::fontSize, "24");
        if (node.fontSize.local != 24)
            return juce::Result::fail("font size text must set a local value");

        node = applyText(node, Field::fontSize, "  ");
        if (node.fontSize.isLocal())
            return juce::Result::fail("blank font size must return to inherit");

        int parsed = 0;
        if (Teul::Core::PropertyInput::parseStrictInt("12px", parsed))
            return juce::Result::fail("trailing garbage must be rejected");
        if (!Teul::Core::PropertyInput::parseStrictInt(" 42 ", parsed) || parsed != 42)
            return juce::Result::fail("surrounding whitespace must be accepted");

        return juce::Result::ok();
    }
}

int main()
{
    const std::vector<std::pair<const char*, std::function<juce::Result()>>> tests =
    {
        { "Cursor navigation", testCursorNavigation },
        { "findById after appendChild", testFindByIdAfterAppend },
        { "remove(appendChild) restores tree", testRemoveAfterAppendRestoresTree },
        { "Copy-on-write mutations", testCopyOnWrite },
        { "Bottom-up fold", testFoldTree },
        { "replaceFocus", testReplaceFocus },
        { "Template library", testTemplateLibrary },
        { "Placement tables", testPlacementTables },
        { "Combined insert", testCombinedInsert },
        { "Seeded id generation", testIdGeneration },
        { "Duplicate gets fresh ids", testDuplicateGetsFreshIds },
        { "Font inheritance", testFontInheritance },
        { "Property input clamps", testPropertyInputClamps }
    };

    for (const auto& [name, run] : tests)
    {
        const auto result = run();
        if (result.failed())
        {
            std::cerr << "[FAIL] " << name << ": " << result.getErrorMessage() << std::endl;
            return 1;
        }

        std::cout << "[PASS] " << name << std::endl;
    }

    std::cout << "Tree smoke passed." << std::endl;
    return 0;
}
