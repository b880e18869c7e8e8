#include "Teul/Public/DocumentHandle.h"

#include "Teul/Core/Cursor.h"
#include "Teul/Core/History.h"
#include "Teul/Core/NodeTypes.h"
#include "Teul/Core/PlacementRules.h"
#include "Teul/Core/Templates.h"
#include "Teul/Core/TreeValidator.h"
#include "Teul/Serialization/DocumentJson.h"

namespace Teul
{
    namespace
    {
        Core::Seed systemSeed()
        {
            auto& random = juce::Random::getSystemRandom();
            return Core::Seed::fromWords(static_cast<juce::uint32>(random.nextInt()),
                                         static_cast<juce::uint32>(random.nextInt()),
                                         static_cast<juce::uint32>(random.nextInt()),
                                         static_cast<juce::uint32>(random.nextInt()));
        }

        DocumentModel makeInitialDocument(Core::Seed& seed)
        {
            auto stamped = Core::Templates::emptyDocument(seed);
            seed = stamped.next;

            DocumentModel document { currentSchemaVersion(), std::move(stamped.tree), {}, {}, juce::Time::getCurrentTime() };
            return document;
        }

        // Document only takes pages and pages only sit under the document.
        bool respectsPageLevel(NodeType parentType, NodeType candidate) noexcept
        {
            return (parentType == NodeType::document) == (candidate == NodeType::page);
        }
    }

    class DocumentHandle::Impl
    {
    public:
        explicit Impl(Core::Seed initialSeed)
            : seed(initialSeed),
              history(makeInitialDocument(seed))
        {
        }

        Core::Seed seed;
        Core::History<DocumentModel> history;
        EditorStateModel editorState;
        juce::String coalescedKey;
        std::optional<DocumentModel> coalescedBaseline;

        const DocumentModel& present() const noexcept
        {
            return history.present();
        }

        std::optional<Core::Cursor> cursorAt(const NodeId& id) const
        {
            return Core::Cursor(present().tree).findById(id);
        }

        DocumentModel withTree(const Core::Cursor& edited) const
        {
            auto next = present();
            next.tree = edited.toTree();
            next.collapsedIds = Core::TreeValidator::pruneCollapsedIds(next.collapsedIds, next.tree);
            return next;
        }

        bool commit(DocumentModel next, const char* label)
        {
            if (coalescedBaseline.has_value())
            {
                DBG("[Teul] " << label << " rejected: coalesced edit '" << coalescedKey << "' is still open");
                return false;
            }

            const auto validation = Core::TreeValidator::validateDocument(next);
            if (validation.failed())
            {
                DBG("[Teul] " << label << " rejected: " << validation.getErrorMessage());
                return false;
            }

            // An edit that leaves the document as it was is not an undo step.
            if (isUnchanged(next))
                return true;

            next.lastUpdatedOn = juce::Time::getCurrentTime();
            history.apply(std::move(next));
            repairSelection();
            return true;
        }

        bool isUnchanged(const DocumentModel& next) const
        {
            return Core::structurallyEqual(next.tree, present().tree)
                && next.viewport == present().viewport;
        }

        bool preview(DocumentModel next, const char* label)
        {
            if (!coalescedBaseline.has_value())
            {
                DBG("[Teul] " << label << " ignored: no coalesced edit is open");
                return false;
            }

            const auto validation = Core::TreeValidator::validateDocument(next);
            if (validation.failed())
            {
                DBG("[Teul] " << label << " rejected: " << validation.getErrorMessage());
                return false;
            }

            history.replacePresent(std::move(next));
            return true;
        }

        std::optional<DocumentModel> transformed(const NodeId& id,
                                                 const std::function<Node(const Node&)>& transform) const
        {
            const auto target = cursorAt(id);
            if (!target.has_value())
                return std::nullopt;

            // Ids are owned by the document; transforms cannot change them.
            const auto edited = target->mapNode([&transform](const Node& node)
                                                {
                                                    auto next = transform(node);
                                                    next.id = node.id;
                                                    return next;
                                                });
            return withTree(edited);
        }

        std::optional<NodeId> insertSubtree(const Core::Tree& subtree, const NodeId& targetId, const char* label)
        {
            const auto target = cursorAt(targetId);
            if (!target.has_value())
            {
                DBG("[Teul] " << label << " rejected: target " << targetId.toDashedString() << " not found");
                return std::nullopt;
            }

            // Spent even when the insert is refused, so a colliding id is not drawn again.
            auto stamped = Core::stampFreshIds(subtree, seed);
            const auto newId = stamped.tree.label().id;
            seed = stamped.next;

            const auto inserted = Core::PlacementRules::insert(stamped.tree, *target);
            if (inserted.node().id != newId)
            {
                DBG("[Teul] " << label << " rejected: no parent to insert next to");
                return std::nullopt;
            }

            if (!commit(withTree(inserted), label))
                return std::nullopt;

            editorState.selection = newId;
            return newId;
        }

        NodeId fallbackSelection() const
        {
            const auto& tree = present().tree;
            if (tree.hasChildren())
                return tree.children().front().label().id;
            return tree.label().id;
        }

        // The seed keeps moving forward so ids handed out before the load stay unique.
        void resetTo(DocumentModel document)
        {
            history.reset(std::move(document));
            editorState = {};
            coalescedBaseline.reset();
            coalescedKey.clear();
        }

        void repairSelection()
        {
            if (editorState.selection.has_value() && !Core::containsId(present().tree, *editorState.selection))
                editorState.selection = fallbackSelection();
        }
    };

    DocumentHandle::DocumentHandle()
        : impl(std::make_unique<Impl>(systemSeed()))
    {
    }

    DocumentHandle::DocumentHandle(Core::Seed seed)
        : impl(std::make_unique<Impl>(seed))
    {
    }

    DocumentHandle::~DocumentHandle() = default;
    DocumentHandle::DocumentHandle(DocumentHandle&&) noexcept = default;
    DocumentHandle& DocumentHandle::operator=(DocumentHandle&&) noexcept = default;

    const DocumentModel& DocumentHandle::snapshot() const noexcept
    {
        return impl->present();
    }

    const EditorStateModel& DocumentHandle::editorState() const noexcept
    {
        return impl->editorState;
    }

    Core::Seed DocumentHandle::currentSeed() const noexcept
    {
        return impl->seed;
    }

    std::optional<NodeId> DocumentHandle::insertFromTemplate(const Core::Tree& prototype, const NodeId& targetId)
    {
        return impl->insertSubtree(prototype, targetId, "insert");
    }

    std::optional<NodeId> DocumentHandle::duplicate(const NodeId& id)
    {
        const auto source = impl->cursorAt(id);
        if (!source.has_value() || source->isRoot())
        {
            DBG("[Teul] duplicate rejected: " << id.toDashedString() << " is missing or the root");
            return std::nullopt;
        }

        auto stamped = Core::stampFreshIds(source->focus(), impl->seed);
        const auto newId = stamped.tree.label().id;
        impl->seed = stamped.next;

        if (!impl->commit(impl->withTree(source->insertAfter(stamped.tree)), "duplicate"))
            return std::nullopt;

        impl->editorState.selection = newId;
        return newId;
    }

    bool DocumentHandle::remove(const NodeId& id)
    {
        const auto target = impl->cursorAt(id);
        if (!target.has_value() || target->isRoot())
        {
            DBG("[Teul] remove rejected: " << id.toDashedString() << " is missing or the root");
            return false;
        }

        return impl->commit(impl->withTree(target->remove()), "remove");
    }

    bool DocumentHandle::moveNode(const NodeId& id, const NodeId& targetId, DropPosition position)
    {
        const auto source = impl->cursorAt(id);
        if (!source.has_value() || source->isRoot())
            return false;

        if (Core::containsId(source->focus(), targetId))
        {
            DBG("[Teul] move rejected: cannot drop a node onto itself or its own subtree");
            return false;
        }

        if (!canDrop(typeOf(source->node()), targetId, position))
        {
            DBG("[Teul] move rejected: " << Core::NodeTypes::typeKey(typeOf(source->node()))
                << " is not accepted at the drop position");
            return false;
        }

        const auto subtree = source->focus();
        const auto detached = source->remove();
        const auto target = Core::Cursor(detached.toTree()).findById(targetId);
        if (!target.has_value())
            return false;

        switch (position)
        {
            case DropPosition::before:
                return impl->commit(impl->withTree(target->insertBefore(subtree)), "move");
            case DropPosition::after:
                return impl->commit(impl->withTree(target->insertAfter(subtree)), "move");
            case DropPosition::inside:
                return impl->commit(impl->withTree(target->appendChild(subtree)), "move");
        }

        return false;
    }

    std::optional<juce::String> DocumentHandle::copyNode(const NodeId& id) const
    {
        const auto source = impl->cursorAt(id);
        if (!source.has_value() || source->isRoot())
            return std::nullopt;

        return Serialization::serializeSubtreeToJsonString(source->focus());
    }

    std::optional<NodeId> DocumentHandle::paste(const juce::String& json, const NodeId& targetId)
    {
        std::optional<Core::Tree> subtree;
        const auto result = Serialization::parseSubtreeFromJsonString(json, subtree);
        if (result.failed())
        {
            DBG("[Teul] paste rejected: " << result.getErrorMessage());
            return std::nullopt;
        }

        if (typeOf(subtree->label()) == NodeType::document)
        {
            DBG("[Teul] paste rejected: clipboard holds a whole document");
            return std::nullopt;
        }

        return impl->insertSubtree(*subtree, targetId, "paste");
    }

    bool DocumentHandle::rename(const NodeId& id, const juce::String& name)
    {
        return updateNode(id,
                          [&name](const Node& node)
                          {
                              auto next = node;
                              next.name = name.trim();
                              return next;
                          });
    }

    bool DocumentHandle::updateNode(const NodeId& id, const std::function<Node(const Node&)>& transform)
    {
        auto next = impl->transformed(id, transform);
        if (!next.has_value())
            return false;

        return impl->commit(std::move(*next), "update");
    }

    bool DocumentHandle::applyPropertyText(const NodeId& id,
                                           Core::PropertyInput::Field field,
                                           const juce::String& text,
                                           Edge edge,
                                           Corner corner)
    {
        return updateNode(id,
                          [&](const Node& node)
                          {
                              return Core::PropertyInput::applyText(node, field, text, edge, corner);
                          });
    }

    bool DocumentHandle::setViewport(const Viewport& viewport)
    {
        auto next = impl->present();
        next.viewport = viewport;
        return impl->commit(std::move(next), "viewport");
    }

    bool DocumentHandle::setCollapsed(const NodeId& id, bool collapsed)
    {
        if (!Core::containsId(impl->present().tree, id))
            return false;

        const auto toggle = [&id, collapsed](DocumentModel& document)
        {
            if (collapsed)
                document.collapsedIds.insert(id);
            else
                document.collapsedIds.erase(id);
        };

        auto next = impl->present();
        toggle(next);
        impl->history.replacePresent(std::move(next));

        if (impl->coalescedBaseline.has_value())
            toggle(*impl->coalescedBaseline);

        return true;
    }

    bool DocumentHandle::beginCoalescedEdit(const juce::String& key)
    {
        if (key.isEmpty() || impl->coalescedBaseline.has_value())
            return false;

        impl->coalescedKey = key;
        impl->coalescedBaseline = impl->present();
        return true;
    }

    bool DocumentHandle::previewUpdateNode(const NodeId& id, const std::function<Node(const Node&)>& transform)
    {
        auto next = impl->transformed(id, transform);
        if (!next.has_value())
            return false;

        return impl->preview(std::move(*next), "preview");
    }

    bool DocumentHandle::previewPropertyText(const NodeId& id,
                                             Core::PropertyInput::Field field,
                                             const juce::String& text,
                                             Edge edge,
                                             Corner corner)
    {
        return previewUpdateNode(id,
                                 [&](const Node& node)
                                 {
                                     return Core::PropertyInput::applyText(node, field, text, edge, corner);
                                 });
    }

    bool DocumentHandle::endCoalescedEdit(const juce::String& key, bool commit)
    {
        if (!impl->coalescedBaseline.has_value() || key != impl->coalescedKey)
            return false;

        auto baseline = std::move(*impl->coalescedBaseline);
        impl->coalescedBaseline.reset();
        impl->coalescedKey.clear();

        auto edited = impl->present();
        const auto changed = !Core::structurallyEqual(baseline.tree, edited.tree)
                          || !(baseline.viewport == edited.viewport);

        impl->history.replacePresent(std::move(baseline));

        if (commit && changed)
        {
            edited.lastUpdatedOn = juce::Time::getCurrentTime();
            impl->history.apply(std::move(edited));
        }

        impl->repairSelection();
        return true;
    }

    bool DocumentHandle::isCoalescedEditActive() const noexcept
    {
        return impl->coalescedBaseline.has_value();
    }

    bool DocumentHandle::canDrop(NodeType candidate, const NodeId& targetId, DropPosition position) const
    {
        const auto target = impl->cursorAt(targetId);
        if (!target.has_value())
            return false;

        const auto targetType = typeOf(target->node());

        if (position == DropPosition::inside)
            return Core::PlacementRules::canContain(targetType, candidate)
                && respectsPageLevel(targetType, candidate);

        const auto parent = target->parent();
        if (!parent.has_value())
            return false;

        const auto parentType = typeOf(parent->node());
        return Core::PlacementRules::canContain(parentType, candidate)
            && Core::PlacementRules::canBeSibling(targetType, candidate)
            && respectsPageLevel(parentType, candidate);
    }

    std::vector<NodeId> DocumentHandle::dropTargetsFor(NodeType candidate) const
    {
        std::vector<NodeId> targets;
        Core::forEachNode(impl->present().tree,
                          [&targets, candidate](const Node& node)
                          {
                              const auto type = typeOf(node);
                              if (Core::PlacementRules::canContain(type, candidate) && respectsPageLevel(type, candidate))
                                  targets.push_back(node.id);
                          });
        return targets;
    }

    void DocumentHandle::select(const NodeId& id)
    {
        if (Core::containsId(impl->present().tree, id))
            impl->editorState.selection = id;
    }

    void DocumentHandle::clearSelection()
    {
        impl->editorState.selection.reset();
    }

    bool DocumentHandle::canUndo() const noexcept
    {
        return impl->history.hasPast();
    }

    bool DocumentHandle::canRedo() const noexcept
    {
        return impl->history.hasFuture();
    }

    int DocumentHandle::undoDepth() const noexcept
    {
        return static_cast<int>(impl->history.undoDepth());
    }

    int DocumentHandle::redoDepth() const noexcept
    {
        return static_cast<int>(impl->history.redoDepth());
    }

    bool DocumentHandle::undo()
    {
        if (impl->coalescedBaseline.has_value())
            return false;

        if (!impl->history.undo())
            return false;

        impl->repairSelection();
        return true;
    }

    bool DocumentHandle::redo()
    {
        if (impl->coalescedBaseline.has_value())
            return false;

        if (!impl->history.redo())
            return false;

        impl->repairSelection();
        return true;
    }

    void DocumentHandle::setHistoryLimit(size_t limit) noexcept
    {
        impl->history.setLimit(limit);
    }

    juce::Result DocumentHandle::toJson(juce::String& jsonOut) const
    {
        return Serialization::serializeDocumentToJsonString(snapshot(), jsonOut);
    }

    juce::Result DocumentHandle::loadFromJson(const juce::String& json)
    {
        std::optional<DocumentModel> loaded;
        const auto result = Serialization::parseDocumentFromJsonString(json, loaded);
        if (result.failed())
        {
            DBG("[Teul] load failed: " << result.getErrorMessage());
            return result;
        }

        impl->resetTo(std::move(*loaded));
        return juce::Result::ok();
    }

    juce::Result DocumentHandle::saveToFile(const juce::File& file) const
    {
        return Serialization::saveDocumentToFile(file, snapshot());
    }

    juce::Result DocumentHandle::loadFromFile(const juce::File& file)
    {
        std::optional<DocumentModel> loaded;
        const auto result = Serialization::loadDocumentFromFile(file, loaded);
        if (result.failed())
        {
            DBG("[Teul] load failed: " << result.getErrorMessage());
            return result;
        }

        impl->resetTo(std::move(*loaded));
        return juce::Result::ok();
    }
}
