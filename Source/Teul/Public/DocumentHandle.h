#pragma once

#include "Teul/Core/IdGenerator.h"
#include "Teul/Core/PropertyInput.h"
#include "Teul/Public/DocumentModel.h"
#include <functional>
#include <memory>
#include <optional>

namespace Teul
{
    // Entry point for user-intent edits. Each successful edit is exactly one undo
    // step; failed edits leave the document and the history untouched.
    class DocumentHandle
    {
    public:
        DocumentHandle();
        explicit DocumentHandle(Core::Seed seed);
        ~DocumentHandle();
        DocumentHandle(DocumentHandle&&) noexcept;
        DocumentHandle& operator=(DocumentHandle&&) noexcept;

        DocumentHandle(const DocumentHandle&) = delete;
        DocumentHandle& operator=(const DocumentHandle&) = delete;

        const DocumentModel& snapshot() const noexcept;
        const EditorStateModel& editorState() const noexcept;
        Core::Seed currentSeed() const noexcept;

        // Structure
        std::optional<NodeId> insertFromTemplate(const Core::Tree& prototype, const NodeId& targetId);
        std::optional<NodeId> duplicate(const NodeId& id);
        bool remove(const NodeId& id);
        bool moveNode(const NodeId& id, const NodeId& targetId, DropPosition position);

        // Clipboard
        std::optional<juce::String> copyNode(const NodeId& id) const;
        std::optional<NodeId> paste(const juce::String& json, const NodeId& targetId);

        // Content and style
        bool rename(const NodeId& id, const juce::String& name);
        bool updateNode(const NodeId& id, const std::function<Node(const Node&)>& transform);
        bool applyPropertyText(const NodeId& id,
                               Core::PropertyInput::Field field,
                               const juce::String& text,
                               Edge edge = Edge::top,
                               Corner corner = Corner::topLeft);

        bool setViewport(const Viewport& viewport);

        // Outline state, not recorded in history.
        bool setCollapsed(const NodeId& id, bool collapsed);

        // In-progress edits (typing, dragging a slider) update the present only.
        // Committing records one step against the state before the first preview.
        bool beginCoalescedEdit(const juce::String& key);
        bool previewUpdateNode(const NodeId& id, const std::function<Node(const Node&)>& transform);
        bool previewPropertyText(const NodeId& id,
                                 Core::PropertyInput::Field field,
                                 const juce::String& text,
                                 Edge edge = Edge::top,
                                 Corner corner = Corner::topLeft);
        bool endCoalescedEdit(const juce::String& key, bool commit);
        bool isCoalescedEditActive() const noexcept;

        // Drag-and-drop queries
        bool canDrop(NodeType candidate, const NodeId& targetId, DropPosition position) const;
        std::vector<NodeId> dropTargetsFor(NodeType candidate) const;

        void select(const NodeId& id);
        void clearSelection();

        bool canUndo() const noexcept;
        bool canRedo() const noexcept;
        int undoDepth() const noexcept;
        int redoDepth() const noexcept;
        bool undo();
        bool redo();
        void setHistoryLimit(size_t limit) noexcept;

        juce::Result toJson(juce::String& jsonOut) const;
        juce::Result loadFromJson(const juce::String& json);
        juce::Result saveToFile(const juce::File& file) const;
        juce::Result loadFromFile(const juce::File& file);

    private:
        class Impl;
        std::unique_ptr<Impl> impl;
    };
}
