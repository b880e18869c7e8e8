#include "Teul/Core/History.h"
#include "Teul/Core/PropertyResolver.h"
#include "Teul/Core/Templates.h"
#include "Teul/Core/TreeValidator.h"
#include "Teul/Public/DocumentHandle.h"
#include "Teul/Serialization/DocumentJson.h"

#include <functional>
#include <iostream>
#include <set>
#include <vector>

namespace
{
    using Teul::Core::PropertyInput::Field;
    using Teul::DropPosition;
    using Teul::NodeType;

    Teul::DocumentHandle makeHandle()
    {
        return Teul::DocumentHandle(Teul::Core::Seed::fromWords(7u, 11u, 13u, 17u));
    }

    Teul::NodeId firstPageId(const Teul::DocumentHandle& handle)
    {
        return handle.snapshot().tree.children().front().label().id;
    }

    const Teul::Node* findNode(const Teul::DocumentHandle& handle, const Teul::NodeId& id)
    {
        const auto cursor = Teul::Core::Cursor(handle.snapshot().tree).findById(id);
        if (!cursor.has_value())
            return nullptr;

        // Labels live in shared storage owned by the snapshot tree.
        return &cursor->focus().label();
    }

    std::optional<Teul::NodeId> insert(Teul::DocumentHandle& handle, NodeType type, const Teul::NodeId& targetId)
    {
        return handle.insertFromTemplate(Teul::Core::Templates::templateFor(type), targetId);
    }

    struct SampleIds
    {
        Teul::NodeId row;
        Teul::NodeId heading;
        Teul::NodeId column;
        Teul::NodeId text;
        Teul::NodeId button;
    };

    // page > row > (heading, column > (text, button))
    std::optional<SampleIds> buildSample(Teul::DocumentHandle& handle)
    {
        const auto row = insert(handle, NodeType::row, firstPageId(handle));
        if (!row.has_value())
            return std::nullopt;

        const auto heading = insert(handle, NodeType::heading, *row);
        const auto column = insert(handle, NodeType::column, *row);
        if (!heading.has_value() || !column.has_value())
            return std::nullopt;

        const auto text = insert(handle, NodeType::text, *column);
        const auto button = insert(handle, NodeType::button, *column);
        if (!text.has_value() || !button.has_value())
            return std::nullopt;

        return SampleIds { *row, *heading, *column, *text, *button };
    }

    juce::Result testHistorySemantics()
    {
        Teul::Core::History<juce::String> history("A");
        if (history.hasPast() || history.hasFuture())
            return juce::Result::fail("fresh history must be empty");

        history.apply("B");
        if (history.present() != "B" || history.past() != std::vector<juce::String> { "A" } || history.hasFuture())
            return juce::Result::fail("apply must push the old present onto past");

        if (!history.undo() || history.present() != "A" || history.future() != std::vector<juce::String> { "B" })
            return juce::Result::fail("undo must move the present onto future");

        if (!history.redo() || history.present() != "B" || history.hasFuture())
            return juce::Result::fail("redo must restore the undone state");

        history.undo();
        if (history.undo() || history.present() != "A")
            return juce::Result::fail("undo with an empty past must be a no-op");

        history.apply("C");
        if (history.hasFuture())
            return juce::Result::fail("apply must clear future");

        Teul::Core::History<int> bounded(0);
        bounded.setLimit(3);
        for (int i = 1; i <= 10; ++i)
            bounded.apply(i);

        if (bounded.undoDepth() != 3 || bounded.past().front() != 7)
            return juce::Result::fail("history limit must drop the oldest entries");

        if (history.getLimit() != 256)
            return juce::Result::fail("default history limit must be 256");

        bounded.setLimit(0);
        if (bounded.getLimit() != 1 || bounded.undoDepth() != 1)
            return juce::Result::fail("history limit must not drop below one");

        return juce::Result::ok();
    }

    juce::Result testInitialDocument()
    {
        auto handle = makeHandle();
        const auto& document = handle.snapshot();

        if (Teul::typeOf(document.tree.label()) != NodeType::document)
            return juce::Result::fail("root must be a document");
        if (document.tree.children().size() != 1 || Teul::typeOf(document.tree.children().front().label()) != NodeType::page)
            return juce::Result::fail("new document must hold one page");
        if (handle.canUndo() || handle.canRedo())
            return juce::Result::fail("new document must have no history");

        const auto validation = Teul::Core::TreeValidator::validateDocument(document);
        if (validation.failed())
            return juce::Result::fail("initial document invalid: " + validation.getErrorMessage());

        return juce::Result::ok();
    }

    juce::Result testInsertAndUndoRedo()
    {
        auto handle = makeHandle();
        const auto sample = buildSample(handle);
        if (!sample.has_value())
            return juce::Result::fail("building the sample tree failed");

        if (handle.undoDepth() != 5)
            return juce::Result::fail("each insert must record exactly one undo step");
        if (handle.editorState().selection != sample->button)
            return juce::Result::fail("insert must select the new node");

        const auto seedAfterInserts = handle.currentSeed();

        if (!handle.undo() || findNode(handle, sample->button) != nullptr)
            return juce::Result::fail("undo must remove the last insert");
        if (handle.editorState().selection == sample->button)
            return juce::Result::fail("selection must leave a node that no longer exists");
        if (!handle.redo() || findNode(handle, sample->button) == nullptr)
            return juce::Result::fail("redo must restore the last insert");

        handle.undo();
        const auto again = insert(handle, NodeType::button, sample->column);
        if (!again.has_value() || *again == sample->button)
            return juce::Result::fail("ids must not be reused after undo");
        if (handle.currentSeed() == seedAfterInserts)
            return juce::Result::fail("seed must keep moving after undo");
        if (handle.canRedo())
            return juce::Result::fail("a new edit must clear redo");

        return juce::Result::ok();
    }

    juce::Result testRejectedEditsLeaveHistoryAlone()
    {
        auto handle = makeHandle();
        const auto sample = buildSample(handle);
        if (!sample.has_value())
            return juce::Result::fail("building the sample tree failed");

        const auto depth = handle.undoDepth();
        const auto rootId = handle.snapshot().tree.label().id;

        if (handle.remove(rootId))
            return juce::Result::fail("removing the root must be refused");
        if (insert(handle, NodeType::option, sample->column).has_value())
            return juce::Result::fail("option must not be inserted into a column");
        if (insert(handle, NodeType::row, rootId).has_value())
            return juce::Result::fail("only pages may be inserted under the document");
        if (insert(handle, NodeType::text, juce::Uuid()).has_value())
            return juce::Result::fail("insert into an unknown target must fail");
        if (handle.rename(juce::Uuid(), "Ghost"))
            return juce::Result::fail("rename of an unknown node must fail");

        // A leaf directly under a page would land beside the page.
        const auto pageHeading = insert(handle, NodeType::heading, firstPageId(handle));
        if (!pageHeading.has_value())
            return juce::Result::fail("heading into page failed");
        if (insert(handle, NodeType::text, *pageHeading).has_value())
            return juce::Result::fail("insert beside a page must be refused");

        if (handle.undoDepth() != depth + 1)
            return juce::Result::fail("refused edits must not record history");

        return juce::Result::ok();
    }

    juce::Result testDuplicateSubtree()
    {
        auto handle = makeHandle();
        const auto sample = buildSample(handle);
        if (!sample.has_value())
            return juce::Result::fail("building the sample tree failed");

        const auto before = Teul::Core::collectIds(handle.snapshot().tree);
        const std::set<Teul::NodeId> existing(before.begin(), before.end());
        const auto depth = handle.undoDepth();

        const auto copyId = handle.duplicate(sample->row);
        if (!copyId.has_value())
            return juce::Result::fail("duplicate failed");
        if (handle.undoDepth() != depth + 1)
            return juce::Result::fail("duplicate must be one undo step");

        const auto copy = Teul::Core::Cursor(handle.snapshot().tree).findById(*copyId);
        const auto copyIds = Teul::Core::collectIds(copy->focus());
        const std::set<Teul::NodeId> unique(copyIds.begin(), copyIds.end());
        if (copyIds.size() != 5 || unique.size() != 5)
            return juce::Result::fail("duplicated row must carry five distinct ids");

        for (const auto& id : copyIds)
        {
            if (existing.count(id) != 0)
                return juce::Result::fail("duplicate reused an existing id");
        }

        if (copy->indexInParent() != 1 || copy->previousSibling()->node().id != sample->row)
            return juce::Result::fail("duplicate must land right after the original");

        if (handle.duplicate(handle.snapshot().tree.label().id).has_value())
            return juce::Result::fail("the root must not be duplicated");

        return juce::Result::ok();
    }

    juce::Result testMoveNode()
    {
        auto handle = makeHandle();
        const auto sample = buildSample(handle);
        if (!sample.has_value())
            return juce::Result::fail("building the sample tree failed");

        handle.updateNode(sample->column,
                          [](const Teul::Node& node)
                          {
                              auto next = node;
                              next.fontColor = Teul::Inheritable<juce::Colour>::localValue(juce::Colours::red);
                              return next;
                          });

        const auto colourOf = [&handle](const Teul::NodeId& id)
        {
            const auto cursor = Teul::Core::Cursor(handle.snapshot().tree).findById(id);
            return Teul::Core::PropertyResolver::resolveFontColor(*cursor, juce::Colours::black);
        };

        if (colourOf(sample->heading) != juce::Colours::black)
            return juce::Result::fail("heading outside the column must not inherit its colour");

        const auto depth = handle.undoDepth();
        if (!handle.moveNode(sample->heading, sample->column, DropPosition::inside))
            return juce::Result::fail("move inside column failed");
        if (handle.undoDepth() != depth + 1)
            return juce::Result::fail("move must be one undo step");
        if (colourOf(sample->heading) != juce::Colours::red)
            return juce::Result::fail("reparented heading must resolve the column's colour");

        if (!handle.moveNode(sample->heading, sample->text, DropPosition::before))
            return juce::Result::fail("move before text failed");

        const auto heading = Teul::Core::Cursor(handle.snapshot().tree).findById(sample->heading);
        if (heading->indexInParent() != 0 || heading->nextSibling()->node().id != sample->text)
            return juce::Result::fail("move before must land ahead of the target");

        if (handle.moveNode(sample->row, sample->column, DropPosition::inside))
            return juce::Result::fail("a node must not move into its own subtree");
        if (handle.moveNode(sample->row, handle.snapshot().tree.label().id, DropPosition::inside))
            return juce::Result::fail("a row must not move under the document");
        if (handle.moveNode(sample->text, firstPageId(handle), DropPosition::after))
            return juce::Result::fail("a text must not sit beside a page");

        handle.undo();
        handle.undo();
        if (colourOf(sample->heading) != juce::Colours::black)
            return juce::Result::fail("undoing the move must restore the original resolution");

        return juce::Result::ok();
    }

    juce::Result testDropTargets()
    {
        auto handle = makeHandle();
        const auto sample = buildSample(handle);
        if (!sample.has_value())
            return juce::Result::fail("building the sample tree failed");

        const auto radio = insert(handle, NodeType::radio, sample->column);
        if (!radio.has_value())
            return juce::Result::fail("radio into column failed");

        if (handle.dropTargetsFor(NodeType::option) != std::vector<Teul::NodeId> { *radio })
            return juce::Result::fail("options drop only into radios");

        const auto rootId = handle.snapshot().tree.label().id;
        if (handle.dropTargetsFor(NodeType::page) != std::vector<Teul::NodeId> { rootId })
            return juce::Result::fail("pages drop only into the document");

        const auto rowTargets = handle.dropTargetsFor(NodeType::button);
        const std::vector<Teul::NodeId> expected { firstPageId(handle), sample->row, sample->column };
        if (rowTargets != expected)
            return juce::Result::fail("buttons drop into the page, row and column");

        if (!handle.canDrop(NodeType::option, *radio, DropPosition::inside))
            return juce::Result::fail("radio must accept a dropped option");

        const auto option = Teul::Core::Cursor(handle.snapshot().tree).findById(*radio)->firstChild()->node().id;
        if (!handle.canDrop(NodeType::option, option, DropPosition::after))
            return juce::Result::fail("option must be droppable beside an option");
        if (handle.canDrop(NodeType::text, option, DropPosition::before))
            return juce::Result::fail("text must not be droppable beside an option");
        if (handle.canDrop(NodeType::page, rootId, DropPosition::before))
            return juce::Result::fail("nothing can be dropped beside the root");

        return juce::Result::ok();
    }

    juce::Result testSelectionRepair()
    {
        auto handle = makeHandle();
        const auto sample = buildSample(handle);
        if (!sample.has_value())
            return juce::Result::fail("building the sample tree failed");

        handle.select(sample->text);
        if (!handle.remove(sample->column))
            return juce::Result::fail("remove column failed");
        if (handle.editorState().selection != firstPageId(handle))
            return juce::Result::fail("selection must fall back to the first page");

        handle.select(juce::Uuid());
        if (handle.editorState().selection != firstPageId(handle))
            return juce::Result::fail("selecting an unknown id must be ignored");

        handle.clearSelection();
        if (handle.editorState().selection.has_value())
            return juce::Result::fail("clearSelection must empty the selection");

        return juce::Result::ok();
    }

    juce::Result testCollapseIsNotHistory()
    {
        auto handle = makeHandle();
        const auto sample = buildSample(handle);
        if (!sample.has_value())
            return juce::Result::fail("building the sample tree failed");

        const auto depth = handle.undoDepth();
        if (!handle.setCollapsed(sample->row, true) || handle.undoDepth() != depth)
            return juce::Result::fail("collapse must not record history");
        if (handle.snapshot().collapsedIds.count(sample->row) != 1)
            return juce::Result::fail("collapse must be stored on the document");

        handle.remove(sample->row);
        if (!handle.snapshot().collapsedIds.empty())
            return juce::Result::fail("removed nodes must leave the collapsed set");

        handle.undo();
        if (handle.snapshot().collapsedIds.count(sample->row) != 1)
            return juce::Result::fail("undo must bring back the collapsed state with the node");

        if (handle.setCollapsed(juce::Uuid(), true))
            return juce::Result::fail("collapsing an unknown node must fail");

        return juce::Result::ok();
    }

    juce::Result testCoalescedPreviewRollbackAndCommit()
    {
        auto handle = makeHandle();
        const auto sample = buildSample(handle);
        if (!sample.has_value())
            return juce::Result::fail("building the sample tree failed");

        const auto depth = handle.undoDepth();
        const auto originalWidth = findNode(handle, sample->button)->width;

        if (handle.isCoalescedEditActive())
            return juce::Result::fail("no coalesced edit may be open initially");
        if (!handle.beginCoalescedEdit("width") || !handle.isCoalescedEditActive())
            return juce::Result::fail("beginCoalescedEdit failed");
        if (handle.beginCoalescedEdit("other"))
            return juce::Result::fail("a second coalesced edit must be refused");

        for (const auto* text : { "1", "12", "120" })
        {
            if (!handle.previewPropertyText(sample->button, Field::width, text))
                return juce::Result::fail("preview failed");
        }

        if (handle.undoDepth() != depth)
            return juce::Result::fail("previews must not record history");
        if (findNode(handle, sample->button)->width.px != 120)
            return juce::Result::fail("preview must update the present");
        if (handle.rename(sample->button, "Blocked") || handle.undo())
            return juce::Result::fail("discrete edits must wait for the coalesced edit");
        if (handle.endCoalescedEdit("other", true))
            return juce::Result::fail("ending with the wrong key must fail");

        if (!handle.isCoalescedEditActive())
            return juce::Result::fail("a wrong key must leave the coalesced edit open");
        if (!handle.endCoalescedEdit("width", true) || handle.isCoalescedEditActive())
            return juce::Result::fail("endCoalescedEdit commit failed");
        if (handle.undoDepth() != depth + 1)
            return juce::Result::fail("commit must record exactly one step");

        handle.beginCoalescedEdit("width");
        handle.previewPropertyText(sample->button, Field::width, "300");
        handle.endCoalescedEdit("width", false);
        if (findNode(handle, sample->button)->width.px != 120 || handle.undoDepth() != depth + 1)
            return juce::Result::fail("cancel must restore the baseline");

        handle.beginCoalescedEdit("noop");
        handle.endCoalescedEdit("noop", true);
        if (handle.undoDepth() != depth + 1)
            return juce::Result::fail("an unchanged coalesced edit must not record history");

        handle.undo();
        if (!(findNode(handle, sample->button)->width == originalWidth))
            return juce::Result::fail("undo must return to the state before the first preview");

        return juce::Result::ok();
    }

    juce::Result testPropertyTextEdits()
    {
        auto handle = makeHandle();
        const auto sample = buildSample(handle);
        if (!sample.has_value())
            return juce::Result::fail("building the sample tree failed");

        if (!handle.applyPropertyText(sample->button, Field::widthMin, "99999"))
            return juce::Result::fail("width min edit failed");
        if (findNode(handle, sample->button)->width.min != 9999)
            return juce::Result::fail("width min must clamp to 9999");

        if (!handle.applyPropertyText(sample->button, Field::spacing, "-5", Teul::Edge::right))
            return juce::Result::fail("spacing edit failed");
        if (findNode(handle, sample->button)->spacing.right != 0)
            return juce::Result::fail("negative spacing must fall back to 0");

        if (!handle.rename(sample->button, "  Submit  ") || findNode(handle, sample->button)->name != "Submit")
            return juce::Result::fail("rename must store the trimmed name");

        const auto changedType = handle.updateNode(sample->button,
                                                   [](const Teul::Node& node)
                                                   {
                                                       auto next = node;
                                                       next.data = Teul::OptionData {};
                                                       return next;
                                                   });
        if (changedType)
            return juce::Result::fail("turning a column child into an option must be refused");

        Teul::Viewport phone;
        phone.kind = Teul::ViewportKind::device;
        phone.deviceName = "Phone";
        phone.width = 390;
        phone.height = 844;
        if (!handle.setViewport(phone) || !(handle.snapshot().viewport == phone))
            return juce::Result::fail("setViewport failed");

        phone.width = 0;
        if (handle.setViewport(phone))
            return juce::Result::fail("a zero-width device viewport must be refused");

        return juce::Result::ok();
    }

    juce::Result testClipboard()
    {
        auto handle = makeHandle();
        const auto sample = buildSample(handle);
        if (!sample.has_value())
            return juce::Result::fail("building the sample tree failed");

        const auto json = handle.copyNode(sample->column);
        if (!json.has_value())
            return juce::Result::fail("copyNode failed");

        const auto pasted = handle.paste(*json, sample->row);
        if (!pasted.has_value())
            return juce::Result::fail("paste failed");

        const auto copy = Teul::Core::Cursor(handle.snapshot().tree).findById(*pasted);
        const auto original = Teul::Core::Cursor(handle.snapshot().tree).findById(sample->column);
        if (!Teul::Core::structurallyEqual(copy->focus(), original->focus(), false))
            return juce::Result::fail("pasted subtree must match the copied content");
        if (Teul::Core::containsId(copy->focus(), sample->text))
            return juce::Result::fail("pasted subtree must carry fresh ids");

        if (handle.paste("{ not json", sample->row).has_value())
            return juce::Result::fail("malformed clipboard text must be refused");

        juce::String documentJson;
        handle.toJson(documentJson);
        if (handle.paste(documentJson, sample->row).has_value())
            return juce::Result::fail("a whole document must not be pasted as a node");

        return juce::Result::ok();
    }

    juce::Result testRoundTripDocument()
    {
        auto handle = makeHandle();
        const auto sample = buildSample(handle);
        if (!sample.has_value())
            return juce::Result::fail("building the sample tree failed");

        handle.updateNode(sample->heading,
                          [](const Teul::Node& node)
                          {
                              auto next = node;
                              next.fontColor = Teul::Inheritable<juce::Colour>::localValue(juce::Colour(0x80336699));
                              next.fontFamily = Teul::Inheritable<juce::String>::localValue("Inter");
                              next.transformation.rotation = 12.5f;
                              next.shadow.type = Teul::ShadowType::inner;
                              next.alignment.x = Teul::Align::center;
                              return next;
                          });
        handle.applyPropertyText(sample->button, Field::heightMax, "48");
        handle.setCollapsed(sample->column, true);

        juce::String json;
        const auto saveResult = handle.toJson(json);
        if (saveResult.failed())
            return juce::Result::fail("toJson failed: " + saveResult.getErrorMessage());

        auto restored = makeHandle();
        const auto loadResult = restored.loadFromJson(json);
        if (loadResult.failed())
            return juce::Result::fail("loadFromJson failed: " + loadResult.getErrorMessage());

        if (!Teul::Core::structurallyEqual(restored.snapshot().tree, handle.snapshot().tree))
            return juce::Result::fail("round trip changed the tree");
        if (restored.snapshot().collapsedIds != handle.snapshot().collapsedIds)
            return juce::Result::fail("round trip changed the collapsed set");
        if (restored.canUndo() || restored.editorState().selection.has_value())
            return juce::Result::fail("loading must start a fresh history and selection");

        const auto file = juce::File::createTempFile(".teul.json");
        const auto fileSave = handle.saveToFile(file);
        const auto fileLoad = restored.loadFromFile(file);
        file.deleteFile();
        if (fileSave.failed() || fileLoad.failed())
            return juce::Result::fail("file round trip failed");

        return juce::Result::ok();
    }

    juce::Result testSchemaChecks()
    {
        auto handle = makeHandle();
        juce::String json;
        handle.toJson(json);

        const auto withVersion = [&json](int major, int minor)
        {
            auto root = juce::JSON::parse(json);
            auto* version = root.getProperty("version", {}).getDynamicObject();
            version->setProperty("major", major);
            version->setProperty("minor", minor);
            return juce::JSON::toString(root, true);
        };

        auto target = makeHandle();
        const auto before = target.snapshot().tree;

        if (target.loadFromJson(withVersion(2, 0)).wasOk())
            return juce::Result::fail("a different major version must be refused");
        if (target.loadFromJson(withVersion(1, 9)).wasOk())
            return juce::Result::fail("a newer minor version must be refused");
        if (target.loadFromJson("{ \"document\": {} }").wasOk())
            return juce::Result::fail("a missing version must be refused");
        if (target.loadFromJson("[]").wasOk())
            return juce::Result::fail("a non-object root must be refused");

        if (!target.snapshot().tree.sharesStorageWith(before))
            return juce::Result::fail("failed loads must leave the document alone");

        return juce::Result::ok();
    }

    juce::Result testMigrationFrom_1_0()
    {
        auto handle = makeHandle();
        const auto sample = buildSample(handle);
        if (!sample.has_value())
            return juce::Result::fail("building the sample tree failed");

        juce::String json;
        handle.toJson(json);

        auto root = juce::JSON::parse(json);
        auto* object = root.getDynamicObject();
        object->getProperty("version").getDynamicObject()->setProperty("minor", 0);
        const auto tree = object->getProperty("document");
        object->setProperty("tree", tree);
        object->removeProperty("document");
        object->removeProperty("viewport");
        object->removeProperty("collapsed");

        std::optional<Teul::DocumentModel> migrated;
        const auto result = Teul::Serialization::parseDocumentFromJsonString(juce::JSON::toString(root, true), migrated);
        if (result.failed())
            return juce::Result::fail("1.0 document failed to load: " + result.getErrorMessage());

        if (Teul::compareSchemaVersion(migrated->schemaVersion, Teul::currentSchemaVersion()) != 0)
            return juce::Result::fail("migrated document must carry the current schema");
        if (!Teul::Core::structurallyEqual(migrated->tree, handle.snapshot().tree))
            return juce::Result::fail("migration changed the tree");
        if (!(migrated->viewport == Teul::Viewport {}) || !migrated->collapsedIds.empty())
            return juce::Result::fail("migration must add the default viewport and collapsed set");

        return juce::Result::ok();
    }

    juce::Result testUnchangedEditsRecordNothing()
    {
        auto handle = makeHandle();
        const auto sample = buildSample(handle);
        if (!sample.has_value())
            return juce::Result::fail("building the sample tree failed");

        const auto depth = handle.undoDepth();
        const auto currentName = findNode(handle, sample->button)->name;

        if (!handle.rename(sample->button, currentName))
            return juce::Result::fail("renaming to the same name must succeed");
        if (!handle.setViewport(handle.snapshot().viewport))
            return juce::Result::fail("setting the same viewport must succeed");
        if (!handle.applyPropertyText(sample->button, Field::widthMin, ""))
            return juce::Result::fail("clearing an unset bound must succeed");
        if (!handle.moveNode(sample->button, sample->text, DropPosition::after))
            return juce::Result::fail("dropping a node where it already is must succeed");

        if (handle.undoDepth() != depth)
            return juce::Result::fail("edits that change nothing must not record history");

        return juce::Result::ok();
    }

    juce::Result testSeedMovesPastRefusedInsert()
    {
        auto source = makeHandle();
        const auto sourceRow = insert(source, NodeType::row, firstPageId(source));
        if (!sourceRow.has_value())
            return juce::Result::fail("row into page failed");

        juce::String json;
        source.toJson(json);

        // Same seed: the next id this handle draws is already in the loaded document.
        auto target = makeHandle();
        if (target.loadFromJson(json).failed())
            return juce::Result::fail("loading the source document failed");

        const auto seedBefore = target.currentSeed();
        if (insert(target, NodeType::row, firstPageId(target)).has_value())
            return juce::Result::fail("an insert reusing an existing id must be refused");
        if (target.currentSeed() == seedBefore)
            return juce::Result::fail("a refused insert must still spend its ids");

        const auto retried = insert(target, NodeType::row, firstPageId(target));
        if (!retried.has_value() || *retried == *sourceRow)
            return juce::Result::fail("the next insert must draw a fresh id");

        const auto copy = target.duplicate(*retried);
        if (!copy.has_value())
            return juce::Result::fail("duplicate after a refused insert failed");

        return juce::Result::ok();
    }

    juce::Result testLoadClampsOutOfRangeNumbers()
    {
        auto handle = makeHandle();
        const auto sample = buildSample(handle);
        if (!sample.has_value())
            return juce::Result::fail("building the sample tree failed");

        handle.applyPropertyText(sample->button, Field::widthMin, "10");

        juce::String json;
        handle.toJson(json);

        auto root = juce::JSON::parse(json);
        const auto button = root.getProperty("document", {})["children"][0]["children"][0]["children"][1]["children"][1];
        auto* node = button.getDynamicObject();
        if (node == nullptr || node->getProperty("name").toString() != "Button")
            return juce::Result::fail("could not locate the button in the saved JSON");

        node->getProperty("width").getDynamicObject()->setProperty("px", juce::var(static_cast<juce::int64>(4294967301LL)));
        node->getProperty("width").getDynamicObject()->setProperty("min", -1.0e20);
        node->getProperty("height").getDynamicObject()->setProperty("px", 1.0e20);
        node->getProperty("padding").getDynamicObject()->setProperty("top", juce::var(static_cast<juce::int64>(-4294967296LL)));

        auto* transformation = node->getProperty("transformation").getDynamicObject();
        transformation->setProperty("offsetX", -1.0e300);
        transformation->setProperty("rotation", 1.0e300);
        transformation->setProperty("scale", 50.0);

        auto* shadow = node->getProperty("shadow").getDynamicObject();
        shadow->setProperty("size", 1.0e300);
        shadow->setProperty("blur", -3.0);

        node->setProperty("fontSize", 100000);

        auto restored = makeHandle();
        const auto result = restored.loadFromJson(juce::JSON::toString(root, true));
        if (result.failed())
            return juce::Result::fail("out-of-range numbers must load clamped: " + result.getErrorMessage());

        const auto* loaded = findNode(restored, sample->button);
        if (loaded == nullptr)
            return juce::Result::fail("button missing after load");

        if (loaded->width.px != 9999 || loaded->width.min != 0 || loaded->height.px != 9999)
            return juce::Result::fail("lengths must clamp to [0, 9999] without wrapping");
        if (loaded->padding.top != 0)
            return juce::Result::fail("negative int64 padding must clamp to 0");
        if (loaded->transformation.offsetX != -9999.0f || loaded->transformation.rotation != 360.0f
            || loaded->transformation.scale != 10.0f)
            return juce::Result::fail("transformation must clamp to the inspector ranges");
        if (loaded->shadow.size != 9999.0f || loaded->shadow.blur != 0.0f)
            return juce::Result::fail("shadow size and blur must clamp to [0, 9999]");
        if (loaded->fontSize.local != 999)
            return juce::Result::fail("font size must clamp to 999");

        node->setProperty("fontSize", -5);
        if (restored.loadFromJson(juce::JSON::toString(root, true)).failed())
            return juce::Result::fail("reload with a negative font size failed");
        if (findNode(restored, sample->button)->fontSize.local != 1)
            return juce::Result::fail("font size must clamp to 1");

        return juce::Result::ok();
    }

    juce::Result testValidatorRejectsBrokenTrees()
    {
        auto handle = makeHandle();
        const auto& tree = handle.snapshot().tree;

        const auto page = tree.children().front();
        const auto duplicatePages = tree.withChildren({ page, page });
        if (Teul::Core::TreeValidator::validateTree(duplicatePages).wasOk())
            return juce::Result::fail("duplicate ids must be rejected");

        const auto placeholder = Teul::Core::Templates::templateFor(NodeType::text);
        if (Teul::Core::TreeValidator::validateTree(tree.withChildren({ page.withChildren({ placeholder }) })).wasOk())
            return juce::Result::fail("placeholder ids must be rejected");

        if (Teul::Core::TreeValidator::validateTree(page).wasOk())
            return juce::Result::fail("a tree must be rooted at a document");

        return juce::Result::ok();
    }

    juce::Result testUndoRedo100()
    {
        auto handle = makeHandle();
        const auto sample = buildSample(handle);
        if (!sample.has_value())
            return juce::Result::fail("building the sample tree failed");

        for (int i = 1; i <= 100; ++i)
        {
            if (!handle.applyPropertyText(sample->button, Field::width, juce::String(i)))
                return juce::Result::fail("width edit failed at step " + juce::String(i));
        }

        for (int i = 0; i < 99; ++i)
        {
            if (!handle.undo())
                return juce::Result::fail("undo failed at step " + juce::String(i));
        }

        if (findNode(handle, sample->button)->width.px != 1)
            return juce::Result::fail("undo final width mismatch");

        for (int i = 0; i < 99; ++i)
        {
            if (!handle.redo())
                return juce::Result::fail("redo failed at step " + juce::String(i));
        }

        if (findNode(handle, sample->button)->width.px != 100 || handle.canRedo())
            return juce::Result::fail("redo final width mismatch");

        handle.setHistoryLimit(10);
        if (handle.undoDepth() != 10)
            return juce::Result::fail("setHistoryLimit must trim the oldest steps");

        return juce::Result::ok();
    }
}

int main()
{
    const std::vector<std::pair<const char*, std::function<juce::Result()>>> tests =
    {
        { "History semantics", testHistorySemantics },
        { "Initial document", testInitialDocument },
        { "Insert and undo/redo", testInsertAndUndoRedo },
        { "Rejected edits leave history alone", testRejectedEditsLeaveHistoryAlone },
        { "Duplicate subtree", testDuplicateSubtree },
        { "Move node", testMoveNode },
        { "Drop targets", testDropTargets },
        { "Selection repair", testSelectionRepair },
        { "Collapse is not history", testCollapseIsNotHistory },
        { "Coalesced preview rollback/commit", testCoalescedPreviewRollbackAndCommit },
        { "Property text edits", testPropertyTextEdits },
        { "Unchanged edits record nothing", testUnchangedEditsRecordNothing },
        { "Seed moves past a refused insert", testSeedMovesPastRefusedInsert },
        { "Clipboard copy/paste", testClipboard },
        { "Round-trip document", testRoundTripDocument },
        { "Schema checks", testSchemaChecks },
        { "Migration from 1.0", testMigrationFrom_1_0 },
        { "Load clamps out-of-range numbers", testLoadClampsOutOfRangeNumbers },
        { "Validator rejects broken trees", testValidatorRejectsBrokenTrees },
        { "Undo/Redo 100", testUndoRedo100 }
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

    std::cout << "Document smoke passed." << std::endl;
    return 0;
}
