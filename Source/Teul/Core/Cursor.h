#pragma once

#include "Teul/Core/Tree.h"
#include <functional>
#include <optional>
#include <vector>

namespace Teul::Core
{
    // Zipper over a Tree.
    //
    // The position is the focused subtree plus one crumb per ancestor. A crumb keeps
    // the parent label and the focus' siblings on each side, which is enough to
    // rebuild the parent without any back pointers.
    //
    // Navigation returns std::nullopt at a boundary. Mutations never touch the tree
    // they started from; illegal ones (sibling insert or remove at the root) return
    // the cursor unchanged.
    class Cursor
    {
    public:
        explicit Cursor(Tree tree);

        const Tree& focus() const noexcept;
        const Node& node() const noexcept;

        bool isRoot() const noexcept;
        size_t depth() const noexcept;
        size_t indexInParent() const noexcept;

        std::optional<Cursor> parent() const;
        std::optional<Cursor> nextSibling() const;
        std::optional<Cursor> previousSibling() const;
        std::optional<Cursor> firstChild() const;
        std::optional<Cursor> lastChild() const;

        Cursor root() const;
        Tree toTree() const;

        // Pre-order search starting at the root of the whole tree.
        std::optional<Cursor> findById(const NodeId& id) const;

        std::vector<NodeId> path() const;

        Cursor mapNode(const std::function<Node(const Node&)>& transform) const;
        Cursor replaceFocus(Tree subtree) const;

        Cursor appendChild(Tree subtree) const;
        Cursor insertBefore(Tree subtree) const;
        Cursor insertAfter(Tree subtree) const;
        Cursor remove() const;

    private:
        struct Crumb
        {
            Node parentLabel;
            std::vector<Tree> left;   // in document order
            std::vector<Tree> right;  // in document order
            Tree original;            // parent as it was before descending
        };

        Cursor(Tree focusTree, std::vector<Crumb> crumbs, bool modified);

        Cursor descend(size_t childIndex) const;
        static Tree rebuildParent(const Crumb& crumb, Tree focusTree);

        Tree focusTree;
        std::vector<Crumb> crumbs;    // back() is the nearest ancestor
        bool modified = false;        // ancestors must be rebuilt on the way up
    };
}
