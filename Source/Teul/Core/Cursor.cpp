#include "Teul/Core/Cursor.h"

namespace
{
    bool findIndexPath(const Teul::Core::Tree& tree, const Teul::NodeId& id, std::vector<size_t>& pathOut)
    {
        if (tree.label().id == id)
            return true;

        const auto& children = tree.children();
        for (size_t i = 0; i < children.size(); ++i)
        {
            pathOut.push_back(i);
            if (findIndexPath(children[i], id, pathOut))
                return true;
            pathOut.pop_back();
        }

        return false;
    }
}

namespace Teul::Core
{
    Cursor::Cursor(Tree tree)
        : focusTree(std::move(tree))
    {
    }

    Cursor::Cursor(Tree focusTreeIn, std::vector<Crumb> crumbsIn, bool modifiedIn)
        : focusTree(std::move(focusTreeIn)),
          crumbs(std::move(crumbsIn)),
          modified(modifiedIn)
    {
    }

    const Tree& Cursor::focus() const noexcept
    {
        return focusTree;
    }

    const Node& Cursor::node() const noexcept
    {
        return focusTree.label();
    }

    bool Cursor::isRoot() const noexcept
    {
        return crumbs.empty();
    }

    size_t Cursor::depth() const noexcept
    {
        return crumbs.size();
    }

    size_t Cursor::indexInParent() const noexcept
    {
        return crumbs.empty() ? 0 : crumbs.back().left.size();
    }

    Tree Cursor::rebuildParent(const Crumb& crumb, Tree focusTreeIn)
    {
        std::vector<Tree> children;
        children.reserve(crumb.left.size() + 1 + crumb.right.size());
        children.insert(children.end(), crumb.left.begin(), crumb.left.end());
        children.push_back(std::move(focusTreeIn));
        children.insert(children.end(), crumb.right.begin(), crumb.right.end());
        return Tree(crumb.parentLabel, std::move(children));
    }

    std::optional<Cursor> Cursor::parent() const
    {
        if (crumbs.empty())
            return std::nullopt;

        const auto& crumb = crumbs.back();
        auto parentTree = modified ? rebuildParent(crumb, focusTree) : crumb.original;

        std::vector<Crumb> remaining(crumbs.begin(), crumbs.end() - 1);
        return Cursor(std::move(parentTree), std::move(remaining), modified);
    }

    std::optional<Cursor> Cursor::nextSibling() const
    {
        if (crumbs.empty() || crumbs.back().right.empty())
            return std::nullopt;

        auto nextCrumbs = crumbs;
        auto& crumb = nextCrumbs.back();
        auto nextFocus = crumb.right.front();
        crumb.left.push_back(focusTree);
        crumb.right.erase(crumb.right.begin());
        return Cursor(std::move(nextFocus), std::move(nextCrumbs), modified);
    }

    std::optional<Cursor> Cursor::previousSibling() const
    {
        if (crumbs.empty() || crumbs.back().left.empty())
            return std::nullopt;

        auto nextCrumbs = crumbs;
        auto& crumb = nextCrumbs.back();
        auto nextFocus = crumb.left.back();
        crumb.left.pop_back();
        crumb.right.insert(crumb.right.begin(), focusTree);
        return Cursor(std::move(nextFocus), std::move(nextCrumbs), modified);
    }

    Cursor Cursor::descend(size_t childIndex) const
    {
        const auto& children = focusTree.children();
        jassert(childIndex < children.size());

        Crumb crumb { node(),
                      std::vector<Tree>(children.begin(), children.begin() + static_cast<std::ptrdiff_t>(childIndex)),
                      std::vector<Tree>(children.begin() + static_cast<std::ptrdiff_t>(childIndex) + 1, children.end()),
                      focusTree };

        auto nextCrumbs = crumbs;
        nextCrumbs.push_back(std::move(crumb));
        return Cursor(children[childIndex], std::move(nextCrumbs), modified);
    }

    std::optional<Cursor> Cursor::firstChild() const
    {
        if (!focusTree.hasChildren())
            return std::nullopt;

        return descend(0);
    }

    std::optional<Cursor> Cursor::lastChild() const
    {
        if (!focusTree.hasChildren())
            return std::nullopt;

        return descend(focusTree.children().size() - 1);
    }

    Cursor Cursor::root() const
    {
        auto current = *this;
        while (auto up = current.parent())
            current = std::move(*up);
        return current;
    }

    Tree Cursor::toTree() const
    {
        return root().focus();
    }

    std::optional<Cursor> Cursor::findById(const NodeId& id) const
    {
        auto current = root();

        std::vector<size_t> indexPath;
        if (!findIndexPath(current.focus(), id, indexPath))
            return std::nullopt;

        for (const auto index : indexPath)
            current = current.descend(index);

        return current;
    }

    std::vector<NodeId> Cursor::path() const
    {
        std::vector<NodeId> ids;
        ids.reserve(crumbs.size() + 1);
        for (const auto& crumb : crumbs)
            ids.push_back(crumb.parentLabel.id);
        ids.push_back(node().id);
        return ids;
    }

    Cursor Cursor::mapNode(const std::function<Node(const Node&)>& transform) const
    {
        return Cursor(focusTree.withLabel(transform(node())), crumbs, true);
    }

    Cursor Cursor::replaceFocus(Tree subtree) const
    {
        return Cursor(std::move(subtree), crumbs, true);
    }

    Cursor Cursor::appendChild(Tree subtree) const
    {
        Crumb crumb { node(), focusTree.children(), {}, focusTree };

        auto nextCrumbs = crumbs;
        nextCrumbs.push_back(std::move(crumb));
        return Cursor(std::move(subtree), std::move(nextCrumbs), true);
    }

    Cursor Cursor::insertBefore(Tree subtree) const
    {
        if (crumbs.empty())
            return *this;

        auto nextCrumbs = crumbs;
        auto& crumb = nextCrumbs.back();
        crumb.right.insert(crumb.right.begin(), focusTree);
        return Cursor(std::move(subtree), std::move(nextCrumbs), true);
    }

    Cursor Cursor::insertAfter(Tree subtree) const
    {
        if (crumbs.empty())
            return *this;

        auto nextCrumbs = crumbs;
        nextCrumbs.back().left.push_back(focusTree);
        return Cursor(std::move(subtree), std::move(nextCrumbs), true);
    }

    Cursor Cursor::remove() const
    {
        if (crumbs.empty())
            return *this;

        const auto& crumb = crumbs.back();

        std::vector<Tree> siblings;
        siblings.reserve(crumb.left.size() + crumb.right.size());
        siblings.insert(siblings.end(), crumb.left.begin(), crumb.left.end());
        siblings.insert(siblings.end(), crumb.right.begin(), crumb.right.end());

        std::vector<Crumb> remaining(crumbs.begin(), crumbs.end() - 1);
        return Cursor(Tree(crumb.parentLabel, std::move(siblings)), std::move(remaining), true);
    }
}
