#include "Teul/Core/Tree.h"

namespace Teul::Core
{
    struct Tree::Storage
    {
        Node label;
        std::vector<Tree> children;
    };

    Tree::Tree(Node label, std::vector<Tree> children)
        : storage(std::make_shared<const Storage>(Storage { std::move(label), std::move(children) }))
    {
    }

    const Node& Tree::label() const noexcept
    {
        return storage->label;
    }

    const std::vector<Tree>& Tree::children() const noexcept
    {
        return storage->children;
    }

    bool Tree::hasChildren() const noexcept
    {
        return !storage->children.empty();
    }

    Tree Tree::withLabel(Node label) const
    {
        return Tree(std::move(label), storage->children);
    }

    Tree Tree::withChildren(std::vector<Tree> children) const
    {
        return Tree(storage->label, std::move(children));
    }

    bool Tree::sharesStorageWith(const Tree& other) const noexcept
    {
        return storage == other.storage;
    }

    Tree leaf(Node label)
    {
        return Tree(std::move(label));
    }

    size_t countNodes(const Tree& tree)
    {
        size_t count = 1;
        for (const auto& child : tree.children())
            count += countNodes(child);
        return count;
    }

    void forEachNode(const Tree& tree, const std::function<void(const Node&)>& visit)
    {
        visit(tree.label());
        for (const auto& child : tree.children())
            forEachNode(child, visit);
    }

    std::vector<NodeId> collectIds(const Tree& tree)
    {
        std::vector<NodeId> ids;
        forEachNode(tree, [&ids](const Node& node) { ids.push_back(node.id); });
        return ids;
    }

    bool containsId(const Tree& tree, const NodeId& id)
    {
        if (tree.label().id == id)
            return true;

        for (const auto& child : tree.children())
        {
            if (containsId(child, id))
                return true;
        }

        return false;
    }

    bool sameNodeContent(const Node& lhs, const Node& rhs, bool compareIds)
    {
        if (compareIds && lhs.id != rhs.id)
            return false;

        return lhs.name == rhs.name
            && lhs.data == rhs.data
            && lhs.width == rhs.width
            && lhs.height == rhs.height
            && lhs.spacing == rhs.spacing
            && lhs.padding == rhs.padding
            && lhs.transformation == rhs.transformation
            && lhs.borders == rhs.borders
            && lhs.shadow == rhs.shadow
            && lhs.background == rhs.background
            && lhs.fontFamily == rhs.fontFamily
            && lhs.fontSize == rhs.fontSize
            && lhs.fontColor == rhs.fontColor
            && lhs.alignment == rhs.alignment
            && lhs.position == rhs.position;
    }

    bool structurallyEqual(const Tree& lhs, const Tree& rhs, bool compareIds)
    {
        if (lhs.sharesStorageWith(rhs))
            return true;

        if (!sameNodeContent(lhs.label(), rhs.label(), compareIds))
            return false;

        const auto& left = lhs.children();
        const auto& right = rhs.children();
        if (left.size() != right.size())
            return false;

        for (size_t i = 0; i < left.size(); ++i)
        {
            if (!structurallyEqual(left[i], right[i], compareIds))
                return false;
        }

        return true;
    }
}
