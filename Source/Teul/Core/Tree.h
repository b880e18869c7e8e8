#pragma once

#include "Teul/Public/Types.h"
#include <functional>
#include <memory>
#include <vector>

namespace Teul::Core
{
    // Immutable n-ary tree. Copies share storage; every "with" call builds a new
    // root and reuses the untouched children as they are.
    class Tree
    {
    public:
        explicit Tree(Node label, std::vector<Tree> children = {});

        const Node& label() const noexcept;
        const std::vector<Tree>& children() const noexcept;
        bool hasChildren() const noexcept;

        Tree withLabel(Node label) const;
        Tree withChildren(std::vector<Tree> children) const;

        bool sharesStorageWith(const Tree& other) const noexcept;

    private:
        struct Storage;
        std::shared_ptr<const Storage> storage;
    };

    Tree leaf(Node label);

    size_t countNodes(const Tree& tree);

    // Pre-order, parents before children, siblings left to right.
    void forEachNode(const Tree& tree, const std::function<void(const Node&)>& visit);
    std::vector<NodeId> collectIds(const Tree& tree);

    bool containsId(const Tree& tree, const NodeId& id);

    // Bottom-up fold: each node sees its label and the already-folded children.
    template <typename Result>
    Result foldTree(const Tree& tree,
                    const std::function<Result(const Node&, std::vector<Result>)>& combine)
    {
        std::vector<Result> folded;
        folded.reserve(tree.children().size());
        for (const auto& child : tree.children())
            folded.push_back(foldTree<Result>(child, combine));

        return combine(tree.label(), std::move(folded));
    }

    bool sameNodeContent(const Node& lhs, const Node& rhs, bool compareIds = true);
    bool structurallyEqual(const Tree& lhs, const Tree& rhs, bool compareIds = true);
}
