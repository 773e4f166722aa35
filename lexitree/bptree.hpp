// BPTree -- simple single-threaded in-memory B+ tree class.

#include <algorithm>
#include <cassert>
#include <cstring>
#include <functional>
#include <iostream>
#include <iterator>
#include <memory>
#include <stdexcept>
#include <string>
#include <tuple>
#include <vector>

#include "common.hpp"
#include "include/lexitree.hpp"
#include "node.hpp"

#pragma once

namespace lexitree {

/**
 * Simple in-memory B+ tree over keys of type K, ordered by a strict weak
 * ordering comparator fixed at construction. Keys must be printable through
 * operator<< for tracing.
 *
 * Insertion splits full nodes eagerly on the way down, so a node never
 * exceeds max_keys keys. Deletion never merges or rebalances.
 */
template <typename K, typename Compare = std::less<K>>
class BPTree {
   private:
    // max number of keys per node
    const size_t max_keys = 0;

    // how leaf splits treat the promoted key
    const SplitPolicy policy = SPLIT_COPY_UP;

    // total order over keys
    Compare comp;

    // owning pointer to root node, replaced whenever root overflows
    std::unique_ptr<Node<K>> root;

    // current height of tree, number of live keys
    unsigned height = 1;
    size_t nkeys = 0;

    /**
     * Allocate a new node of specific type.
     */
    std::unique_ptr<NodeLeaf<K>> NewNodeLeaf() const;
    std::unique_ptr<NodeItnl<K>> NewNodeItnl() const;

    /**
     * Fail fast if the comparator does not treat key as a sane element of
     * a strict weak ordering.
     */
    void CheckKey(const K& key) const;

    /**
     * Split the full child at index of given parent into itself and a new
     * right sibling, injecting one promoted key into parent at index.
     * Parent must not be full.
     */
    void SplitChild(NodeItnl<K>* parent, size_t index);

    /**
     * Insert key into the subtree rooted at given non-full node, splitting
     * full children on the way down.
     */
    void InsertNonFull(Node<K>* node, K key);

    /**
     * Do B+ tree search to traverse through internal nodes and find the
     * leftmost leaf node that may hold the given key.
     */
    NodeLeaf<K>* TraverseToLeaf(const K& key) const;

    /**
     * Find the first copy of key, starting from the leaf returned by
     * TraverseToLeaf and following the leaf chain while it can still hold
     * equal keys. Returns (leaf, idx) on a match, or (nullptr, 0) if absent.
     */
    std::tuple<NodeLeaf<K>*, size_t> LocateKey(const K& key) const;

    /**
     * Get the leftmost leaf, head of the leaf chain.
     */
    NodeLeaf<K>* LeftmostLeaf() const;

    /**
     * Iterate through all nodes in tree in depth-first pre-order manner,
     * applying given function to each (node, depth, lo, hi) tuple, where
     * lo and hi bound the keys routed to node. Root has depth 1.
     */
    template <typename Func>
    void DepthFirstIterate(Func func) const;

   public:
    BPTree(size_t max_keys, SplitPolicy policy = SPLIT_COPY_UP,
           Compare comp = Compare());
    ~BPTree() = default;

    BPTree(const BPTree&) = delete;
    BPTree& operator=(const BPTree&) = delete;

    /**
     * Insert a key into B+ tree. Duplicates are stored adjacently.
     *
     * Exceptions might be thrown.
     */
    void Insert(K key);

    /**
     * Search for a key. Returns true if found, otherwise false.
     *
     * Exceptions might be thrown.
     */
    bool Search(const K& key) const;

    /**
     * Delete the first copy of key. Returns true if key found and removed,
     * otherwise false, in which case the tree is left untouched.
     *
     * Exceptions might be thrown.
     */
    bool Delete(const K& key);

    /**
     * Walk the leaf chain and return all keys in order.
     */
    std::vector<K> Keys() const;

    size_t Size() const { return nkeys; }
    unsigned Height() const { return height; }
    const Node<K>* Root() const { return root.get(); }

    /**
     * Print every node in depth-first pre-order, indented by depth.
     */
    void PrintNodes(std::ostream& s) const;

    /**
     * Iterate through the whole B+-tree, gather and verify statistics. If
     * print_nodes is true, also prints content of all nodes.
     */
    BPTreeStats GatherStats(bool print_nodes = false) const;
};

}  // namespace lexitree

// Include template implementation in-place.
#include "bptree.tpl.hpp"
