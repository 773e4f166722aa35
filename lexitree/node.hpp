// B+-tree node format definitions.

#include <algorithm>
#include <iostream>
#include <memory>
#include <vector>

#include "common.hpp"

#pragma once

namespace lexitree {

/**
 * Node types enum.
 */
typedef enum NodeType {
    NODE_LEAF = 1,  // leaf node holding keys, chained left-to-right
    NODE_ITNL = 2,  // internal node holding routing keys and children
} NodeType;

static inline std::string NodeTypeStr(NodeType type) {
    switch (type) {
        case NODE_LEAF:
            return "leaf";
        case NODE_ITNL:
            return "itnl";
        default:
            return "unknown";
    }
}

/**
 * Node base class, containing common metadata and vector of keys.
 * Each node type derives its own sub-type. The type of a node is fixed at
 * creation and never changes.
 */
template <typename K>
struct Node {
    // node type
    const NodeType type;

    // max number of keys
    const size_t max_keys = 0;

    // sorted list of keys
    std::vector<K> keys;

    Node() = delete;
    Node(NodeType type, size_t max_keys)
        : type(type), max_keys(max_keys), keys() {
        keys.reserve(max_keys);
    }

    Node(const Node&) = delete;
    Node& operator=(const Node&) = delete;

    virtual ~Node() = default;

    bool IsLeaf() const { return type == NODE_LEAF; }

    /**
     * Get number of keys in node.
     */
    size_t NumKeys() const;

    /**
     * A full node holds max_keys keys and must be split before anything
     * descends into it for insertion.
     */
    bool IsFull() const;

    /**
     * Binary search for the first index whose key is not less than the
     * given key. Returns NumKeys() if all existing keys are less.
     * Assumes keys vector is sorted accendingly under comp.
     */
    template <typename Compare>
    size_t LowerBound(const K& key, const Compare& comp) const;

    /**
     * Binary search for the first index whose key is greater than the
     * given key. Returns NumKeys() if no existing key is greater.
     */
    template <typename Compare>
    size_t UpperBound(const K& key, const Compare& comp) const;
};

template <typename K>
std::ostream& operator<<(std::ostream& s, const Node<K>& node) {
    s << "Node{type=" << NodeTypeStr(node.type)
      << ",nkeys=" << node.keys.size();
    s << ",keys=[";
    for (auto&& k : node.keys) s << k << ",";
    s << "]}";
    return s;
}

/**
 * Node type -- leaf.
 */
template <typename K>
struct NodeLeaf : public Node<K> {
    // pointer to right sibling, non-owning
    NodeLeaf<K>* next = nullptr;

    NodeLeaf() = delete;
    NodeLeaf(size_t max_keys) : Node<K>(NODE_LEAF, max_keys), next(nullptr) {}

    NodeLeaf(const NodeLeaf&) = delete;
    NodeLeaf& operator=(const NodeLeaf&) = delete;

    ~NodeLeaf() = default;

    /**
     * Insert a key into non-full leaf node at given slot, shifting array
     * content if necessary. shift_idx should be calculated through
     * UpperBound so that equal keys stay in insertion order.
     */
    void Inject(size_t shift_idx, K key);

    /**
     * Remove the key at given slot, shifting array content left.
     */
    void Remove(size_t idx);
};

template <typename K>
std::ostream& operator<<(std::ostream& s, const NodeLeaf<K>& node) {
    s << "Node{type=" << NodeTypeStr(node.type)
      << ",nkeys=" << node.keys.size();
    s << ",keys=[";
    for (auto&& k : node.keys) s << k << ",";
    s << "],next=" << static_cast<const void*>(node.next) << "}";
    return s;
}

/**
 * Node type -- internal.
 */
template <typename K>
struct NodeItnl : public Node<K> {
    // owning pointers to child nodes
    // children[0] holds keys <= keys[0];
    // children[1] holds keys >= keys[0] and <= keys[1], etc.
    std::vector<std::unique_ptr<Node<K>>> children;

    NodeItnl() = delete;
    NodeItnl(size_t max_keys) : Node<K>(NODE_ITNL, max_keys), children() {
        children.reserve(max_keys + 1);
    }

    NodeItnl(const NodeItnl&) = delete;
    NodeItnl& operator=(const NodeItnl&) = delete;

    ~NodeItnl() = default;

    /**
     * Insert a key into non-full internal node at given slot, taking
     * ownership of its new right child which lands at shift_idx + 1.
     */
    void Inject(size_t shift_idx, K key, std::unique_ptr<Node<K>> rnode);
};

template <typename K>
std::ostream& operator<<(std::ostream& s, const NodeItnl<K>& node) {
    s << "Node{type=" << NodeTypeStr(node.type)
      << ",nkeys=" << node.keys.size();
    s << ",keys=[";
    for (auto&& k : node.keys) s << k << ",";
    s << "],children=[";
    for (auto&& c : node.children)
        s << static_cast<const void*>(c.get()) << ",";
    s << "]}";
    return s;
}

}  // namespace lexitree

// Include template implementation in-place.
#include "node.tpl.hpp"
