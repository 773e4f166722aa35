// Template implementation included in-place by the ".hpp".

#pragma once

namespace lexitree {

template <typename K, typename Compare>
BPTree<K, Compare>::BPTree(size_t max_keys, SplitPolicy policy, Compare comp)
    : max_keys(max_keys), policy(policy), comp(std::move(comp)) {
    if (max_keys < 4) {
        throw LexitreeException("max_keys parameter too small: " +
                                std::to_string(max_keys));
    }
    if (policy != SPLIT_COPY_UP && policy != SPLIT_DISCARD)
        throw LexitreeException("unknown leaf split policy");

    // tree starts as a single empty leaf root
    root = NewNodeLeaf();
}

template <typename K, typename Compare>
std::unique_ptr<NodeLeaf<K>> BPTree<K, Compare>::NewNodeLeaf() const {
    return std::make_unique<NodeLeaf<K>>(max_keys);
}

template <typename K, typename Compare>
std::unique_ptr<NodeItnl<K>> BPTree<K, Compare>::NewNodeItnl() const {
    return std::make_unique<NodeItnl<K>>(max_keys);
}

template <typename K, typename Compare>
void BPTree<K, Compare>::CheckKey(const K& key) const {
    if (comp(key, key)) {
        throw ComparatorViolation("key " + StreamStr(key) +
                                  " compares less than itself");
    }
}

template <typename K, typename Compare>
void BPTree<K, Compare>::SplitChild(NodeItnl<K>* parent, size_t index) {
    assert(!parent->IsFull());
    assert(index < parent->children.size());

    Node<K>* node = parent->children[index].get();
    assert(node->NumKeys() == max_keys);

    // left half keeps keys[0:mid]
    size_t mid = (max_keys + 1) / 2;

    if (node->IsLeaf()) {
        DEBUG("split leaf %p (%s)", static_cast<void*>(node),
              SplitPolicyStr(policy).c_str());

        auto* lnode = static_cast<NodeLeaf<K>*>(node);
        auto rnode = NewNodeLeaf();

        // copy-up keeps the promoted key as the first key of right leaf;
        // discard drops it from the leaves entirely
        size_t rpos = (policy == SPLIT_COPY_UP) ? mid : mid + 1;
        std::move(lnode->keys.begin() + rpos, lnode->keys.end(),
                  std::back_inserter(rnode->keys));
        K mkey =
            (policy == SPLIT_COPY_UP) ? rnode->keys[0] : lnode->keys[mid];
        lnode->keys.erase(lnode->keys.begin() + mid, lnode->keys.end());
        if (policy == SPLIT_DISCARD) nkeys--;

        // new leaf takes over the chain link of the old one
        rnode->next = lnode->next;
        lnode->next = rnode.get();

        parent->Inject(index, std::move(mkey), std::move(rnode));

    } else {
        DEBUG("split internal %p", static_cast<void*>(node));

        auto* lnode = static_cast<NodeItnl<K>*>(node);
        auto rnode = NewNodeItnl();

        // populate right sibling
        std::move(lnode->keys.begin() + mid + 1, lnode->keys.end(),
                  std::back_inserter(rnode->keys));
        std::move(lnode->children.begin() + mid + 1, lnode->children.end(),
                  std::back_inserter(rnode->children));

        // middle key moves up and leaves this level
        K mkey = std::move(lnode->keys[mid]);
        lnode->keys.erase(lnode->keys.begin() + mid, lnode->keys.end());
        lnode->children.erase(lnode->children.begin() + mid + 1,
                              lnode->children.end());

        parent->Inject(index, std::move(mkey), std::move(rnode));
    }
}

template <typename K, typename Compare>
void BPTree<K, Compare>::InsertNonFull(Node<K>* node, K key) {
    assert(!node->IsFull());

    // search through internal nodes, splitting any full child before
    // stepping into it
    while (!node->IsLeaf()) {
        auto* itnl = static_cast<NodeItnl<K>*>(node);
        size_t idx = itnl->UpperBound(key, comp);

        if (itnl->children[idx]->IsFull()) {
            SplitChild(itnl, idx);
            if (!comp(key, itnl->keys[idx])) idx++;
        }

        node = itnl->children[idx].get();
        if (node == nullptr)
            throw LexitreeException("got nullptr as child node");
    }

    // inject after any equal keys
    auto* leaf = static_cast<NodeLeaf<K>*>(node);
    leaf->Inject(leaf->UpperBound(key, comp), std::move(key));
}

template <typename K, typename Compare>
NodeLeaf<K>* BPTree<K, Compare>::TraverseToLeaf(const K& key) const {
    Node<K>* node = root.get();

    while (!node->IsLeaf()) {
        auto* itnl = static_cast<NodeItnl<K>*>(node);
        node = itnl->children[itnl->LowerBound(key, comp)].get();
        if (node == nullptr)
            throw LexitreeException("got nullptr as child node");
    }

    return static_cast<NodeLeaf<K>*>(node);
}

template <typename K, typename Compare>
std::tuple<NodeLeaf<K>*, size_t> BPTree<K, Compare>::LocateKey(
    const K& key) const {
    NodeLeaf<K>* leaf = TraverseToLeaf(key);

    // a run of equal keys may straddle a leaf boundary, and leaves may have
    // been emptied by deletes; stop at the first key greater than given key
    while (leaf != nullptr) {
        size_t idx = leaf->LowerBound(key, comp);
        if (idx < leaf->NumKeys()) {
            if (!comp(key, leaf->keys[idx])) return std::make_tuple(leaf, idx);
            break;
        }
        leaf = leaf->next;
    }

    return std::make_tuple(nullptr, 0);
}

template <typename K, typename Compare>
NodeLeaf<K>* BPTree<K, Compare>::LeftmostLeaf() const {
    Node<K>* node = root.get();
    while (!node->IsLeaf())
        node = static_cast<NodeItnl<K>*>(node)->children.front().get();
    return static_cast<NodeLeaf<K>*>(node);
}

template <typename K, typename Compare>
template <typename Func>
void BPTree<K, Compare>::DepthFirstIterate(Func func) const {
    // traversal stack of (node, depth, lower bound, upper bound) tuples;
    // a nullptr bound means unbounded on that side
    std::vector<std::tuple<const Node<K>*, unsigned, const K*, const K*>>
        stack;
    stack.reserve(height * max_keys + 1);
    stack.emplace_back(root.get(), 1u, nullptr, nullptr);

    // depth-first pre-order walk
    while (!stack.empty()) {
        auto [node, depth, lo, hi] = stack.back();
        stack.pop_back();

        func(node, depth, lo, hi);

        if (!node->IsLeaf()) {
            // push children right to left so the leftmost is visited first
            auto* itnl = static_cast<const NodeItnl<K>*>(node);
            for (size_t idx = itnl->children.size(); idx > 0; --idx) {
                size_t cidx = idx - 1;
                const K* clo = (cidx > 0) ? &itnl->keys[cidx - 1] : lo;
                const K* chi =
                    (cidx < itnl->keys.size()) ? &itnl->keys[cidx] : hi;
                stack.emplace_back(itnl->children[cidx].get(), depth + 1, clo,
                                   chi);
            }
        }
    }
}

template <typename K, typename Compare>
void BPTree<K, Compare>::Insert(K key) {
    DEBUG("req Insert %s", StreamStr(key).c_str());
    CheckKey(key);

    if (!root->IsFull()) {
        InsertNonFull(root.get(), std::move(key));
    } else {
        // root overflows: hang it under a new internal root and split it,
        // the only way the tree grows in height
        auto new_root = NewNodeItnl();
        new_root->children.push_back(std::move(root));
        SplitChild(new_root.get(), 0);
        root = std::move(new_root);
        height++;
        DEBUG("root grown to height %u", height);

        InsertNonFull(root.get(), std::move(key));
    }

    nkeys++;
}

template <typename K, typename Compare>
bool BPTree<K, Compare>::Search(const K& key) const {
    DEBUG("req Search %s", StreamStr(key).c_str());
    CheckKey(key);

    return std::get<0>(LocateKey(key)) != nullptr;
}

template <typename K, typename Compare>
bool BPTree<K, Compare>::Delete(const K& key) {
    DEBUG("req Delete %s", StreamStr(key).c_str());
    CheckKey(key);

    auto [leaf, idx] = LocateKey(key);
    if (leaf == nullptr) {
        DEBUG("delete %s not found", StreamStr(key).c_str());
        return false;
    }

    // no merging or borrowing; leaf may underflow and routing keys above
    // may go stale
    leaf->Remove(idx);
    nkeys--;
    DEBUG("delete %s from leaf %p", StreamStr(key).c_str(),
          static_cast<void*>(leaf));
    return true;
}

template <typename K, typename Compare>
std::vector<K> BPTree<K, Compare>::Keys() const {
    std::vector<K> results;
    results.reserve(nkeys);

    for (const NodeLeaf<K>* leaf = LeftmostLeaf(); leaf != nullptr;
         leaf = leaf->next)
        results.insert(results.end(), leaf->keys.begin(), leaf->keys.end());

    return results;
}

template <typename K, typename Compare>
void BPTree<K, Compare>::PrintNodes(std::ostream& s) const {
    DepthFirstIterate([&](const Node<K>* node, unsigned depth, const K*,
                          const K*) {
        s << std::string(2 * depth, ' ') << static_cast<const void*>(node)
          << " ";
        if (node->IsLeaf())
            s << *static_cast<const NodeLeaf<K>*>(node) << std::endl;
        else
            s << *static_cast<const NodeItnl<K>*>(node) << std::endl;
    });
}

template <typename K, typename Compare>
BPTreeStats BPTree<K, Compare>::GatherStats(bool print_nodes) const {
    BPTreeStats stats;
    stats.height = height;
    stats.nnodes = 0;
    stats.nnodes_itnl = 0;
    stats.nnodes_leaf = 0;
    stats.nkeys_itnl = 0;
    stats.nkeys_leaf = 0;

    std::vector<const NodeLeaf<K>*> leaves;

    auto iterate_func = [&](const Node<K>* node, unsigned depth, const K* lo,
                            const K* hi) {
        if (node == nullptr)
            throw LexitreeException("stats: got nullptr as child node");

        // do tree data integrity checks along the way
        if (node->NumKeys() > max_keys) {
            throw LexitreeException("stats: node holds " +
                                    std::to_string(node->NumKeys()) +
                                    " keys, more than max_keys " +
                                    std::to_string(max_keys));
        }
        for (size_t idx = 1; idx < node->NumKeys(); ++idx) {
            if (comp(node->keys[idx], node->keys[idx - 1]))
                throw LexitreeException("stats: keys of a node not sorted");
        }
        for (auto&& k : node->keys) {
            if ((lo != nullptr && comp(k, *lo)) ||
                (hi != nullptr && comp(*hi, k))) {
                throw LexitreeException(
                    "stats: key " + StreamStr(k) +
                    " falls outside the range routed to its node");
            }
        }

        if (node->IsLeaf()) {
            if (depth != height) {
                throw LexitreeException("stats: leaf at depth " +
                                        std::to_string(depth) +
                                        ", expect " + std::to_string(height));
            }
            leaves.push_back(static_cast<const NodeLeaf<K>*>(node));

            stats.nnodes++;
            stats.nnodes_leaf++;
            stats.nkeys_leaf += node->NumKeys();

        } else {
            auto* itnl = static_cast<const NodeItnl<K>*>(node);
            if (depth >= height) {
                throw LexitreeException("stats: internal node at depth " +
                                        std::to_string(depth) +
                                        ", tree height " +
                                        std::to_string(height));
            }
            if (itnl->NumKeys() == 0)
                throw LexitreeException("stats: internal node has no keys");
            if (itnl->children.size() != itnl->NumKeys() + 1) {
                throw LexitreeException(
                    "stats: internal node has " +
                    std::to_string(itnl->children.size()) + " children for " +
                    std::to_string(itnl->NumKeys()) + " keys");
            }

            stats.nnodes++;
            stats.nnodes_itnl++;
            stats.nkeys_itnl += node->NumKeys();
        }

        if (print_nodes) {
            std::cout << std::string(2 * depth, ' ')
                      << static_cast<const void*>(node) << " ";
            if (node->IsLeaf())
                std::cout << *static_cast<const NodeLeaf<K>*>(node)
                          << std::endl;
            else
                std::cout << *static_cast<const NodeItnl<K>*>(node)
                          << std::endl;
        }
    };

    // scan through all nodes
    if (print_nodes) std::cout << "Nodes:" << std::endl;
    DepthFirstIterate(iterate_func);

    // leaf chain must visit exactly the leaves in depth-first order
    assert(!leaves.empty());
    if (leaves.front() != LeftmostLeaf())
        throw LexitreeException("stats: incorrect leftmost leaf");
    for (size_t idx = 0; idx < leaves.size(); ++idx) {
        const NodeLeaf<K>* expect =
            (idx + 1 < leaves.size()) ? leaves[idx + 1] : nullptr;
        if (leaves[idx]->next != expect)
            throw LexitreeException("stats: incorrect leaf chain pointer");
    }

    if (stats.nkeys_leaf != nkeys) {
        throw LexitreeException("stats: found " +
                                std::to_string(stats.nkeys_leaf) +
                                " leaf keys, expect " + std::to_string(nkeys));
    }

    if (stats.nnodes != stats.nnodes_itnl + stats.nnodes_leaf) {
        throw LexitreeException(
            "stats: total #nodes " + std::to_string(stats.nnodes) +
            " does not match #itnl " + std::to_string(stats.nnodes_itnl) +
            " + #leaf " + std::to_string(stats.nnodes_leaf));
    }

    return stats;
}

}  // namespace lexitree
