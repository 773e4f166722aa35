// Template implementation included in-place by the ".hpp".

#pragma once

#include <cassert>

namespace lexitree {

template <typename K>
size_t Node<K>::NumKeys() const {
    return keys.size();
}

template <typename K>
bool Node<K>::IsFull() const {
    return NumKeys() >= max_keys;
}

template <typename K>
template <typename Compare>
size_t Node<K>::LowerBound(const K& key, const Compare& comp) const {
    size_t spos = 0, epos = NumKeys();

    // shrink range until the first key >= given key is pinned
    while (spos < epos) {
        size_t pos = (spos + epos) / 2;
        if (comp(keys[pos], key))
            spos = pos + 1;
        else
            epos = pos;
    }

    return spos;
}

template <typename K>
template <typename Compare>
size_t Node<K>::UpperBound(const K& key, const Compare& comp) const {
    size_t spos = 0, epos = NumKeys();

    // shrink range until the first key > given key is pinned
    while (spos < epos) {
        size_t pos = (spos + epos) / 2;
        if (comp(key, keys[pos]))
            epos = pos;
        else
            spos = pos + 1;
    }

    return spos;
}

template <typename K>
void NodeLeaf<K>::Inject(size_t shift_idx, K key) {
    assert(this->NumKeys() < this->max_keys);
    assert(shift_idx <= this->NumKeys());

    this->keys.insert(this->keys.begin() + shift_idx, std::move(key));
}

template <typename K>
void NodeLeaf<K>::Remove(size_t idx) {
    assert(idx < this->NumKeys());

    this->keys.erase(this->keys.begin() + idx);
}

template <typename K>
void NodeItnl<K>::Inject(size_t shift_idx, K key,
                         std::unique_ptr<Node<K>> rnode) {
    assert(this->NumKeys() < this->max_keys);
    assert(shift_idx <= this->NumKeys());
    assert(children.size() == this->NumKeys() + 1);

    if (rnode == nullptr)
        throw LexitreeException("got nullptr as new right child node");

    // shift any array content with larger key to the right, and inject key
    // and right child
    this->keys.insert(this->keys.begin() + shift_idx, std::move(key));
    children.insert(children.begin() + shift_idx + 1, std::move(rnode));
}

}  // namespace lexitree
