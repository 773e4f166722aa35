// Lexitree -- simple in-memory ordered word index backed by a B+-tree.

#include <iostream>
#include <string>
#include <vector>

#pragma once

namespace lexitree {

/** Statistics buffer. */
struct BPTreeStats {
    unsigned height;
    size_t nnodes;
    size_t nnodes_itnl;  // includes root node if it's not the only leaf
    size_t nnodes_leaf;
    size_t nkeys_itnl;
    size_t nkeys_leaf;
};

std::ostream& operator<<(std::ostream& s, const BPTreeStats& stats);

/**
 * Leaf split policies enum.
 */
typedef enum SplitPolicy {
    SPLIT_COPY_UP,  // promoted key stays in the right leaf
    SPLIT_DISCARD   // promoted key is dropped from the leaves
} SplitPolicy;

std::string SplitPolicyStr(SplitPolicy policy);

/**
 * Lexitree in-memory ordered index interface.
 *
 * Currently hardcodes the key type as std::string. The underlying BPTree
 * template accepts any key type with a strict weak ordering comparator.
 *
 * Not thread-safe; callers must serialize all access to one instance.
 */
class Lexitree {
   public:
    typedef std::string KType;

    /**
     * Opens an empty Lexitree index, returning a pointer to the interface
     * on success. max_keys is the fan-out bound of every node.
     *
     * Exceptions might be thrown.
     *
     * The returned struct should be deleted when no longer needed.
     */
    static Lexitree* Open(size_t max_keys = 4,
                          SplitPolicy policy = SPLIT_COPY_UP);

    Lexitree() = default;

    Lexitree(const Lexitree&) = delete;
    Lexitree& operator=(const Lexitree&) = delete;

    virtual ~Lexitree() = default;

    /**
     * Insert a key into the index. Duplicate keys are allowed and stored
     * adjacently.
     *
     * Exceptions might be thrown.
     */
    virtual void Insert(KType key) = 0;

    /**
     * Search for a key. Returns true if at least one copy is present,
     * otherwise false.
     *
     * Exceptions might be thrown.
     */
    virtual bool Search(const KType& key) const = 0;

    /**
     * Delete the first copy of the key. Returns true if key found and
     * removed, otherwise false. Never rebalances the tree.
     *
     * Exceptions might be thrown.
     */
    virtual bool Delete(const KType& key) = 0;

    /**
     * Collect all keys in ascending order by walking the leaf chain.
     */
    virtual std::vector<KType> Keys() const = 0;

    /** Number of keys currently stored. */
    virtual size_t Size() const = 0;

    /** Current height of tree; 1 when root is the only leaf. */
    virtual unsigned Height() const = 0;

    /**
     * Iterate through the whole B+-tree, gather and verify statistics. If
     * print_nodes is true, also prints content of all nodes.
     *
     * Throws if any structural invariant does not hold.
     */
    virtual BPTreeStats GatherStats(bool print_nodes = false) const = 0;
};

}  // namespace lexitree
