// LexitreeImpl -- internal implementation of Lexitree index interface.

#include <string>
#include <vector>

#include "bptree.hpp"
#include "common.hpp"
#include "include/lexitree.hpp"

#pragma once

namespace lexitree {

/**
 * Implementation of Lexitree index interface.
 */
class LexitreeImpl : public Lexitree {
   private:
    // B+-tree index data structure.
    BPTree<KType>* bptree;

   public:
    LexitreeImpl(size_t max_keys, SplitPolicy policy);

    LexitreeImpl(const LexitreeImpl&) = delete;
    LexitreeImpl& operator=(const LexitreeImpl&) = delete;

    ~LexitreeImpl();

    void Insert(KType key) override;
    bool Search(const KType& key) const override;
    bool Delete(const KType& key) override;

    std::vector<KType> Keys() const override;
    size_t Size() const override;
    unsigned Height() const override;

    BPTreeStats GatherStats(bool print_nodes = false) const override;
};

}  // namespace lexitree
