#include "lexitree_impl.hpp"

namespace lexitree {

LexitreeImpl::LexitreeImpl(size_t max_keys, SplitPolicy policy) {
    bptree = new BPTree<KType>(max_keys, policy);
    if (bptree == nullptr)
        throw LexitreeException("failed to allocate BPTree instance");
    DEBUG("opened index max_keys %zu policy %s", max_keys,
          SplitPolicyStr(policy).c_str());
}

LexitreeImpl::~LexitreeImpl() { delete bptree; }

void LexitreeImpl::Insert(KType key) { bptree->Insert(std::move(key)); }

bool LexitreeImpl::Search(const KType& key) const {
    return bptree->Search(key);
}

bool LexitreeImpl::Delete(const KType& key) { return bptree->Delete(key); }

std::vector<Lexitree::KType> LexitreeImpl::Keys() const {
    return bptree->Keys();
}

size_t LexitreeImpl::Size() const { return bptree->Size(); }

unsigned LexitreeImpl::Height() const { return bptree->Height(); }

BPTreeStats LexitreeImpl::GatherStats(bool print_nodes) const {
    return bptree->GatherStats(print_nodes);
}

}  // namespace lexitree
