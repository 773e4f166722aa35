#include "common.hpp"
#include "include/lexitree.hpp"
#include "lexitree_impl.hpp"

namespace lexitree {

Lexitree* Lexitree::Open(size_t max_keys, SplitPolicy policy) {
    LexitreeImpl* impl = new LexitreeImpl(max_keys, policy);
    if (impl == nullptr)
        throw LexitreeException("failed to allocate LexitreeImpl instance");

    return impl;
}

}  // namespace lexitree
