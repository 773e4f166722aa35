#include "common.hpp"

#include <syscall.h>
#include <unistd.h>

#include "include/lexitree.hpp"

namespace lexitree {

std::ostream& operator<<(std::ostream& s, const BPTreeStats& stats) {
    return s << "BPTreeStats{height=" << stats.height
             << ",nnodes=" << stats.nnodes
             << ",nnodes_itnl=" << stats.nnodes_itnl
             << ",nnodes_leaf=" << stats.nnodes_leaf
             << ",nkeys_itnl=" << stats.nkeys_itnl
             << ",nkeys_leaf=" << stats.nkeys_leaf << "}";
}

std::string SplitPolicyStr(SplitPolicy policy) {
    switch (policy) {
        case SPLIT_COPY_UP:
            return "copy-up";
        case SPLIT_DISCARD:
            return "discard";
        default:
            return "unknown";
    }
}

thread_local const pid_t tid = static_cast<pid_t>(syscall(SYS_gettid));

}  // namespace lexitree
