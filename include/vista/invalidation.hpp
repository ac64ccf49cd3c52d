#pragma once

#include <vista/cache.hpp>
#include <string>
#include <vector>

namespace vista {

// Every mutating facade operation, as far as the cache is concerned
enum class Operation {
    Stage,
    Unstage,
    StageFromParent,
    ApplyPatchToIndex,
    WriteMergeConflictToIndex,
    CheckoutPaths,
    ApplyPatchToWorkdir,
    DiscardWorkdirChanges,
    StoreDiscardSnapshots,
    RestoreDiscard,
    CheckoutSide,
    Commit,
    Merge,
    AbortMerge,
    Checkout,
    Pull,
    Fetch,
    Push,
    SetConfig,
    PersistDiscardHistory
};

const char* operation_name(Operation op);
const std::vector<Operation>& all_operations();

// What an operation may change. per_scope groups are invalidated only for
// the scopes (paths, config keys) the operation was called with; whole
// groups lose every entry.
struct InvalidationRule {
    std::vector<KeyGroup> per_scope;
    std::vector<KeyGroup> whole;

    bool covers(const CacheKey& key, const std::vector<std::string>& scopes) const;
};

const InvalidationRule& invalidation_rule(Operation op);

// The exact keys to drop for op over scopes, plus the whole groups
void invalidate_for(Cache& cache, Operation op,
                    const std::vector<std::string>& scopes = {});

} // namespace vista
