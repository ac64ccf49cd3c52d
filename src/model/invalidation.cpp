#include <vista/invalidation.hpp>
#include <vista/log.hpp>

#include <algorithm>

namespace vista {

const char* operation_name(Operation op) {
    switch (op) {
        case Operation::Stage:                     return "stage";
        case Operation::Unstage:                   return "unstage";
        case Operation::StageFromParent:           return "stage-from-parent";
        case Operation::ApplyPatchToIndex:         return "apply-patch-to-index";
        case Operation::WriteMergeConflictToIndex: return "write-merge-conflict-to-index";
        case Operation::CheckoutPaths:             return "checkout-paths";
        case Operation::ApplyPatchToWorkdir:       return "apply-patch-to-workdir";
        case Operation::DiscardWorkdirChanges:     return "discard-workdir-changes";
        case Operation::StoreDiscardSnapshots:     return "store-discard-snapshots";
        case Operation::RestoreDiscard:            return "restore-discard";
        case Operation::CheckoutSide:              return "checkout-side";
        case Operation::Commit:                    return "commit";
        case Operation::Merge:                     return "merge";
        case Operation::AbortMerge:                return "abort-merge";
        case Operation::Checkout:                  return "checkout";
        case Operation::Pull:                      return "pull";
        case Operation::Fetch:                     return "fetch";
        case Operation::Push:                      return "push";
        case Operation::SetConfig:                 return "set-config";
        case Operation::PersistDiscardHistory:     return "persist-discard-history";
    }
    return "unknown";
}

const std::vector<Operation>& all_operations() {
    static const std::vector<Operation> ops = {
        Operation::Stage, Operation::Unstage, Operation::StageFromParent,
        Operation::ApplyPatchToIndex, Operation::WriteMergeConflictToIndex,
        Operation::CheckoutPaths, Operation::ApplyPatchToWorkdir,
        Operation::DiscardWorkdirChanges, Operation::StoreDiscardSnapshots,
        Operation::RestoreDiscard, Operation::CheckoutSide, Operation::Commit,
        Operation::Merge, Operation::AbortMerge, Operation::Checkout,
        Operation::Pull, Operation::Fetch, Operation::Push,
        Operation::SetConfig, Operation::PersistDiscardHistory,
    };
    return ops;
}

namespace {

using G = KeyGroup;

// Index writes for specific paths
const InvalidationRule INDEX_PATHS = {
    {G::IsPartiallyStaged, G::UnstagedFilePatch, G::StagedFilePatch,
     G::AmendingFilePatch, G::Index},
    {G::ChangedFiles, G::StagedChanges, G::StagedChangesSinceParent},
};

// Working tree writes for specific paths
const InvalidationRule WORKDIR_PATHS = {
    {G::IsPartiallyStaged, G::UnstagedFilePatch},
    {G::ChangedFiles},
};

const InvalidationRule COMMIT = {
    {},
    {G::ChangedFiles, G::StagedChanges, G::StagedChangesSinceParent,
     G::StagedFilePatch, G::AmendingFilePatch, G::IsPartiallyStaged,
     G::LastCommit, G::Branches, G::AheadCount, G::Commit},
};

// HEAD, index and working tree may all move
const InvalidationRule EVERYTHING_BUT_CONFIG = {
    {},
    {G::ChangedFiles, G::StagedChanges, G::StagedChangesSinceParent,
     G::IsPartiallyStaged, G::UnstagedFilePatch, G::StagedFilePatch,
     G::AmendingFilePatch, G::Index, G::LastCommit, G::Branches,
     G::CurrentBranch, G::AheadCount, G::BehindCount, G::Commit},
};

const InvalidationRule FETCH = {
    {},
    {G::Branches, G::AheadCount, G::BehindCount, G::Commit},
};

// --set-upstream writes branch.<name>.remote
const InvalidationRule PUSH = {
    {},
    {G::Branches, G::AheadCount, G::BehindCount, G::Commit, G::Remotes,
     G::Config, G::ConfigLocal},
};

const InvalidationRule CONFIG_KEYS = {
    {G::Config, G::ConfigLocal},
    {},
};

bool contains(const std::vector<KeyGroup>& groups, KeyGroup g) {
    return std::find(groups.begin(), groups.end(), g) != groups.end();
}

} // namespace

const InvalidationRule& invalidation_rule(Operation op) {
    switch (op) {
        case Operation::Stage:
        case Operation::Unstage:
        case Operation::StageFromParent:
        case Operation::ApplyPatchToIndex:
        case Operation::WriteMergeConflictToIndex:
        case Operation::CheckoutPaths:
            return INDEX_PATHS;
        case Operation::ApplyPatchToWorkdir:
        case Operation::DiscardWorkdirChanges:
        case Operation::StoreDiscardSnapshots:
        case Operation::RestoreDiscard:
        case Operation::CheckoutSide:
            return WORKDIR_PATHS;
        case Operation::Commit:
            return COMMIT;
        case Operation::Merge:
        case Operation::AbortMerge:
        case Operation::Checkout:
        case Operation::Pull:
            return EVERYTHING_BUT_CONFIG;
        case Operation::Fetch:
            return FETCH;
        case Operation::Push:
            return PUSH;
        case Operation::SetConfig:
        case Operation::PersistDiscardHistory:
            return CONFIG_KEYS;
    }
    return EVERYTHING_BUT_CONFIG;
}

bool InvalidationRule::covers(const CacheKey& key,
                              const std::vector<std::string>& scopes) const {
    if (contains(whole, key.group)) return true;
    if (!contains(per_scope, key.group)) return false;
    return std::find(scopes.begin(), scopes.end(), key.scope) != scopes.end();
}

void invalidate_for(Cache& cache, Operation op, const std::vector<std::string>& scopes) {
    const InvalidationRule& rule = invalidation_rule(op);

    std::vector<CacheKey> exact;
    exact.reserve(rule.per_scope.size() * scopes.size());
    for (KeyGroup g : rule.per_scope) {
        for (const auto& scope : scopes) {
            exact.push_back(CacheKey{g, scope});
        }
    }
    cache.invalidate(exact);

    for (KeyGroup g : rule.whole) {
        cache.invalidate_group(g);
    }

    vista::log::trace("invalidated %s for %zu scope(s)",
                      operation_name(op), scopes.size());
}

} // namespace vista
