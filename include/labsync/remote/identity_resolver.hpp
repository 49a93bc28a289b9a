#pragma once

#include "labsync/core/result.hpp"
#include "labsync/model/owner.hpp"
#include "labsync/remote/repository_api.hpp"

#include <atomic>
#include <map>
#include <mutex>
#include <string>
#include <utility>

namespace labsync::remote {

enum class LookupOutcome { Found, NotFound, Ambiguous };

struct IdentityLookup {
    LookupOutcome outcome = LookupOutcome::NotFound;
    model::Owner owner;             ///< Valid when outcome == Found
    std::size_t match_count = 0;

    bool found() const { return outcome == LookupOutcome::Found; }
};

/**
 * @brief Maps identity folder names to repository owners
 *
 * NotFound and Ambiguous are lookup outcomes, not errors. Only transport
 * and protocol failures come back as Err. Outcomes are cached until
 * clear_cache(), which the scanner calls at the start of every pass.
 * Group names are looked up with the configured prefix prepended.
 */
class IdentityResolver {
public:
    IdentityResolver(RepositoryApi& api, std::string group_prefix = {});

    Result<IdentityLookup> resolve(model::IdentityKind kind, const std::string& key);

    void clear_cache();

    /// Remote lookups issued since construction.
    std::size_t lookups_performed() const { return lookups_.load(); }

private:
    RepositoryApi& api_;
    std::string group_prefix_;
    std::mutex mutex_;
    std::map<std::pair<model::IdentityKind, std::string>, IdentityLookup> cache_;
    std::atomic<std::size_t> lookups_{0};
};

} // namespace labsync::remote
