#include "labsync/remote/identity_resolver.hpp"

#include <spdlog/spdlog.h>

namespace labsync::remote {

IdentityResolver::IdentityResolver(RepositoryApi& api, std::string group_prefix)
    : api_(api), group_prefix_(std::move(group_prefix)) {}

Result<IdentityLookup> IdentityResolver::resolve(model::IdentityKind kind, const std::string& key) {
    const std::string lookup_key = kind == model::IdentityKind::GroupName ? group_prefix_ + key : key;
    {
        std::lock_guard lock(mutex_);
        auto it = cache_.find({kind, lookup_key});
        if (it != cache_.end()) {
            return Ok(it->second);
        }
    }

    lookups_++;
    Result<std::vector<model::Owner>> matches = Err(ErrorKind::Protocol, "unreachable");
    switch (kind) {
        case model::IdentityKind::Username:
            matches = api_.find_user_by_username(lookup_key);
            break;
        case model::IdentityKind::Email:
            matches = api_.find_user_by_email(lookup_key);
            break;
        case model::IdentityKind::GroupName:
            matches = api_.find_group_by_name(lookup_key);
            break;
    }
    if (matches.is_error()) {
        return Err(matches.error());
    }

    IdentityLookup lookup;
    lookup.match_count = matches.value().size();
    if (lookup.match_count == 0) {
        lookup.outcome = LookupOutcome::NotFound;
        spdlog::debug("No {} matching \"{}\"", model::identity_kind_name(kind), lookup_key);
    } else if (lookup.match_count > 1) {
        lookup.outcome = LookupOutcome::Ambiguous;
        spdlog::debug("{} {} records match \"{}\"", lookup.match_count,
                      model::identity_kind_name(kind), lookup_key);
    } else {
        lookup.outcome = LookupOutcome::Found;
        lookup.owner = matches.value().front();
    }

    std::lock_guard lock(mutex_);
    cache_.emplace(std::make_pair(kind, lookup_key), lookup);
    return Ok(std::move(lookup));
}

void IdentityResolver::clear_cache() {
    std::lock_guard lock(mutex_);
    cache_.clear();
}

} // namespace labsync::remote
