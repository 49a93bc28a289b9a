#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace labsync::model {

/// Marker written into the fields of an owner that has no remote account.
inline constexpr const char* kUserNotFoundMarker = "USER NOT FOUND IN MYTARDIS";

enum class OwnerKind { Individual, Group };

/// How an identity folder name is matched against the remote directory.
enum class IdentityKind { Username, Email, GroupName };

inline const char* identity_kind_name(IdentityKind kind) {
    switch (kind) {
        case IdentityKind::Username: return "username";
        case IdentityKind::Email: return "email";
        case IdentityKind::GroupName: return "group";
    }
    return "unknown";
}

struct GroupMembership {
    std::int64_t id = 0;
    std::string name;
};

/**
 * @brief Remote identity that owns a dataset folder
 *
 * Built once by the identity resolver and copied into every FolderRecord
 * it owns. Never mutated after resolution.
 */
struct Owner {
    OwnerKind kind = OwnerKind::Individual;
    std::int64_t id = 0;
    std::string display_name;
    std::string username;
    std::string email;
    std::vector<GroupMembership> groups;
    bool not_found = false;

    /// Name shown in logs and synthesized experiment titles.
    const std::string& label() const {
        if (!display_name.empty()) {
            return display_name;
        }
        return username.empty() ? email : username;
    }

    /**
     * @brief Stand-in owner for an identity folder with no remote match
     *
     * The folder name is kept in the field it was looked up by; the other
     * identifying fields carry kUserNotFoundMarker.
     */
    static Owner placeholder(IdentityKind kind, const std::string& key) {
        Owner owner;
        owner.not_found = true;
        owner.display_name = kUserNotFoundMarker;
        owner.username = kUserNotFoundMarker;
        owner.email = kUserNotFoundMarker;
        switch (kind) {
            case IdentityKind::Username:
                owner.username = key;
                break;
            case IdentityKind::Email:
                owner.email = key;
                break;
            case IdentityKind::GroupName:
                owner.kind = OwnerKind::Group;
                owner.display_name = key;
                break;
        }
        return owner;
    }
};

} // namespace labsync::model
