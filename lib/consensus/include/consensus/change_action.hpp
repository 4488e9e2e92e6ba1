#pragma once

#include "consensus/artifact.hpp"
#include <compare>
#include <string>
#include <variant>
#include <vector>

namespace Subnet::Consensus {

/// Locally produced artifact entering the validated pool directly.
struct AddToValidated {
    Artifact artifact;
};

struct MoveToValidated {
    ArtifactId id;
};

struct RemoveFromUnvalidated {
    ArtifactId id;
};

struct PurgeUnvalidatedBelow {
    Height height;
};

struct PurgeValidatedBelow {
    Height height;
};

using ChangeAction = std::variant<
    AddToValidated,
    MoveToValidated,
    RemoveFromUnvalidated,
    PurgeUnvalidatedBelow,
    PurgeValidatedBelow>;

/// Applied strictly in order.
using ChangeSet = std::vector<ChangeAction>;

/// Identity of an action, used to match observed against computed change sets.
struct ActionKey {
    uint8_t type = 0;
    ArtifactId id {};
    Height height = 0;

    auto operator<=>(const ActionKey&) const = default;
};

ActionKey action_key(const ChangeAction& action);

std::string describe(const ChangeAction& action);

} // namespace Subnet::Consensus
