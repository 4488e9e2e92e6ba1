#include "consensus/change_action.hpp"

#include <fmt/format.h>

namespace Subnet::Consensus {

namespace {

    struct KeyVisitor {
        uint8_t type;

        ActionKey operator()(const AddToValidated& a) const { return { .type = type, .id = artifact_id(a.artifact) }; }
        ActionKey operator()(const MoveToValidated& a) const { return { .type = type, .id = a.id }; }
        ActionKey operator()(const RemoveFromUnvalidated& a) const { return { .type = type, .id = a.id }; }
        ActionKey operator()(const PurgeUnvalidatedBelow& a) const { return { .type = type, .height = a.height }; }
        ActionKey operator()(const PurgeValidatedBelow& a) const { return { .type = type, .height = a.height }; }
    };

    struct DescribeVisitor {
        std::string operator()(const AddToValidated& a) const { return fmt::format("AddToValidated({})", describe(a.artifact)); }
        std::string operator()(const MoveToValidated& a) const { return fmt::format("MoveToValidated({})", short_hex(a.id)); }
        std::string operator()(const RemoveFromUnvalidated& a) const { return fmt::format("RemoveFromUnvalidated({})", short_hex(a.id)); }
        std::string operator()(const PurgeUnvalidatedBelow& a) const { return fmt::format("PurgeUnvalidatedBelow({})", a.height); }
        std::string operator()(const PurgeValidatedBelow& a) const { return fmt::format("PurgeValidatedBelow({})", a.height); }
    };

} // namespace

ActionKey action_key(const ChangeAction& action)
{
    return std::visit(KeyVisitor { .type = static_cast<uint8_t>(action.index()) }, action);
}

std::string describe(const ChangeAction& action)
{
    return std::visit(DescribeVisitor {}, action);
}

} // namespace Subnet::Consensus
