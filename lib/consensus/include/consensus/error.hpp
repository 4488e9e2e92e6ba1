#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <system_error>

namespace Subnet::Consensus {

enum class Error : std::uint8_t {
    Success = 0,
    DuplicateArtifact,
    NotFound,
    VerificationFailed,
    InsufficientShares,
    InvalidConfig,
    NotAMember,
    InvalidArtifact,
    MalformedTrace,
};

class ConsensusErrorCategory : public std::error_category {
public:
    [[nodiscard]] const char* name() const noexcept override { return "SubnetConsensus"; }

    std::string message(int ev) const override
    {
        switch (static_cast<Error>(ev)) {
        case Error::Success:
            return "Success";
        case Error::DuplicateArtifact:
            return "Artifact already present in the pool";
        case Error::NotFound:
            return "Artifact not found in the unvalidated pool";
        case Error::VerificationFailed:
            return "Artifact signature verification failed";
        case Error::InsufficientShares:
            return "Not enough signature shares for an aggregate";
        case Error::InvalidConfig:
            return "Invalid consensus configuration";
        case Error::NotAMember:
            return "Node is not a member of the subnet at this height";
        case Error::InvalidArtifact:
            return "Artifact is malformed or inconsistent with the pool";
        case Error::MalformedTrace:
            return "Trace or key file is malformed";
        default:
            return "Unknown consensus error";
        }
    }
};

inline const std::error_category& consensus_category()
{
    static ConsensusErrorCategory instance;
    return instance;
}

inline std::error_code make_error_code(Error e)
{
    return { static_cast<int>(e), consensus_category() };
}

/// A broken pool invariant, e.g. two different blocks finalized at one height.
/// Never caused by a single bad artifact; signals a bug.
class InvariantViolation : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

} // namespace Subnet::Consensus

namespace std {
template <>
struct is_error_code_enum<Subnet::Consensus::Error> : true_type { };
} // namespace std
