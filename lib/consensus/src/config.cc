#include "consensus/config.hpp"
#include "consensus/error.hpp"

namespace Subnet::Consensus {

std::expected<void, std::error_code> ConsensusConfig::validate() const
{
    if (unit_delay <= Duration::zero() || initial_notary_delay < Duration::zero())
        return std::unexpected(Error::InvalidConfig);
    if (catch_up_interval == 0)
        return std::unexpected(Error::InvalidConfig);
    if (validated_retention < catch_up_interval)
        return std::unexpected(Error::InvalidConfig);
    return {};
}

} // namespace Subnet::Consensus
