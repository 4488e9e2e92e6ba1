#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace Subnet::Consensus {

using Logger = std::shared_ptr<spdlog::logger>;

/**
 * Named stdout logger. The level is taken from SPDLOG_LEVEL
 * ("name=level,other=level"), `info` when the name is not listed.
 * Repeated calls with the same name return the same logger.
 **/
Logger std_out_logger(std::string const& name);

} // namespace Subnet::Consensus
