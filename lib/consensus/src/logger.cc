#include "consensus/logger.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <mutex>
#include <sstream>
#include <string>
#include <unordered_map>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace Subnet::Consensus {

namespace {

    constexpr auto FormatStr = "[%n:%^%l%$] %v";

    std::string trim(std::string s)
    {
        auto const* spaces = " \n\r\t";
        s.erase(s.find_last_not_of(spaces) + 1);
        s.erase(0, s.find_first_not_of(spaces));
        return s;
    }

    std::string to_lower(std::string s)
    {
        std::transform(s.begin(), s.end(), s.begin(),
            [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    }

    // "pool=debug,engine=trace" => {pool: debug, engine: trace}.
    // A bare level without a name sets the default.
    std::unordered_map<std::string, spdlog::level::level_enum> parse_levels(const char* env)
    {
        std::unordered_map<std::string, spdlog::level::level_enum> levels;
        if (env == nullptr)
            return levels;

        std::stringstream in(env);
        std::string token;
        while (std::getline(in, token, ',')) {
            std::string name;
            std::string value = token;
            if (auto eq = token.find('='); eq != std::string::npos) {
                name = trim(token.substr(0, eq));
                value = token.substr(eq + 1);
            }
            auto level = spdlog::level::from_str(to_lower(trim(value)));
            // from_str maps unknown strings to off; only accept the literal "off".
            if (level == spdlog::level::off && to_lower(trim(value)) != "off")
                continue;
            levels[name] = level;
        }
        return levels;
    }

    spdlog::level::level_enum level_for(std::string const& name)
    {
        static auto const levels = parse_levels(std::getenv("SPDLOG_LEVEL"));
        if (auto it = levels.find(name); it != levels.end())
            return it->second;
        if (auto it = levels.find(""); it != levels.end())
            return it->second;
        return spdlog::level::info;
    }

} // namespace

Logger std_out_logger(std::string const& name)
{
    static std::mutex mutex;
    std::lock_guard lock(mutex);

    if (auto existing = spdlog::get(name))
        return existing;

    auto logger = spdlog::stdout_color_mt(name);
    logger->set_pattern(FormatStr);
    logger->set_level(level_for(name));
    return logger;
}

} // namespace Subnet::Consensus
