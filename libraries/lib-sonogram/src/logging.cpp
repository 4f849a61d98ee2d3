#include "sonogram-core/util/logging.hpp"

#include <stdexcept>

namespace sonogram
{
    template<> log * singleton<log>::single = nullptr;

    spdlog::level::level_enum parse_log_level(const std::string & name)
    {
        const spdlog::level::level_enum level = spdlog::level::from_str(name);

        // from_str() maps unknown names to off, so only accept off when it was asked for
        if (level == spdlog::level::off && name != "off")
        {
            throw std::invalid_argument("unknown log level: " + name);
        }
        return level;
    }

} // end namespace sonogram
