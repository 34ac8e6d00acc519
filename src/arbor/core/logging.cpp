#include <arbor/core/logging.hpp>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace arbor {

static std::shared_ptr<spdlog::logger>
create_logger()
{
    auto logger = spdlog::get("arbor");
    if (!logger)
        logger = spdlog::stdout_color_mt("arbor");
    return logger;
}

std::shared_ptr<spdlog::logger>
get_logger()
{
    static std::shared_ptr<spdlog::logger> logger = create_logger();
    return logger;
}

} // namespace arbor
