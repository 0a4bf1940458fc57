#include "workpool/common/logging.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>

namespace workpool
{

std::shared_ptr<spdlog::logger> logger()
{
    static std::once_flag s_once;
    static std::shared_ptr<spdlog::logger> s_logger;

    std::call_once(s_once, []()
    {
        s_logger = spdlog::get(k_logger_name);
        if (!s_logger)
        {
            s_logger = spdlog::stderr_color_mt(k_logger_name);
            s_logger->set_level(spdlog::level::info);
            s_logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
        }
    });
    return s_logger;
}

void enable_verbose_logging(bool verbose)
{
    if (!verbose)
    {
        return;
    }
    auto log = logger();
    if (log->level() > spdlog::level::debug)
    {
        log->set_level(spdlog::level::debug);
    }
}

} // namespace workpool
