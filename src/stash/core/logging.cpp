#include <stash/core/logging.hpp>

#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace stash {

std::shared_ptr<spdlog::logger>
get_logger()
{
    static std::mutex creation_mutex;
    std::scoped_lock<std::mutex> lock(creation_mutex);

    auto logger = spdlog::get("stash");
    if (!logger)
        logger = spdlog::stderr_color_mt("stash");
    return logger;
}

} // namespace stash
