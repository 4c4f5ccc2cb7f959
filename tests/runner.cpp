#define CATCH_CONFIG_RUNNER
#include <stash/utilities/testing.hpp>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

int
main(int argc, char* argv[])
{
    // Register the logger before anything else asks for it so that the
    // library's messages show up alongside Catch's output.
    auto logger = spdlog::stdout_color_mt("stash");
    logger->set_level(spdlog::level::debug);

    return Catch::Session().run(argc, argv);
}
