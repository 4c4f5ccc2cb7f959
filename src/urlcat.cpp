#include <stash/caching/http_cache.hpp>

#include <iostream>

#include <boost/program_options.hpp>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

using namespace stash;

// urlcat writes the content of a URL to stdout, going through (and updating)
// the cache.

int
main(int argc, char const* const* argv)
{
    namespace po = boost::program_options;

    po::options_description desc("Supported options");
    desc.add_options()
        ("help", "show help message")
        ("cache-dir", po::value<string>(), "the cache directory to use")
        ("cacert", po::value<string>(), "the CA certificate bundle to use")
        ("verbose", "log what the cache is doing")
        ("url", po::value<string>(), "the URL to fetch")
    ;

    po::positional_options_description positional;
    positional.add("url", 1);

    po::variables_map vm;
    try
    {
        po::store(
            po::command_line_parser(argc, argv)
                .options(desc)
                .positional(positional)
                .run(),
            vm);
        po::notify(vm);
    }
    catch (po::error& e)
    {
        std::cerr << "urlcat: " << e.what() << "\n" << desc;
        return 1;
    }

    if (vm.count("help") || !vm.count("url"))
    {
        std::cout << "usage: urlcat [options] URL\n" << desc;
        return vm.count("help") ? 0 : 1;
    }

    // Logging goes to stderr so that it doesn't mix with the content.
    auto logger = spdlog::stderr_color_mt("stash");
    logger->set_level(
        vm.count("verbose") ? spdlog::level::debug : spdlog::level::warn);

    try
    {
        optional<file_path> cacert_path;
        if (vm.count("cacert"))
            cacert_path = file_path(vm["cacert"].as<string>());
        http_request_system system(cacert_path);
        http_connection connection(system);

        http_cache_config config;
        if (vm.count("cache-dir"))
            config.directory = file_path(vm["cache-dir"].as<string>());
        http_cache cache(config, connection);

        auto content = cache.fetch(vm["url"].as<string>());
        std::cout << content.rdbuf();
        std::cout.flush();
    }
    catch (std::exception& e)
    {
        std::cerr << "urlcat: could not fetch URL:\n" << e.what() << "\n";
        return 1;
    }

    return 0;
}
