#define CATCH_CONFIG_RUNNER
#include <catch2/catch.hpp>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

int
main(int argc, char* argv[])
{
    auto logger = spdlog::stdout_color_mt("anykey");
    logger->set_level(spdlog::level::warn);

    return Catch::Session().run(argc, argv);
}
