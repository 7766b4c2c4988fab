#define CATCH_CONFIG_RUNNER
#define CATCH_CONFIG_FAST_COMPILE

#include <catch2/catch.hpp>

#include <spdlog/cfg/env.h>

int main(int argc, char* argv[]) {
    // SPDLOG_LEVEL=debug shows rejected filters and decode failures
    spdlog::cfg::load_env_levels();
    return Catch::Session().run(argc, argv);
}
