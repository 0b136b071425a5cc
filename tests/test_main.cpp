#define CATCH_CONFIG_RUNNER
#include <spdlog/spdlog.h>

#include <catch2/catch.hpp>

int main(int argc, char* argv[]) {
    // Failure paths are exercised on purpose; keep their logs out of the report.
    spdlog::set_level(spdlog::level::critical);
    return Catch::Session().run(argc, argv);
}
