#define CATCH_CONFIG_RUNNER
#include <catch2/catch.hpp>

#include "Log.hpp"

int main(int argc, char* argv[]) {
    vd::Logger::set_level(vd::LogLevel::warn);
    return Catch::Session().run(argc, argv);
}
