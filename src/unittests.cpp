#define DOCTEST_CONFIG_IMPLEMENT
#include "doctest/doctest.h"

#include "spdlog/spdlog.h"

int main(int argc, char* argv[]) {
    // Keep logged problems short so they read cleanly between doctest failure reports.
    spdlog::set_pattern("[canon %l] %v");
    spdlog::set_level(spdlog::level::debug);

    doctest::Context context;
    context.applyCommandLine(argc, argv);
    return context.run();
}
