#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>

#include "meshrelay/log.hpp"

int main(int argc, char** argv) {
    // keep test output to doctest's own report
    meshrelay::log::set_level(meshrelay::LogLevel::Off);

    doctest::Context ctx;
    ctx.applyCommandLine(argc, argv);
    return ctx.run();
}
