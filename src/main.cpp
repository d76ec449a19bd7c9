/// @file main.cpp
/// @brief sail_layout entry point - checks, formats and exports HUD layouts

#include <sail_engine/core/log.hpp>
#include <sail_engine/tool/cli.hpp>

#include <iostream>
#include <string>
#include <vector>

int main(int argc, char** argv) {
    sail_core::init_logging();

    std::vector<std::string> args(argv, argv + argc);
    const int exit_code = sail_tool::run(args, std::cout, std::cerr);

    sail_core::shutdown_logging();
    return exit_code;
}
