#include "archiver/archiver.h"
#include "config/config.h"

#include <iostream>
#include <format>
#include <string>
#include <vector>

int main(int argc, char** argv) {
    const auto program = std::string(0 < argc ? argv[0] : config::PROGRAM_NAME);

    config::options_t options;
    try {
        options = config::load(std::vector<std::string>(argv + (0 < argc ? 1 : 0), argv + argc));
    } catch (const std::exception& e) {
        std::cerr << std::format("{}: Error: {}", program, e.what()) << std::endl;
        std::cerr << config::usage(config::PROGRAM_NAME);
        return 1;
    }

    if (options.help) {
        std::cout << config::usage(config::PROGRAM_NAME);
        return 0;
    }

    try {
        archiver::run(options, std::cout);
    } catch (const std::exception& e) {
        std::cerr << std::format("{}: Error: {}", program, e.what()) << std::endl;
        return 1;
    }

    return 0;
}
