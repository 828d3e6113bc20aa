#include "Switchboard/CliParser.hpp"
#include "Switchboard/Core.hpp"
#include <iostream>
#include <memory>

int main(int argc, char** argv) {
    // CliParser is responsible for defining and parsing all command-line
    // arguments using the CLI11 library.
    Switchboard::CliParser parser;
    auto app = parser.setupCli();

    try {
        app->parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app->exit(e);
    } catch (const std::exception& e) {
        std::cerr << "An unexpected error occurred: " << e.what() << std::endl;
        return 1;
    }

    // Core loads the configuration and wires the components together,
    // so configuration errors surface here.
    std::unique_ptr<Switchboard::Core> core;
    try {
        core = std::make_unique<Switchboard::Core>(parser.getCommands());
    } catch (const std::exception& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 2;
    }

    try {
        return core->run();
    } catch (const std::exception& e) {
        std::cerr << "Error during execution: " << e.what() << std::endl;
        return 1;
    }
}
