#include <atomic>
#include <csignal>
#include <iostream>
#include <unistd.h>
#include <CLI/CLI.hpp>
#include "app/runner.hpp"
#include "utils/color.hpp"
#include "cli/cli_parser.hpp"
#include "../../libmediapress/include/errors.hpp"
#include "../../libmediapress/include/logger.hpp"

using namespace mediapress;
namespace {

std::atomic<bool> interrupted{false};

} // namespace

extern "C" void signal_handler(const int sig) {
    if (sig != SIGINT && sig != SIGTERM) {
        return;
    }
    constexpr char msg[] = "\n[INTERRUPT] Stop requested, waiting for running files to finish...\n";
    [[maybe_unused]] const auto n = ::write(STDERR_FILENO, msg, sizeof(msg) - 1);
    interrupted.store(true);
}

int main(int argc, char* argv[]) {
    CLI::App app{"mediapress: compress a media directory into a mirrored output directory, where beneficial."};
    Settings settings;
    setup_cli_parser(app, settings);

    try {
        app.parse(argc, argv);
    } catch (const CLI::CallForHelp& e) {
        return app.exit(e);
    } catch (const CLI::CallForVersion& e) {
        return app.exit(e);
    } catch (const CLI::ParseError& e) {
        std::cerr << RED << "Parse error: " << e.what() << RESET << std::endl;
        return app.exit(e);
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    try {
        setup_logging(settings);
        return run(settings, std::cout, interrupted);
    } catch (const ValidationError& e) {
        Logger::log(LogLevel::Error, e.what(), "main");
        std::cerr << RED << "Invalid input: " << e.what() << RESET << std::endl;
    } catch (const VerificationError& e) {
        Logger::log(LogLevel::Error, e.what(), "main");
        std::cerr << RED << "Verification failed: " << e.what() << RESET << std::endl;
    } catch (const std::exception& e) {
        Logger::log(LogLevel::Error, e.what(), "main");
        std::cerr << RED << "Error: " << e.what() << RESET << std::endl;
    }
    return 1;
}
