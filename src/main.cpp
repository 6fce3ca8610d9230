/**
 * parafetch - segmented HTTP downloader
 *
 * Main entry point for the application.
 * Parses the command line and runs a single download.
 *
 * @version 1.0.0
 * @license MIT
 */

#include <memory>
#include <iostream>
#include <csignal>
#include <string>
#include <vector>

#include "core/Application.hpp"
#include "core/CommandLine.hpp"
#include "core/Logger.hpp"

// Global application instance for signal handling
std::unique_ptr<parafetch::core::Application> g_app;

/**
 * Signal handler: stop the download, keep part files for resume
 */
void signalHandler(int /*signal*/) {
    if (g_app) {
        g_app->requestStop();
    }
}

/**
 * Setup signal handlers for graceful shutdown
 */
void setupSignalHandlers() {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
}

void restoreSignalHandlers() {
    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
}

/**
 * Main application entry point
 */
int main(int argc, char* argv[]) {
    using parafetch::core::Application;
    using parafetch::core::CommandLine;

    std::vector<std::string> args(argv + 1, argv + argc);
    std::string program = argc > 0 ? argv[0] : Application::getName();

    CommandLine commandLine;
    std::string error;
    if (!CommandLine::parse(args, commandLine, error)) {
        std::cerr << program << ": " << error << "\n\n" << CommandLine::usage(program);
        return parafetch::core::ExitUsage;
    }

    if (commandLine.showHelp) {
        std::cout << CommandLine::usage(program) << std::endl;
        return 0;
    }

    if (commandLine.showVersion) {
        std::cout << Application::getName() << " v" << Application::getVersion() << std::endl;
        return 0;
    }

    try {
        g_app = std::make_unique<Application>();

        if (!g_app->initialize(commandLine)) {
            return parafetch::core::ExitUsage;
        }

        setupSignalHandlers();
        int exitCode = g_app->run(commandLine);
        restoreSignalHandlers();

        g_app->shutdown();
        g_app.reset();
        return exitCode;

    } catch (const std::exception& e) {
        restoreSignalHandlers();
        parafetch::core::Logger::instance().critical("Unhandled exception: {}", e.what());
        return parafetch::core::ExitFailure;
    }
}
