#pragma once

/**
 * Application.hpp
 *
 * Process-level lifecycle: configuration, logging, the HTTP stack and
 * one download run.
 */

#include "CommandLine.hpp"
#include "downloader/DownloadError.hpp"

#include <atomic>
#include <memory>
#include <string>

namespace parafetch::utils { class HttpClient; }
namespace parafetch::core::downloader {
class DownloadManager;
struct DownloadOptions;
}

namespace parafetch::core {

/**
 * Application state enum
 */
enum class AppState {
    Uninitialized,
    Ready,
    Downloading,
    ShuttingDown,
    Error
};

/**
 * Process exit codes
 */
enum ExitCode : int {
    ExitSuccess = 0,
    ExitFailure = 1,
    ExitVerificationFailed = 2,
    ExitUsage = 64,
    ExitInterrupted = 130
};

/**
 * Main application class
 */
class Application {
public:
    Application();
    ~Application();

    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;
    Application(Application&&) = delete;
    Application& operator=(Application&&) = delete;

    /**
     * Load configuration, start logging and create the download stack
     * @param commandLine Parsed arguments
     * @return false if the configuration could not be loaded
     */
    bool initialize(const CommandLine& commandLine);

    /**
     * Run the download described by the command line
     * @return Process exit code
     */
    int run(const CommandLine& commandLine);

    /**
     * Stop the running download. Async-signal-safe.
     */
    void requestStop();

    void shutdown();

    AppState getState() const { return m_state.load(); }

    /**
     * Merge configuration values and command-line overrides
     */
    static downloader::DownloadOptions buildOptions(const CommandLine& commandLine);

    static int exitCodeFor(downloader::ErrorCode code);

    static std::string getVersion() { return "1.0.0"; }
    static std::string getName() { return "parafetch"; }

private:
    bool loadConfiguration(const CommandLine& commandLine, std::string& error);
    void initializeLogging(const CommandLine& commandLine);

private:
    std::atomic<AppState> m_state{AppState::Uninitialized};
    std::atomic<bool> m_stopRequested{false};

    std::unique_ptr<utils::HttpClient> m_httpClient;
    std::unique_ptr<downloader::DownloadManager> m_downloadManager;
};

} // namespace parafetch::core
