/**
 * Application.cpp
 *
 * Implementation of the core Application class.
 */

#include "Application.hpp"
#include "Logger.hpp"
#include "Config.hpp"
#include "downloader/DownloadManager.hpp"
#include "../utils/HttpClient.hpp"
#include "../utils/PathUtils.hpp"
#include "../utils/FileUtils.hpp"

#include <chrono>

namespace parafetch::core {

using downloader::DownloadManager;
using downloader::DownloadOptions;
using downloader::ErrorCode;

Application::Application() = default;

Application::~Application() {
    if (m_state != AppState::Uninitialized && m_state != AppState::ShuttingDown) {
        shutdown();
    }
}

bool Application::initialize(const CommandLine& commandLine) {
    if (m_state != AppState::Uninitialized) {
        Logger::instance().warn("Application already initialized");
        return false;
    }

    // Logging settings may come from the config file, so load it first
    std::string configError;
    bool configLoaded = loadConfiguration(commandLine, configError);

    initializeLogging(commandLine);

    auto& logger = Logger::instance();
    logger.debug("{} v{} starting", getName(), getVersion());

    if (!configLoaded) {
        logger.error("Failed to load configuration: {}", configError);
        m_state = AppState::Error;
        return false;
    }
    if (!Config::instance().loadedPath().empty()) {
        logger.debug("Configuration loaded from {}", Config::instance().loadedPath());
    }

    if (!utils::CurlGlobalInit::init()) {
        logger.critical("Failed to initialize libcurl");
        m_state = AppState::Error;
        return false;
    }

    auto& config = Config::instance();

    utils::HttpOptions http;
    http.connectTimeoutSeconds = config.get<int>("downloads.connectTimeoutSeconds", 15);
    http.inactivityTimeoutSeconds = commandLine.timeoutSeconds
        ? *commandLine.timeoutSeconds
        : config.get<int>("downloads.timeoutSeconds", 60);
    http.maxRedirects = config.get<int>("downloads.maxRedirects", 3);
    http.verifySSL = config.get<bool>("downloads.verifySSL", true);
    http.userAgent = config.get<std::string>("downloads.userAgent", getName() + "/" + getVersion());

    m_httpClient = std::make_unique<utils::HttpClient>(http);
    m_downloadManager = std::make_unique<DownloadManager>(*m_httpClient);

    m_state = AppState::Ready;
    return true;
}

bool Application::loadConfiguration(const CommandLine& commandLine, std::string& error) {
    auto& config = Config::instance();
    config.setDefaults();

    if (!commandLine.configPath.empty()) {
        return config.load(commandLine.configPath, error);
    }

    // The default location is optional
    auto defaultPath = utils::PathUtils::getConfigPath();
    if (utils::FileUtils::fileExists(defaultPath) && !config.load(defaultPath.string(), error)) {
        error += " (" + defaultPath.string() + ")";
        return false;
    }
    return true;
}

void Application::initializeLogging(const CommandLine& commandLine) {
    auto& config = Config::instance();

    LogLevel level = Logger::parseLevel(config.get<std::string>("logging.level", "info"));
    if (commandLine.debug) {
        level = LogLevel::Debug;
    }

    std::string logFile = commandLine.logFile.empty()
        ? config.get<std::string>("logging.file", "")
        : commandLine.logFile;

    Logger::instance().initialize(level, logFile);
}

DownloadOptions Application::buildOptions(const CommandLine& commandLine) {
    auto& config = Config::instance();

    DownloadOptions options;
    options.url = commandLine.url;
    options.output = commandLine.output;

    options.workers = commandLine.workers ? *commandLine.workers
                                          : config.get<int>("downloads.workers", 8);

    if (commandLine.chunkSize) {
        options.chunkSize = commandLine.chunkSize;
    } else {
        // 0 in the config file means "not set"
        int64_t configured = config.get<int64_t>("downloads.chunkSize", 0);
        if (configured != 0) {
            options.chunkSize = configured;
        }
    }

    options.maxRetries = commandLine.maxRetries ? *commandLine.maxRetries
                                                : config.get<int>("downloads.maxRetries", 3);
    options.retryDelay = std::chrono::milliseconds(
        commandLine.retryDelayMs ? *commandLine.retryDelayMs
                                 : config.get<int>("downloads.retryDelayMs", 1000));

    options.sha256 = commandLine.sha256;
    options.resume = !commandLine.noResume && config.get<bool>("downloads.resume", true);
    options.keepParts = commandLine.keepParts || config.get<bool>("downloads.keepParts", false);

    return options;
}

int Application::exitCodeFor(ErrorCode code) {
    switch (code) {
        case ErrorCode::None:
            return ExitSuccess;
        case ErrorCode::InvalidConfiguration:
            return ExitUsage;
        case ErrorCode::SizeMismatch:
        case ErrorCode::IntegrityMismatch:
            return ExitVerificationFailed;
        case ErrorCode::Cancelled:
            return ExitInterrupted;
        default:
            return ExitFailure;
    }
}

int Application::run(const CommandLine& commandLine) {
    if (m_state != AppState::Ready) {
        Logger::instance().error("Cannot start download: application not ready");
        return ExitFailure;
    }

    if (m_stopRequested.load()) {
        m_downloadManager->cancel();
    }

    m_state = AppState::Downloading;
    auto startTime = std::chrono::steady_clock::now();

    downloader::DownloadOutcome outcome = m_downloadManager->run(buildOptions(commandLine));

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - startTime);
    Logger::instance().debug("Finished in {}ms ({})", elapsed.count(),
                             downloader::errorCodeLabel(outcome.code));

    m_state = AppState::Ready;
    return exitCodeFor(outcome.code);
}

void Application::requestStop() {
    m_stopRequested.store(true);
    if (m_downloadManager) {
        m_downloadManager->cancel();
    }
}

void Application::shutdown() {
    if (m_state == AppState::ShuttingDown || m_state == AppState::Uninitialized) {
        return;
    }

    m_state = AppState::ShuttingDown;

    m_downloadManager.reset();
    m_httpClient.reset();
    utils::CurlGlobalInit::cleanup();

    Logger::instance().flush();
    m_state = AppState::Uninitialized;
}

} // namespace parafetch::core
