/**
 * umedia - background media retrieval manager
 *
 * Command line entry point. Starts one background task per source, waits
 * for any or all of them and prints the batch status as JSON.
 */

#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "core/Config.hpp"
#include "core/Logger.hpp"
#include "core/retrieval/LocalFileRetrieval.hpp"
#include "core/tasks/TaskManager.hpp"
#include "utils/FileUtils.hpp"
#include "utils/PathUtils.hpp"
#include "utils/PathValidator.hpp"

namespace fs = std::filesystem;

using umedia::core::Config;
using umedia::core::Logger;
using umedia::core::tasks::TaskManager;

namespace {

constexpr const char* kVersion = "1.0.0";

// Set from the signal handler, polled by the wait loop
std::atomic<bool> g_interrupted{false};

struct Options {
    std::vector<std::string> sources;
    std::string mediaKind;
    std::string quality;
    std::string format;
    umedia::core::tasks::WaitMode mode{umedia::core::tasks::WaitMode::All};
    std::optional<int> timeoutSeconds;
    std::string configPath;
    bool debug{false};
};

/**
 * Signal handler for graceful shutdown
 */
void signalHandler(int) {
    g_interrupted = true;
}

void setupSignalHandlers() {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
}

void printUsage(const char* program) {
    std::cout << "umedia - background media retrieval manager\n"
              << "\nUsage: " << program << " [options] <source>...\n"
              << "\nOptions:\n"
              << "  -k, --kind <video|audio>  Media kind (default: video)\n"
              << "  -q, --quality <q>         Video quality label or audio bitrate\n"
              << "  -f, --format <fmt>        Audio output format\n"
              << "  -m, --mode <any|all>      Wait for any or all tasks (default: all)\n"
              << "  -t, --timeout <seconds>   Maximum wait time\n"
              << "  -c, --config <file>       Configuration file\n"
              << "  -d, --debug               Enable debug logging\n"
              << "  -h, --help                Show this help message\n"
              << "  -v, --version             Show version information\n"
              << std::endl;
}

/**
 * Parse command line arguments
 * @return std::nullopt on usage errors (already reported)
 */
std::optional<Options> parseArguments(int argc, char* argv[], bool& exitEarly) {
    Options options;
    exitEarly = false;

    auto requireValue = [&](int& i, const std::string& flag) -> std::optional<std::string> {
        if (i + 1 >= argc) {
            std::cerr << "Missing value for " << flag << std::endl;
            return std::nullopt;
        }
        return std::string(argv[++i]);
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);

        if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            exitEarly = true;
            return options;
        } else if (arg == "--version" || arg == "-v") {
            std::cout << "umedia v" << kVersion << std::endl;
            exitEarly = true;
            return options;
        } else if (arg == "--debug" || arg == "-d") {
            options.debug = true;
        } else if (arg == "--kind" || arg == "-k") {
            auto value = requireValue(i, arg);
            if (!value) return std::nullopt;
            options.mediaKind = *value;
        } else if (arg == "--quality" || arg == "-q") {
            auto value = requireValue(i, arg);
            if (!value) return std::nullopt;
            options.quality = *value;
        } else if (arg == "--format" || arg == "-f") {
            auto value = requireValue(i, arg);
            if (!value) return std::nullopt;
            options.format = *value;
        } else if (arg == "--mode" || arg == "-m") {
            auto value = requireValue(i, arg);
            if (!value) return std::nullopt;
            auto mode = umedia::core::tasks::parseWaitMode(*value);
            if (!mode) {
                std::cerr << "Invalid mode: " << *value << " (expected any or all)" << std::endl;
                return std::nullopt;
            }
            options.mode = *mode;
        } else if (arg == "--timeout" || arg == "-t") {
            auto value = requireValue(i, arg);
            if (!value) return std::nullopt;
            try {
                options.timeoutSeconds = std::stoi(*value);
            } catch (const std::exception&) {
                std::cerr << "Invalid timeout: " << *value << std::endl;
                return std::nullopt;
            }
        } else if (arg == "--config" || arg == "-c") {
            auto value = requireValue(i, arg);
            if (!value) return std::nullopt;
            options.configPath = *value;
        } else if (!arg.empty() && arg.front() == '-') {
            std::cerr << "Unknown option: " << arg << std::endl;
            return std::nullopt;
        } else {
            options.sources.push_back(arg);
        }
    }

    if (options.sources.empty()) {
        std::cerr << "No sources given" << std::endl;
        printUsage(argv[0]);
        return std::nullopt;
    }
    return options;
}

/**
 * Load configuration, creating the default file on first run
 */
bool loadConfiguration(const std::string& explicitPath) {
    auto& config = Config::instance();
    config.setDefaults();

    fs::path configPath = explicitPath.empty()
        ? umedia::utils::PathUtils::getConfigPath()
        : fs::path(explicitPath);

    if (umedia::utils::FileUtils::fileExists(configPath)) {
        if (!config.load(configPath.string())) {
            std::cerr << "Failed to parse configuration " << configPath.string() << std::endl;
            return false;
        }
    } else if (explicitPath.empty()) {
        // Best effort: a read-only home must not stop the run
        if (!config.save(configPath.string())) {
            std::cerr << "Could not write default configuration to " << configPath.string() << std::endl;
        }
    } else {
        std::cerr << "Configuration file not found: " << configPath.string() << std::endl;
        return false;
    }

    config.applyEnvironment();
    return true;
}

} // namespace

/**
 * Main entry point
 */
int main(int argc, char* argv[]) {
    bool exitEarly = false;
    auto options = parseArguments(argc, argv, exitEarly);
    if (!options) {
        return 2;
    }
    if (exitEarly) {
        return 0;
    }

    if (!loadConfiguration(options->configPath)) {
        return 2;
    }

    auto& config = Config::instance();

    auto level = options->debug
        ? umedia::core::LogLevel::Debug
        : umedia::core::parseLogLevel(config.get<std::string>("logging.level", "info"));
    fs::path logDir = umedia::utils::PathUtils::resolveDirectory(
        config.get<std::string>("logging.directory", ""),
        umedia::utils::PathUtils::getLogsPath());
    Logger::instance().initialize(level, logDir.string());

    auto& logger = Logger::instance();
    logger.info("umedia v{} starting", kVersion);

    setupSignalHandlers();

    fs::path downloadDir = umedia::utils::PathUtils::resolveDirectory(
        config.get<std::string>("downloads.directory", ""),
        umedia::utils::PathUtils::getDefaultDownloadPath());
    fs::path tmpDir = umedia::utils::PathUtils::resolveDirectory(
        config.get<std::string>("downloads.tmpDirectory", ""),
        umedia::utils::PathUtils::getDefaultTmpPath());

    for (const auto& dir : {downloadDir, tmpDir}) {
        if (!umedia::utils::FileUtils::createDirectories(dir)) {
            logger.critical("Failed to create directory {}", dir.string());
            return 1;
        }
    }

    try {
        auto validator = std::make_shared<umedia::utils::PathValidator>(
            std::vector<fs::path>{downloadDir, tmpDir});

        umedia::core::retrieval::LocalFileRetrieval retrieval(
            downloadDir, tmpDir,
            config.get<size_t>("retrieval.chunkSize", umedia::core::retrieval::LocalFileRetrieval::kDefaultChunkSize));

        auto remover = [validator](const fs::path& path) {
            if (validator->safeUnlink(path)) {
                Logger::instance().debug("Removed partial file {}", path.string());
            }
        };

        TaskManager manager(retrieval,
                            umedia::core::tasks::TaskDefaults::fromConfig(config),
                            remover);

        std::vector<std::string> taskIds;
        bool rejected = false;
        for (const auto& source : options->sources) {
            umedia::core::tasks::DownloadRequest request;
            request.url = source;
            request.mediaKind = options->mediaKind;
            request.quality = options->quality;
            request.format = options->format;

            auto response = manager.startDownload(request);
            if (!response.taskId) {
                std::cerr << umedia::core::tasks::toJson(response).dump(2) << std::endl;
                rejected = true;
                continue;
            }
            taskIds.push_back(*response.taskId);
        }

        if (taskIds.empty()) {
            return rejected ? 2 : 1;
        }

        int timeoutSeconds = options->timeoutSeconds.value_or(
            config.get<int>("downloads.waitTimeoutSeconds", 300));
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(timeoutSeconds);

        // Wait in short slices so a signal is noticed promptly
        umedia::core::tasks::BatchStatus status;
        while (true) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            auto slice = std::min(remaining, std::chrono::milliseconds(200));

            status = manager.waitForAnyOrAll(taskIds, options->mode, slice);
            if (!status.timedOut || remaining <= slice) {
                break;
            }

            if (g_interrupted) {
                logger.info("Interrupted, canceling {} task(s)", taskIds.size());
                for (const auto& taskId : taskIds) {
                    manager.cancel(taskId);
                }
                status = manager.waitForAnyOrAll(taskIds, umedia::core::tasks::WaitMode::All,
                                                 std::chrono::seconds(10));
                break;
            }
        }

        std::cout << umedia::core::tasks::toJson(status).dump(2) << std::endl;

        bool allCompleted = !status.completed.empty() && !status.timedOut && !rejected;
        for (const auto& lookup : status.completed) {
            if (lookup.status() != umedia::core::tasks::TaskStatus::Completed) {
                allCompleted = false;
            }
        }

        manager.shutdown();
        logger.info("umedia shutdown complete");
        Logger::instance().flush();
        return allCompleted ? 0 : 1;

    } catch (const std::exception& e) {
        logger.critical("Unhandled exception: {}", e.what());
        return 1;
    }
}
