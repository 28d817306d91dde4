//=============================================================================
// cavern - terminal cave painter and cellular automaton playground
//
// Main entry point. Parses the command line into config overrides, sets up
// file logging (the terminal belongs to the UI) and runs the App.
//=============================================================================

#include <cavern/app.h>
#include <cavern/command-line.h>
#include <cavern/config.h>

#include <spdlog/spdlog.h>
#include <spdlog/cfg/env.h>
#include <spdlog/sinks/basic_file_sink.h>

#include <filesystem>
#include <iostream>

namespace {

cavern::Result<void> setupLogging(const cavern::Config& config) {
    using namespace cavern;

    auto logFile = config.get<std::string>(Config::KEY_LOG_FILE, Config::getDefaultLogPath().string());
    auto level = spdlog::level::from_str(config.get<std::string>(Config::KEY_LOG_LEVEL, "info"));

    try {
        auto parent = std::filesystem::path(logFile).parent_path();
        if (!parent.empty()) {
            std::filesystem::create_directories(parent);
        }
        auto fileLogger = spdlog::basic_logger_mt("cavern", logFile, true);
        spdlog::set_default_logger(fileLogger);
    } catch (const spdlog::spdlog_ex& e) {
        return Err<void>("Failed to open log file " + logFile + ": " + e.what());
    } catch (const std::filesystem::filesystem_error& e) {
        return Err<void>("Failed to create log directory for " + logFile + ": " + e.what());
    }

    spdlog::set_level(level);
    spdlog::flush_on(spdlog::level::warn);
    // SPDLOG_LEVEL wins over the config file
    spdlog::cfg::load_env_levels();
    return Ok();
}

} // namespace

int main(int argc, char* argv[]) {
    auto cmdLine = cavern::parseCommandLine(argc, argv);
    if (!cmdLine) {
        std::cerr << "cavern: " << cavern::error_msg(cmdLine) << std::endl;
        return 1;
    }
    if (cmdLine->helpShown) {
        std::cout << cmdLine->helpText;
        return 0;
    }

    auto config = cavern::Config::create(cmdLine->configPath, cmdLine->overrides);
    if (!config) {
        std::cerr << "cavern: " << cavern::error_msg(config) << std::endl;
        return 1;
    }

    if (auto res = setupLogging(**config); !res) {
        std::cerr << "cavern: " << cavern::error_msg(res) << std::endl;
        return 1;
    }
    if (!(*config)->loadedFrom().empty()) {
        spdlog::info("Config: {}", (*config)->loadedFrom());
    }

    auto app = cavern::App::create(*config);
    if (!app) {
        spdlog::error("Failed to initialize cavern: {}", cavern::error_msg(app));
        std::cerr << "cavern: " << cavern::error_msg(app) << std::endl;
        return 1;
    }

    if (cmdLine->headlessSteps) {
        auto world = (*app)->runHeadless(*cmdLine->headlessSteps);
        if (!world) {
            spdlog::error("Headless run failed: {}", cavern::error_msg(world));
            std::cerr << "cavern: " << cavern::error_msg(world) << std::endl;
            return 1;
        }
        std::cout << *world;
        return 0;
    }

    auto runResult = (*app)->run();
    if (!runResult) {
        spdlog::error("cavern run failed: {}", cavern::error_msg(runResult));
        std::cerr << "cavern: " << cavern::error_msg(runResult) << std::endl;
        return 1;
    }
    return 0;
}
