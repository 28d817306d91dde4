#include <cavern/command-line.h>

#include <args.hxx>

#include <sstream>

namespace cavern {

Result<CommandLine> parseCommandLine(int argc, const char* const* argv) {
    args::ArgumentParser parser("cavern - paint, evolve and carve cave maps in the terminal");
    args::HelpFlag help(parser, "help", "Display this help menu", {'h', "help"});

    args::ValueFlag<std::string> configFile(parser, "path", "Config file path", {'c', "config"});
    args::ValueFlag<uint32_t> widthArg(parser, "cells", "World width in cells", {'W', "width"});
    args::ValueFlag<uint32_t> heightArg(parser, "cells", "World height in cells", {'H', "height"});
    args::ValueFlag<uint64_t> seedArg(parser, "seed", "Initial random seed", {'s', "seed"});
    args::ValueFlag<std::string> modeArg(parser, "mode", "Start mode: paint, life or drunk", {'m', "mode"});
    args::ValueFlag<uint32_t> tickArg(parser, "ms", "Autonomous step interval in ms", {'t', "tick-ms"});
    args::ValueFlag<std::string> initialArg(parser, "map", "Initial map: empty, random or drunk", {"initial"});
    args::ValueFlag<std::string> logFileArg(parser, "path", "Log file path", {"log-file"});
    args::ValueFlag<std::string> logLevelArg(parser, "level", "Log level (trace..off)", {"log-level"});
    args::ValueFlag<uint64_t> headlessArg(parser, "steps",
        "Run N steps of the start mode without a UI and print the world", {"headless"});

    CommandLine out;
    try {
        parser.ParseCLI(argc, argv);
    } catch (const args::Help&) {
        std::ostringstream usage;
        usage << parser;
        out.helpShown = true;
        out.helpText = usage.str();
        return Ok(std::move(out));
    } catch (const args::ParseError& e) {
        return Err<CommandLine>(std::string("Parse error: ") + e.what() + " (see --help)");
    } catch (const args::ValidationError& e) {
        return Err<CommandLine>(std::string("Invalid argument: ") + e.what());
    }

    // Build command line overrides for config
    if (widthArg) out.overrides["world"]["width"] = args::get(widthArg);
    if (heightArg) out.overrides["world"]["height"] = args::get(heightArg);
    if (seedArg) out.overrides["simulation"]["seed"] = args::get(seedArg);
    if (modeArg) out.overrides["simulation"]["mode"] = args::get(modeArg);
    if (tickArg) out.overrides["simulation"]["tick-ms"] = args::get(tickArg);
    if (initialArg) out.overrides["generator"]["initial"] = args::get(initialArg);
    if (logFileArg) out.overrides["log"]["file"] = args::get(logFileArg);
    if (logLevelArg) out.overrides["log"]["level"] = args::get(logLevelArg);

    if (configFile) out.configPath = args::get(configFile);
    if (headlessArg) out.headlessSteps = args::get(headlessArg);
    return Ok(std::move(out));
}

} // namespace cavern
