#pragma once

//=============================================================================
// Command line
//
// Turns argv into config overrides. Every flag that mirrors a config key
// lands in `overrides` under the same path, so the command line is just
// the last config layer.
//=============================================================================

#include <cavern/result.hpp>
#include <yaml-cpp/yaml.h>

#include <cstdint>
#include <optional>
#include <string>

namespace cavern {

struct CommandLine {
    // --help was given; helpText holds the usage to print
    bool helpShown = false;
    std::string helpText;

    std::string configPath;
    YAML::Node overrides;
    std::optional<uint64_t> headlessSteps;
};

Result<CommandLine> parseCommandLine(int argc, const char* const* argv);

} // namespace cavern
