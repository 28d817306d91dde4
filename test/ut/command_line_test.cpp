//=============================================================================
// Command line Unit Tests
//=============================================================================

#include <boost/ut.hpp>
#include <cavern/command-line.h>

#include <string>

using namespace boost::ut;
using namespace cavern;

suite command_line_tests = [] {
    "--help is reported as a flag, not an error"_test = [] {
        const char* argv[] = {"cavern", "--help"};
        auto cmd = parseCommandLine(2, argv);
        expect(cmd.has_value()) << error_msg(cmd);
        if (!cmd) return;
        expect(cmd->helpShown);
        expect(cmd->helpText.find("--headless") != std::string::npos);
    };

    "-h works like --help"_test = [] {
        const char* argv[] = {"cavern", "-W", "40", "-h"};
        auto cmd = parseCommandLine(4, argv);
        expect(cmd.has_value());
        if (!cmd) return;
        expect(cmd->helpShown);
    };

    "flags become config overrides"_test = [] {
        const char* argv[] = {"cavern", "-W", "40", "--height", "25", "-m", "life",
                              "--seed", "9", "-c", "/tmp/cave.yaml", "--headless", "12"};
        auto cmd = parseCommandLine(13, argv);
        expect(cmd.has_value()) << error_msg(cmd);
        if (!cmd) return;

        expect(!cmd->helpShown);
        const YAML::Node& o = cmd->overrides;
        expect(o["world"]["width"].as<uint32_t>() == 40_u);
        expect(o["world"]["height"].as<uint32_t>() == 25_u);
        expect(o["simulation"]["mode"].as<std::string>() == "life");
        expect(o["simulation"]["seed"].as<uint64_t>() == 9_ul);
        expect(!o["generator"]) << "unset flags add no overrides";
        expect(cmd->configPath == std::string("/tmp/cave.yaml"));
        expect(cmd->headlessSteps == std::optional<uint64_t>(12));
    };

    "no flags means no overrides"_test = [] {
        const char* argv[] = {"cavern"};
        auto cmd = parseCommandLine(1, argv);
        expect(cmd.has_value());
        if (!cmd) return;
        expect(!cmd->helpShown);
        expect(!cmd->overrides.IsMap() || cmd->overrides.size() == 0_ul);
        expect(cmd->configPath.empty());
        expect(!cmd->headlessSteps.has_value());
    };

    "bad arguments are errors"_test = [] {
        const char* unknown[] = {"cavern", "--warp-drive"};
        auto r1 = parseCommandLine(2, unknown);
        expect(!r1.has_value());
        expect(!error_msg(r1).empty());

        const char* notNumber[] = {"cavern", "--width", "wide"};
        expect(!parseCommandLine(3, notNumber).has_value());
    };
};
