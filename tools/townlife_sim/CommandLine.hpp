#pragma once
// tools/townlife_sim/CommandLine.hpp
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace townlife::demo {

// Parsed arguments for townlife_sim.
//
// Notes:
//   - Both "--opt=value" and "--opt value" forms are supported.
//   - Option names are case-insensitive; values are not.
struct CommandLineArgs
{
    bool showHelp = false;   // --help / -h
    bool verbose  = false;   // --verbose / -v
    bool restore  = false;   // --restore (load the last saved state)

    std::optional<std::string>   configPath;   // --config <file>
    std::optional<std::string>   dataDir;      // --data-dir <dir>
    std::optional<std::string>   logDir;       // --log-dir <dir>
    std::optional<int>           seconds;      // --seconds <N>, 0 = until Ctrl+C
    std::optional<std::uint64_t> seed;         // --seed <N>

    // Unknown or malformed args, kept for the error message.
    std::vector<std::string> unknown;
};

[[nodiscard]] CommandLineArgs ParseCommandLineArgs(int argc, char** argv);

[[nodiscard]] std::string BuildCommandLineHelpText();

} // namespace townlife::demo
