// tools/townlife_sim/CommandLine.cpp
#include "CommandLine.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <string_view>

namespace townlife::demo {

namespace {

[[nodiscard]] std::string ToLower(std::string_view s)
{
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

// "--opt=value" -> value. The option part is matched case-insensitively.
[[nodiscard]] bool ConsumeValue(std::string_view raw, std::string_view prefix, std::string_view& outValue)
{
    if (raw.size() <= prefix.size() || raw[prefix.size()] != '=')
        return false;
    if (ToLower(raw.substr(0, prefix.size())) != prefix)
        return false;
    outValue = raw.substr(prefix.size() + 1);
    return true;
}

template <typename T>
[[nodiscard]] std::optional<T> ParseNumber(std::string_view s)
{
    T v{};
    const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
    if (ec != std::errc{} || ptr != s.data() + s.size())
        return std::nullopt;
    return v;
}

} // namespace

CommandLineArgs ParseCommandLineArgs(int argc, char** argv)
{
    CommandLineArgs out;

    for (int i = 1; i < argc; ++i)
    {
        const std::string_view raw(argv[i]);
        if (raw.empty())
            continue;

        const std::string lowered = ToLower(raw);
        const std::string_view arg(lowered);

        if (arg == "--help" || arg == "-h" || arg == "-?") { out.showHelp = true; continue; }
        if (arg == "--verbose" || arg == "-v") { out.verbose = true; continue; }
        if (arg == "--restore") { out.restore = true; continue; }

        // "--opt value": the next argv entry, or unknown when missing.
        const auto next = [&]() -> std::optional<std::string_view> {
            if (i + 1 >= argc) {
                out.unknown.emplace_back(raw);
                return std::nullopt;
            }
            return std::string_view(argv[++i]);
        };

        const auto setString = [&](std::optional<std::string>& dst, std::optional<std::string_view> v) {
            if (v)
                dst = std::string(*v);
        };

        const auto setInt = [&](std::optional<int>& dst, std::optional<std::string_view> v) {
            if (!v)
                return;
            if (auto parsed = ParseNumber<int>(*v); parsed && *parsed >= 0)
                dst = *parsed;
            else
                out.unknown.emplace_back(raw);
        };

        const auto setSeed = [&](std::optional<std::uint64_t>& dst, std::optional<std::string_view> v) {
            if (!v)
                return;
            if (auto parsed = ParseNumber<std::uint64_t>(*v))
                dst = *parsed;
            else
                out.unknown.emplace_back(raw);
        };

        std::string_view value;
        if (ConsumeValue(raw, "--config", value))   { setString(out.configPath, value); continue; }
        if (ConsumeValue(raw, "--data-dir", value)) { setString(out.dataDir, value); continue; }
        if (ConsumeValue(raw, "--log-dir", value))  { setString(out.logDir, value); continue; }
        if (ConsumeValue(raw, "--seconds", value))  { setInt(out.seconds, value); continue; }
        if (ConsumeValue(raw, "--seed", value))     { setSeed(out.seed, value); continue; }

        if (arg == "--config")   { setString(out.configPath, next()); continue; }
        if (arg == "--data-dir") { setString(out.dataDir, next()); continue; }
        if (arg == "--log-dir")  { setString(out.logDir, next()); continue; }
        if (arg == "--seconds" || arg == "-s") { setInt(out.seconds, next()); continue; }
        if (arg == "--seed")     { setSeed(out.seed, next()); continue; }

        out.unknown.emplace_back(raw);
    }

    return out;
}

std::string BuildCommandLineHelpText()
{
    return
        "townlife_sim - runs the demo town headless\n"
        "\n"
        "Usage: townlife_sim [options]\n"
        "\n"
        "  --config <file>     Simulation config (JSON). Missing keys use defaults.\n"
        "  --data-dir <dir>    Persist state, schedules and history as JSON files here.\n"
        "                      Without it everything is kept in memory.\n"
        "  --restore           Restore characters from the data dir before starting.\n"
        "  --seconds <N>       Run for N wall-clock seconds (default 30, 0 = until Ctrl+C).\n"
        "  --seed <N>          Seed for the rule-based decider and wandering.\n"
        "  --log-dir <dir>     Also write a rotating townlife.log here.\n"
        "  --verbose, -v       Debug logging.\n"
        "  --help, -h          Show this text.\n";
}

} // namespace townlife::demo
