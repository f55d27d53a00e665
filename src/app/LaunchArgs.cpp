#include "app/LaunchArgs.h"

#include <cctype>
#include <sstream>

namespace twinboot::app {

namespace {

[[nodiscard]] std::string ToLower(std::string_view s)
{
    std::string out;
    out.reserve(s.size());
    for (char c : s)
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    return out;
}

[[nodiscard]] bool StartsWith(std::string_view s, std::string_view prefix)
{
    return s.size() >= prefix.size() && s.substr(0, prefix.size()) == prefix;
}

// "--opt=value" or "--opt:value". `lowered` decides the match, the value is
// cut from `original` so paths keep their case.
[[nodiscard]] bool ConsumeValue(std::string_view lowered,
                                std::string_view original,
                                std::string_view prefix,
                                std::string_view& outValue)
{
    if (!StartsWith(lowered, prefix))
        return false;

    const std::size_t n = prefix.size();
    if (lowered.size() == n)
        return false;

    const char sep = lowered[n];
    if (sep != '=' && sep != ':')
        return false;

    outValue = original.substr(n + 1);
    return true;
}

[[nodiscard]] std::vector<std::string> SplitList(std::string_view s)
{
    std::vector<std::string> out;
    std::size_t start = 0;
    while (start <= s.size())
    {
        std::size_t comma = s.find(',', start);
        if (comma == std::string_view::npos)
            comma = s.size();

        std::string_view item = s.substr(start, comma - start);
        while (!item.empty() && std::isspace(static_cast<unsigned char>(item.front()))) item.remove_prefix(1);
        while (!item.empty() && std::isspace(static_cast<unsigned char>(item.back())))  item.remove_suffix(1);
        if (!item.empty())
            out.emplace_back(ToLower(item));

        start = comma + 1;
    }
    return out;
}

struct ValueOption {
    std::string_view name;
    std::string_view alias;   // may be empty
};

} // namespace

LaunchArgs ParseLaunchArgsFromArgv(std::span<const std::string_view> argv)
{
    LaunchArgs out;
    if (argv.size() <= 1)
        return out;

    for (std::size_t i = 1; i < argv.size(); ++i)
        out.raw.emplace_back(argv[i]);

    for (std::size_t i = 1; i < argv.size(); ++i)
    {
        const std::string_view original = argv[i];
        if (original.empty())
            continue;

        const std::string lowered = ToLower(original);
        const std::string_view arg(lowered);

        // Help
        if (arg == "--help" || arg == "-h" || arg == "-?") { out.showHelp = true; continue; }

        // Flags
        if (arg == "--editor" || arg == "--host") { out.editorMode = true; continue; }
        if (arg == "--player")                    { out.editorMode = false; continue; }
        if (arg == "--player-arg")                { out.useLaunchArgs = true; continue; }
        if (arg == "--no-player-arg")             { out.useLaunchArgs = false; continue; }

        // Options with values
        std::optional<std::string> value;
        std::string_view inlineValue;
        const ValueOption* matched = nullptr;

        static constexpr ValueOption kValueOptions[] = {
            {"--config",      "-c"},
            {"--log-dir",     ""},
            {"--log-level",   ""},
            {"--store-dir",   ""},
            {"--project-dir", ""},
            {"--detectors",   ""},
        };

        for (const auto& opt : kValueOptions)
        {
            if (arg == opt.name || (!opt.alias.empty() && arg == opt.alias))
            {
                matched = &opt;
                if (i + 1 < argv.size())
                {
                    value = std::string(argv[i + 1]);
                    ++i;
                }
                break;
            }
            if (ConsumeValue(arg, original, opt.name, inlineValue))
            {
                matched = &opt;
                value = std::string(inlineValue);
                break;
            }
        }

        if (!matched)
        {
            out.passthrough.emplace_back(original);
            continue;
        }

        if (!value || value->empty())
        {
            out.errors.emplace_back(original);
            continue;
        }

        const std::string_view name = matched->name;
        if (name == "--config")           out.configPath = std::filesystem::path(*value);
        else if (name == "--log-dir")     out.logDir = std::filesystem::path(*value);
        else if (name == "--log-level")   out.logLevel = ToLower(*value);
        else if (name == "--store-dir")   out.storeDir = std::filesystem::path(*value);
        else if (name == "--project-dir") out.projectDir = std::filesystem::path(*value);
        else if (name == "--detectors")   out.detectors = SplitList(*value);
    }

    return out;
}

LaunchArgs ParseLaunchArgs(int argc, char** argv)
{
    std::vector<std::string_view> v;
    v.reserve(argc > 0 ? static_cast<std::size_t>(argc) : 0u);
    for (int i = 0; i < argc; ++i)
        v.emplace_back(argv[i] ? argv[i] : "");
    return ParseLaunchArgsFromArgv(v);
}

std::string BuildLaunchHelpText()
{
    std::ostringstream oss;
    oss << "twinboot - client identity bootstrap\n\n";
    oss << "Usage: twinboot [options] [PlayerArg:<value>] [clone tooling args]\n\n";

    oss << "Configuration\n";
    oss << "  --config, -c <path>          Settings file (default: <config dir>/twinboot.json)\n";
    oss << "  --store-dir <path>           Local session store directory\n";
    oss << "  --project-dir <path>         Folder checked for .clone / .clonearg markers\n\n";

    oss << "Profile signals\n";
    oss << "  --editor / --player          Run as the development host or as a built player\n";
    oss << "  --player-arg / --no-player-arg\n";
    oss << "                               Enable/disable the PlayerArg:<value> source\n";
    oss << "  --detectors <a,b,...>        Sibling detectors in priority order\n";
    oss << "                               (none, virtual-clone, clone-marker)\n\n";

    oss << "Logging\n";
    oss << "  --log-dir <path>             Write twinboot.log into this folder\n";
    oss << "  --log-level <level>          trace, debug, info, warn, error, critical, off\n\n";

    oss << "Misc\n";
    oss << "  --help, -h                   Show this help\n\n";

    oss << "Examples\n";
    oss << "  twinboot PlayerArg:2\n";
    oss << "  twinboot --editor --virtual-project-clone -name Clone1\n";
    return oss.str();
}

} // namespace twinboot::app
