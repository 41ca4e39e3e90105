#include "CommandLine.hpp"
#include "../config/ArchiverConfig.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>

namespace
{

bool parseInt(const std::string& text, std::int64_t& out)
{
    if (text.empty())
        return false;
    const char* first = text.data();
    const char* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, out);
    return ec == std::errc() && ptr == last;
}

std::string toUpper(std::string text)
{
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return text;
}

} // anonymous namespace

const std::vector<std::string>& default_prefixes()
{
    static const std::vector<std::string> kDefaults = { "IM", "TWIG" };
    return kDefaults;
}

std::optional<CommandLineOptions> parse_command_line(int argc, const char* const* argv, std::string& error)
{
    CommandLineOptions options;

    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        std::optional<std::string> inline_value;
        if (arg.rfind("--", 0) == 0)
        {
            std::size_t eq = arg.find('=');
            if (eq != std::string::npos)
            {
                inline_value = arg.substr(eq + 1);
                arg.resize(eq);
            }
        }

        auto takeValue = [&](std::string& out) -> bool
        {
            if (inline_value)
            {
                out = *inline_value;
                return true;
            }
            if (i + 1 >= argc)
            {
                error = arg + " requires a value";
                return false;
            }
            out = argv[++i];
            return true;
        };

        auto takeInt = [&](std::optional<std::int64_t>& out) -> bool
        {
            std::string value;
            if (!takeValue(value))
                return false;
            std::int64_t parsed = 0;
            if (!parseInt(value, parsed))
            {
                error = arg + " expects an integer, got '" + value + "'";
                return false;
            }
            out = parsed;
            return true;
        };

        auto takeString = [&](std::optional<std::string>& out) -> bool
        {
            std::string value;
            if (!takeValue(value))
                return false;
            out = std::move(value);
            return true;
        };

        bool ok = true;
        if (arg == "--help" || arg == "-h")
            options.help = true;
        else if (arg == "--version")
            options.version = true;
        else if (arg == "--all")
            options.all = true;
        else if (arg == "--by-year")
            options.by_year = true;
        else if (arg == "--verbose" || arg == "-v")
            options.verbose = true;
        else if (arg == "--max-words")
            ok = takeInt(options.max_words);
        else if (arg == "--max-bytes")
            ok = takeInt(options.max_bytes);
        else if (arg == "--data-dir")
            ok = takeString(options.data_dir);
        else if (arg == "--output-dir")
            ok = takeString(options.output_dir);
        else if (arg == "--report")
            ok = takeString(options.report_path);
        else if (arg == "--config")
            ok = takeValue(options.config_path);
        else if (!arg.empty() && arg[0] == '-')
        {
            error = "Unknown option: " + arg;
            ok = false;
        }
        else
            options.prefixes.push_back(toUpper(arg));

        if (!ok)
            return std::nullopt;

        if (inline_value && (arg == "--help" || arg == "-h" || arg == "--version" || arg == "--all" ||
                             arg == "--by-year" || arg == "--verbose"))
        {
            error = arg + " does not take a value";
            return std::nullopt;
        }
    }

    std::sort(options.prefixes.begin(), options.prefixes.end());
    options.prefixes.erase(std::unique(options.prefixes.begin(), options.prefixes.end()), options.prefixes.end());
    return options;
}

std::string usage_text(const std::string& program)
{
    return "Usage: " + program + " [OPTIONS] [PREFIX...]\n"
           "\n"
           "Normalizes <data_dir>/<PREFIX>_<n>.html transcripts and packs them into\n"
           "size-bounded Markdown files. Without prefixes or --all, IM and TWIG are processed.\n"
           "\n"
           "Options:\n"
           "  --all               Process every prefix found in the data directory\n"
           "  --by-year           Start a new output file whenever the year changes\n"
           "  --max-words N       Word limit per output file (default 490000)\n"
           "  --max-bytes N       Byte limit per output file (default 199229440)\n"
           "  --data-dir DIR      Transcript directory (default data)\n"
           "  --output-dir DIR    Output directory (default: the data directory)\n"
           "  --config FILE       Configuration file (default config.toml)\n"
           "  --report FILE       Write a JSON run report\n"
           "  --verbose, -v       Trace pipeline stages to the pipeline log\n"
           "  --version           Print the version and exit\n"
           "  --help, -h          Print this help and exit\n";
}

void apply_overrides(const CommandLineOptions& options, ArchiverConfig& config)
{
    if (options.by_year)
        config.chunking.by_year = true;
    if (options.max_words)
        config.chunking.max_words = *options.max_words;
    if (options.max_bytes)
        config.chunking.max_bytes = *options.max_bytes;
    if (options.data_dir)
        config.paths.data_dir = *options.data_dir;
    if (options.output_dir)
        config.paths.output_dir = *options.output_dir;
    if (options.verbose)
        config.processing_options.verbose = true;
}
