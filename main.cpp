#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <iostream>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#ifdef _WIN32
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#include <shellapi.h>
#endif

#include "cdkeygen/alphabet.hpp"
#include "cdkeygen/gen_status.hpp"
#include "cdkeygen/key_generator.hpp"
#include "cdkeygen/key_writer.hpp"

#ifdef CDKEYGEN_WITH_GUI
#include "cdkeygen/key_form.hpp"
#endif

namespace {

constexpr std::size_t kDefaultPreviewCount = 10;
constexpr std::size_t kInteractiveDefaultCount = 100;
constexpr std::size_t kInteractiveDefaultGroupSize = 5;
constexpr int kExitCancelled = 130;

struct CliOptions {
    bool help = false;
    bool interactive = false;
    bool gui = false;
    bool quiet = false;
    bool allow_ambiguous = false;
    bool no_unique = false;
    bool lowercase = false;
    std::optional<std::size_t> count;
    std::optional<std::size_t> length;
    std::optional<std::string> pattern;
    std::optional<std::string> alphabet;
    std::optional<std::string> out;
    std::optional<std::string> format;
    std::size_t group_size = 0;
    std::string separator = "-";
    std::size_t preview = kDefaultPreviewCount;
};

std::string UnquotePathArg(std::string value) {
    if (value.size() < 2) {
        return value;
    }
    const char first = value.front();
    const char last = value.back();
    if ((first == '"' && last == '"') || (first == '\'' && last == '\'')) {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

std::string Trim(const std::string& value) {
    const auto is_space = [](const unsigned char c) { return std::isspace(c) != 0; };
    const auto begin = std::find_if_not(value.begin(), value.end(), is_space);
    const auto end = std::find_if_not(value.rbegin(), value.rend(), is_space).base();
    return begin < end ? std::string(begin, end) : std::string();
}

std::string Upper(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](const unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    return value;
}

bool ParseSize(const std::string& value, const bool allow_zero, std::size_t& out) {
    std::size_t idx = 0;
    try {
        const unsigned long long parsed = std::stoull(value, &idx);
        if (idx != value.size() ||
            value.find('-') != std::string::npos ||
            (!allow_zero && parsed == 0) ||
            parsed > static_cast<unsigned long long>(std::numeric_limits<std::size_t>::max())) {
            return false;
        }
        out = static_cast<std::size_t>(parsed);
        return true;
    } catch (const std::invalid_argument&) {
        return false;
    } catch (const std::out_of_range&) {
        return false;
    }
}

#ifdef _WIN32
bool WideToUtf8(const wchar_t* input, std::string& out) {
    out.clear();
    if (input == nullptr) {
        return false;
    }
    const int required = WideCharToMultiByte(CP_UTF8, 0, input, -1, nullptr, 0, nullptr, nullptr);
    if (required <= 0) {
        return false;
    }
    std::vector<char> converted(static_cast<std::size_t>(required), '\0');
    const int written = WideCharToMultiByte(CP_UTF8, 0, input, -1, converted.data(), required, nullptr, nullptr);
    if (written <= 0) {
        return false;
    }
    out.assign(converted.data(), static_cast<std::size_t>(written - 1));
    return true;
}

bool BuildUtf8ArgsFromCommandLine(std::vector<std::string>& out_args) {
    out_args.clear();
    int wide_argc = 0;
    LPWSTR* wide_argv = CommandLineToArgvW(GetCommandLineW(), &wide_argc);
    if (wide_argv == nullptr || wide_argc <= 0) {
        return false;
    }

    out_args.reserve(static_cast<std::size_t>(wide_argc));
    bool ok = true;
    for (int i = 0; i < wide_argc; ++i) {
        std::string converted;
        if (!WideToUtf8(wide_argv[i], converted)) {
            ok = false;
            break;
        }
        out_args.push_back(std::move(converted));
    }
    LocalFree(wide_argv);
    return ok;
}
#endif

cdkeygen::LogSink MakeCliLog(const bool quiet) {
    if (quiet) {
        return {};
    }
    return [](const std::string& message) {
        std::cerr << "[log] " << message << "\n";
    };
}

void ReportGenerateError(const cdkeygen::GenStatus status, const cdkeygen::GenerationConfig& config) {
    std::cerr << cdkeygen::ToString(status) << "\n";
    if (status == cdkeygen::GenStatus::CapacityExceeded) {
        std::string alphabet;
        if (cdkeygen::ResolveAlphabet(config, alphabet) == cdkeygen::GenStatus::Ok) {
            const std::uint64_t capacity =
                cdkeygen::EstimateCapacity(alphabet.size(), cdkeygen::KeyspaceLength(config));
            std::cerr << "Requested " << config.count << " unique keys, but keyspace is only about "
                      << capacity << ".\n";
        }
    } else if (status == cdkeygen::GenStatus::InvalidAlphabet) {
        std::cerr << "Alphabet is too small. Provide more characters.\n";
    }
}

void PrintPreview(const std::vector<std::string>& keys, const std::size_t limit) {
    const std::size_t shown = std::min(limit, keys.size());
    if (shown == 0) {
        return;
    }
    std::cout << "\nPreview:\n";
    for (std::size_t i = 0; i < shown; ++i) {
        std::cout << "  " << keys[i] << "\n";
    }
}

bool ParseArgs(const int argc, char* argv[], CliOptions& opts, std::string& error) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg(argv[i]);
        auto require_value = [&](std::string& dst) -> bool {
            if (i + 1 >= argc) {
                error = "Missing value for " + arg;
                return false;
            }
            dst = argv[++i];
            return true;
        };
        auto require_size = [&](const bool allow_zero, std::size_t& dst) -> bool {
            std::string value;
            if (!require_value(value)) {
                return false;
            }
            if (!ParseSize(value, allow_zero, dst)) {
                error = "Invalid value for " + arg + (allow_zero ? " (must be >= 0)" : " (must be > 0)");
                return false;
            }
            return true;
        };

        if (arg == "--help" || arg == "-h") {
            opts.help = true;
        } else if (arg == "--interactive" || arg == "--CLIinter") {
            opts.interactive = true;
        } else if (arg == "--GUI" || arg == "--gui") {
            opts.gui = true;
        } else if (arg == "--quiet") {
            opts.quiet = true;
        } else if (arg == "--allow-ambiguous") {
            opts.allow_ambiguous = true;
        } else if (arg == "--no-unique") {
            opts.no_unique = true;
        } else if (arg == "--lowercase") {
            opts.lowercase = true;
        } else if (arg == "--count") {
            std::size_t v = 0;
            if (!require_size(false, v)) {
                return false;
            }
            opts.count = v;
        } else if (arg == "--length") {
            std::size_t v = 0;
            if (!require_size(false, v)) {
                return false;
            }
            opts.length = v;
        } else if (arg == "--groupsize") {
            if (!require_size(true, opts.group_size)) {
                return false;
            }
        } else if (arg == "--preview") {
            if (!require_size(true, opts.preview)) {
                return false;
            }
        } else if (arg == "--sep") {
            if (!require_value(opts.separator)) {
                return false;
            }
        } else if (arg == "--pattern") {
            std::string v;
            if (!require_value(v)) {
                return false;
            }
            if (v.find(cdkeygen::kPatternPlaceholder) == std::string::npos) {
                error = "--pattern must contain at least one 'X'";
                return false;
            }
            opts.pattern = std::move(v);
        } else if (arg == "--alphabet") {
            std::string v;
            if (!require_value(v)) {
                return false;
            }
            opts.alphabet = std::move(v);
        } else if (arg == "--out") {
            std::string v;
            if (!require_value(v)) {
                return false;
            }
            opts.out = UnquotePathArg(std::move(v));
        } else if (arg == "--format") {
            std::string v;
            if (!require_value(v)) {
                return false;
            }
            cdkeygen::OutputFormat parsed = cdkeygen::OutputFormat::Text;
            if (cdkeygen::KeyWriter::ParseFormat(v, parsed) != cdkeygen::GenStatus::Ok) {
                error = "Invalid value for --format (use txt, csv or json)";
                return false;
            }
            opts.format = std::move(v);
        } else {
            error = "Unknown argument: " + arg;
            return false;
        }
    }
    return true;
}

void PrintBanner(std::ostream& out) {
    out << "CDKeyGen (CLI Mode)\n\n";
    out << "Examples:\n";
    out << "  cdkeygen --count 100 --length 25 --out keys.txt\n";
    out << "  cdkeygen --count 50 --pattern \"XXXXX-XXXXX-XXXXX\" --out keys.txt\n";
    out << "  cdkeygen --interactive   (interactive CLI menu)\n";
    out << "  cdkeygen --GUI           (graphical form)\n\n";
    out << "Run with --help for all options.\n";
}

void PrintHelp(std::ostream& out) {
    out << "CDKeyGen - generate random CD keys\n\n";
    out << "Usage:\n";
    out << "  cdkeygen [--count N] [--length N | --pattern P] [--groupsize N] [--sep S]\n";
    out << "           [--alphabet A] [--allow-ambiguous] [--no-unique] [--lowercase]\n";
    out << "           [--out <path>] [--format txt|csv|json] [--preview N] [--quiet]\n";
    out << "  cdkeygen --interactive\n";
    out << "  cdkeygen --GUI\n\n";

    out << "Options:\n";
    out << "  --count <N>          How many keys to generate (default " << cdkeygen::kDefaultKeyCount << ")\n";
    out << "  --length <N>         Key length (default " << cdkeygen::kDefaultKeyLength << ")\n";
    out << "  --pattern <P>        Pattern using X as random chars, e.g. XXXXX-XXXXX-XXXXX\n";
    out << "  --groupsize <N>      Auto-group size, 0 = none. Ignored with --pattern\n";
    out << "  --sep <S>            Separator for grouping (default '-')\n";
    out << "  --alphabet <A>       Custom alphabet characters\n";
    out << "  --allow-ambiguous    Allow ambiguous chars (0,O,1,I,L)\n";
    out << "  --no-unique          Allow duplicates\n";
    out << "  --lowercase          Keep output case as sampled\n";
    out << "  --out <path>         Output file path (e.g. keys.txt)\n";
    out << "  --format <F>         txt, csv or json (default: from --out extension)\n";
    out << "  --preview <N>        How many keys to print to the console (default "
        << kDefaultPreviewCount << ")\n";
    out << "  --quiet              Hide progress and warning logs\n";
    out << "  --interactive        Interactive menu (alias: --CLIinter)\n";
    out << "  --GUI                Open the graphical form\n";
    out << "  --help, -h           Show this help\n\n";

    out << "Examples:\n";
    out << "  cdkeygen --count 100 --length 25 --out keys.txt\n";
    out << "  cdkeygen --count 50 --pattern XXXXX-XXXXX-XXXXX --out keys.txt\n";
    out << "  cdkeygen --count 100 --length 25 --groupsize 5 --sep - --out keys.csv --format csv\n";
}

cdkeygen::GenerationConfig BuildConfig(const CliOptions& opts) {
    cdkeygen::GenerationConfig config;
    config.count = opts.count.value_or(cdkeygen::kDefaultKeyCount);
    config.length = opts.length.value_or(cdkeygen::kDefaultKeyLength);
    config.pattern = opts.pattern;
    config.alphabet = opts.alphabet;
    config.avoid_ambiguous = !opts.allow_ambiguous;
    config.unique = !opts.no_unique;
    config.group_size = opts.pattern.has_value() ? 0 : opts.group_size;
    config.separator = opts.separator;
    config.uppercase = !opts.lowercase;
    return config;
}

int GenerateFlow(const CliOptions& opts) {
    const cdkeygen::GenerationConfig config = BuildConfig(opts);
    const cdkeygen::LogSink log = MakeCliLog(opts.quiet);

    std::cout << "Generating " << config.count << " key(s)...\n" << std::flush;
    std::vector<std::string> keys;
    const cdkeygen::GenStatus status = cdkeygen::KeyGenerator::Generate(config, keys, log);
    if (status != cdkeygen::GenStatus::Ok) {
        ReportGenerateError(status, config);
        return 1;
    }
    std::cout << "Done.\n";

    PrintPreview(keys, opts.preview);

    if (!opts.out.has_value()) {
        std::cout << "\nTip: use --out keys.txt to save them to a file.\n";
        return 0;
    }

    cdkeygen::OutputFormat format = cdkeygen::KeyWriter::FormatFromExtension(*opts.out);
    if (opts.format.has_value()) {
        const cdkeygen::GenStatus format_status = cdkeygen::KeyWriter::ParseFormat(*opts.format, format);
        if (format_status != cdkeygen::GenStatus::Ok) {
            std::cerr << cdkeygen::ToString(format_status) << "\n";
            return 1;
        }
    }
    const cdkeygen::GenStatus save_status = cdkeygen::KeyWriter::Save(keys, *opts.out, format);
    if (save_status != cdkeygen::GenStatus::Ok) {
        std::cerr << cdkeygen::ToString(save_status) << "\n";
        return 1;
    }
    std::cout << "\nSaved: " << *opts.out << " (" << Upper(std::string(cdkeygen::ToString(format))) << ")\n";
    return 0;
}

// Interactive prompts return false once stdin is exhausted.
bool AskLine(const std::string& prompt, const std::string& fallback, std::string& out) {
    std::cout << prompt << " [" << fallback << "]: " << std::flush;
    std::string line;
    if (!std::getline(std::cin, line)) {
        return false;
    }
    line = Trim(line);
    out = line.empty() ? fallback : line;
    return true;
}

bool AskSize(const std::string& prompt, const std::size_t fallback, const std::size_t min_value, std::size_t& out) {
    while (true) {
        std::string raw;
        if (!AskLine(prompt, std::to_string(fallback), raw)) {
            return false;
        }
        std::size_t value = 0;
        if (!ParseSize(raw, true, value)) {
            std::cout << "  Please enter a number.\n";
            continue;
        }
        if (value < min_value) {
            std::cout << "  Must be >= " << min_value << "\n";
            continue;
        }
        out = value;
        return true;
    }
}

int InteractiveFlow(const bool quiet) {
    std::cout << "CDKeyGen (Interactive CLI Menu)\n\n";
    auto cancelled = []() {
        std::cout << "\nCancelled.\n";
        return kExitCancelled;
    };

    cdkeygen::GenerationConfig config;
    config.unique = true;

    if (!AskSize("How many keys to generate?", kInteractiveDefaultCount, 1, config.count)) {
        return cancelled();
    }

    std::string pattern;
    if (!AskLine("Use pattern? (leave blank for no, or enter like XXXXX-XXXXX-XXXXX)", "", pattern)) {
        return cancelled();
    }
    if (!pattern.empty()) {
        if (pattern.find(cdkeygen::kPatternPlaceholder) == std::string::npos) {
            std::cerr << "Pattern must contain at least one 'X'.\n";
            return 1;
        }
        config.pattern = pattern;
        config.group_size = 0;
    } else {
        if (!AskSize("Key length?", cdkeygen::kDefaultKeyLength, 1, config.length) ||
            !AskSize("Group size (0 = no grouping)?", kInteractiveDefaultGroupSize, 0, config.group_size)) {
            return cancelled();
        }
    }

    std::string allow_ambiguous;
    std::string custom_alphabet;
    std::string out_path;
    std::string format_token;
    if (!AskLine("Group separator?", "-", config.separator) ||
        !AskLine("Allow ambiguous chars (0,O,1,I,L)? (y/n)", "n", allow_ambiguous) ||
        !AskLine("Custom alphabet? (leave blank to use default)", "", custom_alphabet) ||
        !AskLine("Output file path (e.g. keys.txt)", "keys.txt", out_path) ||
        !AskLine("Format (txt/csv/json)", "txt", format_token)) {
        return cancelled();
    }
    const bool allow = std::tolower(static_cast<unsigned char>(allow_ambiguous.front())) == 'y';
    config.avoid_ambiguous = !allow;
    if (!custom_alphabet.empty()) {
        config.alphabet = custom_alphabet;
    }

    cdkeygen::OutputFormat format = cdkeygen::OutputFormat::Text;
    if (cdkeygen::KeyWriter::ParseFormat(format_token, format) != cdkeygen::GenStatus::Ok) {
        std::cout << "Invalid format; defaulting to txt.\n";
        format = cdkeygen::OutputFormat::Text;
    }

    std::cout << "\nGenerating " << config.count << " key(s)...\n" << std::flush;
    std::vector<std::string> keys;
    const cdkeygen::GenStatus status = cdkeygen::KeyGenerator::Generate(config, keys, MakeCliLog(quiet));
    if (status != cdkeygen::GenStatus::Ok) {
        ReportGenerateError(status, config);
        return 1;
    }
    const cdkeygen::GenStatus save_status = cdkeygen::KeyWriter::Save(keys, out_path, format);
    if (save_status != cdkeygen::GenStatus::Ok) {
        std::cerr << cdkeygen::ToString(save_status) << "\n";
        return 1;
    }
    std::cout << "Done. Saved: " << out_path << " (" << Upper(std::string(cdkeygen::ToString(format))) << ")\n";

    PrintPreview(keys, kDefaultPreviewCount);
    return 0;
}

int GuiFlow(const int argc, char* argv[], const cdkeygen::LogSink& log) {
#ifdef CDKEYGEN_WITH_GUI
    int app_argc = argc;
    return cdkeygen::RunKeyForm(app_argc, argv, log);
#else
    (void)argc;
    (void)argv;
    (void)log;
    std::cerr << "This build has no GUI support\n";
    return 1;
#endif
}

// A console-less launch (e.g. double-clicked on Windows) opens the form.
bool ShouldAutoGui(const int argc, char* argv[]) {
#if defined(_WIN32) && defined(CDKEYGEN_WITH_GUI)
    for (int i = 1; i < argc; ++i) {
        const std::string arg(argv[i]);
        if (arg == "--interactive" || arg == "--CLIinter") {
            return false;
        }
    }
    return GetConsoleWindow() == nullptr;
#else
    (void)argc;
    (void)argv;
    return false;
#endif
}

}  // namespace

int RunCliMain(const int argc, char* argv[]) {
    if (ShouldAutoGui(argc, argv)) {
        return GuiFlow(argc, argv, {});
    }
    if (argc <= 1) {
        PrintBanner(std::cout);
        return 0;
    }

    CliOptions opts;
    std::string error;
    if (!ParseArgs(argc, argv, opts, error)) {
        std::cerr << error << "\n";
        return 1;
    }

    if (opts.help) {
        PrintHelp(std::cout);
        return 0;
    }
    if (opts.gui) {
        return GuiFlow(argc, argv, MakeCliLog(opts.quiet));
    }
    if (opts.interactive) {
        return InteractiveFlow(opts.quiet);
    }
    return GenerateFlow(opts);
}

#ifdef _WIN32
int main(const int argc, char* argv[]) {
    std::vector<std::string> utf8_args;
    if (BuildUtf8ArgsFromCommandLine(utf8_args)) {
        std::vector<char*> utf8_argv;
        utf8_argv.reserve(utf8_args.size());
        for (auto& arg : utf8_args) {
            utf8_argv.push_back(arg.data());
        }
        return RunCliMain(static_cast<int>(utf8_argv.size()), utf8_argv.data());
    }
    return RunCliMain(argc, argv);
}
#else
int main(const int argc, char* argv[]) {
    return RunCliMain(argc, argv);
}
#endif
