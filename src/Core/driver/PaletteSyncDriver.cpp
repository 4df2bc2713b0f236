#include <iostream>
#include <string>

#include "psync_version.h"

#include "CoreErrors.h"
#include "Logging.h"
#include "PaletteSync.h"
#include "PathUtils.h"
#include "SyncConfig.h"

using namespace PSYNC::Core;

namespace {

struct Options {
    bool help = false;
    bool parseError = false;
    bool verbose = false;
    bool quiet = false;
    SyncOptions sync;
    std::string configPath;
    std::string logFile;
};

void PrintUsage() {
    std::cout << "PaletteSync " << PSYNC_VERSION_STR << " usage:\n"
              << "  PaletteSync --template <path> --output <path> [options]\n\n"
              << "Options:\n"
              << "  --template <path>   Prompt config template to start from (required).\n"
              << "  --output <path>     Generated config to write (required).\n"
              << "  --ghostty-cmd <cmd> Terminal executable queried for its theme (default: ghostty).\n"
              << "  --config <path>     TOML file overriding thresholds, fallbacks and the palette name.\n"
              << "  --log-file <path>   Append log lines to a file instead of stderr.\n"
              << "  --verbose           Log debug details.\n"
              << "  --quiet             Only log warnings and errors.\n"
              << "  --help              Show this message.\n";
}

bool TakeValue(int argc, char **argv, int &i, const std::string &flag, std::string &out) {
    if (i + 1 >= argc) {
        std::cerr << flag << " requires a value" << std::endl;
        return false;
    }
    out = argv[++i];
    return true;
}

Options ParseOptions(int argc, char **argv) {
    Options opts;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        bool ok = true;
        if (arg == "--help" || arg == "-h") {
            opts.help = true;
        } else if (arg == "--template") {
            ok = TakeValue(argc, argv, i, arg, opts.sync.template_path);
        } else if (arg == "--output") {
            ok = TakeValue(argc, argv, i, arg, opts.sync.output_path);
        } else if (arg == "--ghostty-cmd") {
            ok = TakeValue(argc, argv, i, arg, opts.sync.ghostty_cmd);
        } else if (arg == "--config") {
            ok = TakeValue(argc, argv, i, arg, opts.configPath);
        } else if (arg == "--log-file") {
            ok = TakeValue(argc, argv, i, arg, opts.logFile);
        } else if (arg == "--verbose" || arg == "-v") {
            opts.verbose = true;
        } else if (arg == "--quiet" || arg == "-q") {
            opts.quiet = true;
        } else {
            std::cerr << "Unknown argument: " << arg << std::endl;
            ok = false;
        }
        if (!ok) {
            opts.parseError = true;
            break;
        }
    }

    if (!opts.help && !opts.parseError) {
        if (opts.sync.template_path.empty() || opts.sync.output_path.empty()) {
            std::cerr << "--template and --output are required" << std::endl;
            opts.parseError = true;
        } else if (opts.verbose && opts.quiet) {
            std::cerr << "--verbose and --quiet are mutually exclusive" << std::endl;
            opts.parseError = true;
        }
    }

    opts.sync.template_path = utils::ExpandUserUtf8(opts.sync.template_path);
    opts.sync.output_path = utils::ExpandUserUtf8(opts.sync.output_path);
    opts.configPath = utils::ExpandUserUtf8(opts.configPath);
    opts.logFile = utils::ExpandUserUtf8(opts.logFile);
    return opts;
}

void PrintConfigError(const ConfigLoadError &error) {
    std::cerr << "Config error: " << error.message;
    if (error.file) {
        std::cerr << " (" << *error.file;
        if (error.line)
            std::cerr << ":" << *error.line;
        if (error.column)
            std::cerr << "," << *error.column;
        std::cerr << ")";
    }
    std::cerr << " [" << GetErrorString(error.code) << "]" << std::endl;
}

} // namespace

int main(int argc, char **argv) {
    auto opts = ParseOptions(argc, argv);
    if (opts.help || opts.parseError) {
        PrintUsage();
        return opts.parseError ? 1 : 0;
    }

    if (opts.verbose)
        SetLogFilter(PSYNC_LOG_DEBUG);
    else if (opts.quiet)
        SetLogFilter(PSYNC_LOG_WARN);

    if (!opts.logFile.empty() && PSYNC_FAILED(SetLogFile(opts.logFile))) {
        std::cerr << "Unable to open log file '" << opts.logFile << "'; logging to stderr" << std::endl;
    }

    SyncConfig config;
    ConfigLoadError configError;
    SyncConfigLoader loader;
    if (PSYNC_FAILED(loader.LoadFile(opts.configPath, config, configError))) {
        PrintConfigError(configError);
        return 2;
    }

    SyncReport report;
    PSYNC_Result result = GuardResult("driver", [&]() {
        return RunPaletteSync(opts.sync, config, &report);
    });

    if (PSYNC_FAILED(result)) {
        PSYNC_ErrorInfo info = PSYNC_ERROR_INFO_INIT;
        const char *detail = PSYNC_SUCCEEDED(GetLastErrorInfo(&info)) && info.message ? info.message : "";
        std::cerr << "Palette sync failed: " << GetErrorString(result);
        if (*detail)
            std::cerr << ": " << detail;
        std::cerr << std::endl;
        return 3;
    }

    CoreLog(PSYNC_LOG_INFO, "driver", "Done: theme=%s entries=%zu output=%s (%s)",
            report.theme_available ? "ghostty" : "unavailable",
            report.entry_count,
            opts.sync.output_path.c_str(),
            report.written ? "written" : "unchanged");
    return 0;
}
