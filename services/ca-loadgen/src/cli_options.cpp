/**
 * @file cli_options.cpp
 * @brief getopt_long based argument parsing
 */

#include "cli_options.h"
#include "config_manager.h"
#include "exceptions.h"

#include <getopt.h>

namespace caload {
namespace cli {

using common::ConfigManager;

namespace {

enum LongOnly {
    OPT_CERTREQ = 1000,
    OPT_BACKEND,
    OPT_TIMEOUT,
    OPT_REPORT_JSON,
    OPT_LOG_LEVEL,
    OPT_LOG_FILE
};

const char* const SHORT_OPTIONS = ":s:c:t:n:o:g:w:h";

const struct option LONG_OPTIONS[] = {
    {"server",             required_argument, nullptr, 's'},
    {"ca",                 required_argument, nullptr, 'c'},
    {"template",           required_argument, nullptr, 't'},
    {"count",              required_argument, nullptr, 'n'},
    {"output-dir",         required_argument, nullptr, 'o'},
    {"generation-workers", required_argument, nullptr, 'g'},
    {"submission-workers", required_argument, nullptr, 'w'},
    {"certreq",            required_argument, nullptr, OPT_CERTREQ},
    {"backend",            required_argument, nullptr, OPT_BACKEND},
    {"timeout",            required_argument, nullptr, OPT_TIMEOUT},
    {"report-json",        required_argument, nullptr, OPT_REPORT_JSON},
    {"log-level",          required_argument, nullptr, OPT_LOG_LEVEL},
    {"log-file",           required_argument, nullptr, OPT_LOG_FILE},
    {"help",               no_argument,       nullptr, 'h'},
    {nullptr, 0, nullptr, 0}
};

const char* keyFor(int opt) {
    switch (opt) {
        case 's':             return ConfigManager::CA_SERVER;
        case 'c':             return ConfigManager::CA_NAME;
        case 't':             return ConfigManager::CERT_TEMPLATE;
        case 'n':             return ConfigManager::REQUEST_COUNT;
        case 'o':             return ConfigManager::OUTPUT_DIR;
        case 'g':             return ConfigManager::GENERATION_WORKERS;
        case 'w':             return ConfigManager::SUBMISSION_WORKERS;
        case OPT_CERTREQ:     return ConfigManager::CERTREQ_PATH;
        case OPT_BACKEND:     return ConfigManager::REQUEST_BACKEND;
        case OPT_TIMEOUT:     return ConfigManager::CALL_TIMEOUT_SEC;
        case OPT_REPORT_JSON: return ConfigManager::REPORT_JSON;
        case OPT_LOG_LEVEL:   return ConfigManager::LOG_LEVEL;
        case OPT_LOG_FILE:    return ConfigManager::LOG_FILE;
        default:              return nullptr;
    }
}

/// Numeric flags are checked here so a typo is a usage error, not a silent default
bool isNumericKey(const std::string& key) {
    return key == ConfigManager::REQUEST_COUNT ||
           key == ConfigManager::GENERATION_WORKERS ||
           key == ConfigManager::SUBMISSION_WORKERS ||
           key == ConfigManager::CALL_TIMEOUT_SEC;
}

bool isInteger(const std::string& value) {
    if (value.empty()) return false;
    size_t start = (value[0] == '-' || value[0] == '+') ? 1 : 0;
    if (start == value.size()) return false;
    for (size_t i = start; i < value.size(); ++i) {
        if (value[i] < '0' || value[i] > '9') return false;
    }
    return true;
}

} // anonymous namespace

CliOptions parseCommandLine(int argc, char* argv[]) {
    CliOptions options;

    // Full reinitialization so the parser can run more than once per process
    optind = 0;
    opterr = 0;

    int opt;
    while ((opt = getopt_long(argc, argv, SHORT_OPTIONS, LONG_OPTIONS, nullptr)) != -1) {
        if (opt == 'h') {
            options.showHelp = true;
            continue;
        }
        if (opt == ':') {
            throw common::ConfigException(std::string("option ") + argv[optind - 1] + " requires a value");
        }
        if (opt == '?') {
            std::string flag = optopt ? std::string("-") + static_cast<char>(optopt) : argv[optind - 1];
            throw common::ConfigException("unknown option " + flag);
        }

        const char* key = keyFor(opt);
        if (!key) {
            throw common::ConfigException("unhandled option");
        }
        std::string value = optarg ? optarg : "";
        if (isNumericKey(key) && !isInteger(value)) {
            throw common::ConfigException(std::string("option for ") + key + " expects an integer, got '" + value + "'");
        }
        options.overrides[key] = value;
    }

    if (optind < argc) {
        throw common::ConfigException(std::string("unexpected argument '") + argv[optind] + "'");
    }

    return options;
}

void applyOverrides(const CliOptions& options, ConfigManager& config) {
    for (const auto& [key, value] : options.overrides) {
        config.set(key, value);
    }
}

void printUsage(std::ostream& out, const std::string& progname) {
    out << "usage: " << progname << " -s <server> -c <ca name> -t <template> [options]\n"
        << "\n"
        << "Generates N certificate requests against a Microsoft CA template, submits\n"
        << "them concurrently, and reports submission throughput and errors.\n"
        << "\n"
        << "Required:\n"
        << "  -s, --server <host>              CA server DNS name            (CA_SERVER)\n"
        << "  -c, --ca <name>                  CA service name               (CA_NAME)\n"
        << "  -t, --template <name>            Certificate template name     (CERT_TEMPLATE)\n"
        << "\n"
        << "Options:\n"
        << "  -n, --count <n>                  Requests to issue, default 10 (REQUEST_COUNT)\n"
        << "  -o, --output-dir <dir>           Artifact directory, default ./loadtest-requests\n"
        << "                                                                 (OUTPUT_DIR)\n"
        << "  -g, --generation-workers <n>     Parallel creations, default 4 (GENERATION_WORKERS)\n"
        << "  -w, --submission-workers <n>     Parallel submissions, default 4\n"
        << "                                                                 (SUBMISSION_WORKERS)\n"
        << "      --certreq <path>             certreq executable            (CERTREQ_PATH)\n"
        << "      --backend certreq|openssl    Request generation backend    (REQUEST_BACKEND)\n"
        << "      --timeout <sec>              Per-call timeout, 0 = none    (CALL_TIMEOUT_SEC)\n"
        << "      --report-json <path>         Also write the report as JSON (REPORT_JSON)\n"
        << "      --log-level <level>          trace|debug|info|warn|error   (LOG_LEVEL)\n"
        << "      --log-file <path>            Rotating log file             (LOG_FILE)\n"
        << "  -h, --help                       Show this help\n"
        << "\n"
        << "Exit status: 0 run completed, 1 setup failed, 2 usage or configuration error.\n";
}

} // namespace cli
} // namespace caload
