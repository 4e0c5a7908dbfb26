#include "utils/cli.h"
#include "utils/version.h"
#include <sstream>
#include <cstring>
#include <cstdlib>

namespace sagegate {

std::string getHelpMessage() {
    std::ostringstream oss;
    oss << "sagegate " << SAGEGATE_VERSION << " - OpenAI-compatible gateway for SageMaker text generation\n";
    oss << "\n";
    oss << "USAGE:\n";
    oss << "    sagegate [COMMAND] [OPTIONS]\n";
    oss << "\n";
    oss << "COMMANDS:\n";
    oss << "    serve      Start the HTTP server (default)\n";
    oss << "    invoke     Handle one Lambda proxy event and print the response\n";
    oss << "\n";
    oss << "OPTIONS:\n";
    oss << "    -h, --help       Print help information\n";
    oss << "    -V, --version    Print version information\n";
    oss << "\n";
    oss << "Run 'sagegate <COMMAND> --help' for more info.\n";
    return oss.str();
}

std::string getServeHelpMessage() {
    std::ostringstream oss;
    oss << "sagegate serve - Start the HTTP server\n";
    oss << "\n";
    oss << "USAGE:\n";
    oss << "    sagegate serve [OPTIONS]\n";
    oss << "\n";
    oss << "OPTIONS:\n";
    oss << "    --port <PORT>         Server port (default: 8080, or SAGEGATE_PORT)\n";
    oss << "    --host <HOST>         Bind address (default: 0.0.0.0)\n";
    oss << "    -h, --help            Print help\n";
    oss << "\n";
    oss << "ENVIRONMENT VARIABLES:\n";
    oss << "    SAGEMAKER_ENDPOINT_NAME       SageMaker endpoint (reported as the model id)\n";
    oss << "    AWS_REGION                    Endpoint region (default: eu-north-1)\n";
    oss << "    AWS_ACCESS_KEY_ID             Credentials used to sign runtime requests\n";
    oss << "    AWS_SECRET_ACCESS_KEY\n";
    oss << "    AWS_SESSION_TOKEN\n";
    oss << "    SAGEGATE_BACKEND              sagemaker|http (default: sagemaker)\n";
    oss << "    SAGEGATE_BACKEND_URL          Runtime URL override / HTTP backend base URL\n";
    oss << "    SAGEGATE_PORT                 HTTP server port (default: 8080)\n";
    oss << "    SAGEGATE_BIND_ADDRESS         Bind address\n";
    oss << "    SAGEGATE_REQUEST_TIMEOUT_MS   Backend timeout (default: 60000)\n";
    oss << "    SAGEGATE_CONFIG               Config file path (default: ~/.sagegate/config.json)\n";
    oss << "    SAGEGATE_LOG_LEVEL            Log level (trace|debug|info|warn|error)\n";
    oss << "    SAGEGATE_LOG_DIR              Log directory (default: ~/.sagegate/logs)\n";
    oss << "    SAGEGATE_LOG_RETENTION_DAYS   Log retention days (default: 7)\n";
    return oss.str();
}

std::string getInvokeHelpMessage() {
    std::ostringstream oss;
    oss << "sagegate invoke - Handle one Lambda proxy event\n";
    oss << "\n";
    oss << "USAGE:\n";
    oss << "    sagegate invoke [--event <FILE>]\n";
    oss << "\n";
    oss << "OPTIONS:\n";
    oss << "    --event <FILE>    Event JSON file (default: stdin)\n";
    oss << "    -h, --help        Print help\n";
    oss << "\n";
    oss << "The proxy response ({statusCode, headers, body}) is written to stdout.\n";
    return oss.str();
}

std::string getVersionMessage() {
    std::ostringstream oss;
    oss << "sagegate " << SAGEGATE_VERSION << "\n";
    return oss.str();
}

namespace {

// Helper to check for help flag in arguments
bool hasHelpFlag(int argc, char* argv[], int start) {
    for (int i = start; i < argc; ++i) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            return true;
        }
    }
    return false;
}

CliResult fail(CliResult result, const std::string& message, const std::string& help) {
    result.should_exit = true;
    result.exit_code = 1;
    result.output = message + "\n\n" + help;
    return result;
}

bool parsePort(const char* text, uint16_t& port) {
    char* end = nullptr;
    const long value = std::strtol(text, &end, 10);
    if (end == text || *end != '\0' || value <= 0 || value > 65535) {
        return false;
    }
    port = static_cast<uint16_t>(value);
    return true;
}

CliResult parseServeOptions(CliResult result, int argc, char* argv[], int start) {
    for (int i = start; i < argc; ++i) {
        if (std::strcmp(argv[i], "--port") == 0 && i + 1 < argc) {
            const char* value = argv[++i];
            if (!parsePort(value, result.serve_options.port)) {
                return fail(result, std::string("Error: invalid port: ") + value, getServeHelpMessage());
            }
        } else if (std::strcmp(argv[i], "--host") == 0 && i + 1 < argc) {
            result.serve_options.host = argv[++i];
        } else {
            return fail(result, std::string("Unknown option: ") + argv[i], getServeHelpMessage());
        }
    }
    return result;
}

}  // namespace

CliResult parseCliArgs(int argc, char* argv[]) {
    CliResult result;

    // No arguments - server mode
    if (argc < 2) {
        result.should_exit = false;
        result.subcommand = Subcommand::None;
        return result;
    }

    const char* command = argv[1];

    // Global help and version
    if (std::strcmp(command, "-h") == 0 || std::strcmp(command, "--help") == 0) {
        result.should_exit = true;
        result.exit_code = 0;
        result.output = getHelpMessage();
        return result;
    }

    if (std::strcmp(command, "-V") == 0 || std::strcmp(command, "--version") == 0) {
        result.should_exit = true;
        result.exit_code = 0;
        result.output = getVersionMessage();
        return result;
    }

    // Server options without the subcommand
    if (std::strcmp(command, "--port") == 0 || std::strcmp(command, "--host") == 0) {
        return parseServeOptions(result, argc, argv, 1);
    }

    if (std::strcmp(command, "serve") == 0) {
        result.subcommand = Subcommand::Serve;

        if (hasHelpFlag(argc, argv, 2)) {
            result.should_exit = true;
            result.exit_code = 0;
            result.output = getServeHelpMessage();
            return result;
        }
        return parseServeOptions(result, argc, argv, 2);
    }

    if (std::strcmp(command, "invoke") == 0) {
        result.subcommand = Subcommand::Invoke;

        if (hasHelpFlag(argc, argv, 2)) {
            result.should_exit = true;
            result.exit_code = 0;
            result.output = getInvokeHelpMessage();
            return result;
        }

        for (int i = 2; i < argc; ++i) {
            if (std::strcmp(argv[i], "--event") == 0 && i + 1 < argc) {
                result.invoke_options.event_file = argv[++i];
            } else {
                return fail(result, std::string("Unknown option: ") + argv[i], getInvokeHelpMessage());
            }
        }
        return result;
    }

    // Check for unknown flags (starting with - or --)
    if (command[0] == '-') {
        return fail(result, std::string("Unknown option: ") + command, getHelpMessage());
    }

    // Unknown command
    return fail(result, std::string("Unknown command: ") + command, getHelpMessage());
}

std::string subcommandToString(Subcommand subcommand) {
    switch (subcommand) {
        case Subcommand::None: return "none";
        case Subcommand::Serve: return "serve";
        case Subcommand::Invoke: return "invoke";
        default: return "unknown";
    }
}

}  // namespace sagegate
