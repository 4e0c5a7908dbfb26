#pragma once

#include <cstdint>
#include <string>

namespace sagegate {

/// Subcommand types for the sagegate CLI
enum class Subcommand {
    None,    // No subcommand (server mode)
    Serve,   // serve
    Invoke,  // invoke: one Lambda proxy event from a file or stdin
};

/// Options for serve (and the default server mode)
struct ServeOptions {
    uint16_t port{0};  // 0: keep the configured port
    std::string host;  // empty: keep the configured bind address
};

/// Options for invoke command
struct InvokeOptions {
    std::string event_file;  // empty or "-": read stdin
};

/// Result of CLI argument parsing
struct CliResult {
    /// Whether the program should exit immediately (e.g., after --help or --version)
    bool should_exit{false};

    /// Exit code to use if should_exit is true
    int exit_code{0};

    /// Output message to display (help text, version info, or error message)
    std::string output;

    Subcommand subcommand{Subcommand::None};
    ServeOptions serve_options;
    InvokeOptions invoke_options;
};

/// Parse command line arguments
///
/// @param argc Number of arguments
/// @param argv Argument values
/// @return CliResult indicating whether to continue or exit
CliResult parseCliArgs(int argc, char* argv[]);

std::string getHelpMessage();
std::string getServeHelpMessage();
std::string getInvokeHelpMessage();
std::string getVersionMessage();

/// Convert subcommand enum to string
std::string subcommandToString(Subcommand cmd);

}  // namespace sagegate
