#include <iostream>
#include <fstream>
#include <iterator>
#include <memory>
#include <signal.h>
#include <thread>
#include <chrono>
#include <string>

#include "api/http_server.h"
#include "gateway/gateway.h"
#include "gateway/lambda_event.h"
#include "utils/config.h"
#include "utils/cli.h"
#include "utils/json_utils.h"
#include "utils/version.h"
#include "runtime/state.h"
#include "utils/logger.h"

namespace {

void applyServeOptions(sagegate::GatewayConfig& cfg, const sagegate::ServeOptions& opts) {
    if (opts.port != 0) {
        cfg.port = opts.port;
    }
    if (!opts.host.empty()) {
        cfg.bind_address = opts.host;
    }
}

bool readEvent(const std::string& path, std::string& out) {
    if (path.empty() || path == "-") {
        out.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
        return true;
    }
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs) return false;
    out.assign(std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>());
    return true;
}

}  // namespace

int run_server(const sagegate::GatewayConfig& cfg, bool single_iteration) {
    sagegate::g_running_flag.store(true);

    try {
        sagegate::logger::init_from_env();
        if (cfg.endpoint_name.empty()) {
            spdlog::warn("SAGEMAKER_ENDPOINT_NAME is not set; completion requests will fail");
        }
        spdlog::info("Backend: {} endpoint={} region={}", sagegate::to_string(cfg.backend),
                     cfg.endpoint_name, cfg.region);

        sagegate::Gateway gateway(cfg);
        sagegate::HttpServer server(cfg.port, gateway, cfg.bind_address);
        server.enableCompression(cfg.gzip_enabled);

        std::cout << "Starting HTTP server on " << cfg.bind_address << ":" << cfg.port << "..." << std::endl;
        server.start();

        // Main loop
        if (single_iteration) {
            std::this_thread::sleep_for(std::chrono::milliseconds(500));
            sagegate::request_shutdown();
        }
        while (sagegate::is_running()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        std::cout << "Shutting down..." << std::endl;
        server.stop();
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }

    std::cout << "Server shutdown complete" << std::endl;
    return 0;
}

int run_invoke(const sagegate::GatewayConfig& cfg, const sagegate::InvokeOptions& opts) {
    sagegate::logger::init_stderr_from_env();

    std::string raw;
    if (!readEvent(opts.event_file, raw)) {
        std::cerr << "Error: cannot read event file: " << opts.event_file << std::endl;
        return 1;
    }
    std::string parse_error;
    auto event = sagegate::parse_json(raw, &parse_error);
    if (!event) {
        std::cerr << "Error: invalid event JSON: " << parse_error << std::endl;
        return 1;
    }
    auto invocation = sagegate::fromLambdaEvent(*event);
    if (!invocation.ok()) {
        std::cerr << "Error: " << invocation.error_message << std::endl;
        return 1;
    }

    try {
        sagegate::Gateway gateway(cfg);
        const auto response = gateway.handle(invocation.data->request, invocation.data->context);
        std::cout << sagegate::toLambdaResponse(response).dump(2, ' ', false,
                                                               nlohmann::json::error_handler_t::replace)
                  << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}

void signalHandler(int signal) {
    std::cout << "Received signal " << signal << ", shutting down..." << std::endl;
    sagegate::request_shutdown();
}

#ifndef SAGEGATE_TESTING
int main(int argc, char* argv[]) {
    // Parse CLI arguments first
    auto cli_result = sagegate::parseCliArgs(argc, argv);
    if (cli_result.should_exit) {
        (cli_result.exit_code == 0 ? std::cout : std::cerr) << cli_result.output;
        return cli_result.exit_code;
    }

    auto [cfg, config_log] = sagegate::loadGatewayConfigWithLog();

    switch (cli_result.subcommand) {
        case sagegate::Subcommand::Invoke:
            return run_invoke(cfg, cli_result.invoke_options);

        case sagegate::Subcommand::Serve:
        case sagegate::Subcommand::None:
        default:
            signal(SIGINT, signalHandler);
            signal(SIGTERM, signalHandler);
            std::cout << "sagegate v" << SAGEGATE_VERSION << " starting..." << std::endl;
            std::cout << "Config: " << config_log << std::endl;
            applyServeOptions(cfg, cli_result.serve_options);
            return run_server(cfg, /*single_iteration=*/false);
    }
}
#endif

#ifdef SAGEGATE_TESTING
extern "C" int sagegate_run_for_test() {
    auto cfg = sagegate::loadGatewayConfig();
    return run_server(cfg, /*single_iteration=*/true);
}
#endif
