/**
 * relay-server: Entry Point
 *
 * Loads config, configures logging, then runs the relay node: the
 * client socket listener, the REST API, the heartbeat sweep and the
 * offline-queue cleanup, all on one io_context.
 */

#include <exception>
#include <string>

#include <asio.hpp>
#include <spdlog/spdlog.h>

#include "config/relay_config.h"
#include "node/relay_node.h"

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::info);
    spdlog::info("relay-server starting…");

    const std::string config_path = (argc > 1) ? argv[1] : "config.json";

    RelayConfig config;
    try {
        config = load_config(config_path);
    } catch (const ConfigError& e) {
        spdlog::error("Invalid configuration: {}", e.what());
        return 1;
    }

    spdlog::set_level(spdlog::level::from_str(config.log_level));
    spdlog::info("Max offline messages per address: {}", config.max_offline_messages);

    try {
        asio::io_context io;
        RelayNode node(io, config);
        node.start();

        spdlog::info("Relay ready. Press Ctrl+C to exit.");
        io.run();
    } catch (const std::exception& e) {
        spdlog::error("Fatal: {}", e.what());
        return 1;
    }
    return 0;
}
