/*
 * Copyright 2025 Switchyard Contributors
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

// Switchyard - Main Entry Point
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "adapter/factory.hpp"
#include "adapter/registration.hpp"
#include "control/config.hpp"
#include "core/admin_server.hpp"
#include "core/logging.hpp"
#include "core/server.hpp"
#include "crypto/credential_vault.hpp"
#include "events/event_broadcaster.hpp"
#include "gateway/connect_handler.hpp"
#include "gateway/rate_limit.hpp"
#include "store/gateway_store.hpp"
#include "ws/manager.hpp"

namespace {

std::atomic<bool> g_shutdown_requested{false};
std::atomic<bool> g_reload_requested{false};

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_shutdown_requested = true;
    } else if (signal == SIGHUP) {
        g_reload_requested = true;
    }
}

void print_validation(const switchyard::control::ValidationResult& validation) {
    for (const auto& error : validation.errors) {
        fprintf(stderr, "  - ERROR: %s\n", error.c_str());
    }
    for (const auto& warning : validation.warnings) {
        fprintf(stderr, "  - WARNING: %s\n", warning.c_str());
    }
}

/// Encrypt seed credentials and (re)load them into the store
bool seed_store(switchyard::store::InMemoryGatewayStore& store,
                const switchyard::control::Config& config, const std::vector<uint8_t>& key,
                quill::Logger* logger) {
    std::error_code ec;
    auto records = switchyard::control::build_gateway_records(config, key, ec);
    if (!records) {
        LOG_ERROR(logger, "Failed to build gateway records: error={}", ec.message());
        return false;
    }
    for (auto& record : *records) {
        LOG_INFO(logger, "Gateway registered: gateway_id={}, name={}, adapter_type={}", record.id,
                 record.name, record.adapter_type);
        store.upsert(std::move(record));
    }
    return true;
}

}  // namespace

int main(int argc, char* argv[]) {
    using namespace switchyard;

    printf("Switchyard v0.1.0\n");
    printf("Gateway fleet control plane\n\n");

    if (argc < 3 || std::string(argv[1]) != "--config") {
        fprintf(stderr, "Usage: %s --config <config.json>\n", argv[0]);
        return EXIT_FAILURE;
    }

    control::ConfigManager config_manager;
    printf("Loading configuration from %s...\n", argv[2]);
    if (!config_manager.load(argv[2])) {
        fprintf(stderr, "Failed to load configuration\n");
        print_validation(config_manager.last_validation());
        return EXIT_FAILURE;
    }
    auto config = config_manager.get();
    if (!config_manager.last_validation().warnings.empty()) {
        print_validation(config_manager.last_validation());
    }

    quill::Logger* logger = nullptr;
    try {
        logging::init_logging_system();
        logger = logging::init_logger("switchyard", config->logging);
    } catch (const std::exception& e) {
        fprintf(stderr, "Failed to initialize logging: %s\n", e.what());
        return EXIT_FAILURE;
    }

    std::error_code ec;
    auto key = control::resolve_encryption_key(config->credentials, ec);
    if (ec) {
        LOG_ERROR(logger, "Invalid credential encryption key: error={}", ec.message());
        logging::shutdown_logging();
        return EXIT_FAILURE;
    }
    if (!key) {
        key = crypto::generate_encryption_key(ec);
        if (!key) {
            LOG_ERROR(logger, "Failed to generate encryption key: error={}", ec.message());
            logging::shutdown_logging();
            return EXIT_FAILURE;
        }
        LOG_WARNING(logger,
                    "No encryption key configured (set {}); using an ephemeral key, stored "
                    "credentials will not survive a restart",
                    config->credentials.encryption_key_env);
    }

    auto store = std::make_shared<store::InMemoryGatewayStore>();
    if (!seed_store(*store, *config, *key, logger)) {
        logging::shutdown_logging();
        return EXIT_FAILURE;
    }

    adapter::AdapterFactory adapter_factory(logger);
    adapter::register_builtin_adapters(adapter_factory, store, *key);
    for (const auto& gateway : config->gateways) {
        if (!adapter_factory.supports(gateway.adapter_type)) {
            LOG_WARNING(logger, "Gateway uses an unregistered adapter: gateway_id={}, type={}",
                        gateway.id, gateway.adapter_type);
        }
    }

    ws::ManagerConfig manager_config;
    manager_config.max_connections = config->websocket.max_connections;
    manager_config.heartbeat_interval =
        std::chrono::milliseconds(config->websocket.heartbeat_interval_ms);
    manager_config.heartbeat_timeout =
        std::chrono::milliseconds(config->websocket.heartbeat_timeout_ms);
    ws::Manager manager(manager_config, logger);
    events::EventBroadcaster broadcaster(manager, logger);

    gateway::SlidingWindowRateLimiter rate_limiter(config->websocket.rate_limit_per_minute,
                                                   std::chrono::minutes(1));

    gateway::ConnectHandlerConfig handler_config;
    handler_config.ws_path = config->server.ws_path;
    handler_config.handshake_timeout =
        std::chrono::milliseconds(config->server.handshake_timeout_ms);
    handler_config.max_handshake_bytes = config->server.max_handshake_bytes;
    handler_config.max_message_size = config->websocket.max_message_size;
    gateway::ConnectHandler connect_handler(handler_config, manager, store, rate_limiter, logger);

    core::ServerOptions server_options;
    server_options.address = config->server.listen_address;
    server_options.port = config->server.listen_port;
    server_options.backlog = static_cast<int>(config->server.backlog);
    core::Server server(
        server_options,
        [&connect_handler](int client_fd, std::string remote_address) {
            connect_handler.handle(client_fd, remote_address);
        },
        logger);

    if (auto start_ec = server.start()) {
        LOG_ERROR(logger, "Failed to start listener on {}:{}: error={}",
                  server_options.address, server_options.port, start_ec.message());
        logging::shutdown_logging();
        return EXIT_FAILURE;
    }

    std::unique_ptr<core::AdminServer> admin_server;
    std::thread admin_thread;
    if (config->admin.enabled) {
        admin_server = std::make_unique<core::AdminServer>(config->admin, manager, broadcaster,
                                                           logger);
        if (auto admin_ec = admin_server->start()) {
            LOG_ERROR(logger, "Failed to start admin server on port {}: error={}",
                      config->admin.port, admin_ec.message());
            server.stop();
            logging::shutdown_logging();
            return EXIT_FAILURE;
        }
        admin_thread = std::thread([&admin_server] { admin_server->run(); });
    }

    std::signal(SIGINT, signal_handler);   // Ctrl+C
    std::signal(SIGTERM, signal_handler);  // Kill signal
    std::signal(SIGHUP, signal_handler);   // Reload gateway seeds

    std::thread accept_thread([&server] { server.run(); });
    LOG_INFO(logger, "Switchyard started: ws_path={}, max_connections={}",
             config->server.ws_path, config->websocket.max_connections);

    while (!g_shutdown_requested.load()) {
        if (g_reload_requested.exchange(false)) {
            LOG_INFO(logger, "Reloading configuration from {}", config_manager.config_path());
            if (config_manager.reload()) {
                // Listener, registry and limiter settings need a restart; seeds apply now
                if (!seed_store(*store, *config_manager.get(), *key, logger)) {
                    LOG_WARNING(logger, "Keeping previously loaded gateway records");
                }
            } else {
                for (const auto& error : config_manager.last_validation().errors) {
                    LOG_ERROR(logger, "Configuration reload rejected: {}", error);
                }
            }
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    LOG_INFO(logger, "Shutdown requested, draining gateway connections");
    server.stop();
    accept_thread.join();
    manager.shutdown();
    server.wait_for_handlers();
    if (admin_server) {
        admin_server->stop();
        admin_thread.join();
    }

    LOG_INFO(logger, "Switchyard stopped");
    logging::shutdown_logging();
    return EXIT_SUCCESS;
}
