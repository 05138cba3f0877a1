// src/main.cpp
// termleased - ephemeral terminal session daemon

#include <iostream>
#include <memory>
#include "termlease/termlease.hpp"

using namespace termlease;

int main() {
    Config config;
    try {
        config = EnvConfig::from_environment();
    } catch (const ConfigError& e) {
        std::cerr << "termleased: " << e.what() << std::endl;
        return 2;
    }

    Logger::instance().configure(config.logging());

    try {
        // Signals are consumed by sigwait below, so every thread must inherit the mask
        LifecycleManager::block_shutdown_signals();

        auto driver = std::make_shared<DockerWorkerDriver>(config.worker());
        auto leads = std::make_shared<MemoryLeadStore>(config.leads().persistence_file);
        Orchestrator orchestrator(config, driver, leads);
        ApiRouter router(orchestrator);
        HttpServer server(config.server(), router);

        orchestrator.set_session_created_callback([](const Session& session) {
            TL_LOG_INFO("termleased", "New demo session " << session.id.substr(0, 8)
                        << " for " << session.email);
        });

        LifecycleManager lifecycle;
        lifecycle.set_state_change_callback([&lifecycle](LifecycleManager::ApplicationState from,
                                                         LifecycleManager::ApplicationState to) {
            TL_LOG_DEBUG("termleased", "Lifecycle " << application_state_to_string(from)
                         << " -> " << application_state_to_string(to));
            if (to == LifecycleManager::ApplicationState::STOPPING) {
                TL_LOG_INFO("termleased", "Shutting down after "
                            << lifecycle.get_metrics().uptime.count() / 1000 << "s uptime");
            }
        });
        lifecycle.register_startup_task("orchestrator", [&] { orchestrator.start(); }, 100);
        lifecycle.register_startup_task("http", [&] { server.start(); }, 50);
        // Stop accepting requests before tearing sessions down
        lifecycle.register_shutdown_task("http", [&] { server.stop(); }, 100);
        lifecycle.register_shutdown_task("orchestrator", [&] { orchestrator.stop(); }, 50);
        lifecycle.register_shutdown_task("logger", [] { Logger::instance().shutdown(); }, 0);

        lifecycle.start();
        TL_LOG_INFO("termleased", "termleased " << version() << " ready on "
                    << config.server().bind_address << ":" << server.bound_port());

        int signal_number = LifecycleManager::wait_for_shutdown_signal();
        TL_LOG_INFO("termleased", "Received signal " << signal_number << ", shutting down");

        lifecycle.stop();
    } catch (const Error& e) {
        TL_LOG_ERROR("termleased", "Fatal: " << e.what());
        Logger::instance().shutdown();
        return 1;
    } catch (const std::exception& e) {
        TL_LOG_ERROR("termleased", "Fatal: " << e.what());
        Logger::instance().shutdown();
        return 1;
    }

    return 0;
}
