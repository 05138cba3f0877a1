// orchestrator_simple.cpp
// Embedding the termlease orchestrator without the HTTP front end

#include <iostream>
#include "termlease/termlease.hpp"

using namespace termlease;

int main() {
    try {
        // Two short sessions, docker as the runtime
        Config config = ConfigBuilder()
            .sessions(std::chrono::minutes(2), 2)
            .sweep(std::chrono::seconds(5))
            .lead_capture("", true)
            .system_logging(SystemLogLevel::INFO)
            .build();

        Logger::instance().configure(config.logging());

        auto driver = std::make_shared<DockerWorkerDriver>(config.worker());
        Orchestrator orchestrator(config, driver);
        orchestrator.start();

        SessionGrant grant = orchestrator.create_session("jane@example.com");
        std::cout << "Session " << grant.session_id << " on " << grant.host << ":" << grant.port
                  << ", open " << grant.terminal_path << std::endl;

        SessionStatus status = orchestrator.get_session(grant.session_id);
        std::cout << "Remaining: " << status.remaining_seconds << "s" << std::endl;

        orchestrator.delete_session(grant.session_id);
        std::cout << "State after delete: "
                  << Utils::session_state_to_string(orchestrator.get_session(grant.session_id).state)
                  << std::endl;

        orchestrator.stop();

    } catch (const Error& e) {
        std::cerr << "Error [" << e.category() << "]: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
