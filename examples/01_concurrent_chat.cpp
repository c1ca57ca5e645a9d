/**
 * Example 01: Concurrent Chat
 *
 * Reads AI_* settings from .env and the environment, then talks to the
 * detected backend through the shared client.
 * Concepts:
 * - ClientRegistry::global() for one process-wide client
 * - Named sessions that keep their conversation
 * - send_async and send_batch for fan-out
 */

#include <scriptor/client_registry.h>
#include <scriptor/environment.h>
#include <scriptor/exceptions.h>
#include <scriptor/logger.h>
#include <iostream>

using namespace scriptor;

int main() {
    load_env();
    Logger::instance().configure(env<std::string>("SCRIPTOR_LOG", "stdout"));

    try {
        auto client = ClientRegistry::global().get();
        std::cout << "Backend: " << to_string(client->backend_kind()) << std::endl;

        // A named session carries history between calls
        const auto session = client->create_session();
        client->send("I am writing a thesis on urban heat islands.", session);
        auto follow_up = client->send("Suggest three chapter titles.", session);
        std::cout << follow_up.content << "\n\n";

        auto pending = client->send_async("Define 'urban heat island' in one sentence.");

        auto batch = client->send_batch({
            "Name one mitigation strategy for heat islands.",
            "Name one sensor used to measure surface temperature.",
            "Name one city with a published heat action plan."
        });
        for (size_t i = 0; i < batch.size(); ++i) {
            std::cout << "[" << i << "] " << (batch[i] ? batch[i]->content : "(failed)") << "\n";
        }

        std::cout << "\n" << pending.get().content << "\n";
        std::cout << boost::json::serialize(client->model_info()) << std::endl;

        client->close_session(session);
        ClientRegistry::global().reset();
    } catch (const ConfigurationError& e) {
        std::cerr << e.what() << std::endl;
        return 2;
    } catch (const ClientError& e) {
        std::cerr << "Request failed: " << e.what() << std::endl;
        return 1;
    }

    Logger::instance().flush();
    return 0;
}
