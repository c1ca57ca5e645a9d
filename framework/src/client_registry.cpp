#include <scriptor/client_registry.h>
#include <scriptor/logger.h>

namespace scriptor {

ClientRegistry::ClientRegistry(ConfigProvider provider, std::shared_ptr<BackendFactory> factory)
    : provider_(std::move(provider)), factory_(std::move(factory)) {}

ClientRegistry::~ClientRegistry() {
    reset();
}

std::shared_ptr<ConcurrentClient> ClientRegistry::get() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (client_) {
        return client_;
    }

    auto client = std::make_shared<ConcurrentClient>(provider_(), factory_);
    client->initialize();
    client_ = std::move(client);
    return client_;
}

void ClientRegistry::reset() {
    std::shared_ptr<ConcurrentClient> client;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        client = std::move(client_);
    }
    if (client) {
        client->shutdown();
    }
}

bool ClientRegistry::has_client() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return client_ != nullptr;
}

ClientRegistry& ClientRegistry::global() {
    // Logger must outlive the registry: it is used during shutdown.
    Logger::instance();
    static ClientRegistry registry;
    return registry;
}

} // namespace scriptor
