#ifndef SCRIPTOR_CLIENT_REGISTRY_H
#define SCRIPTOR_CLIENT_REGISTRY_H

#include <scriptor/concurrent_client.h>
#include <functional>
#include <memory>
#include <mutex>

namespace scriptor {

/**
 * @brief Lazily builds and hands out one shared ConcurrentClient.
 *
 * The first get() decides the configuration; later calls return the same
 * instance until reset().
 */
class ClientRegistry {
public:
    using ConfigProvider = std::function<ClientConfig()>;

    explicit ClientRegistry(ConfigProvider provider = &ClientConfig::from_env,
                            std::shared_ptr<BackendFactory> factory = nullptr);
    ~ClientRegistry();

    ClientRegistry(const ClientRegistry&) = delete;
    ClientRegistry& operator=(const ClientRegistry&) = delete;

    /**
     * @brief The shared client, built and initialized on first use.
     * @throws ConfigurationError if initialization fails; nothing is kept then.
     */
    std::shared_ptr<ConcurrentClient> get();

    /**
     * @brief Shuts the current client down and forgets it.
     */
    void reset();

    bool has_client() const;

    /** @brief Process-wide registry configured from the environment. */
    static ClientRegistry& global();

private:
    ConfigProvider provider_;
    std::shared_ptr<BackendFactory> factory_;
    mutable std::mutex mutex_;
    std::shared_ptr<ConcurrentClient> client_;
};

} // namespace scriptor

#endif
