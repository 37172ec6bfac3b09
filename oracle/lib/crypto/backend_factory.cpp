#include "lib/crypto/backend_factory.hpp"

#include <map>
#include <mutex>

#include "include/fhecredit_constants.h"

#include "lib/common/oracle_exception.hpp"
#include "lib/common/oracle_logger.hpp"
#include "lib/crypto/simulated_backend.hpp"

namespace
{

using namespace fhecredit::oracle;

struct RegisteredBackend
{
    bool insecure;
    BackendCreator creator;
};

std::unique_ptr<EncryptionBackend> create_simulated_backend(const BackendOptions &options)
{
    if (!options.key_material.empty())
        return SimulatedBackend::from_key_material(options.key_material);
    if (!options.seed.empty())
        return SimulatedBackend::from_seed(options.seed);

    return SimulatedBackend::generate();
}

class Registry
{
public:
    static Registry &instance()
    {
        static Registry registry;
        return registry;
    }

    std::mutex mutex;
    std::map<std::string, RegisteredBackend> backends;

private:
    Registry() { backends[FHECREDIT_SIMULATION_SCHEME] = {true, create_simulated_backend}; }
};

} // namespace

namespace fhecredit
{
namespace oracle
{

void BackendFactory::register_backend(const std::string &name,
                                      bool insecure,
                                      BackendCreator creator)
{
    if (name.empty() || !creator)
        THROW_EXCEPTION(kInvalidInput, "Backend registration requires a name and a creator");

    Registry &registry = Registry::instance();
    std::lock_guard<std::mutex> lock(registry.mutex);
    if (!registry.backends.emplace(name, RegisteredBackend{insecure, creator}).second)
        THROW_EXCEPTION(kConfigurationError, "Backend \"" + name + "\" is already registered");
}

bool BackendFactory::has_backend(const std::string &name)
{
    Registry &registry = Registry::instance();
    std::lock_guard<std::mutex> lock(registry.mutex);
    return registry.backends.count(name) == 1;
}

std::vector<std::string> BackendFactory::backend_names()
{
    Registry &registry = Registry::instance();
    std::lock_guard<std::mutex> lock(registry.mutex);
    std::vector<std::string> names;
    for (const auto &entry : registry.backends)
        names.push_back(entry.first);

    return names;
}

std::unique_ptr<EncryptionBackend> BackendFactory::create(const std::string &name,
                                                          const BackendOptions &options)
{
    RegisteredBackend backend;
    if (!has_backend(name))
    {
        std::string available;
        for (const std::string &backend_name : backend_names())
            available += (available.empty() ? "" : ", ") + backend_name;
        THROW_EXCEPTION(kConfigurationError,
                        "No encryption backend named \"" + name + "\" (available: " + available +
                            ")");
    }

    {
        Registry &registry = Registry::instance();
        std::lock_guard<std::mutex> lock(registry.mutex);
        const auto iter = registry.backends.find(name);
        if (iter == registry.backends.end())
            THROW_EXCEPTION(kConfigurationError, "No encryption backend named \"" + name + "\"");
        backend = iter->second;
    }

    if (backend.insecure && !options.allow_insecure)
        THROW_EXCEPTION(kConfigurationError,
                        "Backend \"" + name +
                            "\" is not secure and insecure backends are not allowed");

    if (backend.insecure)
        WARNING_LOG("Using insecure encryption backend \"%s\"", name.c_str());

    std::unique_ptr<EncryptionBackend> created = backend.creator(options);
    if (!created)
        THROW_EXCEPTION(kConfigurationError, "Backend \"" + name + "\" creator returned null");

    return created;
}

} // namespace oracle
} // namespace fhecredit
