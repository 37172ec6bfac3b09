/*
 * Creates encryption backends by name
 *
 * The reversible simulation is registered as an insecure backend and is only created when the
 * caller explicitly allows insecure backends. Genuine homomorphic schemes plug in through
 * register_backend.
 */

#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "lib/crypto/encryption_backend.hpp"

namespace fhecredit
{
namespace oracle
{

struct BackendOptions
{
    bool allow_insecure = false;
    std::vector<uint8_t> seed;         // deterministic key derivation
    std::vector<uint8_t> key_material; // serialized key, takes precedence over seed
};

typedef std::function<std::unique_ptr<EncryptionBackend>(const BackendOptions &)> BackendCreator;

class BackendFactory
{
public:
    static void register_backend(const std::string &name, bool insecure, BackendCreator creator);
    static bool has_backend(const std::string &name);
    static std::vector<std::string> backend_names();

    static std::unique_ptr<EncryptionBackend> create(const std::string &name,
                                                     const BackendOptions &options);
};

} // namespace oracle
} // namespace fhecredit
