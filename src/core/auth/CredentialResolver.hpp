#pragma once

#include <string>

#include "ICredentialResolver.hpp"

namespace switchboard::core {

/**
 * @brief Default resolver driven by each backend's `auth` configuration.
 *
 * - unauthenticated: no credential.
 * - header_injection: the configured header; `${NAME}` references in the value
 *   are expanded from the environment at resolution time, so rotated secrets
 *   are picked up on re-resolution.
 * - pass_through: the caller's bearer token as `Authorization: Bearer ...`.
 */
class ConfiguredCredentialResolver : public ICredentialResolver {
   public:
    boost::asio::awaitable<std::optional<Credential>> Resolve(const Identity& identity,
                                                              const BackendTarget& backend) override;
};

// Expands ${NAME} from the environment; unknown variables expand to "".
std::string ExpandEnv(const std::string& value);

}  // namespace switchboard::core
