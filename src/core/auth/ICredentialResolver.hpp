#pragma once

#include <boost/asio/awaitable.hpp>
#include <optional>

#include "BackendTarget.hpp"
#include "Identity.hpp"

namespace switchboard::core {

/**
 * @brief Resolves the outgoing credential for (caller, backend).
 * Invoked at connection creation and again when a backend rejects the
 * credential during a call.
 */
class ICredentialResolver {
   public:
    virtual ~ICredentialResolver() = default;

    // std::nullopt means "send no credential".
    virtual boost::asio::awaitable<std::optional<Credential>> Resolve(const Identity& identity,
                                                                      const BackendTarget& backend) = 0;
};

}  // namespace switchboard::core
