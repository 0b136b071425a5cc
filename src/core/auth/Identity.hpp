#pragma once

#include <string>

namespace switchboard::core {

// Authenticated caller. Opaque to the session core beyond being handed to the
// credential resolver.
struct Identity {
    std::string subject = "anonymous";
    std::string token;  // raw bearer token, empty for anonymous callers

    bool anonymous() const noexcept { return token.empty(); }
};

// One header attached to every request sent to a backend.
struct Credential {
    std::string header;
    std::string value;
};

}  // namespace switchboard::core
