#include "CredentialResolver.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>

#include "Errors.hpp"

namespace switchboard::core {

std::string ExpandEnv(const std::string& value) {
    std::string out;
    out.reserve(value.size());

    std::size_t pos = 0;
    while (pos < value.size()) {
        auto start = value.find("${", pos);
        if (start == std::string::npos) {
            out.append(value, pos, std::string::npos);
            break;
        }
        auto end = value.find('}', start + 2);
        if (end == std::string::npos) {
            out.append(value, pos, std::string::npos);
            break;
        }
        out.append(value, pos, start - pos);

        const std::string name = value.substr(start + 2, end - start - 2);
        if (const char* env = std::getenv(name.c_str())) {
            out += env;
        } else {
            spdlog::warn("Environment variable '{}' referenced by a credential is not set", name);
        }
        pos = end + 1;
    }
    return out;
}

boost::asio::awaitable<std::optional<Credential>> ConfiguredCredentialResolver::Resolve(
    const Identity& identity, const BackendTarget& backend) {
    switch (backend.auth.type) {
        case BackendAuth::Type::unauthenticated:
            co_return std::nullopt;

        case BackendAuth::Type::header_injection:
            co_return Credential{backend.auth.header_name, ExpandEnv(backend.auth.header_value)};

        case BackendAuth::Type::pass_through:
            if (identity.anonymous()) {
                Throw(errc::authorization_failed,
                      "backend '" + backend.id + "' requires the caller's token, caller is anonymous");
            }
            co_return Credential{"Authorization", "Bearer " + identity.token};
    }
    co_return std::nullopt;
}

}  // namespace switchboard::core
