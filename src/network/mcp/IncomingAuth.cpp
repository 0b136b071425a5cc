#include "IncomingAuth.hpp"

#include <openssl/sha.h>

#include <array>
#include <stdexcept>

namespace switchboard::network {

namespace {

constexpr std::string_view BEARER_PREFIX = "Bearer ";
constexpr std::size_t SUBJECT_DIGEST_BYTES = 8;

std::string Subject(std::string_view token) {
    std::array<unsigned char, SHA256_DIGEST_LENGTH> digest{};
    SHA256(reinterpret_cast<const unsigned char*>(token.data()), token.size(), digest.data());

    static constexpr char hex[] = "0123456789abcdef";
    std::string subject = "bearer:";
    for (std::size_t i = 0; i < SUBJECT_DIGEST_BYTES; ++i) {
        subject += hex[digest[i] >> 4];
        subject += hex[digest[i] & 0x0f];
    }
    return subject;
}

}  // namespace

IncomingAuth::Mode IncomingAuth::ParseMode(const std::string& name) {
    if (name == "anonymous") {
        return Mode::anonymous;
    }
    if (name == "bearer") {
        return Mode::bearer;
    }
    throw std::invalid_argument("unknown incoming auth mode '" + name + "'");
}

std::optional<core::Identity> IncomingAuth::Authenticate(
    std::string_view authorization_header) const {
    if (mode_ == Mode::anonymous) {
        return core::Identity{};
    }

    if (!authorization_header.starts_with(BEARER_PREFIX)) {
        return std::nullopt;
    }
    auto token = authorization_header.substr(BEARER_PREFIX.size());
    if (token.empty()) {
        return std::nullopt;
    }

    core::Identity identity;
    identity.subject = Subject(token);
    identity.token = std::string(token);
    return identity;
}

}  // namespace switchboard::network
