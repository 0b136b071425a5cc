#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "Identity.hpp"

namespace switchboard::network {

/**
 * @brief Derives the caller identity from an incoming request.
 *
 * anonymous: every caller is "anonymous".
 * bearer: requires `Authorization: Bearer <token>`; the subject is a digest
 * of the token so logs never carry the token itself.
 */
class IncomingAuth {
   public:
    enum class Mode { anonymous, bearer };

    explicit IncomingAuth(Mode mode) : mode_(mode) {}

    // Throws std::invalid_argument for unknown mode names.
    static Mode ParseMode(const std::string& name);

    // std::nullopt means the request must be rejected with 401.
    std::optional<core::Identity> Authenticate(std::string_view authorization_header) const;

    Mode mode() const noexcept { return mode_; }

   private:
    Mode mode_;
};

}  // namespace switchboard::network
