#pragma once

#include <boost/system/error_code.hpp>
#include <boost/system/system_error.hpp>
#include <chrono>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

namespace switchboard {

/**
 * @brief Error taxonomy of the session core.
 *
 * Every failure the core reports to a caller is a boost::system::system_error
 * whose code belongs to switchboard::category(). The front end maps each code
 * to a distinct JSON-RPC error code and HTTP status.
 */
enum class errc {
    operation_not_found = 1,  // name absent from the routing table
    no_backends_available,    // session populated with zero backends
    backend_unavailable,      // backend call failed, or backend missing from the session
    backend_session_expired,  // backend no longer knows its own session token
    authorization_failed,     // backend rejected the outgoing credential
    circuit_open,             // recovery for this backend is suspended
    session_not_found,        // unknown, expired or terminated client session
    session_closed,           // call reached a session after Close() began
    session_limit_exceeded,   // process-wide active-session cap reached
    invalid_request,          // malformed client request
    deadline_exceeded,        // backend initialization or call ran out of time
};

const boost::system::error_category& category() noexcept;

boost::system::error_code make_error_code(errc e) noexcept;

// Convenience for the `throw boost::system::system_error(...)` idiom.
[[noreturn]] void Throw(errc e, const std::string& what);

// True when ec belongs to the switchboard category and equals e.
bool Is(const boost::system::error_code& ec, errc e) noexcept;

// Stable identifier of e, such as "circuit_open", sent to clients in error.data.
const char* ErrorName(errc e) noexcept;

// JSON-RPC error code and HTTP status surfaced to clients for a given error.
int JsonRpcCode(const boost::system::error_code& ec) noexcept;
unsigned HttpStatus(const boost::system::error_code& ec) noexcept;

/**
 * @brief Thrown by SessionManager::Generate() when the active-session cap is reached.
 * Carries only the retry hint; no internal state is exposed.
 */
class SessionLimitExceeded : public boost::system::system_error {
   public:
    explicit SessionLimitExceeded(std::chrono::seconds retry_after);

    std::chrono::seconds retry_after() const noexcept { return retry_after_; }

   private:
    std::chrono::seconds retry_after_;
};

/**
 * @brief Thrown by Session::Close() after every backend connection was closed,
 * when at least one of them failed to close cleanly.
 */
class SessionCloseError : public std::runtime_error {
   public:
    explicit SessionCloseError(std::vector<std::string> failures);

    const std::vector<std::string>& failures() const noexcept { return failures_; }

   private:
    std::vector<std::string> failures_;
};

}  // namespace switchboard

namespace boost::system {
template <>
struct is_error_code_enum<switchboard::errc> : std::true_type {};
}  // namespace boost::system
