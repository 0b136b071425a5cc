#include "Errors.hpp"

#include <string>

namespace switchboard {

namespace {

class SwitchboardCategory : public boost::system::error_category {
   public:
    const char* name() const noexcept override { return "switchboard"; }

    std::string message(int ev) const override {
        switch (static_cast<errc>(ev)) {
            case errc::operation_not_found:
                return "no such operation";
            case errc::no_backends_available:
                return "no backends available";
            case errc::backend_unavailable:
                return "backend unavailable";
            case errc::backend_session_expired:
                return "backend session expired";
            case errc::authorization_failed:
                return "backend authorization failed";
            case errc::circuit_open:
                return "backend circuit open";
            case errc::session_not_found:
                return "session not found";
            case errc::session_closed:
                return "session closed";
            case errc::session_limit_exceeded:
                return "session limit exceeded";
            case errc::invalid_request:
                return "invalid request";
            case errc::deadline_exceeded:
                return "deadline exceeded";
        }
        return "unknown switchboard error";
    }
};

std::string JoinFailures(const std::vector<std::string>& failures) {
    std::string out = "failed to close " + std::to_string(failures.size()) + " backend connection(s)";
    for (const auto& f : failures) {
        out += "; ";
        out += f;
    }
    return out;
}

}  // namespace

const boost::system::error_category& category() noexcept {
    static const SwitchboardCategory instance;
    return instance;
}

boost::system::error_code make_error_code(errc e) noexcept {
    return {static_cast<int>(e), category()};
}

void Throw(errc e, const std::string& what) {
    throw boost::system::system_error(make_error_code(e), what);
}

bool Is(const boost::system::error_code& ec, errc e) noexcept {
    return ec.category() == category() && ec.value() == static_cast<int>(e);
}

const char* ErrorName(errc e) noexcept {
    switch (e) {
        case errc::operation_not_found:
            return "operation_not_found";
        case errc::no_backends_available:
            return "no_backends_available";
        case errc::backend_unavailable:
            return "backend_unavailable";
        case errc::backend_session_expired:
            return "backend_session_expired";
        case errc::authorization_failed:
            return "authorization_failed";
        case errc::circuit_open:
            return "circuit_open";
        case errc::session_not_found:
            return "session_not_found";
        case errc::session_closed:
            return "session_closed";
        case errc::session_limit_exceeded:
            return "session_limit_exceeded";
        case errc::invalid_request:
            return "invalid_request";
        case errc::deadline_exceeded:
            return "deadline_exceeded";
    }
    return "unknown";
}

int JsonRpcCode(const boost::system::error_code& ec) noexcept {
    if (ec.category() != category()) {
        return -32603;  // internal error
    }
    switch (static_cast<errc>(ec.value())) {
        case errc::operation_not_found:
            return -32601;
        case errc::session_not_found:
        case errc::session_closed:
            return -32001;
        case errc::backend_unavailable:
        case errc::backend_session_expired:
        case errc::authorization_failed:
        case errc::circuit_open:
        case errc::deadline_exceeded:
            return -32002;
        case errc::no_backends_available:
            return -32003;
        case errc::session_limit_exceeded:
            return -32004;
        case errc::invalid_request:
            return -32600;
    }
    return -32603;
}

unsigned HttpStatus(const boost::system::error_code& ec) noexcept {
    if (ec.category() != category()) {
        return 500;
    }
    switch (static_cast<errc>(ec.value())) {
        case errc::session_not_found:
        case errc::session_closed:
            return 404;
        case errc::session_limit_exceeded:
            return 503;
        case errc::invalid_request:
            return 400;
        default:
            // Per-call failures travel inside a successful HTTP exchange.
            return 200;
    }
}

SessionLimitExceeded::SessionLimitExceeded(std::chrono::seconds retry_after)
    : boost::system::system_error(make_error_code(errc::session_limit_exceeded),
                                  "retry after " + std::to_string(retry_after.count()) + "s"),
      retry_after_(retry_after) {}

SessionCloseError::SessionCloseError(std::vector<std::string> failures)
    : std::runtime_error(JoinFailures(failures)), failures_(std::move(failures)) {}

}  // namespace switchboard
