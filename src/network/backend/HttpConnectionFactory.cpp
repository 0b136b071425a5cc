#include "HttpConnectionFactory.hpp"

#include <spdlog/spdlog.h>

#include "HttpBackendConnection.hpp"

namespace switchboard::network {

HttpConnectionFactory::HttpConnectionFactory()
    : tls_(std::make_shared<boost::asio::ssl::context>(boost::asio::ssl::context::tls_client)) {
    boost::system::error_code ec;
    tls_->set_default_verify_paths(ec);
    if (ec) {
        spdlog::warn("Could not load the system trust store: {}", ec.message());
    }
    tls_->set_verify_mode(boost::asio::ssl::verify_peer);
}

core::BackendConnectionPtr HttpConnectionFactory::Create(boost::asio::any_io_executor ex,
                                                         const core::BackendTarget& target,
                                                         std::optional<core::Credential> credential) {
    spdlog::trace("Creating connection to backend '{}' at {}", target.id, target.url);
    return std::make_shared<HttpBackendConnection>(std::move(ex), tls_, target,
                                                   std::move(credential));
}

}  // namespace switchboard::network
