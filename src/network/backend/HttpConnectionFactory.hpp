#pragma once

#include <boost/asio/ssl/context.hpp>
#include <memory>

#include "IBackendConnection.hpp"

namespace switchboard::network {

/**
 * @brief Creates HttpBackendConnection objects.
 *
 * @details
 * Holds the one TLS client context shared by every https backend; it is
 * configured at startup (system trust store, peer verification) and only read
 * afterwards, so this class is thread-safe.
 */
class HttpConnectionFactory : public core::IConnectionFactory {
   public:
    HttpConnectionFactory();

    core::BackendConnectionPtr Create(boost::asio::any_io_executor ex,
                                      const core::BackendTarget& target,
                                      std::optional<core::Credential> credential) override;

   private:
    std::shared_ptr<boost::asio::ssl::context> tls_;
};

}  // namespace switchboard::network
