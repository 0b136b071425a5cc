#pragma once

#include <utility>

#include "ISession.hpp"

namespace switchboard::core {

// Forwards everything to the wrapped session. Derive and override the
// operations to intercept.
class SessionDecorator : public ISession {
   public:
    explicit SessionDecorator(SessionPtr inner) : inner_(std::move(inner)) {}

    const std::string& Id() const override { return inner_->Id(); }

    boost::asio::awaitable<boost::json::value> CallTool(std::string name,
                                                        boost::json::object arguments) override {
        return inner_->CallTool(std::move(name), std::move(arguments));
    }
    boost::asio::awaitable<boost::json::value> ReadResource(std::string uri) override {
        return inner_->ReadResource(std::move(uri));
    }
    boost::asio::awaitable<boost::json::value> GetPrompt(std::string name,
                                                         boost::json::object arguments) override {
        return inner_->GetPrompt(std::move(name), std::move(arguments));
    }

    CapabilitySet Capabilities() const override { return inner_->Capabilities(); }
    std::vector<Tool> Tools() const override { return inner_->Tools(); }
    std::vector<Resource> Resources() const override { return inner_->Resources(); }
    std::vector<Prompt> Prompts() const override { return inner_->Prompts(); }

    boost::asio::awaitable<void> Close() override { return inner_->Close(); }
    bool IsClosed() const override { return inner_->IsClosed(); }
    std::size_t InFlight() const override { return inner_->InFlight(); }

   protected:
    const SessionPtr& inner() const noexcept { return inner_; }

   private:
    SessionPtr inner_;
};

}  // namespace switchboard::core
