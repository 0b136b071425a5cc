#include "SessionManager.hpp"

#include <spdlog/spdlog.h>

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <optional>

#include "BoundedParallel.hpp"
#include "Errors.hpp"

namespace switchboard::core {

namespace {

std::string RandomId() {
    thread_local boost::uuids::random_generator gen;
    return boost::uuids::to_string(gen());
}

[[noreturn]] void ThrowNotFound(const std::string& id) {
    Throw(errc::session_not_found, "session '" + id + "' not found");
}

// Registered handlers hold the session weakly; these keep it alive per call.
std::shared_ptr<ISession> Lock(const std::weak_ptr<ISession>& weak) {
    auto session = weak.lock();
    if (!session) {
        Throw(errc::session_not_found, "session no longer exists");
    }
    return session;
}

asio::awaitable<json::value> CallTool(std::weak_ptr<ISession> weak, std::string name,
                                      json::object args) {
    auto session = Lock(weak);
    co_return co_await session->CallTool(std::move(name), std::move(args));
}

asio::awaitable<json::value> ReadResource(std::weak_ptr<ISession> weak, std::string uri) {
    auto session = Lock(weak);
    co_return co_await session->ReadResource(std::move(uri));
}

asio::awaitable<json::value> GetPrompt(std::weak_ptr<ISession> weak, std::string name,
                                       json::object args) {
    auto session = Lock(weak);
    co_return co_await session->GetPrompt(std::move(name), std::move(args));
}

}  // namespace

SessionManager::SessionManager(SessionManagerConfig cfg, std::shared_ptr<SessionFactory> factory,
                               std::shared_ptr<ISessionStore> store,
                               std::shared_ptr<ICapabilityRegistrar> registrar,
                               std::vector<BackendTarget> backends)
    : cfg_(cfg),
      factory_(std::move(factory)),
      store_(std::move(store)),
      registrar_(std::move(registrar)),
      backends_(std::move(backends)),
      next_id_(RandomId) {
    store_->SetEvictionHandler([this](std::string id) -> asio::awaitable<void> {
        spdlog::info("[{}] Session expired, closing.", id);
        co_await CloseLive(id);
    });
}

void SessionManager::SetDecorator(Decorator decorator) { decorator_ = std::move(decorator); }

void SessionManager::SetIdGenerator(IdGenerator generator) { next_id_ = std::move(generator); }

asio::awaitable<std::string> SessionManager::Generate() {
    std::string id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (pending_.size() + live_.size() >= cfg_.max_sessions) {
            spdlog::warn("Session limit of {} reached, rejecting new session.", cfg_.max_sessions);
            throw SessionLimitExceeded(cfg_.retry_after);
        }
        do {
            id = next_id_();
        } while (pending_.count(id) != 0 || live_.count(id) != 0);
        pending_.insert(id);
    }

    std::optional<std::string> store_error;
    try {
        co_await store_->Add(id, SessionMetadata::MakePlaceholder(id));
    } catch (const std::exception& e) {
        store_error = e.what();
    }
    if (store_error) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            pending_.erase(id);
        }
        spdlog::error("[{}] Storing placeholder failed: {}", id, *store_error);
        throw std::runtime_error("session store unavailable: " + *store_error);
    }

    spdlog::debug("[{}] Placeholder issued.", id);
    co_return id;
}

asio::awaitable<void> SessionManager::OnRegisterSession(std::string id, Identity identity) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (pending_.count(id) == 0) {
            ThrowNotFound(id);
        }
    }

    auto metadata = SessionMetadata::MakePlaceholder(id);
    metadata.identity_reference = identity.subject;

    std::shared_ptr<Session> session =
        co_await factory_->MakeSession(id, std::move(identity), backends_);
    SessionPtr exposed = decorator_ ? decorator_(session) : session;

    bool still_pending = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        still_pending = pending_.erase(id) != 0;
        if (still_pending) {
            live_.emplace(id, exposed);
        }
    }
    if (!still_pending) {
        // Terminated or expired while the backends were coming up.
        spdlog::info("[{}] Session went away during creation, discarding it.", id);
        std::optional<std::string> close_error;
        try {
            co_await exposed->Close();
        } catch (const std::exception& e) {
            close_error = e.what();
        }
        if (close_error) {
            spdlog::warn("[{}] {}", id, *close_error);
        }
        ThrowNotFound(id);
    }

    co_await store_->Add(id, std::move(metadata));

    // Terminate() may have closed the session while the record was written.
    bool registered = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = live_.find(id);
        if (it != live_.end() && it->second == exposed) {
            registrar_->RegisterSession(id, BuildRegistrations(exposed));
            registered = true;
        }
    }
    if (!registered) {
        spdlog::info("[{}] Session terminated while its record was stored, dropping it.", id);
        co_await store_->Delete(id);
        ThrowNotFound(id);
    }
    spdlog::info("[{}] Session registered with {} tool(s).", id, exposed->Tools().size());
}

asio::awaitable<bool> SessionManager::Validate(std::string id) {
    auto metadata = co_await store_->Get(id);
    co_return metadata.has_value();
}

asio::awaitable<SessionPtr> SessionManager::GetSession(std::string id) {
    auto metadata = co_await store_->Get(id);
    if (!metadata) {
        ThrowNotFound(id);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = live_.find(id);
    if (it == live_.end()) {
        // Known to the store but owned by another instance, or still a placeholder.
        ThrowNotFound(id);
    }
    co_return it->second;
}

asio::awaitable<void> SessionManager::Terminate(std::string id) {
    co_await CloseLive(id);
    co_await store_->Delete(id);
    spdlog::info("[{}] Session terminated.", id);
}

asio::awaitable<void> SessionManager::CloseLive(const std::string& id) {
    SessionPtr session;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_.erase(id);
        if (auto it = live_.find(id); it != live_.end()) {
            session = std::move(it->second);
            live_.erase(it);
        }
    }
    registrar_->UnregisterSession(id);
    if (!session) {
        co_return;
    }

    std::optional<std::string> close_error;
    try {
        co_await session->Close();
    } catch (const SessionCloseError& e) {
        close_error = e.what();
    }
    if (close_error) {
        spdlog::warn("[{}] {}", id, *close_error);
    }
}

asio::awaitable<void> SessionManager::ShutdownAll() {
    std::vector<std::string> ids;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ids.reserve(live_.size() + pending_.size());
        for (const auto& [id, session] : live_) {
            ids.push_back(id);
        }
        ids.insert(ids.end(), pending_.begin(), pending_.end());
    }
    spdlog::info("Terminating {} session(s).", ids.size());

    co_await infra::RunBounded(ids.size(), factory_->config().max_concurrency,
                               [&](std::size_t i) -> asio::awaitable<void> {
                                   std::optional<std::string> error;
                                   try {
                                       co_await Terminate(ids[i]);
                                   } catch (const std::exception& e) {
                                       error = e.what();
                                   }
                                   if (error) {
                                       spdlog::error("[{}] Shutdown failed: {}", ids[i], *error);
                                   }
                               });
}

std::size_t SessionManager::ActiveCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return live_.size();
}

SessionRegistrations SessionManager::BuildRegistrations(const SessionPtr& session) const {
    SessionRegistrations regs;
    std::weak_ptr<ISession> weak = session;

    for (auto& tool : session->Tools()) {
        auto name = tool.name;
        regs.tools.push_back({std::move(tool), [weak, name](json::object args) {
                                  return CallTool(weak, name, std::move(args));
                              }});
    }
    for (auto& resource : session->Resources()) {
        auto uri = resource.uri;
        regs.resources.push_back(
            {std::move(resource), [weak, uri]() { return ReadResource(weak, uri); }});
    }
    for (auto& prompt : session->Prompts()) {
        auto name = prompt.name;
        regs.prompts.push_back({std::move(prompt), [weak, name](json::object args) {
                                    return GetPrompt(weak, name, std::move(args));
                                }});
    }

    regs.unlisted_tool = [weak](std::string name, json::object args) {
        return CallTool(weak, std::move(name), std::move(args));
    };
    regs.unlisted_resource = [weak](std::string uri) { return ReadResource(weak, std::move(uri)); };
    regs.unlisted_prompt = [weak](std::string name, json::object args) {
        return GetPrompt(weak, std::move(name), std::move(args));
    };
    return regs;
}

}  // namespace switchboard::core
