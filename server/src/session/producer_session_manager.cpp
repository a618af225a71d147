#include "hindsight/core/session/producer_session_manager.hpp"

#include <mutex>
#include <stdexcept>

#include <openssl/rand.h>

namespace hindsight::core::session {

ProducerSessionManager::ProducerSessionManager(discovery::CapabilityRegistryPtr registry,
                                               observability::TelemetryPtr telemetry,
                                               std::shared_ptr<logging::Logger> logger)
    : registry_(std::move(registry)), telemetry_(std::move(telemetry)), logger_(std::move(logger)) {
    if (!registry_) {
        throw std::invalid_argument("session manager requires a capability registry");
    }
}

ProducerSessionManager::~ProducerSessionManager() {
    shutdown();
}

std::string ProducerSessionManager::generate_session_id() {
    unsigned char bytes[8];
    if (RAND_bytes(bytes, sizeof(bytes)) != 1) {
        throw std::runtime_error("RAND_bytes failed while generating a session id");
    }
    static constexpr char kHex[] = "0123456789abcdef";
    std::string id = "sess_";
    for (auto byte : bytes) {
        id.push_back(kHex[byte >> 4]);
        id.push_back(kHex[byte & 0x0f]);
    }
    return id;
}

DataSessionPtr ProducerSessionManager::on_connection_ready(const std::string& remote_endpoint,
                                                           discovery::CapabilityProbePtr probe) {
    auto session_id = generate_session_id();

    observability::TracerPtr tracer;
    if (telemetry_) {
        tracer = telemetry_->get_tracer("hindsight-ingest");
    }

    SessionRecord record;
    record.context.session_id = session_id;
    record.context.remote_endpoint = remote_endpoint;
    record.context.status = SessionStatus::Discovering;
    record.context.connected_at = std::chrono::system_clock::now();
    record.data = std::make_shared<const DataSession>(session_id, remote_endpoint, std::move(tracer));
    record.control = std::make_shared<const ControlSession>(session_id, remote_endpoint, std::move(probe));

    auto data = record.data;
    {
        std::unique_lock lock(sessions_mutex_);
        sessions_.emplace(session_id, std::move(record));
    }

    if (logger_) {
        logger_->info("[session] producer connected, id:", session_id, "endpoint:", remote_endpoint);
    }

    discover_capabilities(session_id);
    return data;
}

bool ProducerSessionManager::discover_capabilities(const std::string& session_id) {
    ControlSessionPtr control;
    {
        std::shared_lock lock(sessions_mutex_);
        auto it = sessions_.find(session_id);
        if (it == sessions_.end()) {
            return false;
        }
        control = it->second.control;
    }

    // Fire and forget; the registry records the outcome.
    registry_->discover(*control);

    // A disconnect that ran before discover() had nothing to forget yet.
    bool connected = false;
    {
        std::shared_lock lock(sessions_mutex_);
        connected = sessions_.count(session_id) != 0;
    }
    if (!connected) {
        registry_->forget(session_id);
        if (logger_) {
            logger_->debug("[session] dropped discovery for disconnected session", session_id);
        }
    }
    return connected;
}

void ProducerSessionManager::on_disconnect(const std::string& session_id) {
    bool removed = false;
    {
        std::unique_lock lock(sessions_mutex_);
        removed = sessions_.erase(session_id) != 0;
    }
    registry_->forget(session_id);

    if (removed && logger_) {
        logger_->info("[session] producer disconnected:", session_id);
    }
}

DataSessionPtr ProducerSessionManager::find_data_session(const std::string& session_id) const {
    std::shared_lock lock(sessions_mutex_);
    auto it = sessions_.find(session_id);
    return it == sessions_.end() ? nullptr : it->second.data;
}

std::vector<SessionContext> ProducerSessionManager::get_active_sessions() const {
    std::vector<SessionContext> result;
    {
        std::shared_lock lock(sessions_mutex_);
        result.reserve(sessions_.size());
        for (const auto& [_, record] : sessions_) {
            result.push_back(record.context);
        }
    }

    for (auto& context : result) {
        context.capabilities = registry_->find(context.session_id);
        if (context.capabilities) {
            context.status = SessionStatus::Active;
        }
    }
    return result;
}

std::size_t ProducerSessionManager::session_count() const {
    std::shared_lock lock(sessions_mutex_);
    return sessions_.size();
}

void ProducerSessionManager::shutdown() {
    std::unordered_map<std::string, SessionRecord> sessions;
    {
        std::unique_lock lock(sessions_mutex_);
        sessions.swap(sessions_);
    }
    for (const auto& [id, _] : sessions) {
        registry_->forget(id);
    }
    if (!sessions.empty() && logger_) {
        logger_->info("[session] closed", sessions.size(), "producer sessions");
    }
}

}  // namespace hindsight::core::session
