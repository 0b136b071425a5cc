#include "SessionMetadata.hpp"

namespace switchboard::core {

namespace json = boost::json;

namespace {

std::int64_t ToMillis(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::chrono::system_clock::time_point FromMillis(std::int64_t ms) {
    return std::chrono::system_clock::time_point(std::chrono::milliseconds(ms));
}

}  // namespace

SessionMetadata SessionMetadata::MakePlaceholder(std::string session_id) {
    SessionMetadata m;
    m.id = std::move(session_id);
    m.created_at = std::chrono::system_clock::now();
    m.last_touched_at = m.created_at;
    return m;
}

void tag_invoke(json::value_from_tag, json::value& jv, const SessionMetadata& m) {
    jv = json::object{
        {"id", m.id},
        {"created_at", ToMillis(m.created_at)},
        {"last_touched_at", ToMillis(m.last_touched_at)},
        {"identity_reference", m.identity_reference},
    };
}

SessionMetadata tag_invoke(json::value_to_tag<SessionMetadata>, const json::value& jv) {
    const auto& obj = jv.as_object();
    SessionMetadata m;
    m.id = json::value_to<std::string>(obj.at("id"));
    m.created_at = FromMillis(obj.at("created_at").to_number<std::int64_t>());
    m.last_touched_at = FromMillis(obj.at("last_touched_at").to_number<std::int64_t>());
    m.identity_reference = json::value_to<std::string>(obj.at("identity_reference"));
    return m;
}

}  // namespace switchboard::core
