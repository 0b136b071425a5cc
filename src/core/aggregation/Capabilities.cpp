#include "Capabilities.hpp"

#include <stdexcept>

namespace switchboard::core {

namespace json = boost::json;

namespace {

std::string StringOr(const json::object& obj, std::string_view key, std::string fallback = {}) {
    if (const auto* v = obj.if_contains(key); v && v->is_string()) {
        return std::string(v->as_string());
    }
    return fallback;
}

const json::object& AsObject(const json::value& jv, const char* what) {
    if (!jv.is_object()) {
        throw std::invalid_argument(std::string(what) + " descriptor must be a JSON object");
    }
    return jv.as_object();
}

}  // namespace

void tag_invoke(json::value_from_tag, json::value& jv, const Tool& t) {
    json::object obj;
    obj["name"] = t.name;
    if (!t.description.empty()) {
        obj["description"] = t.description;
    }
    if (t.input_schema.empty()) {
        obj["inputSchema"] = json::object{{"type", "object"}};
    } else {
        obj["inputSchema"] = t.input_schema;
    }
    jv = std::move(obj);
}

Tool tag_invoke(json::value_to_tag<Tool>, const json::value& jv) {
    const auto& obj = AsObject(jv, "tool");
    Tool t;
    t.name = StringOr(obj, "name");
    if (t.name.empty()) {
        throw std::invalid_argument("tool descriptor without a name");
    }
    t.description = StringOr(obj, "description");
    if (const auto* schema = obj.if_contains("inputSchema"); schema && schema->is_object()) {
        t.input_schema = schema->as_object();
    }
    return t;
}

void tag_invoke(json::value_from_tag, json::value& jv, const Resource& r) {
    json::object obj;
    obj["uri"] = r.uri;
    obj["name"] = r.name.empty() ? r.uri : r.name;
    if (!r.description.empty()) {
        obj["description"] = r.description;
    }
    if (!r.mime_type.empty()) {
        obj["mimeType"] = r.mime_type;
    }
    jv = std::move(obj);
}

Resource tag_invoke(json::value_to_tag<Resource>, const json::value& jv) {
    const auto& obj = AsObject(jv, "resource");
    Resource r;
    r.uri = StringOr(obj, "uri");
    if (r.uri.empty()) {
        throw std::invalid_argument("resource descriptor without a uri");
    }
    r.name = StringOr(obj, "name", r.uri);
    r.description = StringOr(obj, "description");
    r.mime_type = StringOr(obj, "mimeType");
    return r;
}

void tag_invoke(json::value_from_tag, json::value& jv, const Prompt& p) {
    json::object obj;
    obj["name"] = p.name;
    if (!p.description.empty()) {
        obj["description"] = p.description;
    }
    if (!p.arguments.empty()) {
        obj["arguments"] = p.arguments;
    }
    jv = std::move(obj);
}

Prompt tag_invoke(json::value_to_tag<Prompt>, const json::value& jv) {
    const auto& obj = AsObject(jv, "prompt");
    Prompt p;
    p.name = StringOr(obj, "name");
    if (p.name.empty()) {
        throw std::invalid_argument("prompt descriptor without a name");
    }
    p.description = StringOr(obj, "description");
    if (const auto* args = obj.if_contains("arguments"); args && args->is_array()) {
        p.arguments = args->as_array();
    }
    return p;
}

}  // namespace switchboard::core
