#include "storyguard/service.hpp"
#include "storyguard/logging.hpp"

#include <stdexcept>

namespace storyguard {

namespace {

const JsonObject& params_object(const Json& params) {
    if (!params.is_object()) {
        throw std::invalid_argument("params must be an object");
    }
    return params.as_object();
}

std::string require_string(const JsonObject& params, const std::string& key) {
    if (auto value = string_member(params, key)) {
        return *value;
    }
    throw std::invalid_argument("missing string parameter: " + key);
}

Selection require_selection(const JsonObject& params, const std::string& key) {
    auto it = params.find(key);
    if (it == params.end() || !it->second.is_array() || it->second.as_array().size() != kSelectionSize) {
        throw std::invalid_argument(key + " must be an array of " + std::to_string(kSelectionSize) + " strings");
    }
    Selection selection;
    const auto& items = it->second.as_array();
    for (std::size_t i = 0; i < kSelectionSize; ++i) {
        if (!items[i].is_string()) {
            throw std::invalid_argument(key + " must be an array of " + std::to_string(kSelectionSize) + " strings");
        }
        selection[i] = items[i].as_string();
    }
    return selection;
}

Json string_array(const std::vector<std::string>& values) {
    JsonArray array;
    for (const auto& value : values) {
        array.emplace_back(value);
    }
    return Json(std::move(array));
}

StoryRequest parse_story_request(const JsonObject& params) {
    StoryRequest request;
    auto it = params.find("characters");
    if (it == params.end() || !it->second.is_array()) {
        throw std::invalid_argument("characters must be an array");
    }
    for (const auto& entry : it->second.as_array()) {
        if (!entry.is_object()) {
            throw std::invalid_argument("each character must be an object");
        }
        const auto& character = entry.as_object();
        request.characters.push_back({require_string(character, "name"), require_string(character, "pronouns")});
    }
    request.topic = require_string(params, "topic");
    request.words = require_selection(params, "words");
    request.categories = require_selection(params, "categories");
    return request;
}

} // namespace

Json to_json(const ValidationResult& result) {
    JsonObject obj;
    obj["is_valid"] = Json(result.is_valid);
    obj["error_kind"] = result.error_kind ? Json(to_string(*result.error_kind)) : Json();
    obj["child_message"] = result.child_message ? Json(*result.child_message) : Json();
    obj["sanitized_text"] = result.sanitized_text ? Json(*result.sanitized_text) : Json();
    JsonArray flags;
    for (const auto& flag : result.security_flags) {
        flags.emplace_back(flag);
    }
    obj["security_flags"] = Json(std::move(flags));
    return Json(std::move(obj));
}

Json to_json(const StoryRequestReport& report) {
    JsonObject obj;
    obj["is_valid"] = Json(report.is_valid);
    obj["failure"] = report.failure ? to_json(*report.failure) : Json();
    obj["sanitized_names"] = string_array(report.sanitized_names);
    if (report.is_valid) {
        obj["topic"] = Json(report.topic);
        obj["words"] = string_array(std::vector<std::string>(report.words.begin(), report.words.end()));
    }
    return Json(std::move(obj));
}

Service::Service(SafetyController& controller,
                 std::shared_ptr<CountingAuditSink> audit_counter,
                 std::shared_ptr<WordUsageTally> usage)
    : m_controller(&controller), m_audit_counter(std::move(audit_counter)), m_usage(std::move(usage)) {
    register_builtin_handlers();
}

void Service::register_handler(const std::string& method, Handler handler) {
    m_handlers[method] = std::move(handler);
}

void Service::register_builtin_handlers() {
    register_handler("validate_name", [this](const Json& params) {
        const auto& obj = params_object(params);
        return to_json(m_controller->validate_name(require_string(obj, "name"), require_string(obj, "session_id")));
    });
    register_handler("validate_selection", [this](const Json& params) {
        const auto& obj = params_object(params);
        return to_json(m_controller->validate_selection(require_selection(obj, "words"),
                                                        require_selection(obj, "categories"),
                                                        require_string(obj, "session_id")));
    });
    register_handler("validate_character", [this](const Json& params) {
        const auto& obj = params_object(params);
        return to_json(m_controller->validate_character(require_string(obj, "name"),
                                                        require_string(obj, "pronouns"),
                                                        require_string(obj, "session_id")));
    });
    register_handler("validate_topic", [this](const Json& params) {
        return to_json(m_controller->validate_topic(require_string(params_object(params), "topic")));
    });
    register_handler("validate_story_request", [this](const Json& params) {
        const auto& obj = params_object(params);
        return to_json(m_controller->validate_story_request(parse_story_request(obj), require_string(obj, "session_id")));
    });
    register_handler("screen_story_text", [this](const Json& params) {
        return to_json(m_controller->screen_story_text(require_string(params_object(params), "text")));
    });
    register_handler("categories", [this](const Json&) {
        JsonObject categories;
        for (const auto& category : m_controller->config().categories) {
            JsonArray words;
            for (const auto& word : category.approved_words) {
                words.emplace_back(word);
            }
            categories[category.name] = Json(std::move(words));
        }
        JsonObject obj;
        obj["categories"] = Json(std::move(categories));
        obj["topics"] = string_array(m_controller->config().topics);
        obj["pronouns"] = string_array(m_controller->config().pronouns);
        return Json(std::move(obj));
    });
    register_handler("stats", [this](const Json&) {
        JsonObject obj;
        obj["sessions"] = Json(m_controller->rate_limiter().session_count());
        if (m_audit_counter) {
            JsonObject kinds;
            for (const auto& [kind, count] : m_audit_counter->by_kind()) {
                kinds[kind] = Json(count);
            }
            obj["audit_events"] = Json(m_audit_counter->total());
            obj["audit_events_by_kind"] = Json(std::move(kinds));
        }
        if (m_usage) {
            obj["usage"] = m_usage->to_json();
        }
        return Json(std::move(obj));
    });
}

void Service::run(std::istream& in, std::ostream& out) {
    std::string line;
    std::size_t served = 0;
    while (std::getline(in, line)) {
        if (line.find_first_not_of(" \t\r") == std::string::npos) {
            continue;
        }
        Request request;
        try {
            request = parse_request(line);
        } catch (const std::exception& ex) {
            log_message(LogLevel::Warning, "Service", std::string("rejected request line: ") + ex.what());
            send_error(out, Json(), ex.what());
            continue;
        }
        try {
            send_response(out, request.id, handle_request(request));
        } catch (const std::exception& ex) {
            log_message(LogLevel::Warning, "Service", request.method + " failed: " + ex.what());
            send_error(out, request.id, ex.what());
        }
        ++served;
    }
    log_message(LogLevel::Info, "Service", "input closed after " + std::to_string(served) + " requests");
}

Json Service::handle_request(const Request& request) {
    auto it = m_handlers.find(request.method);
    if (it == m_handlers.end()) {
        throw std::invalid_argument("unknown method: " + request.method);
    }
    return it->second(request.params);
}

Service::Request Service::parse_request(const std::string& line) {
    Json parsed = Json::parse(line);
    if (!parsed.is_object()) {
        throw std::invalid_argument("request must be a JSON object");
    }
    const auto& obj = parsed.as_object();
    Request request;
    if (const Json* id = parsed.find("id"); id && (id->is_string() || id->is_number())) {
        request.id = *id;
    }
    if (auto method = string_member(obj, "method")) {
        request.method = *method;
    } else {
        throw std::invalid_argument("request is missing a method");
    }
    if (const Json* params = parsed.find("params")) {
        request.params = *params;
    } else {
        request.params = Json(JsonObject{});
    }
    return request;
}

void Service::send_response(std::ostream& out, const Json& id, const Json& result) {
    JsonObject obj;
    obj["jsonrpc"] = Json("2.0");
    obj["id"] = id;
    obj["result"] = result;
    out << Json(std::move(obj)).dump() << '\n';
    out.flush();
}

void Service::send_error(std::ostream& out, const Json& id, const std::string& message) {
    JsonObject err;
    err["code"] = Json(-1);
    err["message"] = Json(message);
    JsonObject obj;
    obj["jsonrpc"] = Json("2.0");
    obj["id"] = id;
    obj["error"] = Json(std::move(err));
    out << Json(std::move(obj)).dump() << '\n';
    out.flush();
}

} // namespace storyguard
