#pragma once

#include "audit.hpp"
#include "json.hpp"
#include "safety_controller.hpp"
#include "usage.hpp"

#include <functional>
#include <istream>
#include <map>
#include <memory>
#include <optional>
#include <ostream>
#include <string>

namespace storyguard {

// JSON-lines front end: one request object per input line, one response
// object per output line.
class Service {
public:
    struct Request {
        Json id;
        std::string method;
        Json params;
    };

    using Handler = std::function<Json(const Json& params)>;

    Service(SafetyController& controller,
            std::shared_ptr<CountingAuditSink> audit_counter,
            std::shared_ptr<WordUsageTally> usage);

    // Serves until end of input. A malformed line gets an error response and
    // the loop carries on.
    void run(std::istream& in, std::ostream& out);

    Json handle_request(const Request& request);

    // Throws JsonParseError or std::invalid_argument.
    static Request parse_request(const std::string& line);
    static void send_response(std::ostream& out, const Json& id, const Json& result);
    static void send_error(std::ostream& out, const Json& id, const std::string& message);

private:
    SafetyController* m_controller;
    std::shared_ptr<CountingAuditSink> m_audit_counter;
    std::shared_ptr<WordUsageTally> m_usage;
    std::map<std::string, Handler> m_handlers;

    void register_handler(const std::string& method, Handler handler);
    void register_builtin_handlers();
};

Json to_json(const ValidationResult& result);
Json to_json(const StoryRequestReport& report);

} // namespace storyguard
