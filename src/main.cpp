#include "storyguard/audit.hpp"
#include "storyguard/logging.hpp"
#include "storyguard/safety_config.hpp"
#include "storyguard/safety_controller.hpp"
#include "storyguard/service.hpp"
#include "storyguard/usage.hpp"

#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

namespace {

std::optional<std::string> env_value(const char* name) {
    if (const char* value = std::getenv(name); value && *value) {
        return std::string(value);
    }
    return std::nullopt;
}

storyguard::SafetyConfig startup_config() {
    using namespace storyguard;
    SafetyConfig config = default_config();
    if (auto path = env_value("STORYGUARD_CONFIG")) {
        config = load_config(*path);
        log_message(LogLevel::Info, "Main", "loaded configuration from " + *path);
    }
    apply_env_overrides(config);
    validate_config(config);
    return config;
}

// Durable sinks first, the diagnostic stream as fallback, all of it behind
// the async queue so validation never waits on I/O.
storyguard::AuditSinkPtr build_audit_sink() {
    using namespace storyguard;
    AuditSinkPtr durable;
    if (auto path = env_value("STORYGUARD_AUDIT_LOG")) {
        durable = std::make_shared<JsonlFileAuditSink>(*path);
    }
    if (auto url = env_value("STORYGUARD_AUDIT_URL")) {
        AuditSinkPtr http = std::make_shared<HttpAuditSink>(*url);
        durable = durable ? std::make_shared<FallbackAuditSink>(http, durable) : http;
    }
    AuditSinkPtr fallback = std::make_shared<LogAuditSink>();
    AuditSinkPtr chain = durable ? std::make_shared<FallbackAuditSink>(durable, fallback) : fallback;
    return std::make_shared<AsyncAuditSink>(chain);
}

} // namespace

int main() {
    using namespace storyguard;

    try {
        SharedConfig config = make_shared_config(startup_config());
        auto counter = std::make_shared<CountingAuditSink>(build_audit_sink());
        auto usage = std::make_shared<WordUsageTally>();

        SafetyController controller(config, counter);
        controller.set_usage_recorder([usage](const std::string& category, const std::string& word) {
            usage->record(category, word);
        });

        Service service(controller, counter, usage);
        std::ios::sync_with_stdio(false);
        service.run(std::cin, std::cout);
    } catch (const ConfigurationError& ex) {
        log_message(LogLevel::Error, "Main", std::string("configuration rejected: ") + ex.what());
        return 2;
    } catch (const std::exception& ex) {
        log_message(LogLevel::Error, "Main", std::string("fatal: ") + ex.what());
        return 1;
    }
    return 0;
}
