#include "storyguard/audit.hpp"
#include "storyguard/logging.hpp"
#include "storyguard/net/http.hpp"

#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace storyguard {

namespace {

constexpr std::chrono::milliseconds kDefaultHttpTimeout{2000};

std::chrono::milliseconds http_timeout_from_env() {
    const char* raw = std::getenv("STORYGUARD_HTTP_TIMEOUT_MS");
    if (!raw) {
        return kDefaultHttpTimeout;
    }
    char* end = nullptr;
    const long parsed = std::strtol(raw, &end, 10);
    if (end == raw || *end != '\0' || parsed <= 0) {
        log_message(LogLevel::Warning, "Audit", "ignoring invalid STORYGUARD_HTTP_TIMEOUT_MS");
        return kDefaultHttpTimeout;
    }
    return std::chrono::milliseconds(parsed);
}

} // namespace

const char* to_string(SecurityEventKind kind) noexcept {
    switch (kind) {
    case SecurityEventKind::PromptInjection: return "prompt_injection";
    case SecurityEventKind::InappropriateContent: return "inappropriate_content";
    case SecurityEventKind::CharacterRuleViolation: return "character_rule_violation";
    case SecurityEventKind::InappropriateCombination: return "inappropriate_combination";
    case SecurityEventKind::CooldownStarted: return "cooldown_started";
    }
    return "unknown";
}

std::string format_timestamp(std::chrono::system_clock::time_point timestamp) {
    const std::time_t t = std::chrono::system_clock::to_time_t(timestamp);
    std::tm tm{};
#ifdef _WIN32
    gmtime_s(&tm, &t);
#else
    gmtime_r(&t, &tm);
#endif
    const auto millis =
        std::chrono::duration_cast<std::chrono::milliseconds>(timestamp.time_since_epoch()).count() % 1000;
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
    return oss.str();
}

Json to_json(const SecurityEvent& event) {
    JsonArray rule_ids;
    for (const auto& id : event.matched_rule_ids) {
        rule_ids.emplace_back(id);
    }
    JsonObject obj;
    obj["timestamp"] = Json(format_timestamp(event.timestamp));
    obj["session_id"] = Json(event.session_id);
    obj["event_kind"] = Json(to_string(event.event_kind));
    obj["matched_rule_ids"] = Json(std::move(rule_ids));
    return Json(std::move(obj));
}

LogAuditSink::LogAuditSink() : m_out(&std::clog) {}

LogAuditSink::LogAuditSink(std::ostream& out) : m_out(&out) {}

void LogAuditSink::emit(const SecurityEvent& event) {
    const std::string line = "[Audit] " + to_json(event).dump() + '\n';
    std::scoped_lock lock(m_mutex);
    *m_out << line;
    m_out->flush();
    if (!*m_out) {
        throw std::runtime_error("audit log stream is not writable");
    }
}

JsonlFileAuditSink::JsonlFileAuditSink(std::filesystem::path path) : m_path(std::move(path)) {
    if (m_path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(m_path.parent_path(), ec);
    }
    m_file.open(m_path, std::ios::app);
    if (!m_file) {
        throw std::runtime_error("unable to open audit log " + m_path.string());
    }
}

void JsonlFileAuditSink::emit(const SecurityEvent& event) {
    const std::string line = to_json(event).dump();
    std::scoped_lock lock(m_mutex);
    m_file << line << '\n';
    m_file.flush();
    if (!m_file) {
        throw std::runtime_error("failed to append to audit log " + m_path.string());
    }
}

HttpAuditSink::HttpAuditSink(std::string url, std::chrono::milliseconds timeout)
    : m_url(std::move(url)), m_timeout(timeout.count() > 0 ? timeout : http_timeout_from_env()) {
    if (m_url.empty()) {
        throw std::invalid_argument("audit collector url must not be empty");
    }
}

void HttpAuditSink::emit(const SecurityEvent& event) {
    net::post_json(m_url, to_json(event).dump(), m_timeout);
}

FallbackAuditSink::FallbackAuditSink(AuditSinkPtr primary, AuditSinkPtr secondary)
    : m_primary(std::move(primary)), m_secondary(std::move(secondary)) {
    if (!m_primary) {
        throw std::invalid_argument("fallback audit sink requires a primary sink");
    }
}

void FallbackAuditSink::emit(const SecurityEvent& event) {
    try {
        m_primary->emit(event);
        return;
    } catch (const std::exception& ex) {
        log_message(LogLevel::Warning, "Audit", std::string("primary sink failed: ") + ex.what());
    } catch (...) {
        log_message(LogLevel::Warning, "Audit", "primary sink failed with an unknown exception");
    }
    if (!m_secondary) {
        return;
    }
    try {
        m_secondary->emit(event);
    } catch (const std::exception& ex) {
        log_message(LogLevel::Warning, "Audit", std::string("fallback sink failed, event dropped: ") + ex.what());
    } catch (...) {
        log_message(LogLevel::Warning, "Audit", "fallback sink failed with an unknown exception, event dropped");
    }
}

AsyncAuditSink::AsyncAuditSink(AuditSinkPtr inner, std::size_t capacity)
    : m_inner(std::move(inner)), m_capacity(capacity == 0 ? 1 : capacity) {
    if (!m_inner) {
        throw std::invalid_argument("async audit sink requires an inner sink");
    }
    m_worker = std::thread([this] { run(); });
}

AsyncAuditSink::~AsyncAuditSink() {
    {
        std::scoped_lock lock(m_mutex);
        m_stopping = true;
    }
    m_ready.notify_all();
    if (m_worker.joinable()) {
        m_worker.join();
    }
}

void AsyncAuditSink::emit(const SecurityEvent& event) {
    {
        std::scoped_lock lock(m_mutex);
        if (m_queue.size() >= m_capacity) {
            ++m_dropped;
            return;
        }
        m_queue.push_back(event);
    }
    m_ready.notify_one();
}

void AsyncAuditSink::flush() {
    std::unique_lock lock(m_mutex);
    m_idle.wait(lock, [this] { return m_queue.empty() && !m_busy; });
}

std::size_t AsyncAuditSink::dropped_events() const {
    std::scoped_lock lock(m_mutex);
    return m_dropped;
}

std::size_t AsyncAuditSink::failed_events() const {
    std::scoped_lock lock(m_mutex);
    return m_failed;
}

void AsyncAuditSink::run() {
    std::unique_lock lock(m_mutex);
    while (true) {
        m_ready.wait(lock, [this] { return m_stopping || !m_queue.empty(); });
        if (m_queue.empty()) {
            // Stopping with nothing left to drain.
            break;
        }
        SecurityEvent event = std::move(m_queue.front());
        m_queue.pop_front();
        m_busy = true;
        lock.unlock();

        bool failed = false;
        try {
            m_inner->emit(event);
        } catch (const std::exception& ex) {
            failed = true;
            log_message(LogLevel::Warning, "Audit", std::string("async delivery failed: ") + ex.what());
        } catch (...) {
            failed = true;
            log_message(LogLevel::Warning, "Audit", "async delivery failed with an unknown exception");
        }

        lock.lock();
        if (failed) {
            ++m_failed;
        }
        m_busy = false;
        if (m_queue.empty()) {
            m_idle.notify_all();
        }
    }
    m_idle.notify_all();
}

void MemoryAuditSink::emit(const SecurityEvent& event) {
    std::scoped_lock lock(m_mutex);
    m_events.push_back(event);
}

std::vector<SecurityEvent> MemoryAuditSink::events() const {
    std::scoped_lock lock(m_mutex);
    return m_events;
}

std::size_t MemoryAuditSink::size() const {
    std::scoped_lock lock(m_mutex);
    return m_events.size();
}

void MemoryAuditSink::clear() {
    std::scoped_lock lock(m_mutex);
    m_events.clear();
}

CountingAuditSink::CountingAuditSink(AuditSinkPtr inner) : m_inner(std::move(inner)) {}

void CountingAuditSink::emit(const SecurityEvent& event) {
    {
        std::scoped_lock lock(m_mutex);
        ++m_counts[to_string(event.event_kind)];
        ++m_total;
    }
    if (m_inner) {
        m_inner->emit(event);
    }
}

std::size_t CountingAuditSink::total() const {
    std::scoped_lock lock(m_mutex);
    return m_total;
}

std::map<std::string, std::size_t> CountingAuditSink::by_kind() const {
    std::scoped_lock lock(m_mutex);
    return m_counts;
}

} // namespace storyguard
