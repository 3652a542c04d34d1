#pragma once

#include "json.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <fstream>
#include <map>
#include <filesystem>
#include <iosfwd>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace storyguard {

enum class SecurityEventKind {
    PromptInjection,
    InappropriateContent,
    CharacterRuleViolation,
    InappropriateCombination,
    CooldownStarted
};

// Metadata only: an event never carries the text that triggered it.
struct SecurityEvent {
    std::chrono::system_clock::time_point timestamp;
    std::string session_id;
    SecurityEventKind event_kind = SecurityEventKind::CharacterRuleViolation;
    std::set<std::string> matched_rule_ids;
};

const char* to_string(SecurityEventKind kind) noexcept;
std::string format_timestamp(std::chrono::system_clock::time_point timestamp);
Json to_json(const SecurityEvent& event);

struct AuditSink {
    virtual ~AuditSink() = default;
    // May throw; callers treat delivery as best effort.
    virtual void emit(const SecurityEvent& event) = 0;
};

using AuditSinkPtr = std::shared_ptr<AuditSink>;

class LogAuditSink : public AuditSink {
public:
    LogAuditSink();
    explicit LogAuditSink(std::ostream& out);

    void emit(const SecurityEvent& event) override;

private:
    std::ostream* m_out;
    std::mutex m_mutex;
};

class JsonlFileAuditSink : public AuditSink {
public:
    explicit JsonlFileAuditSink(std::filesystem::path path);

    void emit(const SecurityEvent& event) override;

    const std::filesystem::path& path() const noexcept { return m_path; }

private:
    std::filesystem::path m_path;
    std::ofstream m_file;
    std::mutex m_mutex;
};

class HttpAuditSink : public AuditSink {
public:
    // A non-positive timeout defers to STORYGUARD_HTTP_TIMEOUT_MS, then 2 s.
    explicit HttpAuditSink(std::string url, std::chrono::milliseconds timeout = std::chrono::milliseconds::zero());

    void emit(const SecurityEvent& event) override;

    std::chrono::milliseconds timeout() const noexcept { return m_timeout; }

private:
    std::string m_url;
    std::chrono::milliseconds m_timeout;
};

class FallbackAuditSink : public AuditSink {
public:
    FallbackAuditSink(AuditSinkPtr primary, AuditSinkPtr secondary);

    // Never throws: a failing secondary drops the event.
    void emit(const SecurityEvent& event) override;

private:
    AuditSinkPtr m_primary;
    AuditSinkPtr m_secondary;
};

// Moves delivery onto a worker thread. emit() only enqueues; a full queue
// drops the event.
class AsyncAuditSink : public AuditSink {
public:
    explicit AsyncAuditSink(AuditSinkPtr inner, std::size_t capacity = 1024);
    ~AsyncAuditSink() override;

    AsyncAuditSink(const AsyncAuditSink&) = delete;
    AsyncAuditSink& operator=(const AsyncAuditSink&) = delete;

    void emit(const SecurityEvent& event) override;

    // Blocks until every queued event has been handed to the inner sink.
    void flush();

    std::size_t dropped_events() const;
    std::size_t failed_events() const;

private:
    AuditSinkPtr m_inner;
    std::size_t m_capacity;
    mutable std::mutex m_mutex;
    std::condition_variable m_ready;
    std::condition_variable m_idle;
    std::deque<SecurityEvent> m_queue;
    bool m_stopping = false;
    bool m_busy = false;
    std::size_t m_dropped = 0;
    std::size_t m_failed = 0;
    std::thread m_worker;

    void run();
};

class MemoryAuditSink : public AuditSink {
public:
    void emit(const SecurityEvent& event) override;

    std::vector<SecurityEvent> events() const;
    std::size_t size() const;
    void clear();

private:
    mutable std::mutex m_mutex;
    std::vector<SecurityEvent> m_events;
};

// Tallies events per kind before handing them to an optional inner sink.
class CountingAuditSink : public AuditSink {
public:
    explicit CountingAuditSink(AuditSinkPtr inner = nullptr);

    void emit(const SecurityEvent& event) override;

    std::size_t total() const;
    std::map<std::string, std::size_t> by_kind() const;

private:
    AuditSinkPtr m_inner;
    mutable std::mutex m_mutex;
    std::map<std::string, std::size_t> m_counts;
    std::size_t m_total = 0;
};

} // namespace storyguard
