#pragma once

#include <boost/uuid/random_generator.hpp>
#include <chrono>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace slb {

// Opaque handle for one session -> upstream association.
struct SessionToken {
    std::string value;

    bool operator==(const SessionToken&) const = default;
};

// Session affinity table. Bounded by capacity (least recently used entry goes
// first) and by idle time; a zero for either disables that bound.
class StickyTable {
public:
    StickyTable(size_t capacity, std::chrono::milliseconds idle_ttl);

    StickyTable(const StickyTable&) = delete;
    StickyTable& operator=(const StickyTable&) = delete;

    // Address recorded for the session; refreshes its recency.
    std::optional<std::string> find(const std::string& session_id);

    // Replaces any existing association and issues a fresh token for it.
    SessionToken assign(const std::string& session_id, const std::string& address);

    std::optional<SessionToken> token_for(const std::string& session_id);
    std::optional<std::string> address_for_token(const SessionToken& token);

    size_t size() const;

private:
    using Clock = std::chrono::steady_clock;

    struct Entry {
        std::string session_id;
        SessionToken token;
        std::string address;
        Clock::time_point last_used;
    };

    using EntryList = std::list<Entry>;

    bool expired(const Entry& entry, Clock::time_point now) const;
    void touch(EntryList::iterator it, Clock::time_point now);
    void erase(EntryList::iterator it);
    void evict(Clock::time_point now);

    size_t capacity_;
    std::chrono::milliseconds idle_ttl_;

    EntryList lru_;  // most recently used first
    std::unordered_map<std::string, EntryList::iterator> by_session_;
    std::unordered_map<std::string, EntryList::iterator> by_token_;
    boost::uuids::random_generator token_generator_;
    mutable std::mutex mutex_;
};

} // namespace slb
