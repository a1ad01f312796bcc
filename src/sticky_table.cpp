#include "sticky_table.hpp"
#include <boost/uuid/uuid_io.hpp>

namespace slb {

StickyTable::StickyTable(size_t capacity, std::chrono::milliseconds idle_ttl)
    : capacity_(capacity), idle_ttl_(idle_ttl) {}

std::optional<std::string> StickyTable::find(const std::string& session_id) {
    std::lock_guard lock(mutex_);
    auto now = Clock::now();

    auto it = by_session_.find(session_id);
    if (it == by_session_.end()) {
        return std::nullopt;
    }
    if (expired(*it->second, now)) {
        erase(it->second);
        return std::nullopt;
    }
    touch(it->second, now);
    return lru_.front().address;
}

SessionToken StickyTable::assign(const std::string& session_id, const std::string& address) {
    std::lock_guard lock(mutex_);
    auto now = Clock::now();

    auto existing = by_session_.find(session_id);
    if (existing != by_session_.end()) {
        erase(existing->second);
    }

    SessionToken token{boost::uuids::to_string(token_generator_())};
    lru_.push_front(Entry{session_id, token, address, now});
    by_session_[session_id] = lru_.begin();
    by_token_[token.value] = lru_.begin();

    evict(now);
    return token;
}

std::optional<SessionToken> StickyTable::token_for(const std::string& session_id) {
    std::lock_guard lock(mutex_);

    auto it = by_session_.find(session_id);
    if (it == by_session_.end() || expired(*it->second, Clock::now())) {
        return std::nullopt;
    }
    return it->second->token;
}

std::optional<std::string> StickyTable::address_for_token(const SessionToken& token) {
    std::lock_guard lock(mutex_);
    auto now = Clock::now();

    auto it = by_token_.find(token.value);
    if (it == by_token_.end()) {
        return std::nullopt;
    }
    if (expired(*it->second, now)) {
        erase(it->second);
        return std::nullopt;
    }
    touch(it->second, now);
    return lru_.front().address;
}

size_t StickyTable::size() const {
    std::lock_guard lock(mutex_);
    return lru_.size();
}

bool StickyTable::expired(const Entry& entry, Clock::time_point now) const {
    return idle_ttl_.count() > 0 && now - entry.last_used >= idle_ttl_;
}

void StickyTable::touch(EntryList::iterator it, Clock::time_point now) {
    it->last_used = now;
    lru_.splice(lru_.begin(), lru_, it);
}

void StickyTable::erase(EntryList::iterator it) {
    by_token_.erase(it->token.value);
    by_session_.erase(it->session_id);
    lru_.erase(it);
}

void StickyTable::evict(Clock::time_point now) {
    // Idle entries collect at the back of the list
    while (!lru_.empty() && expired(lru_.back(), now)) {
        erase(std::prev(lru_.end()));
    }
    while (capacity_ > 0 && lru_.size() > capacity_) {
        erase(std::prev(lru_.end()));
    }
}

} // namespace slb
