#include "session/session_store.hpp"

#include <algorithm>

namespace readrouter {

// ============================================================================
// Shard
// ============================================================================

std::shared_ptr<SessionStore::Entry> SessionStore::Shard::get_or_create(const std::string& session_id) {
    std::lock_guard lock(mutex_);
    auto& entry = entries_[session_id];
    if (!entry) {
        entry = std::make_shared<Entry>();
        entry->state.session_id = session_id;
    }
    return entry;
}

std::shared_ptr<SessionStore::Entry> SessionStore::Shard::find(const std::string& session_id) const {
    std::lock_guard lock(mutex_);
    const auto it = entries_.find(session_id);
    return it == entries_.end() ? nullptr : it->second;
}

void SessionStore::Shard::erase(const std::string& session_id) {
    std::lock_guard lock(mutex_);
    entries_.erase(session_id);
}

size_t SessionStore::Shard::size() const {
    std::lock_guard lock(mutex_);
    return entries_.size();
}

// ============================================================================
// SessionStore
// ============================================================================

SessionStore::SessionStore(size_t num_shards) {
    const size_t n = std::max(num_shards, size_t{1});
    shards_.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        shards_.push_back(std::make_unique<Shard>());
    }
}

SessionStore::Shard& SessionStore::shard_for(const std::string& session_id) const {
    return *shards_[std::hash<std::string>{}(session_id) % shards_.size()];
}

void SessionStore::update(const std::string& session_id, const std::function<void(Entry&)>& fn) {
    const auto entry = shard_for(session_id).get_or_create(session_id);
    std::lock_guard lock(entry->mutex);
    fn(*entry);
}

SessionState SessionStore::snapshot(const std::string& session_id) {
    const auto entry = shard_for(session_id).get_or_create(session_id);
    std::lock_guard lock(entry->mutex);
    return entry->state;
}

uint64_t SessionStore::unknown_epoch(const std::string& session_id) {
    uint64_t epoch = 0;
    update(session_id, [&epoch](Entry& e) { epoch = e.unknown_marks; });
    return epoch;
}

void SessionStore::record_write_time(const std::string& session_id, SteadyClock::time_point when) {
    update(session_id, [when](Entry& e) {
        if (!e.state.last_write_time || *e.state.last_write_time < when) {
            e.state.last_write_time = when;
        }
    });
}

void SessionStore::record_write_position(
    const std::string& session_id, uint64_t epoch_before_query, const LogPosition& position) {
    update(session_id, [epoch_before_query, &position](Entry& e) {
        if (!e.state.last_write_position || !e.state.last_write_position->reached(position)) {
            e.state.last_write_position = position;
        }
        // Every unknown write marked before our query committed before it
        if (e.unknown_marks == epoch_before_query) {
            e.state.position_unknown = false;
        }
    });
}

void SessionStore::mark_position_unknown(const std::string& session_id) {
    update(session_id, [](Entry& e) {
        ++e.unknown_marks;
        e.state.position_unknown = true;
    });
}

void SessionStore::erase(const std::string& session_id) {
    shard_for(session_id).erase(session_id);
}

bool SessionStore::contains(const std::string& session_id) const {
    return shard_for(session_id).find(session_id) != nullptr;
}

size_t SessionStore::size() const {
    size_t total = 0;
    for (const auto& shard : shards_) {
        total += shard->size();
    }
    return total;
}

} // namespace readrouter
