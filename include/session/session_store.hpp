#pragma once

#include "core/clock.hpp"
#include "replication/log_position.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace readrouter {

/**
 * @brief Per-session routing history
 */
struct SessionState {
    std::string session_id;
    std::optional<SteadyClock::time_point> last_write_time;
    std::optional<LogPosition> last_write_position;

    // A write committed but its log position could not be read. Reads must
    // not trust any replica until a later write records a position.
    bool position_unknown = false;
};

/**
 * @brief Explicit, injectable store of session state keyed by session id
 *
 * Sharded like the result cache: a shard mutex guards only the id → entry
 * index, and each entry has its own mutex guarding its state, so updates to
 * one session never contend with unrelated sessions and a reader always sees
 * a whole state, never a half-applied update.
 *
 * Updates are monotonic: concurrent writes of one session that finish out of
 * order never move last_write_time or last_write_position backwards.
 */
class SessionStore {
public:
    explicit SessionStore(size_t num_shards = 16);

    SessionStore(const SessionStore&) = delete;
    SessionStore& operator=(const SessionStore&) = delete;

    /// Consistent copy of a session's state; creates the session if absent
    [[nodiscard]] SessionState snapshot(const std::string& session_id);

    /**
     * @brief Count of position-unknown marks so far for this session
     *
     * Read immediately before querying the primary's position. If another
     * write of the session is marked unknown while that query is in flight,
     * its commit may be newer than the position we read, so the session
     * stays pinned to the primary.
     */
    [[nodiscard]] uint64_t unknown_epoch(const std::string& session_id);

    void record_write_time(const std::string& session_id, SteadyClock::time_point when);

    void record_write_position(const std::string& session_id, uint64_t epoch_before_query,
                               const LogPosition& position);

    void mark_position_unknown(const std::string& session_id);

    void erase(const std::string& session_id);

    [[nodiscard]] bool contains(const std::string& session_id) const;

    [[nodiscard]] size_t size() const;

private:
    struct Entry {
        std::mutex mutex;
        SessionState state;
        uint64_t unknown_marks = 0;
    };

    class Shard {
    public:
        std::shared_ptr<Entry> get_or_create(const std::string& session_id);
        std::shared_ptr<Entry> find(const std::string& session_id) const;
        void erase(const std::string& session_id);
        size_t size() const;

    private:
        mutable std::mutex mutex_;
        std::unordered_map<std::string, std::shared_ptr<Entry>> entries_;
    };

    [[nodiscard]] Shard& shard_for(const std::string& session_id) const;

    void update(const std::string& session_id, const std::function<void(Entry&)>& fn);

    std::vector<std::unique_ptr<Shard>> shards_;
};

} // namespace readrouter
