#pragma once

#include "db/iconnection_factory.hpp"
#include "db/idb_connection.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace readrouter::testing {

/**
 * @brief In-memory connection; scripted through a shared behavior block
 */
class MockConnection : public IDbConnection {
public:
    struct Behavior {
        std::atomic<bool> healthy{true};
        std::atomic<bool> timeout_ok{true};
        std::atomic<bool> lose_connection{false};   // Next execute drops the connection
        std::atomic<bool> throw_on_execute{false};
        std::atomic<int> rows_per_result{1};
        std::atomic<uint32_t> last_timeout_ms{0};
    };

    MockConnection(int id, std::shared_ptr<Behavior> behavior)
        : id_(id), behavior_(std::move(behavior)) {}

    DbResultSet execute(const std::string&, const std::vector<std::string>& params) override {
        if (behavior_->throw_on_execute) {
            throw std::runtime_error("driver exploded");
        }
        DbResultSet rs;
        if (behavior_->lose_connection.exchange(false)) {
            connected_ = false;
            rs.success = false;
            rs.connection_lost = true;
            rs.error_message = "server closed the connection unexpectedly";
            return rs;
        }
        rs.success = true;
        rs.has_rows = true;
        rs.column_names = {"conn", "params"};
        for (int i = 0; i < behavior_->rows_per_result; ++i) {
            rs.rows.push_back({std::to_string(id_), std::to_string(params.size())});
            rs.null_mask.push_back({false, false});
        }
        return rs;
    }

    bool is_healthy(const std::string&) override { return connected_ && behavior_->healthy; }
    bool is_connected() const override { return connected_; }

    bool set_query_timeout(uint32_t timeout_ms) override {
        behavior_->last_timeout_ms = timeout_ms;
        return behavior_->timeout_ok;
    }

    void close() override { connected_ = false; }

    int id() const { return id_; }

private:
    int id_;
    std::shared_ptr<Behavior> behavior_;
    bool connected_ = true;
};

/// Counts connections it creates; can be told to refuse
class MockConnectionFactory : public IConnectionFactory {
public:
    MockConnectionFactory() : behavior_(std::make_shared<MockConnection::Behavior>()) {}

    std::unique_ptr<IDbConnection> create(const std::string& connection_string) override {
        {
            std::lock_guard lock(mutex_);
            last_connection_string_ = connection_string;
        }
        if (refuse_) {
            return nullptr;
        }
        return std::make_unique<MockConnection>(next_id_.fetch_add(1), behavior_);
    }

    int total_created() const { return next_id_.load(); }
    void set_refuse(bool refuse) { refuse_ = refuse; }
    MockConnection::Behavior& behavior() { return *behavior_; }

    std::string last_connection_string() const {
        std::lock_guard lock(mutex_);
        return last_connection_string_;
    }

private:
    std::shared_ptr<MockConnection::Behavior> behavior_;
    std::atomic<int> next_id_{0};
    std::atomic<bool> refuse_{false};
    mutable std::mutex mutex_;
    std::string last_connection_string_;
};

} // namespace readrouter::testing
