#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <format>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <spdlog/spdlog.h>
#include "database_connection.hpp"
#include "database_driver.hpp"

namespace gleipnir {

    class database_pool;

    /**
     * RAII connection handle from pool; returned on destruction.
     * A handle that outlives its pool drops the connection instead, which
     * closes it once nothing else holds it.
     */
    class pooled_connection {
    public:
        pooled_connection() = default;

        pooled_connection(std::shared_ptr<database_connection> conn, database_pool* pool,
                          std::weak_ptr<void> pool_alive)
            : conn_(std::move(conn)), pool_(pool), pool_alive_(std::move(pool_alive)) {}

        ~pooled_connection() {
            release();
        }

        // Disable copy, enable move
        pooled_connection(const pooled_connection&) = delete;
        pooled_connection& operator=(const pooled_connection&) = delete;

        pooled_connection(pooled_connection&& other) noexcept
            : conn_(std::move(other.conn_)),
              pool_(std::exchange(other.pool_, nullptr)),
              pool_alive_(std::move(other.pool_alive_)) {}

        pooled_connection& operator=(pooled_connection&& other) noexcept {
            if (this != &other) {
                release();
                conn_ = std::move(other.conn_);
                pool_ = std::exchange(other.pool_, nullptr);
                pool_alive_ = std::move(other.pool_alive_);
            }
            return *this;
        }

        database_connection* operator->() { return conn_.get(); }
        const database_connection* operator->() const { return conn_.get(); }
        database_connection& operator*() { return *conn_; }
        const database_connection& operator*() const { return *conn_; }

        [[nodiscard]] bool valid() const noexcept { return conn_ != nullptr; }
        explicit operator bool() const noexcept { return valid(); }

        // Return the connection now instead of at destruction
        void release() noexcept;

    private:
        std::shared_ptr<database_connection> conn_;
        database_pool* pool_ = nullptr;
        std::weak_ptr<void> pool_alive_;
    };

    /**
     * Thread-safe connection pool.
     *
     * The pool must outlive the threads using its connections. Connections
     * still borrowed when it is destroyed are not returned: pooled_connection
     * handles drop theirs, and borrow() callers must not give_back() to a
     * destroyed pool.
     */
    class database_pool {
    public:
        struct pool_config {
            connection_config connection;
            std::size_t min_connections = 2;
            std::size_t max_connections = 10;
            std::chrono::milliseconds acquire_timeout{5000};
            bool validate_on_acquire = true;
        };

        explicit database_pool(const pool_config& config)
            : config_(config) {

            if (config_.max_connections == 0) {
                throw database_error{"max_connections must be positive"};
            }
            if (config_.min_connections > config_.max_connections) {
                throw database_error{"min_connections cannot exceed max_connections"};
            }

            // Create minimum connections
            for (std::size_t i = 0; i < config_.min_connections; ++i) {
                try {
                    available_.push_back(create_connection());
                } catch (const database_error&) {
                    shutdown();
                    throw;
                }
            }
            spdlog::debug("Connection pool initialized with {} connections", available_.size());
        }

        ~database_pool() {
            alive_.reset();
            shutdown();

            std::lock_guard<std::mutex> lock(mutex_);
            if (!busy_.empty()) {
                spdlog::warn("Connection pool destroyed with {} connections still borrowed",
                             busy_.size());
            }
        }

        // Disable copy and move
        database_pool(const database_pool&) = delete;
        database_pool& operator=(const database_pool&) = delete;
        database_pool(database_pool&&) = delete;
        database_pool& operator=(database_pool&&) = delete;

        // Acquire a connection that goes back to the pool when the handle dies
        [[nodiscard]] pooled_connection acquire(
            std::optional<std::chrono::milliseconds> timeout = std::nullopt) {
            return pooled_connection(checkout(timeout.value_or(config_.acquire_timeout)), this, alive_);
        }

        // Borrow a connection; it stays checked out until give_back()
        [[nodiscard]] std::shared_ptr<database_connection> borrow(
            std::optional<std::chrono::milliseconds> timeout = std::nullopt) {
            return checkout(timeout.value_or(config_.acquire_timeout));
        }

        /**
         * Return a borrowed connection. A connection left inside a transaction
         * is rolled back first; one that is broken is closed and dropped.
         */
        void give_back(database_connection& conn) {
            std::shared_ptr<database_connection> owned;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                auto it = busy_.find(&conn);
                if (it == busy_.end()) {
                    throw database_error{"Connection was not borrowed from this pool"};
                }
                owned = std::move(it->second);
                busy_.erase(it);
            }

            bool reusable = owned->is_connected();
            if (reusable && !owned->is_idle()) {
                try {
                    owned->rollback();
                } catch (const database_error& e) {
                    spdlog::warn("Discarding pooled connection, rollback failed: {}", e.what());
                    reusable = false;
                }
            }

            std::lock_guard<std::mutex> lock(mutex_);
            if (shutdown_ || !reusable) {
                owned->close();
            } else {
                available_.push_back(std::move(owned));
            }
            cv_.notify_one();
        }

        // Run func with a connection borrowed for the duration of the call
        template<typename Func>
        requires std::invocable<Func, database_connection&>
        auto with_connection(Func&& func) -> std::invoke_result_t<Func, database_connection&> {
            auto conn = acquire();
            return std::invoke(std::forward<Func>(func), *conn);
        }

        // Get pool statistics
        struct pool_stats {
            std::size_t active_connections;
            std::size_t available_connections;
            std::size_t total_connections;
            std::size_t max_connections;
        };

        [[nodiscard]] pool_stats get_stats() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return pool_stats{
                .active_connections = busy_.size(),
                .available_connections = available_.size(),
                .total_connections = busy_.size() + available_.size(),
                .max_connections = config_.max_connections
            };
        }

        // True while conn is checked out of this pool
        [[nodiscard]] bool is_borrowed(const database_connection& conn) const {
            std::lock_guard<std::mutex> lock(mutex_);
            return busy_.contains(&conn);
        }

        // Close idle connections and refuse further checkouts
        void shutdown() {
            std::lock_guard<std::mutex> lock(mutex_);
            shutdown_ = true;

            for (auto& conn : available_) {
                conn->close();
            }
            available_.clear();

            cv_.notify_all();
        }

        [[nodiscard]] bool is_shutdown() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return shutdown_;
        }

        [[nodiscard]] const pool_config& config() const noexcept { return config_; }

    private:
        std::shared_ptr<database_connection> checkout(std::chrono::milliseconds timeout) {
            using namespace std::chrono;
            auto deadline = steady_clock::now() + timeout;

            std::unique_lock<std::mutex> lock(mutex_);

            while (true) {
                if (shutdown_) {
                    throw database_error{"Pool is shutting down"};
                }

                // Try to get available connection
                if (!available_.empty()) {
                    auto conn = std::move(available_.front());
                    available_.pop_front();

                    // Replace a dead connection if configured
                    if (config_.validate_on_acquire && !conn->is_connected()) {
                        spdlog::debug("Replacing dead pooled connection");
                        conn->close();
                        conn = create_connection();
                    }
                    return lend(std::move(conn));
                }

                // Try to create new connection if under max limit
                if (busy_.size() < config_.max_connections) {
                    return lend(create_connection());
                }

                // Wait for connection to become available
                if (cv_.wait_until(lock, deadline) == std::cv_status::timeout
                    && available_.empty() && busy_.size() >= config_.max_connections) {
                    throw database_error{"Timeout waiting for connection"};
                }
            }
        }

        // Caller holds mutex_
        std::shared_ptr<database_connection> lend(std::shared_ptr<database_connection> conn) {
            busy_.emplace(conn.get(), conn);
            return conn;
        }

        std::shared_ptr<database_connection> create_connection() {
            return open_connection(config_.connection);
        }

        pool_config config_;
        mutable std::mutex mutex_;
        std::condition_variable cv_;
        std::deque<std::shared_ptr<database_connection>> available_;
        std::unordered_map<const database_connection*, std::shared_ptr<database_connection>> busy_;
        bool shutdown_ = false;
        // Expires when the pool is destroyed; watched by pooled_connection
        std::shared_ptr<void> alive_ = std::make_shared<int>(0);
    };

    inline void pooled_connection::release() noexcept {
        if (conn_ && pool_ && !pool_alive_.expired()) {
            try {
                pool_->give_back(*conn_);
            } catch (const database_error& e) {
                spdlog::error("Failed to return pooled connection: {}", e.what());
            }
        }
        conn_.reset();
        pool_ = nullptr;
        pool_alive_.reset();
    }

} // namespace gleipnir
