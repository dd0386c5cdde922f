#pragma once

#include <cstddef>
#include <format>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>
#include <spdlog/spdlog.h>
#include "database_connection.hpp"
#include "pg_connection.hpp"

namespace gleipnir {

    // Opens a session for a configuration
    using connector = std::function<std::shared_ptr<database_connection>(const connection_config&)>;

    /**
     * Process-wide table of drivers, keyed by connection_config::driver.
     * "postgresql" (libpq) is always registered.
     */
    class driver_registry {
    public:
        static driver_registry& instance() {
            static driver_registry registry;
            return registry;
        }

        driver_registry(const driver_registry&) = delete;
        driver_registry& operator=(const driver_registry&) = delete;

        // Replaces any driver already registered under the same name
        void register_driver(std::string name, connector factory) {
            std::lock_guard<std::mutex> lock(mutex_);
            drivers_.insert_or_assign(std::move(name), std::move(factory));
        }

        bool unregister_driver(std::string_view name) {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = drivers_.find(name);
            if (it == drivers_.end()) {
                return false;
            }
            drivers_.erase(it);
            return true;
        }

        [[nodiscard]] std::optional<connector> find(std::string_view name) const {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = drivers_.find(name);
            if (it == drivers_.end()) {
                return std::nullopt;
            }
            return it->second;
        }

    private:
        driver_registry() {
            drivers_.emplace("postgresql", [](const connection_config& config) {
                return std::make_shared<pg_connection>(config);
            });
        }

        mutable std::mutex mutex_;
        std::map<std::string, connector, std::less<>> drivers_;
    };

    // Open a brand-new session; the caller owns it
    [[nodiscard]] inline std::shared_ptr<database_connection> open_connection(const connection_config& config) {
        auto factory = driver_registry::instance().find(config.driver);
        if (!factory) {
            throw database_error{std::format("No driver registered under '{}'", config.driver)};
        }

        auto conn = (*factory)(config);
        if (!conn) {
            throw database_error{std::format("Driver '{}' returned no connection", config.driver)};
        }
        spdlog::debug("Opened {} connection to {}:{}", config.driver, config.host, config.port);
        return conn;
    }

    /**
     * Connections opened from a configuration outside with_connection().
     *
     * The call that opened one returns without releasing it, so the registry
     * keeps it open (the way a pool keeps a borrowed connection checked out)
     * until the caller hands it back with release().
     */
    class detached_connections {
    public:
        static detached_connections& instance() {
            static detached_connections registry;
            return registry;
        }

        detached_connections(const detached_connections&) = delete;
        detached_connections& operator=(const detached_connections&) = delete;

        // Open a connection for config and keep it open until released
        [[nodiscard]] std::shared_ptr<database_connection> open(const connection_config& config) {
            auto conn = open_connection(config);
            std::lock_guard<std::mutex> lock(mutex_);
            connections_.emplace(conn.get(), conn);
            return conn;
        }

        [[nodiscard]] bool contains(const database_connection& conn) const {
            std::lock_guard<std::mutex> lock(mutex_);
            return connections_.contains(&conn);
        }

        // Close a connection opened by open(); false when it is not held here
        bool release(database_connection& conn) {
            std::shared_ptr<database_connection> held;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                auto it = connections_.find(&conn);
                if (it == connections_.end()) {
                    return false;
                }
                held = std::move(it->second);
                connections_.erase(it);
            }
            held->close();
            spdlog::debug("Released detached connection");
            return true;
        }

        [[nodiscard]] std::vector<std::shared_ptr<database_connection>> connections() const {
            std::lock_guard<std::mutex> lock(mutex_);
            std::vector<std::shared_ptr<database_connection>> result;
            result.reserve(connections_.size());
            for (const auto& [key, conn] : connections_) {
                result.push_back(conn);
            }
            return result;
        }

        [[nodiscard]] std::size_t size() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return connections_.size();
        }

        // Close everything still held; returns how many were closed
        std::size_t close_all() {
            std::unordered_map<const database_connection*, std::shared_ptr<database_connection>> held;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                held.swap(connections_);
            }
            for (auto& [key, conn] : held) {
                conn->close();
            }
            if (!held.empty()) {
                spdlog::debug("Closed {} detached connections", held.size());
            }
            return held.size();
        }

    private:
        detached_connections() = default;

        mutable std::mutex mutex_;
        std::unordered_map<const database_connection*, std::shared_ptr<database_connection>> connections_;
    };

} // namespace gleipnir
