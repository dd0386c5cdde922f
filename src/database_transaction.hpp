#pragma once

#include <array>
#include <atomic>
#include <concepts>
#include <exception>
#include <format>
#include <functional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <spdlog/spdlog.h>
#include "database_connection.hpp"
#include "database_error.hpp"
#include "database_options.hpp"
#include "database_scope.hpp"
#include "database_source.hpp"

namespace gleipnir {

    // Caller-facing transaction option keys
    namespace tx_option {
        inline constexpr std::string_view isolation = "isolation";
        inline constexpr std::string_view read_only = "read-only";
        inline constexpr std::string_view rollback_only = "rollback-only";
    }

    // Keys understood by with_transaction_scope()
    namespace tx_scope_option {
        inline constexpr std::string_view isolation_level = "isolation-level";
        inline constexpr std::string_view read_only = "read-only?";
        inline constexpr std::string_view rollback = "rollback?";
        inline constexpr std::string_view deferrable = "deferrable?";
    }

    namespace detail {

        struct key_rename {
            std::string_view from;
            std::string_view to;
        };

        inline constexpr std::array<key_rename, 3> tx_option_renames{{
            {tx_option::isolation, tx_scope_option::isolation_level},
            {tx_option::read_only, tx_scope_option::read_only},
            {tx_option::rollback_only, tx_scope_option::rollback},
        }};

        template<typename From, typename To>
        option_map rename_keys(const option_map& options, From from, To to) {
            option_map renamed = options;
            for (const auto& rename : tx_option_renames) {
                auto it = renamed.find(from(rename));
                if (it == renamed.end()) {
                    continue;
                }
                option_value moved = std::move(it->second);
                renamed.erase(it);
                renamed.insert_or_assign(std::string(to(rename)), std::move(moved));
            }
            return renamed;
        }

    } // namespace detail

    /**
     * Translate caller transaction options into the scope vocabulary:
     * isolation -> isolation-level, read-only -> read-only?,
     * rollback-only -> rollback?. Values are untouched, other keys pass through.
     */
    [[nodiscard]] inline option_map remap_tx_options(const option_map& options) {
        return detail::rename_keys(options,
            [](const detail::key_rename& r) { return r.from; },
            [](const detail::key_rename& r) { return r.to; });
    }

    // Inverse of remap_tx_options()
    [[nodiscard]] inline option_map unmap_tx_options(const option_map& options) {
        return detail::rename_keys(options,
            [](const detail::key_rename& r) { return r.to; },
            [](const detail::key_rename& r) { return r.from; });
    }

    [[nodiscard]] inline isolation_level parse_isolation_level(std::string_view name) {
        if (name == "read-committed") return isolation_level::read_committed;
        if (name == "read-uncommitted") return isolation_level::read_uncommitted;
        if (name == "repeatable-read") return isolation_level::repeatable_read;
        if (name == "serializable") return isolation_level::serializable;
        throw database_error{std::format("Unknown isolation level: {}", name)};
    }

    // Read scope options; keys this scope does not know are ignored
    [[nodiscard]] inline transaction_config to_transaction_config(const option_map& options) {
        transaction_config config;

        for (const auto& [key, option] : options) {
            auto expect_bool = [&]() {
                if (auto flag = std::get_if<bool>(&option)) return *flag;
                throw database_error{std::format("Transaction option {} expects a boolean", key)};
            };

            if (key == tx_scope_option::isolation_level) {
                auto name = std::get_if<std::string>(&option);
                if (!name) {
                    throw database_error{std::format("Transaction option {} expects a name", key)};
                }
                config.isolation = parse_isolation_level(*name);
            } else if (key == tx_scope_option::read_only) {
                config.mode = expect_bool() ? access_mode::read_only : access_mode::read_write;
            } else if (key == tx_scope_option::rollback) {
                config.rollback = expect_bool();
            } else if (key == tx_scope_option::deferrable) {
                config.deferrable = expect_bool();
            } else {
                spdlog::debug("Ignoring transaction option {}", key);
            }
        }
        return config;
    }

    // Savepoint RAII wrapper; rolls back unless released
    class savepoint {
    public:
        savepoint(database_connection& conn, std::string name)
            : conn_(conn), name_(std::move(name)) {
            run(std::format("SAVEPOINT {}", name_));
        }

        ~savepoint() {
            if (!finished_) {
                try {
                    rollback();
                } catch (const database_error& e) {
                    spdlog::warn("Failed to roll back savepoint {}: {}", name_, e.what());
                }
            }
        }

        savepoint(const savepoint&) = delete;
        savepoint& operator=(const savepoint&) = delete;

        // Keep the changes made since the savepoint
        void release() {
            if (!finished_) {
                run(std::format("RELEASE SAVEPOINT {}", name_));
                finished_ = true;
            }
        }

        // Undo the changes made since the savepoint and discard it
        void rollback() {
            if (!finished_) {
                finished_ = true;
                run(std::format("ROLLBACK TO SAVEPOINT {}", name_));
                run(std::format("RELEASE SAVEPOINT {}", name_));
            }
        }

        [[nodiscard]] const std::string& name() const noexcept { return name_; }

    private:
        void run(const std::string& sql) {
            (void)conn_.execute_text(sql, {});
        }

        database_connection& conn_;
        std::string name_;
        bool finished_ = false;
    };

    namespace detail {

        inline std::string next_savepoint_name() {
            static std::atomic<unsigned long> counter{0};
            return std::format("gleipnir_sp_{}", ++counter);
        }

        // Roll back after func failed; a failing rollback keeps the original error
        template<typename Undo>
        void undo_after_failure(Undo&& undo, std::exception_ptr original) {
            try {
                undo();
            } catch (const std::exception& e) {
                spdlog::error("Rollback after failure failed: {}", e.what());
                throw rollback_error{e.what(), std::move(original)};
            }
        }

        // Run func; on failure undo and rethrow, on success finish
        template<typename Func, typename Undo, typename Finish>
        auto run_guarded(database_connection& conn, Func&& func, Undo&& undo, Finish&& finish)
            -> std::invoke_result_t<Func, database_connection&> {

            using result_type = std::invoke_result_t<Func, database_connection&>;

            auto guarded = [&]() -> result_type {
                try {
                    return std::invoke(std::forward<Func>(func), conn);
                } catch (...) {
                    undo_after_failure(undo, std::current_exception());
                    throw;
                }
            };

            if constexpr (std::is_void_v<result_type>) {
                guarded();
                finish();
            } else {
                result_type result = guarded();
                finish();
                return result;
            }
        }

    } // namespace detail

    /**
     * Transaction primitive: run func inside a transaction configured by
     * scope options (isolation-level, read-only?, rollback?, deferrable?).
     *
     * Commits when func returns, or rolls back when rollback? is set. Rolls
     * back and rethrows when func throws. On a connection that is already
     * inside a transaction the scope becomes a savepoint, and the isolation
     * and access options are not applied.
     */
    template<typename Func>
    requires std::invocable<Func, database_connection&>
    auto with_transaction_scope(database_connection& conn, const option_map& options, Func&& func)
        -> std::invoke_result_t<Func, database_connection&> {

        const auto config = to_transaction_config(options);

        if (!conn.is_idle()) {
            savepoint sp(conn, detail::next_savepoint_name());
            spdlog::debug("Nested transaction scope as savepoint {}", sp.name());
            return detail::run_guarded(conn, std::forward<Func>(func),
                [&] { sp.rollback(); },
                [&] { config.rollback ? sp.rollback() : sp.release(); });
        }

        conn.begin(config);
        spdlog::debug("Transaction started: {}", begin_statement(config));

        return detail::run_guarded(conn, std::forward<Func>(func),
            [&] { conn.rollback(); },
            [&] {
                if (config.rollback) {
                    conn.rollback();
                    spdlog::debug("Transaction rolled back (rollback-only)");
                } else {
                    conn.commit();
                    spdlog::debug("Transaction committed");
                }
            });
    }

    /**
     * Resolve source, then run func in a transaction on it.
     *
     * Options use the caller vocabulary:
     * - "isolation": "read-committed", "read-uncommitted", "repeatable-read"
     *   or "serializable"
     * - "read-only": bool
     * - "rollback-only": bool
     *
     * A connection borrowed from a pool or opened from a config stays out
     * afterwards until release_connection(); with_transaction() releases it.
     */
    template<typename Func>
    requires std::invocable<Func, database_connection&>
    auto transact(const connection_source& source, Func&& func, const option_map& options = {})
        -> std::invoke_result_t<Func, database_connection&> {
        auto conn = resolve_connection(source);
        return with_transaction_scope(*conn, remap_tx_options(options), std::forward<Func>(func));
    }

    // Transaction on a connection from source, released when done
    template<typename Func>
    requires std::invocable<Func, database_connection&>
    auto with_transaction(const connection_source& source, const option_map& options, Func&& func)
        -> std::invoke_result_t<Func, database_connection&> {
        return with_connection(source, [&](database_connection& conn) -> decltype(auto) {
            return transact(conn, std::forward<Func>(func), options);
        });
    }

    template<typename Func>
    requires std::invocable<Func, database_connection&>
    auto with_transaction(const connection_source& source, Func&& func)
        -> std::invoke_result_t<Func, database_connection&> {
        return with_transaction(source, option_map{}, std::forward<Func>(func));
    }

    // True inside a transaction, including one aborted by an error
    [[nodiscard]] inline bool is_in_transaction(const database_connection& conn) noexcept {
        return !conn.is_idle();
    }

} // namespace gleipnir
