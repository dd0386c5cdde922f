#pragma once

#include <concepts>
#include <cstddef>
#include <format>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <spdlog/spdlog.h>
#include "database_connection.hpp"
#include "database_driver.hpp"
#include "database_error.hpp"
#include "database_pool.hpp"
#include "database_value.hpp"

namespace gleipnir {

    // What a connection source turned out to be
    enum class source_kind {
        null,
        connection,
        pool,
        config,
        unsupported
    };

    [[nodiscard]] constexpr std::string_view to_string(source_kind kind) noexcept {
        switch (kind) {
            case source_kind::null: return "null";
            case source_kind::connection: return "connection";
            case source_kind::pool: return "pool";
            case source_kind::config: return "config";
            case source_kind::unsupported: return "unsupported";
        }
        return "unsupported";
    }

    class connection_source;

    // Types a connection_source knows how to resolve
    template<typename T>
    concept KnownSource =
        std::same_as<std::remove_cvref_t<T>, connection_source>
        || std::convertible_to<T, std::shared_ptr<database_connection>>
        || std::convertible_to<T, database_connection*>
        || std::derived_from<std::remove_cvref_t<T>, database_connection>
        || std::derived_from<std::remove_cvref_t<T>, database_pool>
        || std::convertible_to<T, std::shared_ptr<database_pool>>
        || std::convertible_to<T, connection_config>;

    /**
     * Where a connection comes from: an open connection, a pool, or a
     * configuration. Anything else is kept as "unsupported" together with a
     * printable description, so it can be rejected with a useful message.
     *
     *   execute(conn, {"select 1"});
     *   execute(pool, {"select 1"});
     *   execute(connection_config{.host = "db"}, {"select 1"});
     */
    class connection_source {
    public:
        connection_source() noexcept = default;

        connection_source(std::nullptr_t) noexcept {}

        template<std::derived_from<database_connection> C>
        connection_source(std::shared_ptr<C> conn) noexcept {
            if (conn) {
                source_ = std::shared_ptr<database_connection>(std::move(conn));
            }
        }

        // Non-owning: the caller keeps the connection alive
        connection_source(database_connection& conn) noexcept
            : source_(std::shared_ptr<database_connection>(std::shared_ptr<void>{}, &conn)) {}

        connection_source(database_connection* conn) noexcept {
            if (conn) {
                source_ = std::shared_ptr<database_connection>(std::shared_ptr<void>{}, conn);
            }
        }

        connection_source(database_pool& pool) noexcept
            : source_(&pool) {}

        // Non-owning, like a pool reference: the caller keeps the pool alive
        connection_source(const std::shared_ptr<database_pool>& pool) noexcept {
            if (pool) {
                source_ = pool.get();
            }
        }

        connection_source(connection_config config)
            : source_(std::move(config)) {}

        template<typename T>
        requires (!KnownSource<T>)
        connection_source(const T& other)
            : source_(unsupported{describe_value(other)}) {}

        [[nodiscard]] source_kind kind() const noexcept {
            return static_cast<source_kind>(source_.index());
        }

        [[nodiscard]] const std::shared_ptr<database_connection>& connection() const {
            return std::get<std::shared_ptr<database_connection>>(source_);
        }

        [[nodiscard]] database_pool& pool() const {
            return *std::get<database_pool*>(source_);
        }

        [[nodiscard]] const connection_config& config() const {
            return std::get<connection_config>(source_);
        }

        [[nodiscard]] std::string describe() const {
            switch (kind()) {
                case source_kind::config:
                    return std::format("config {}:{}", config().host, config().port);
                case source_kind::unsupported:
                    return std::get<unsupported>(source_).description;
                default:
                    return std::string(to_string(kind()));
            }
        }

        // Throw the matching error unless the source can yield a connection
        void ensure_supported() const {
            switch (kind()) {
                case source_kind::null:
                    throw null_source_error{};
                case source_kind::unsupported:
                    throw unsupported_source_error{describe()};
                default:
                    return;
            }
        }

    private:
        struct unsupported {
            std::string description;
        };

        // Alternative order matches source_kind
        std::variant<std::monostate,
                     std::shared_ptr<database_connection>,
                     database_pool*,
                     connection_config,
                     unsupported> source_;
    };

    /**
     * Produce a connection from a source.
     *
     * - connection: returned as is
     * - pool: a connection is borrowed and stays checked out until it is
     *   given back to the pool
     * - config: a new connection is opened and stays open, held by
     *   detached_connections, until it is released
     *
     * Unlike with_connection(), nothing is released here; pair each call with
     * release_connection().
     */
    [[nodiscard]] inline std::shared_ptr<database_connection> resolve_connection(const connection_source& source) {
        source.ensure_supported();
        spdlog::debug("Resolving connection from {} source", to_string(source.kind()));

        switch (source.kind()) {
            case source_kind::connection:
                return source.connection();
            case source_kind::pool:
                return source.pool().borrow();
            case source_kind::config:
                return detached_connections::instance().open(source.config());
            default:
                throw unsupported_source_error{source.describe()};
        }
    }

    /**
     * Undo one resolve_connection() on source: a pool connection is given
     * back, a connection opened from a config is closed, and a connection
     * source is left alone.
     */
    inline void release_connection(const connection_source& source, database_connection& conn) {
        source.ensure_supported();

        switch (source.kind()) {
            case source_kind::connection:
                return;
            case source_kind::pool:
                source.pool().give_back(conn);
                return;
            case source_kind::config:
                if (!detached_connections::instance().release(conn)) {
                    throw database_error{"Connection was not opened from a config source"};
                }
                return;
            default:
                throw unsupported_source_error{source.describe()};
        }
    }

} // namespace gleipnir
