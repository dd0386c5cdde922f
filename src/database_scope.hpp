#pragma once

#include <concepts>
#include <functional>
#include <type_traits>
#include <utility>
#include <spdlog/spdlog.h>
#include "database_connection.hpp"
#include "database_driver.hpp"
#include "database_error.hpp"
#include "database_pool.hpp"
#include "database_source.hpp"

namespace gleipnir {

    /**
     * Run func with a connection obtained from source, releasing it on every
     * exit path according to how it was obtained:
     *
     * - connection: used as is, never released (the caller owns it)
     * - pool: borrowed, then given back to the pool
     * - config: opened, then closed
     *
     * Null and unsupported sources are rejected before anything is acquired.
     */
    template<typename Func>
    requires std::invocable<Func, database_connection&>
    auto with_connection(const connection_source& source, Func&& func)
        -> std::invoke_result_t<Func, database_connection&> {

        source.ensure_supported();

        switch (source.kind()) {
            case source_kind::connection:
                return std::invoke(std::forward<Func>(func), *source.connection());

            case source_kind::pool:
                return source.pool().with_connection(std::forward<Func>(func));

            case source_kind::config: {
                auto conn = open_connection(source.config());

                // Close the connection we opened, however func exits
                struct connection_closer {
                    database_connection& conn;
                    ~connection_closer() {
                        conn.close();
                        spdlog::debug("Closed scoped connection");
                    }
                } closer{*conn};

                return std::invoke(std::forward<Func>(func), *conn);
            }

            default:
                throw unsupported_source_error{source.describe()};
        }
    }

} // namespace gleipnir
