#pragma once

/**
 * Gleipnir - connection-source execution and transaction layer over libpq
 *
 * A header-only library providing:
 * - One entry point for connections, pools and connection configs
 * - Query execution from [sql-or-statement, params...] expressions
 * - Scoped connections released the way they were obtained
 * - Transactions with option translation, rollback-only and savepoints
 * - Thread-safe connection pooling
 *
 * Usage:
 *   #include "gleipnir.hpp"
 *   using namespace gleipnir;
 *
 * Examples:
 *   // Execute against a config; the driver opens the session
 *   connection_config config{.host = "localhost", .database = "mydb"};
 *   auto row = execute_one(config, {"select $1::int as x", 42});
 *
 *   // Connection pool
 *   database_pool pool({.connection = config, .max_connections = 20});
 *   with_connection(pool, [](database_connection& conn) {
 *       (void)execute(conn, {"insert into logs (msg) values ($1)", "test"});
 *   });
 *
 *   // Transactions
 *   with_transaction(pool, {{"isolation", "serializable"}}, [](database_connection& conn) {
 *       (void)execute(conn, {"update accounts set balance = balance - $1", 10});
 *   });
 */

// Core components
#include "database_error.hpp"
#include "database_value.hpp"
#include "database_options.hpp"
#include "database_connection.hpp"
#include "pg_connection.hpp"
#include "database_driver.hpp"
#include "database_pool.hpp"
#include "database_source.hpp"
#include "database_execute.hpp"
#include "database_scope.hpp"
#include "database_transaction.hpp"

// Version information
#define GLEIPNIR_VERSION_MAJOR 1
#define GLEIPNIR_VERSION_MINOR 0
#define GLEIPNIR_VERSION_PATCH 0

namespace gleipnir {

    /**
     * Library version information
     */
    constexpr struct version_info {
        int major = GLEIPNIR_VERSION_MAJOR;
        int minor = GLEIPNIR_VERSION_MINOR;
        int patch = GLEIPNIR_VERSION_PATCH;

        [[nodiscard]] constexpr const char* string() const noexcept {
            return "1.0.0";
        }
    } version;

} // namespace gleipnir
