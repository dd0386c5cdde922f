#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>
#include "fake_connection.hpp"

using namespace gleipnir;
using namespace gleipnir::testing;
using Catch::Matchers::ContainsSubstring;

TEST_CASE("remap_tx_options - Key rename", "[transaction][options]") {
    SECTION("Caller keys are renamed, values untouched") {
        option_map options{
            {"isolation", std::string("serializable")},
            {"read-only", true},
            {"rollback-only", false}
        };

        auto remapped = remap_tx_options(options);
        REQUIRE(remapped.size() == 3);
        REQUIRE(std::get<std::string>(remapped.at("isolation-level")) == "serializable");
        REQUIRE(std::get<bool>(remapped.at("read-only?")));
        REQUIRE_FALSE(std::get<bool>(remapped.at("rollback?")));
        REQUIRE_FALSE(remapped.contains("isolation"));
    }

    SECTION("Unknown keys and odd values pass through") {
        option_map options{
            {"isolation", std::int64_t{7}},
            {"deferrable?", true},
            {"timeout", std::int64_t{30}}
        };

        auto remapped = remap_tx_options(options);
        REQUIRE(std::get<std::int64_t>(remapped.at("isolation-level")) == 7);
        REQUIRE(std::get<bool>(remapped.at("deferrable?")));
        REQUIRE(std::get<std::int64_t>(remapped.at("timeout")) == 30);
    }

    SECTION("Renaming then reversing reconstructs the options") {
        option_map options{
            {"isolation", std::string("repeatable-read")},
            {"read-only", true},
            {"rollback-only", true},
            {"custom", std::string("kept")}
        };

        REQUIRE(unmap_tx_options(remap_tx_options(options)) == options);
        REQUIRE(remap_tx_options({}).empty());
    }
}

TEST_CASE("to_transaction_config - Scope options", "[transaction][options]") {
    SECTION("Defaults") {
        auto config = to_transaction_config({});
        REQUIRE_FALSE(config.isolation.has_value());
        REQUIRE(config.mode == access_mode::read_write);
        REQUIRE_FALSE(config.rollback);
        REQUIRE(begin_statement(config) == "BEGIN READ WRITE");
    }

    SECTION("All options") {
        auto config = to_transaction_config({
            {"isolation-level", std::string("serializable")},
            {"read-only?", true},
            {"deferrable?", true},
            {"rollback?", true},
            {"unknown", std::int64_t{1}}
        });
        REQUIRE(config.isolation == isolation_level::serializable);
        REQUIRE(config.rollback);
        REQUIRE(begin_statement(config) == "BEGIN ISOLATION LEVEL SERIALIZABLE READ ONLY DEFERRABLE");
    }

    SECTION("Every isolation name") {
        REQUIRE(parse_isolation_level("read-committed") == isolation_level::read_committed);
        REQUIRE(parse_isolation_level("read-uncommitted") == isolation_level::read_uncommitted);
        REQUIRE(parse_isolation_level("repeatable-read") == isolation_level::repeatable_read);
        REQUIRE(parse_isolation_level("serializable") == isolation_level::serializable);
    }

    SECTION("Bad values are rejected") {
        REQUIRE_THROWS_WITH(to_transaction_config({{"isolation-level", std::string("snapshot")}}),
                            "Unknown isolation level: snapshot");
        REQUIRE_THROWS_AS(to_transaction_config({{"isolation-level", true}}), database_error);
        REQUIRE_THROWS_WITH(to_transaction_config({{"read-only?", std::string("yes")}}),
                            ContainsSubstring("expects a boolean"));
    }
}

TEST_CASE("transact - Commit and rollback", "[transaction]") {
    auto journal = std::make_shared<fake_journal>();
    auto conn = std::make_shared<fake_connection>(journal);

    SECTION("Commits and returns the body's value") {
        auto x = transact(conn, [](database_connection& c) {
            REQUIRE(is_in_transaction(c));
            return execute_one(c, {"select $1 as x", 5})->get<int>("x").value();
        });

        REQUIRE(x == 5);
        REQUIRE(journal->statements.front() == "BEGIN READ WRITE");
        REQUIRE(journal->statements.back() == "COMMIT");
        REQUIRE(journal->count("ROLLBACK") == 0);
        REQUIRE_FALSE(is_in_transaction(*conn));
    }

    SECTION("Rolls back and rethrows the original error") {
        struct body_failure : std::runtime_error {
            using std::runtime_error::runtime_error;
        };

        REQUIRE_THROWS_AS(transact(conn, [](database_connection&) {
            throw body_failure("boom");
        }), body_failure);

        REQUIRE(journal->statements.back() == "ROLLBACK");
        REQUIRE(journal->count("COMMIT") == 0);
        REQUIRE_FALSE(is_in_transaction(*conn));
    }

    SECTION("Caller options reach the primitive renamed") {
        transact(conn, [](database_connection&) {}, {
            {"isolation", std::string("serializable")},
            {"read-only", true}
        });

        REQUIRE(journal->begins.size() == 1);
        REQUIRE(journal->begins.front().isolation == isolation_level::serializable);
        REQUIRE(journal->begins.front().mode == access_mode::read_only);
        REQUIRE(journal->statements.front() == "BEGIN ISOLATION LEVEL SERIALIZABLE READ ONLY");
    }

    SECTION("Rollback-only rolls back a successful body") {
        auto value = transact(conn, [](database_connection&) { return std::string("done"); },
                              {{"rollback-only", true}});

        REQUIRE(value == "done");
        REQUIRE(journal->statements.back() == "ROLLBACK");
        REQUIRE(journal->count("COMMIT") == 0);
    }

    SECTION("Invalid options fail before BEGIN") {
        REQUIRE_THROWS_AS(transact(conn, [](database_connection&) {},
                                   {{"isolation", std::string("chaos")}}),
                          database_error);
        REQUIRE(journal->statements.empty());
    }

    SECTION("Failed commit propagates") {
        journal->fail_commit = true;
        REQUIRE_THROWS_WITH(transact(conn, [](database_connection&) {}),
                            ContainsSubstring("could not serialize"));
        REQUIRE(journal->count("ROLLBACK") == 0);
    }
}

TEST_CASE("transact - Aborted transaction stays active", "[transaction]") {
    auto journal = std::make_shared<fake_journal>();
    journal->failing_sql = "broken";
    fake_connection conn(journal);

    bool active_after_error = false;
    REQUIRE_THROWS_AS(transact(conn, [&](database_connection& c) {
        REQUIRE(is_in_transaction(c));
        try {
            (void)execute(c, {"broken statement"});
        } catch (const database_error&) {
            active_after_error = is_in_transaction(c);
            REQUIRE(c.transaction_state() == transaction_status::in_error);
            throw;
        }
    }), database_error);

    REQUIRE(active_after_error);
    REQUIRE_FALSE(is_in_transaction(conn));
    REQUIRE(journal->statements.back() == "ROLLBACK");
}

TEST_CASE("transact - Swallowed error makes the commit fail", "[transaction][error]") {
    auto journal = std::make_shared<fake_journal>();
    journal->failing_sql = "broken";
    fake_connection conn(journal);

    try {
        transact(conn, [](database_connection& c) {
            REQUIRE_THROWS_AS(execute(c, {"broken statement"}), database_error);
        });
        FAIL("Expected database_error");
    } catch (const database_error& e) {
        REQUIRE(e.sql_state == "40000");
        REQUIRE_THAT(e.what(), ContainsSubstring("rolled back"));
    }

    REQUIRE(journal->statements.back() == "COMMIT");
    REQUIRE(journal->count("ROLLBACK") == 0);
    REQUIRE_FALSE(is_in_transaction(conn));
}

TEST_CASE("transact - Rollback failure", "[transaction][error]") {
    auto journal = std::make_shared<fake_journal>();
    journal->fail_rollback = true;
    fake_connection conn(journal);

    try {
        transact(conn, [](database_connection&) {
            throw std::invalid_argument("body failed");
        });
        FAIL("Expected rollback_error");
    } catch (const rollback_error& e) {
        REQUIRE_THAT(e.what(), ContainsSubstring("Rollback failed"));
        REQUIRE(e.original() != nullptr);
        REQUIRE_THROWS_WITH(e.rethrow_original(), "body failed");
        REQUIRE_THROWS_AS(e.rethrow_original(), std::invalid_argument);
    }
}

TEST_CASE("transact - Nested scopes become savepoints", "[transaction][savepoint]") {
    auto journal = std::make_shared<fake_journal>();
    fake_connection conn(journal);

    SECTION("Inner success releases the savepoint") {
        transact(conn, [](database_connection& outer) {
            transact(outer, [](database_connection& inner) {
                (void)execute(inner, {"insert into t values (1)"});
            });
        });

        REQUIRE(journal->count("BEGIN READ WRITE") == 1);
        REQUIRE(journal->count_prefix("SAVEPOINT gleipnir_sp_") == 1);
        REQUIRE(journal->count_prefix("RELEASE SAVEPOINT gleipnir_sp_") == 1);
        REQUIRE(journal->count_prefix("ROLLBACK TO SAVEPOINT") == 0);
        REQUIRE(journal->statements.back() == "COMMIT");
    }

    SECTION("Inner failure rolls back to the savepoint only") {
        journal->failing_sql = "broken";

        transact(conn, [](database_connection& outer) {
            REQUIRE_THROWS_AS(transact(outer, [](database_connection& inner) {
                (void)execute(inner, {"broken insert"});
            }), database_error);

            // The outer transaction is usable again
            REQUIRE(outer.transaction_state() == transaction_status::in_transaction);
            (void)execute(outer, {"insert into t values (2)"});
        });

        REQUIRE(journal->count_prefix("ROLLBACK TO SAVEPOINT gleipnir_sp_") == 1);
        REQUIRE(journal->count("ROLLBACK") == 0);
        REQUIRE(journal->statements.back() == "COMMIT");
    }

    SECTION("Inner rollback-only") {
        transact(conn, [](database_connection& outer) {
            transact(outer, [](database_connection&) {}, {{"rollback-only", true}});
        });

        REQUIRE(journal->count_prefix("ROLLBACK TO SAVEPOINT") == 1);
        REQUIRE(journal->statements.back() == "COMMIT");
    }
}

TEST_CASE("with_transaction - Pool source", "[transaction][pool]") {
    scoped_fake_driver driver;
    database_pool pool(scoped_fake_driver::pool_config(1, 1));

    SECTION("Rollback-only keeps the body's result and returns the slot") {
        const database_connection* used = nullptr;
        auto result = with_transaction(pool, {{"rollback-only", true}}, [&](database_connection& conn) {
            used = &conn;
            REQUIRE(pool.is_borrowed(conn));
            REQUIRE(is_in_transaction(conn));
            return 42;
        });

        REQUIRE(result == 42);
        REQUIRE(driver.journal().count("BEGIN READ WRITE") == 1);
        REQUIRE(driver.journal().statements.back() == "ROLLBACK");
        REQUIRE(driver.journal().count("COMMIT") == 0);
        REQUIRE_FALSE(pool.is_borrowed(*used));
        REQUIRE(pool.get_stats().available_connections == 1);
    }

    SECTION("Failure rolls back and returns the slot") {
        REQUIRE_THROWS_WITH(with_transaction(pool, [](database_connection&) -> int {
            throw std::runtime_error("boom");
        }), "boom");

        REQUIRE(driver.journal().count("ROLLBACK") == 1);
        REQUIRE(pool.get_stats().active_connections == 0);
        REQUIRE(pool.get_stats().available_connections == 1);
    }

    SECTION("transact alone leaves the connection borrowed") {
        transact(pool, [](database_connection&) {});
        REQUIRE(driver.journal().statements.back() == "COMMIT");
        REQUIRE(pool.get_stats().active_connections == 1);
    }
}

TEST_CASE("with_transaction - Config source", "[transaction][config]") {
    scoped_fake_driver driver;

    auto n = with_transaction(scoped_fake_driver::config(), {{"isolation", std::string("read-committed")}},
        [](database_connection& conn) {
            return execute(conn, {"select 1"}).row_count();
        });

    REQUIRE(n == 1);
    REQUIRE(driver.journal().begins.front().isolation == isolation_level::read_committed);
    REQUIRE(driver.journal().statements.back() == "COMMIT");
    REQUIRE(driver.journal().opened == 1);
    REQUIRE(driver.journal().closed == 1);
}

TEST_CASE("transact - Config source stays open until released", "[transaction][config]") {
    scoped_fake_driver driver;
    auto config = scoped_fake_driver::config();

    transact(config, [&](database_connection& conn) {
        (void)execute(conn, {"insert into t values (1)"});
    });

    REQUIRE(driver.journal().statements.back() == "COMMIT");
    REQUIRE(driver.journal().opened == 1);
    REQUIRE(driver.journal().closed == 0);
    REQUIRE(driver.journal().destroyed == 0);

    auto used = detached_connections::instance().connections().front();
    REQUIRE(used->is_connected());
    release_connection(config, *used);
    REQUIRE(driver.journal().closed == 1);
}

TEST_CASE("with_transaction - Null source", "[transaction][error]") {
    scoped_fake_driver driver;

    REQUIRE_THROWS_AS(with_transaction(nullptr, [](database_connection&) {}), null_source_error);
    REQUIRE_THROWS_AS(transact(nullptr, [](database_connection&) {}), null_source_error);
    REQUIRE(driver.journal().opened == 0);
}

TEST_CASE("is_in_transaction - States", "[transaction]") {
    auto journal = std::make_shared<fake_journal>();
    fake_connection conn(journal);

    REQUIRE_FALSE(is_in_transaction(conn));

    conn.begin({});
    REQUIRE(is_in_transaction(conn));

    conn.rollback();
    REQUIRE_FALSE(is_in_transaction(conn));

    // Unknown state is not idle
    conn.close();
    REQUIRE(is_in_transaction(conn));
}
