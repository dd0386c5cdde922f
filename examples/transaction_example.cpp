#include <iostream>
#include <spdlog/spdlog.h>
#include "../src/gleipnir.hpp"

using namespace gleipnir;

int main() {
    spdlog::set_level(spdlog::level::debug);

    try {
        database_pool pool({
            .connection = {.host = "localhost", .database = "testdb", .user = "testuser", .password = "testpass"},
            .min_connections = 1,
            .max_connections = 4
        });

        with_connection(pool, [](database_connection& conn) {
            (void)execute(conn, {"CREATE TABLE IF NOT EXISTS accounts (id INT PRIMARY KEY, balance INT)"});
            (void)execute(conn, {"INSERT INTO accounts VALUES (1, 100), (2, 0) ON CONFLICT DO NOTHING"});
        });

        // Move money atomically; the slot goes back to the pool afterwards
        auto moved = with_transaction(pool, {{"isolation", std::string("serializable")}},
            [](database_connection& conn) {
                (void)execute(conn, {"UPDATE accounts SET balance = balance - $1 WHERE id = $2", 10, 1});
                (void)execute(conn, {"UPDATE accounts SET balance = balance + $1 WHERE id = $2", 10, 2});
                return 10;
            });
        std::cout << "Moved " << moved << "\n";

        // Dry run: rolled back however the body ends
        with_transaction(pool, {{"rollback-only", true}}, [](database_connection& conn) {
            (void)execute(conn, {"DELETE FROM accounts"});
            auto left = execute_one(conn, {"SELECT count(*) AS n FROM accounts"});
            std::cout << "Accounts inside dry run: " << left->get<int>("n").value_or(-1) << "\n";
        });

        auto balance = execute_one(pool, {"SELECT balance FROM accounts WHERE id = $1", 2});
        std::cout << "Balance of account 2: " << balance->get<int>("balance").value_or(0) << "\n";

        return 0;
    } catch (const rollback_error& e) {
        std::cerr << "Rollback failed: " << e.what() << "\n";
        return 2;
    } catch (const database_error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
