#include <iostream>
#include "../src/gleipnir.hpp"

using namespace gleipnir;

constexpr const char* CONNECTION_STRING = "host=localhost dbname=testdb user=testuser password=testpass";

int main() {
    try {
        connection_config config{.conninfo = CONNECTION_STRING};

        // Opened and closed around the block
        with_connection(config, [](database_connection& conn) {
            auto version = execute_one(conn, {"SELECT version()"});
            std::cout << "PostgreSQL version: "
                      << (version ? version->get<std::string>(0).value_or("Unknown") : "Unknown") << "\n";

            auto result = execute(conn, {"SELECT $1::int + $2::int AS sum", 40, 2});
            std::cout << "40 + 2 = " << result.get<int>(0, "sum").value_or(0) << "\n";
        });

        return 0;
    } catch (const database_error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
