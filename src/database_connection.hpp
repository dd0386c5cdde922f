#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <format>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include "database_error.hpp"
#include "database_options.hpp"
#include "database_value.hpp"

namespace gleipnir {

    class database_connection;

    // Transaction state of a session, as reported by the server
    enum class transaction_status {
        idle,
        active,
        in_transaction,
        in_error,
        unknown
    };

    // Transaction isolation levels
    enum class isolation_level {
        read_uncommitted,
        read_committed,
        repeatable_read,
        serializable
    };

    // Transaction access modes
    enum class access_mode {
        read_write,
        read_only
    };

    // Typed settings for BEGIN; an unset isolation keeps the server default
    struct transaction_config {
        std::optional<isolation_level> isolation;
        access_mode mode = access_mode::read_write;
        bool deferrable = false;
        bool rollback = false;
    };

    [[nodiscard]] constexpr std::string_view to_sql(isolation_level level) noexcept {
        switch (level) {
            case isolation_level::read_uncommitted:
                return "READ UNCOMMITTED";
            case isolation_level::read_committed:
                return "READ COMMITTED";
            case isolation_level::repeatable_read:
                return "REPEATABLE READ";
            case isolation_level::serializable:
                return "SERIALIZABLE";
        }
        return "READ COMMITTED";
    }

    [[nodiscard]] inline std::string begin_statement(const transaction_config& config) {
        std::string sql = "BEGIN";
        if (config.isolation) {
            sql += std::format(" ISOLATION LEVEL {}", to_sql(*config.isolation));
        }
        sql += config.mode == access_mode::read_only ? " READ ONLY" : " READ WRITE";
        if (config.deferrable) {
            sql += " DEFERRABLE";
        }
        return sql;
    }

    // Parameters for opening a session
    struct connection_config {
        std::string driver = "postgresql";
        std::string host = "localhost";
        std::uint16_t port = 5432;
        std::string database;
        std::string user;
        std::string password;
        std::chrono::seconds connect_timeout{30};
        std::string application_name = "gleipnir";
        std::string client_encoding = "UTF8";
        // Raw libpq conninfo; when set it replaces the fields above
        std::string conninfo;

        [[nodiscard]] std::string to_conninfo() const {
            if (!conninfo.empty()) {
                return conninfo;
            }

            std::string out = std::format("host={} port={}", quote(host), port);
            if (!database.empty()) {
                out += std::format(" dbname={}", quote(database));
            }
            if (!user.empty()) {
                out += std::format(" user={}", quote(user));
            }
            if (!password.empty()) {
                out += std::format(" password={}", quote(password));
            }
            out += std::format(" connect_timeout={} application_name={} client_encoding={}",
                               connect_timeout.count(), quote(application_name),
                               quote(client_encoding));
            return out;
        }

    private:
        // conninfo values with spaces, quotes or backslashes must be single-quoted
        static std::string quote(std::string_view raw) {
            if (!raw.empty() && raw.find_first_of(" '\\") == std::string_view::npos) {
                return std::string(raw);
            }
            std::string out = "'";
            for (char c : raw) {
                if (c == '\'' || c == '\\') out += '\\';
                out += c;
            }
            out += '\'';
            return out;
        }
    };

    // Opaque handle to a statement prepared on one particular connection
    class prepared_statement {
    public:
        prepared_statement() = default;

        prepared_statement(std::string name, std::string sql, std::vector<oid> param_types,
                           std::uint64_t connection_id)
            : name_(std::move(name)), sql_(std::move(sql)),
              param_types_(std::move(param_types)), connection_id_(connection_id) {}

        [[nodiscard]] const std::string& name() const noexcept { return name_; }
        [[nodiscard]] const std::string& sql() const noexcept { return sql_; }
        [[nodiscard]] const std::vector<oid>& param_types() const noexcept { return param_types_; }

        // id() of the connection that prepared the statement; 0 when invalid
        [[nodiscard]] std::uint64_t connection_id() const noexcept { return connection_id_; }

        [[nodiscard]] bool valid() const noexcept { return connection_id_ != 0 && !name_.empty(); }
        explicit operator bool() const noexcept { return valid(); }

    private:
        std::string name_;
        std::string sql_;
        std::vector<oid> param_types_;
        std::uint64_t connection_id_ = 0;
    };

    /**
     * A live session with a database.
     *
     * Drivers implement the execution and transaction primitives; everything
     * above this interface (source resolution, scoping, transactions) is
     * driver-agnostic. A connection is not safe for concurrent use.
     */
    class database_connection {
    public:
        virtual ~database_connection() = default;

        database_connection(const database_connection&) = delete;
        database_connection& operator=(const database_connection&) = delete;

        // Unique for the life of the process, never reused by a later connection
        [[nodiscard]] std::uint64_t id() const noexcept { return id_; }

        [[nodiscard]] virtual bool is_connected() const noexcept = 0;

        [[nodiscard]] virtual transaction_status transaction_state() const noexcept = 0;

        // True only when no transaction is open, aborted ones included
        [[nodiscard]] bool is_idle() const noexcept {
            return transaction_state() == transaction_status::idle;
        }

        // Idempotent
        virtual void close() noexcept = 0;

        // Compile and run SQL text with the parameters in options
        [[nodiscard]] virtual query_result execute_text(std::string_view sql,
                                                        const execute_options& options) = 0;

        // Bind the parameters in options to an already prepared statement and run it
        [[nodiscard]] virtual query_result execute_statement(const prepared_statement& stmt,
                                                             const execute_options& options) = 0;

        [[nodiscard]] virtual prepared_statement prepare(std::string_view sql,
                                                         const execute_options& options) = 0;

        virtual void close_statement(const prepared_statement& stmt) = 0;

        virtual void begin(const transaction_config& config) = 0;
        virtual void commit() = 0;
        virtual void rollback() = 0;

    protected:
        database_connection() : id_(next_id()) {}

        void check_owner(const prepared_statement& stmt) const {
            if (!stmt.valid()) {
                throw database_error{"Prepared statement is not valid"};
            }
            if (stmt.connection_id() != id_) {
                throw database_error{
                    std::format("Statement {} was prepared on another connection", stmt.name())
                };
            }
        }

    private:
        static std::uint64_t next_id() noexcept {
            static std::atomic<std::uint64_t> counter{0};
            return ++counter;
        }

        std::uint64_t id_;
    };

} // namespace gleipnir
