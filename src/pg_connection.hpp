#pragma once

#include <libpq-fe.h>
#include <algorithm>
#include <atomic>
#include <concepts>
#include <cstdlib>
#include <format>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <spdlog/spdlog.h>
#include "database_connection.hpp"

namespace gleipnir {

    // Connection status enum
    enum class connection_status {
        ok,
        bad,
        started,
        made,
        awaiting_response,
        auth_ok,
        setenv,
        ssl_startup,
        needed
    };

    // C++20 concept for connection string types
    template<typename T>
    concept ConnectionString = std::convertible_to<T, std::string_view>;

    // PostgreSQL session over libpq
    class pg_connection final : public database_connection {
    public:
        // Constructor with connection string
        template<ConnectionString T>
        explicit pg_connection(T&& conn_str) {
            connect(std::string(std::string_view(std::forward<T>(conn_str))));
        }

        explicit pg_connection(const connection_config& config) {
            connect(config.to_conninfo());
        }

        ~pg_connection() override {
            close();
        }

        [[nodiscard]] bool is_connected() const noexcept override {
            return conn_ && PQstatus(conn_) == CONNECTION_OK;
        }

        [[nodiscard]] connection_status status() const noexcept {
            if (!conn_) return connection_status::bad;
            return static_cast<connection_status>(PQstatus(conn_));
        }

        [[nodiscard]] transaction_status transaction_state() const noexcept override {
            if (!conn_) return transaction_status::unknown;
            switch (PQtransactionStatus(conn_)) {
                case PQTRANS_IDLE: return transaction_status::idle;
                case PQTRANS_ACTIVE: return transaction_status::active;
                case PQTRANS_INTRANS: return transaction_status::in_transaction;
                case PQTRANS_INERROR: return transaction_status::in_error;
                default: return transaction_status::unknown;
            }
        }

        void close() noexcept override {
            if (conn_) {
                PQfinish(conn_);
                conn_ = nullptr;
            }
        }

        [[nodiscard]] query_result execute_text(std::string_view sql,
                                                const execute_options& options) override {
            ensure_connected();
            const std::string query(sql);
            bound_params bound(options);

            if (options.first_row_only) {
                if (!PQsendQueryParams(conn_, query.c_str(), bound.count(), bound.types(),
                                       bound.values(), nullptr, nullptr, 0)) {
                    throw database_error{std::format("Failed to send query: {}", last_error())};
                }
                return collect_first_row();
            }

            result_ptr result(PQexecParams(conn_, query.c_str(), bound.count(), bound.types(),
                                           bound.values(), nullptr, nullptr, 0), PQclear);
            return to_query_result(checked(std::move(result)).get());
        }

        [[nodiscard]] query_result execute_statement(const prepared_statement& stmt,
                                                     const execute_options& options) override {
            ensure_connected();
            check_owner(stmt);
            bound_params bound(options);

            if (options.first_row_only) {
                if (!PQsendQueryPrepared(conn_, stmt.name().c_str(), bound.count(),
                                         bound.values(), nullptr, nullptr, 0)) {
                    throw database_error{
                        std::format("Failed to send prepared query: {}", last_error())
                    };
                }
                return collect_first_row();
            }

            result_ptr result(PQexecPrepared(conn_, stmt.name().c_str(), bound.count(),
                                             bound.values(), nullptr, nullptr, 0), PQclear);
            return to_query_result(checked(std::move(result)).get());
        }

        [[nodiscard]] prepared_statement prepare(std::string_view sql,
                                                 const execute_options& options) override {
            ensure_connected();
            const std::string query(sql);
            auto types = prepare_types_for(options);
            auto name = std::format("gleipnir_stmt_{}", ++statement_counter_);

            result_ptr result(PQprepare(conn_, name.c_str(), query.c_str(),
                                        static_cast<int>(types.size()),
                                        types.empty() ? nullptr : types.data()), PQclear);
            (void)checked(std::move(result));

            spdlog::debug("Prepared statement {}: {}", name, query);
            return prepared_statement(std::move(name), query, std::move(types), id());
        }

        void close_statement(const prepared_statement& stmt) override {
            check_owner(stmt);
            run_command(std::format("DEALLOCATE {}", stmt.name()));
        }

        void begin(const transaction_config& config) override {
            run_command(begin_statement(config));
        }

        // COMMIT of an aborted transaction succeeds with the ROLLBACK tag
        void commit() override {
            ensure_connected();
            result_ptr result(PQexec(conn_, "COMMIT"), PQclear);
            result = checked(std::move(result));
            if (std::string_view(PQcmdStatus(result.get())) == "ROLLBACK") {
                throw database_error{"Transaction was aborted and has been rolled back", "40000"};
            }
        }

        void rollback() override {
            run_command("ROLLBACK");
        }

        // Get last error message
        [[nodiscard]] std::string last_error() const {
            return conn_ ? PQerrorMessage(conn_) : "No connection";
        }

        // Get database info
        [[nodiscard]] std::string database_name() const {
            return conn_ ? PQdb(conn_) : "";
        }

        [[nodiscard]] std::string user_name() const {
            return conn_ ? PQuser(conn_) : "";
        }

        [[nodiscard]] std::string host() const {
            return conn_ ? PQhost(conn_) : "";
        }

        [[nodiscard]] std::string port() const {
            return conn_ ? PQport(conn_) : "";
        }

        // Get raw connection pointer (use with caution)
        [[nodiscard]] PGconn* native_handle() noexcept {
            return conn_;
        }

    private:
        using result_ptr = std::unique_ptr<PGresult, decltype(&PQclear)>;

        // Text-format parameters kept alive for the duration of one call
        class bound_params {
        public:
            explicit bound_params(const execute_options& options)
                : types_(param_types_for(options)) {
                texts_.reserve(options.params.size());
                for (const auto& v : options.params) {
                    texts_.push_back(is_null(v) ? std::nullopt : std::optional(to_text(v)));
                }
                for (const auto& text : texts_) {
                    ptrs_.push_back(text ? text->c_str() : nullptr);
                }
            }

            [[nodiscard]] int count() const noexcept { return static_cast<int>(ptrs_.size()); }

            [[nodiscard]] const char* const* values() const noexcept {
                return ptrs_.empty() ? nullptr : ptrs_.data();
            }

            [[nodiscard]] const Oid* types() const noexcept {
                return types_.empty() ? nullptr : types_.data();
            }

        private:
            std::vector<std::optional<std::string>> texts_;
            std::vector<const char*> ptrs_;
            std::vector<Oid> types_;
        };

        void connect(const std::string& conn_str) {
            conn_ = PQconnectdb(conn_str.c_str());
            if (!is_connected()) {
                std::string error = last_error();
                close();
                throw database_error{std::format("Failed to connect to database: {}", error)};
            }
            spdlog::debug("Connected to {}:{}/{}", host(), port(), database_name());
        }

        void ensure_connected() const {
            if (!is_connected()) {
                throw database_error{"Connection is not valid"};
            }
        }

        void run_command(const std::string& sql) {
            ensure_connected();
            result_ptr result(PQexec(conn_, sql.c_str()), PQclear);
            (void)checked(std::move(result));
        }

        [[nodiscard]] database_error make_error(const PGresult* result) const {
            const char* state = PQresultErrorField(result, PG_DIAG_SQLSTATE);
            return database_error{PQresultErrorMessage(result), state ? state : ""};
        }

        [[nodiscard]] result_ptr checked(result_ptr result) const {
            if (!result) {
                throw database_error{std::format("Query execution failed: {}", last_error())};
            }

            ExecStatusType status = PQresultStatus(result.get());
            if (status != PGRES_COMMAND_OK && status != PGRES_TUPLES_OK) {
                throw make_error(result.get());
            }
            return result;
        }

        // Single-row mode: keep the first row, drain the rest of the stream
        [[nodiscard]] query_result collect_first_row() {
            if (!PQsetSingleRowMode(conn_)) {
                spdlog::debug("Single-row mode unavailable, fetching the full result");
            }

            std::optional<query_result> first;
            std::optional<database_error> failure;
            while (PGresult* raw = PQgetResult(conn_)) {
                result_ptr result(raw, PQclear);
                ExecStatusType status = PQresultStatus(raw);

                if (status == PGRES_SINGLE_TUPLE || status == PGRES_TUPLES_OK
                    || status == PGRES_COMMAND_OK) {
                    if (!first) {
                        first = to_query_result(raw, 1);
                    }
                } else if (!failure) {
                    failure = make_error(raw);
                }
            }

            if (failure) {
                throw *failure;
            }
            return first ? std::move(*first) : query_result{};
        }

        [[nodiscard]] static value decode(const PGresult* result, int row, int col, Oid type) {
            if (PQgetisnull(result, row, col)) {
                return std::monostate{};
            }

            std::string_view text(PQgetvalue(result, row, col),
                                  static_cast<std::size_t>(PQgetlength(result, row, col)));
            switch (type) {
                case oids::boolean:
                    return text == "t";
                case oids::int2:
                case oids::int4:
                case oids::int8:
                    if (auto n = detail::parse_number<std::int64_t>(text)) return *n;
                    break;
                case oids::float4:
                case oids::float8:
                    if (auto d = detail::parse_number<double>(text)) return *d;
                    break;
                default:
                    break;
            }
            return std::string(text);
        }

        [[nodiscard]] static query_result to_query_result(const PGresult* result,
                                                          std::optional<int> max_rows = std::nullopt) {
            const int columns = PQnfields(result);
            const int rows = max_rows ? std::min(*max_rows, PQntuples(result)) : PQntuples(result);

            std::vector<column_info> info;
            info.reserve(columns);
            for (int col = 0; col < columns; ++col) {
                info.push_back(column_info{PQfname(result, col), PQftype(result, col)});
            }

            std::vector<std::vector<value>> data;
            data.reserve(rows);
            for (int row = 0; row < rows; ++row) {
                std::vector<value> values;
                values.reserve(columns);
                for (int col = 0; col < columns; ++col) {
                    values.push_back(decode(result, row, col, info[col].type));
                }
                data.push_back(std::move(values));
            }

            const char* affected = PQcmdTuples(const_cast<PGresult*>(result));
            return query_result(std::move(info), std::move(data), PQcmdStatus(const_cast<PGresult*>(result)),
                                affected && *affected ? std::atoi(affected) : 0);
        }

        PGconn* conn_{nullptr};
        std::atomic<unsigned long> statement_counter_{0};
    };

} // namespace gleipnir
