#pragma once

#include <concepts>
#include <format>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>
#include "database_connection.hpp"
#include "database_error.hpp"
#include "database_options.hpp"
#include "database_source.hpp"
#include "database_value.hpp"

namespace gleipnir {

    enum class expression_kind {
        text,
        statement,
        invalid
    };

    /**
     * A query in the form [expr, params...]: the executable form first, then
     * the positional parameters in placeholder order. The executable form is
     * either SQL text or a prepared_statement.
     *
     *   query_expression{"select $1 as x", 42}
     *   query_expression{stmt, "alice", 30}
     */
    class query_expression {
    public:
        query_expression() = default;

        template<typename Expr, typename... Params>
        requires (!std::same_as<std::remove_cvref_t<Expr>, query_expression>)
        query_expression(Expr&& expr, Params&&... params)
            : form_(make_form(std::forward<Expr>(expr))),
              params_{to_value(std::forward<Params>(params))...} {}

        [[nodiscard]] expression_kind kind() const noexcept {
            switch (form_.index()) {
                case 1: return expression_kind::text;
                case 2: return expression_kind::statement;
                default: return expression_kind::invalid;
            }
        }

        [[nodiscard]] const std::string& sql() const {
            return std::get<std::string>(form_);
        }

        [[nodiscard]] const prepared_statement& statement() const {
            return std::get<prepared_statement>(form_);
        }

        [[nodiscard]] const std::vector<value>& params() const noexcept { return params_; }

        [[nodiscard]] std::string describe() const {
            switch (kind()) {
                case expression_kind::text: return sql();
                case expression_kind::statement: return std::format("statement {}", statement().name());
                default: return std::get<invalid_form>(form_).description;
            }
        }

    private:
        struct invalid_form {
            std::string description;
        };

        using form = std::variant<invalid_form, std::string, prepared_statement>;

        template<typename Expr>
        static form make_form(Expr&& expr) {
            using E = std::remove_cvref_t<Expr>;

            if constexpr (std::is_same_v<E, prepared_statement>) {
                if (!expr.valid()) {
                    return invalid_form{"invalid prepared statement"};
                }
                return std::forward<Expr>(expr);
            } else if constexpr (std::is_pointer_v<E> && std::convertible_to<E, std::string_view>) {
                if (expr == nullptr) {
                    return invalid_form{"null SQL text"};
                }
                return std::string(expr);
            } else if constexpr (std::convertible_to<Expr, std::string_view>) {
                return std::string(std::string_view(expr));
            } else {
                return invalid_form{describe_value(expr)};
            }
        }

        form form_{invalid_form{"empty expression"}};
        std::vector<value> params_;
    };

    using execute_fn = query_result (*)(database_connection&, const query_expression&, const execute_options&);

    namespace detail {

        inline query_result execute_by_text(database_connection& conn, const query_expression& expr,
                                            const execute_options& options) {
            return conn.execute_text(expr.sql(), options);
        }

        inline query_result execute_by_statement(database_connection& conn, const query_expression& expr,
                                                 const execute_options& options) {
            return conn.execute_statement(expr.statement(), options);
        }

    } // namespace detail

    // Pick the execution primitive for the expression's executable form
    [[nodiscard]] inline execute_fn executor_for(const query_expression& expr) {
        switch (expr.kind()) {
            case expression_kind::text:
                return &detail::execute_by_text;
            case expression_kind::statement:
                return &detail::execute_by_statement;
            default:
                throw invalid_expression_error{expr.describe()};
        }
    }

    /**
     * Execute a query against a source and return the full result.
     *
     * A connection borrowed from a pool or opened from a config stays out
     * after the call: give it back with release_connection(), or use
     * with_connection() instead.
     */
    [[nodiscard]] inline query_result execute(const connection_source& source,
                                              const query_expression& expr,
                                              const execute_options& options = {}) {
        auto fn = executor_for(expr);
        auto conn = resolve_connection(source);
        return fn(*conn, expr, merge_options(options, expr.params()));
    }

    // Like execute() but asks the driver for the first row only
    [[nodiscard]] inline std::optional<result_row> execute_one(const connection_source& source,
                                                               const query_expression& expr,
                                                               const execute_options& options = {}) {
        auto fn = executor_for(expr);
        auto conn = resolve_connection(source);
        return fn(*conn, expr, merge_options(options, expr.params(), true)).first();
    }

    /**
     * Prepare a statement from [sql, params...]. The params only serve as
     * type hints: without 42 in {"select $1 as x", 42} the server would type
     * $1 as text.
     *
     * The statement belongs to the connection it was prepared on; one
     * opened from a config stays open for it until released.
     */
    [[nodiscard]] inline prepared_statement prepare(const connection_source& source,
                                                    const query_expression& expr,
                                                    const execute_options& options = {}) {
        if (expr.kind() != expression_kind::text) {
            throw invalid_expression_error{expr.describe()};
        }
        auto conn = resolve_connection(source);
        return conn->prepare(expr.sql(), merge_options(options, expr.params()));
    }

    // Server-side batch execution is not supported
    template<typename... Args>
    [[noreturn]] void execute_batch(Args&&...) {
        throw not_implemented_error{"execute_batch"};
    }

} // namespace gleipnir
