#pragma once

#include <exception>
#include <format>
#include <source_location>
#include <stdexcept>
#include <string>

namespace gleipnir {

    // Error type for database operations
    struct database_error : public std::runtime_error {
        std::string sql_state;
        std::source_location location;

        database_error(std::string msg, std::string state = "",
                      std::source_location loc = std::source_location::current())
            : std::runtime_error(msg), sql_state(std::move(state)), location(loc) {}

        std::string message() const { return what(); }
    };

    // The connection source is absent
    struct null_source_error : public database_error {
        explicit null_source_error(std::source_location loc = std::source_location::current())
            : database_error("Connection source cannot be null", "", loc) {}
    };

    // The connection source is neither a connection, a pool nor a config
    struct unsupported_source_error : public database_error {
        std::string source;

        explicit unsupported_source_error(std::string description,
                                          std::source_location loc = std::source_location::current())
            : database_error(std::format("Unsupported connection source: {}", description), "", loc),
              source(std::move(description)) {}
    };

    // The executable form is neither SQL text nor a prepared statement
    struct invalid_expression_error : public database_error {
        std::string expression;

        explicit invalid_expression_error(std::string description,
                                          std::source_location loc = std::source_location::current())
            : database_error(std::format("Wrong execute expression: {}", description), "", loc),
              expression(std::move(description)) {}
    };

    struct not_implemented_error : public database_error {
        std::string operation;

        explicit not_implemented_error(std::string name,
                                       std::source_location loc = std::source_location::current())
            : database_error(std::format("{} is not implemented", name), "", loc),
              operation(std::move(name)) {}
    };

    /**
     * Raised when rolling back after a failed transaction body fails as well.
     * The body's failure is kept and can be rethrown.
     */
    class rollback_error : public database_error {
    public:
        rollback_error(std::string reason, std::exception_ptr original,
                       std::source_location loc = std::source_location::current())
            : database_error(std::format("Rollback failed: {}", reason), "", loc),
              original_(std::move(original)) {}

        [[nodiscard]] std::exception_ptr original() const noexcept {
            return original_;
        }

        [[noreturn]] void rethrow_original() const {
            std::rethrow_exception(original_);
        }

    private:
        std::exception_ptr original_;
    };

} // namespace gleipnir
