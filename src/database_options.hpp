#pragma once

#include <cstdint>
#include <format>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include "database_error.hpp"
#include "database_value.hpp"

namespace gleipnir {

    // Options understood by the execution primitives
    struct execute_options {
        std::vector<value> params;
        // Parameter type OIDs; inferred from params when empty
        std::vector<oid> param_types;
        bool first_row_only = false;
    };

    /**
     * Merge caller options with the values injected by the dispatcher.
     * The injected params (and first_row_only, when given) always win over
     * what the caller passed, so the statement and its parameters cannot
     * disagree.
     */
    [[nodiscard]] inline execute_options merge_options(
        execute_options caller,
        std::vector<value> params,
        std::optional<bool> first_row_only = std::nullopt) {

        caller.params = std::move(params);
        if (first_row_only) {
            caller.first_row_only = *first_row_only;
        }
        return caller;
    }

    /**
     * Parameter type OIDs to send with options.params: the caller's
     * param_types when given, otherwise inferred from the values. Explicit
     * types must match the parameter count, since drivers hand both arrays
     * to the server with a single count.
     */
    [[nodiscard]] inline std::vector<oid> param_types_for(const execute_options& options) {
        if (options.param_types.empty()) {
            return infer_types(options.params);
        }
        if (options.param_types.size() != options.params.size()) {
            throw database_error{std::format("Expected {} parameter types, got {}",
                                             options.params.size(), options.param_types.size())};
        }
        return options.param_types;
    }

    // Types to prepare with: explicit param_types alone may declare a statement
    [[nodiscard]] inline std::vector<oid> prepare_types_for(const execute_options& options) {
        if (options.params.empty()) {
            return options.param_types;
        }
        return param_types_for(options);
    }

    // Keyed option vocabulary, used for transaction options
    using option_value = std::variant<bool, std::int64_t, std::string>;
    using option_map = std::map<std::string, option_value, std::less<>>;

} // namespace gleipnir
