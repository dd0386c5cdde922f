#pragma once

#include <charconv>
#include <concepts>
#include <cstdint>
#include <format>
#include <iterator>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeinfo>
#include <variant>
#include <vector>

namespace gleipnir {

    // Type OIDs, as libpq reports them
    using oid = unsigned int;

    namespace oids {
        inline constexpr oid unspecified = 0;
        inline constexpr oid boolean = 16;
        inline constexpr oid int8 = 20;
        inline constexpr oid int2 = 21;
        inline constexpr oid int4 = 23;
        inline constexpr oid text = 25;
        inline constexpr oid float4 = 700;
        inline constexpr oid float8 = 701;
        inline constexpr oid numeric = 1700;
    }

    // A parameter or column value; std::monostate is SQL NULL
    using value = std::variant<std::monostate, bool, std::int64_t, double, std::string>;

    template<typename T>
    concept Optional = requires(const T& t) {
        typename T::value_type;
        { t.has_value() } -> std::convertible_to<bool>;
        { *t };
    };

    // Printable description of an arbitrary value, used in error messages
    template<typename T>
    [[nodiscard]] std::string describe_value(const T& v) {
        if constexpr (std::is_default_constructible_v<std::formatter<T, char>>) {
            return std::format("{}", v);
        } else {
            return std::format("<{}>", typeid(T).name());
        }
    }

    // Convert a C++ argument to a value, in the manner of parameter binding
    template<typename T>
    [[nodiscard]] value to_value(T&& v) {
        using DecayedT = std::remove_cvref_t<T>;

        if constexpr (std::is_same_v<DecayedT, value>) {
            return std::forward<T>(v);
        } else if constexpr (std::is_same_v<DecayedT, std::nullptr_t>
                             || std::is_same_v<DecayedT, std::monostate>
                             || std::is_same_v<DecayedT, std::nullopt_t>) {
            return std::monostate{};
        } else if constexpr (Optional<DecayedT>) {
            if (!v.has_value()) {
                return std::monostate{};
            }
            return to_value(*std::forward<T>(v));
        } else if constexpr (std::is_same_v<DecayedT, bool>) {
            return v;
        } else if constexpr (std::is_integral_v<DecayedT>) {
            return static_cast<std::int64_t>(v);
        } else if constexpr (std::is_floating_point_v<DecayedT>) {
            return static_cast<double>(v);
        } else if constexpr (std::is_same_v<DecayedT, std::string>) {
            return std::forward<T>(v);
        } else if constexpr (std::is_pointer_v<DecayedT>
                             && std::convertible_to<DecayedT, std::string_view>) {
            if (v == nullptr) {
                return std::monostate{};
            }
            return std::string(v);
        } else if constexpr (std::convertible_to<T, std::string_view>) {
            return std::string(std::string_view(v));
        } else {
            return std::format("{}", v);
        }
    }

    [[nodiscard]] inline bool is_null(const value& v) noexcept {
        return std::holds_alternative<std::monostate>(v);
    }

    // Parameter type hint for a value; text and NULL are left to the server
    [[nodiscard]] inline oid infer_type(const value& v) noexcept {
        switch (v.index()) {
            case 1: return oids::boolean;
            case 2: return oids::int8;
            case 3: return oids::float8;
            default: return oids::unspecified;
        }
    }

    [[nodiscard]] inline std::vector<oid> infer_types(const std::vector<value>& values) {
        std::vector<oid> types;
        types.reserve(values.size());
        for (const auto& v : values) {
            types.push_back(infer_type(v));
        }
        return types;
    }

    // Text representation of a non-null value
    [[nodiscard]] inline std::string to_text(const value& v) {
        return std::visit([](const auto& x) -> std::string {
            using X = std::decay_t<decltype(x)>;
            if constexpr (std::is_same_v<X, std::monostate>) {
                return "NULL";
            } else if constexpr (std::is_same_v<X, bool>) {
                return x ? "t" : "f";
            } else if constexpr (std::is_same_v<X, std::string>) {
                return x;
            } else {
                return std::format("{}", x);
            }
        }, v);
    }

    namespace detail {

        template<typename T>
        std::optional<T> parse_number(std::string_view str) {
            T out{};
            auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), out);
            if (ec != std::errc{} || ptr != str.data() + str.size()) {
                return std::nullopt;
            }
            return out;
        }

        template<typename T>
        std::optional<T> value_cast(const value& v) {
            if (is_null(v)) {
                return std::nullopt;
            }
            if constexpr (std::is_same_v<T, std::string>) {
                return to_text(v);
            } else if constexpr (std::is_same_v<T, bool>) {
                if (auto b = std::get_if<bool>(&v)) return *b;
                if (auto i = std::get_if<std::int64_t>(&v)) return *i != 0;
                const auto& s = to_text(v);
                if (s == "t" || s == "true" || s == "1") return true;
                if (s == "f" || s == "false" || s == "0") return false;
                return std::nullopt;
            } else if constexpr (std::is_arithmetic_v<T>) {
                if (auto i = std::get_if<std::int64_t>(&v)) return static_cast<T>(*i);
                if (auto d = std::get_if<double>(&v)) return static_cast<T>(*d);
                if (auto b = std::get_if<bool>(&v)) return static_cast<T>(*b);
                return parse_number<T>(std::get<std::string>(v));
            } else {
                static_assert(std::is_arithmetic_v<T>, "unsupported target type");
                return std::nullopt;
            }
        }

    } // namespace detail

    struct column_info {
        std::string name;
        oid type = oids::unspecified;
    };

    // Single row, detached from its result
    class result_row {
    public:
        result_row(std::shared_ptr<const std::vector<column_info>> columns, std::vector<value> values)
            : columns_(std::move(columns)), values_(std::move(values)) {}

        [[nodiscard]] std::size_t size() const noexcept { return values_.size(); }

        [[nodiscard]] std::optional<std::size_t> column_index(std::string_view name) const {
            for (std::size_t i = 0; i < columns_->size(); ++i) {
                if ((*columns_)[i].name == name) return i;
            }
            return std::nullopt;
        }

        [[nodiscard]] bool contains(std::string_view name) const {
            return column_index(name).has_value();
        }

        [[nodiscard]] const value& operator[](std::size_t col) const { return values_.at(col); }

        [[nodiscard]] const value& at(std::string_view name) const {
            auto idx = column_index(name);
            if (!idx) {
                throw std::out_of_range(std::format("No column named {}", name));
            }
            return values_[*idx];
        }

        template<typename T>
        [[nodiscard]] std::optional<T> get(std::size_t col) const {
            if (col >= values_.size()) return std::nullopt;
            return detail::value_cast<T>(values_[col]);
        }

        template<typename T>
        [[nodiscard]] std::optional<T> get(std::string_view name) const {
            auto idx = column_index(name);
            if (!idx) return std::nullopt;
            return get<T>(*idx);
        }

        [[nodiscard]] const std::vector<value>& values() const noexcept { return values_; }

    private:
        std::shared_ptr<const std::vector<column_info>> columns_;
        std::vector<value> values_;
    };

    // Materialized result set, independent of the driver that produced it
    class query_result {
    public:
        query_result() : columns_(std::make_shared<const std::vector<column_info>>()) {}

        query_result(std::vector<column_info> columns,
                     std::vector<std::vector<value>> rows,
                     std::string command_tag = {},
                     int affected_rows = 0)
            : columns_(std::make_shared<const std::vector<column_info>>(std::move(columns))),
              rows_(std::move(rows)),
              command_tag_(std::move(command_tag)),
              affected_rows_(affected_rows) {}

        [[nodiscard]] int row_count() const noexcept {
            return static_cast<int>(rows_.size());
        }

        [[nodiscard]] int column_count() const noexcept {
            return static_cast<int>(columns_->size());
        }

        [[nodiscard]] bool empty() const noexcept { return rows_.empty(); }

        [[nodiscard]] std::optional<std::string> column_name(int col) const {
            if (col < 0 || col >= column_count()) {
                return std::nullopt;
            }
            return (*columns_)[col].name;
        }

        [[nodiscard]] std::optional<oid> column_type(int col) const {
            if (col < 0 || col >= column_count()) {
                return std::nullopt;
            }
            return (*columns_)[col].type;
        }

        [[nodiscard]] std::optional<int> column_index(std::string_view name) const {
            for (int i = 0; i < column_count(); ++i) {
                if ((*columns_)[i].name == name) return i;
            }
            return std::nullopt;
        }

        [[nodiscard]] bool is_null(int row, int col) const noexcept {
            if (!in_range(row, col)) return true;
            return gleipnir::is_null(rows_[row][col]);
        }

        [[nodiscard]] std::optional<value> get_value(int row, int col) const {
            if (!in_range(row, col) || is_null(row, col)) {
                return std::nullopt;
            }
            return rows_[row][col];
        }

        // Get value with type conversion
        template<typename T>
        [[nodiscard]] std::optional<T> get(int row, int col) const {
            if (!in_range(row, col)) return std::nullopt;
            return detail::value_cast<T>(rows_[row][col]);
        }

        template<typename T>
        [[nodiscard]] std::optional<T> get(int row, std::string_view col_name) const {
            auto idx = column_index(col_name);
            if (!idx) return std::nullopt;
            return get<T>(row, *idx);
        }

        [[nodiscard]] result_row row(int index) const {
            return result_row(columns_, rows_.at(index));
        }

        [[nodiscard]] std::optional<result_row> first() const {
            if (rows_.empty()) return std::nullopt;
            return row(0);
        }

        // Number of rows touched by INSERT/UPDATE/DELETE
        [[nodiscard]] int affected_rows() const noexcept { return affected_rows_; }

        [[nodiscard]] const std::string& command_tag() const noexcept { return command_tag_; }

        // Iterator support for range-based for loops over row indices
        class row_iterator {
        public:
            using iterator_category = std::forward_iterator_tag;
            using value_type = int;
            using difference_type = std::ptrdiff_t;
            using pointer = const int*;
            using reference = const int&;

            explicit row_iterator(int row) : row_(row) {}

            int operator*() const { return row_; }

            row_iterator& operator++() {
                ++row_;
                return *this;
            }

            row_iterator operator++(int) {
                row_iterator tmp = *this;
                ++(*this);
                return tmp;
            }

            bool operator==(const row_iterator& other) const = default;

        private:
            int row_;
        };

        [[nodiscard]] row_iterator begin() const { return row_iterator(0); }
        [[nodiscard]] row_iterator end() const { return row_iterator(row_count()); }

    private:
        [[nodiscard]] bool in_range(int row, int col) const noexcept {
            return row >= 0 && row < row_count() && col >= 0 && col < column_count();
        }

        std::shared_ptr<const std::vector<column_info>> columns_;
        std::vector<std::vector<value>> rows_;
        std::string command_tag_;
        int affected_rows_ = 0;
    };

} // namespace gleipnir
