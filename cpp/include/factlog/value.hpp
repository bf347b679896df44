#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <variant>

#include "factlog/error.hpp"

namespace factlog {

// 128-bit RFC 4122 identifier, compared bytewise
struct Uuid {
    std::array<uint8_t, 16> bytes{};

    constexpr Uuid() noexcept = default;
    explicit constexpr Uuid(const std::array<uint8_t, 16>& b) noexcept : bytes(b) {}

    // Accepts the canonical 8-4-4-4-12 hex form, either case
    static std::optional<Uuid> parse(std::string_view text);

    std::string to_string() const;

    bool operator==(const Uuid& other) const noexcept { return bytes == other.bytes; }
    bool operator!=(const Uuid& other) const noexcept { return bytes != other.bytes; }
    bool operator<(const Uuid& other) const noexcept { return bytes < other.bytes; }
};

// Wall-clock instant, UTC milliseconds since the Unix epoch
struct Instant {
    // 0001-01-01T00:00:00.000Z .. 9999-12-31T23:59:59.999Z, the four-digit-year span
    static constexpr int64_t MIN_MILLIS = -62135596800000;
    static constexpr int64_t MAX_MILLIS = 253402300799999;

    int64_t millis = 0;

    constexpr Instant() noexcept = default;
    explicit constexpr Instant(int64_t ms) noexcept : millis(ms) {}

    /**
     * Parse ISO-8601: YYYY-MM-DDTHH:MM:SS[.fff][Z|+HH:MM|-HH:MM].
     * A missing zone designator is read as UTC. nullopt when the result
     * falls outside [MIN_MILLIS, MAX_MILLIS].
     */
    static std::optional<Instant> parse(std::string_view text);

    static Instant now();

    // Only in-range instants can be encoded and parsed back
    constexpr bool in_range() const noexcept {
        return millis >= MIN_MILLIS && millis <= MAX_MILLIS;
    }

    // Always rendered as YYYY-MM-DDTHH:MM:SS.fffZ
    std::string to_string() const;

    constexpr bool operator==(const Instant& other) const noexcept { return millis == other.millis; }
    constexpr bool operator!=(const Instant& other) const noexcept { return millis != other.millis; }
    constexpr bool operator<(const Instant& other) const noexcept { return millis < other.millis; }
};

// Symbolic name such as order/status-shipped
struct Keyword {
    std::string name;

    bool operator==(const Keyword& other) const { return name == other.name; }
    bool operator!=(const Keyword& other) const { return name != other.name; }
    bool operator<(const Keyword& other) const { return name < other.name; }
};

// Declaration order of the variant alternatives; also the ordering rank
enum class ValueType : uint8_t {
    String = 0,
    Integer = 1,
    Double = 2,
    Boolean = 3,
    Instant = 4,
    Uuid = 5,
    Keyword = 6
};

const char* value_type_name(ValueType type);

/**
 * Attribute value. A closed set of alternatives so that comparison and
 * merging stay type-checked; values of different types are never equal
 * and order by their type tag first.
 */
class Value {
public:
    using Storage = std::variant<std::string, int64_t, double, bool, Instant, Uuid, Keyword>;

    Value() : data_(std::string()) {}
    Value(std::string s) : data_(std::move(s)) {}
    Value(const char* s) : data_(std::string(s)) {}
    Value(int64_t i) : data_(i) {}
    Value(int i) : data_(static_cast<int64_t>(i)) {}
    Value(double d) : data_(d) {}
    Value(bool b) : data_(b) {}
    Value(Instant t) : data_(t) {}
    Value(Uuid u) : data_(u) {}
    Value(Keyword k) : data_(std::move(k)) {}

    static Value keyword(std::string name) { return Value(Keyword{std::move(name)}); }

    ValueType type() const noexcept { return static_cast<ValueType>(data_.index()); }

    template<typename T>
    bool is() const noexcept { return std::holds_alternative<T>(data_); }

    // Throws InvalidArgumentError when the value holds another type
    template<typename T>
    const T& as() const;

    // Human-readable rendering; strings are not quoted
    std::string to_string() const;

    /**
     * Text codec used by stores that persist values as (tag, text).
     * Tags: s string, i integer, d double, b boolean, t instant, u uuid,
     * k keyword.
     */
    char type_tag() const noexcept;
    std::string encode() const;
    static Value decode(char tag, std::string_view text);

    bool operator==(const Value& other) const { return data_ == other.data_; }
    bool operator!=(const Value& other) const { return data_ != other.data_; }
    bool operator<(const Value& other) const { return data_ < other.data_; }

private:
    Storage data_;
};

template<typename T>
const T& Value::as() const {
    if (const T* p = std::get_if<T>(&data_)) {
        return *p;
    }
    throw InvalidArgumentError(std::string("Value holds ") + value_type_name(type()),
                               "Value::as");
}

std::ostream& operator<<(std::ostream& os, const Value& value);
std::ostream& operator<<(std::ostream& os, const Instant& instant);
std::ostream& operator<<(std::ostream& os, const Uuid& uuid);

} // namespace factlog
