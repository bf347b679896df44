#include "factlog/value.hpp"

#include <cctype>
#include <chrono>
#include <cstdio>
#include <iomanip>
#include <limits>
#include <sstream>

namespace factlog {

namespace {

// Reads exactly `width` decimal digits starting at pos
bool read_digits(std::string_view s, size_t pos, size_t width, int& out) {
    if (pos + width > s.size()) return false;
    int v = 0;
    for (size_t i = 0; i < width; ++i) {
        char c = s[pos + i];
        if (c < '0' || c > '9') return false;
        v = v * 10 + (c - '0');
    }
    out = v;
    return true;
}

// stoll/stod skip leading whitespace and accept '+'; encode() emits neither
bool canonical_number(std::string_view s) {
    return !s.empty() && s[0] != '+' && !std::isspace(static_cast<unsigned char>(s[0]));
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // anonymous namespace

// =============================================================================
// Uuid
// =============================================================================

std::optional<Uuid> Uuid::parse(std::string_view text) {
    if (text.size() != 36) return std::nullopt;

    std::array<uint8_t, 16> bytes{};
    size_t b = 0;
    for (size_t i = 0; i < text.size();) {
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            if (text[i] != '-') return std::nullopt;
            ++i;
            continue;
        }
        int hi = hex_value(text[i]);
        int lo = hex_value(text[i + 1]);
        if (hi < 0 || lo < 0) return std::nullopt;
        bytes[b++] = static_cast<uint8_t>((hi << 4) | lo);
        i += 2;
    }
    return Uuid(bytes);
}

std::string Uuid::to_string() const {
    static const char hex[] = "0123456789abcdef";
    std::string out;
    out.reserve(36);
    for (size_t i = 0; i < bytes.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) out += '-';
        out += hex[(bytes[i] >> 4) & 0xF];
        out += hex[bytes[i] & 0xF];
    }
    return out;
}

// =============================================================================
// Instant
// =============================================================================

std::optional<Instant> Instant::parse(std::string_view s) {
    int year, month, day, hour, minute, second;
    if (!read_digits(s, 0, 4, year) || s.size() < 19 || s[4] != '-' ||
        !read_digits(s, 5, 2, month) || s[7] != '-' ||
        !read_digits(s, 8, 2, day) || (s[10] != 'T' && s[10] != ' ') ||
        !read_digits(s, 11, 2, hour) || s[13] != ':' ||
        !read_digits(s, 14, 2, minute) || s[16] != ':' ||
        !read_digits(s, 17, 2, second)) {
        return std::nullopt;
    }
    const std::chrono::year_month_day date{std::chrono::year{year},
                                           std::chrono::month{static_cast<unsigned>(month)},
                                           std::chrono::day{static_cast<unsigned>(day)}};
    if (!date.ok() || hour > 23 || minute > 59 || second > 59) {
        return std::nullopt;
    }

    size_t pos = 19;
    int64_t millis = 0;
    if (pos < s.size() && s[pos] == '.') {
        ++pos;
        int64_t scale = 100;
        size_t digits = 0;
        while (pos < s.size() && s[pos] >= '0' && s[pos] <= '9') {
            // Sub-millisecond digits are truncated
            if (scale > 0) {
                millis += (s[pos] - '0') * scale;
                scale /= 10;
            }
            ++pos;
            ++digits;
        }
        if (digits == 0) return std::nullopt;
    }

    int64_t offset_minutes = 0;
    if (pos < s.size()) {
        if (s[pos] == 'Z' || s[pos] == 'z') {
            ++pos;
        } else if (s[pos] == '+' || s[pos] == '-') {
            int sign = s[pos] == '-' ? -1 : 1;
            int oh, om;
            if (!read_digits(s, pos + 1, 2, oh)) return std::nullopt;
            size_t mpos = pos + 3;
            if (mpos < s.size() && s[mpos] == ':') ++mpos;
            if (!read_digits(s, mpos, 2, om)) return std::nullopt;
            if (oh > 23 || om > 59) return std::nullopt;
            offset_minutes = sign * (oh * 60 + om);
            pos = mpos + 2;
        } else {
            return std::nullopt;
        }
    }
    if (pos != s.size()) return std::nullopt;

    int64_t days = std::chrono::sys_days{date}.time_since_epoch().count();
    int64_t secs = days * 86400 + hour * 3600 + minute * 60 + second - offset_minutes * 60;
    Instant instant(secs * 1000 + millis);
    if (!instant.in_range()) return std::nullopt;
    return instant;
}

Instant Instant::now() {
    auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
    return Instant(std::chrono::duration_cast<std::chrono::milliseconds>(since_epoch).count());
}

std::string Instant::to_string() const {
    using namespace std::chrono;

    const sys_time<milliseconds> tp{milliseconds{millis}};
    const sys_days day_start = floor<days>(tp);
    const year_month_day date{day_start};
    const int64_t ms_of_day = (tp - day_start).count();

    char buf[48];
    std::snprintf(buf, sizeof(buf), "%04d-%02u-%02uT%02lld:%02lld:%02lld.%03lldZ",
                  static_cast<int>(date.year()),
                  static_cast<unsigned>(date.month()),
                  static_cast<unsigned>(date.day()),
                  static_cast<long long>(ms_of_day / 3600000),
                  static_cast<long long>(ms_of_day / 60000 % 60),
                  static_cast<long long>(ms_of_day / 1000 % 60),
                  static_cast<long long>(ms_of_day % 1000));
    return buf;
}

// =============================================================================
// Value
// =============================================================================

const char* value_type_name(ValueType type) {
    switch (type) {
        case ValueType::String:  return "string";
        case ValueType::Integer: return "integer";
        case ValueType::Double:  return "double";
        case ValueType::Boolean: return "boolean";
        case ValueType::Instant: return "instant";
        case ValueType::Uuid:    return "uuid";
        case ValueType::Keyword: return "keyword";
    }
    return "unknown";
}

char Value::type_tag() const noexcept {
    switch (type()) {
        case ValueType::String:  return 's';
        case ValueType::Integer: return 'i';
        case ValueType::Double:  return 'd';
        case ValueType::Boolean: return 'b';
        case ValueType::Instant: return 't';
        case ValueType::Uuid:    return 'u';
        case ValueType::Keyword: return 'k';
    }
    return '?';
}

std::string Value::encode() const {
    switch (type()) {
        case ValueType::String:  return std::get<std::string>(data_);
        case ValueType::Integer: return std::to_string(std::get<int64_t>(data_));
        case ValueType::Double: {
            std::ostringstream ss;
            ss << std::setprecision(std::numeric_limits<double>::max_digits10)
               << std::get<double>(data_);
            return ss.str();
        }
        case ValueType::Boolean: return std::get<bool>(data_) ? "true" : "false";
        case ValueType::Instant: {
            const Instant& instant = std::get<Instant>(data_);
            FACTLOG_CHECK_ARGUMENT(instant.in_range(),
                                   "Instant " + std::to_string(instant.millis) +
                                   " ms is outside years 0001-9999");
            return instant.to_string();
        }
        case ValueType::Uuid:    return std::get<Uuid>(data_).to_string();
        case ValueType::Keyword: return std::get<Keyword>(data_).name;
    }
    return {};
}

Value Value::decode(char tag, std::string_view text) {
    auto bad = [&](const char* what) {
        return InvalidArgumentError(std::string("Cannot decode ") + what + " value '" +
                                    std::string(text) + "'", "Value::decode");
    };

    switch (tag) {
        case 's':
            return Value(std::string(text));
        case 'i': {
            if (!canonical_number(text)) throw bad("integer");
            std::string s(text);
            size_t used = 0;
            try {
                int64_t v = std::stoll(s, &used);
                if (used == s.size()) return Value(v);
            } catch (const std::exception&) {
            }
            throw bad("integer");
        }
        case 'd': {
            if (!canonical_number(text)) throw bad("double");
            std::string s(text);
            size_t used = 0;
            try {
                double v = std::stod(s, &used);
                if (used == s.size()) return Value(v);
            } catch (const std::exception&) {
            }
            throw bad("double");
        }
        case 'b':
            if (text == "true" || text == "t") return Value(true);
            if (text == "false" || text == "f") return Value(false);
            throw bad("boolean");
        case 't':
            if (auto instant = Instant::parse(text)) return Value(*instant);
            throw bad("instant");
        case 'u':
            if (auto uuid = Uuid::parse(text)) return Value(*uuid);
            throw bad("uuid");
        case 'k':
            if (text.empty()) throw bad("keyword");
            return Value::keyword(std::string(text));
        default:
            throw InvalidArgumentError(std::string("Unknown value type tag '") + tag + "'",
                                       "Value::decode");
    }
}

std::string Value::to_string() const {
    if (type() == ValueType::Keyword) {
        return ":" + std::get<Keyword>(data_).name;
    }
    if (type() == ValueType::Instant) {
        return "#inst \"" + std::get<Instant>(data_).to_string() + "\"";
    }
    if (type() == ValueType::Uuid) {
        return "#uuid \"" + std::get<Uuid>(data_).to_string() + "\"";
    }
    return encode();
}

std::ostream& operator<<(std::ostream& os, const Value& value) {
    return os << value.to_string();
}

std::ostream& operator<<(std::ostream& os, const Instant& instant) {
    return os << instant.to_string();
}

std::ostream& operator<<(std::ostream& os, const Uuid& uuid) {
    return os << uuid.to_string();
}

} // namespace factlog
