#include "key_value.hpp"

#include <cctype>
#include <charconv>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iomanip>
#include <limits>
#include <sstream>
#include <type_traits>
#include <vector>

namespace statforge {
namespace keyvalue {

namespace {

// Nesting deeper than this is treated as a corrupt file
constexpr int kMaxDepth = 256;

constexpr size_t kStringChunk = 128;

bool is_valid_utf8(const std::string &s) {
    size_t i = 0;
    while (i < s.size()) {
        auto c = static_cast<unsigned char>(s[i]);
        size_t extra;
        uint32_t cp;
        if (c < 0x80) {
            ++i;
            continue;
        } else if ((c & 0xE0) == 0xC0) {
            extra = 1;
            cp = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            extra = 2;
            cp = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            extra = 3;
            cp = c & 0x07;
        } else {
            return false;
        }
        if (i + extra >= s.size()) {
            return false;
        }
        for (size_t k = 1; k <= extra; ++k) {
            auto cc = static_cast<unsigned char>(s[i + k]);
            if ((cc & 0xC0) != 0x80) {
                return false;
            }
            cp = (cp << 6) | (cc & 0x3F);
        }
        // Overlong forms, surrogates and out-of-range code points
        if ((extra == 1 && cp < 0x80) || (extra == 2 && cp < 0x800) || (extra == 3 && cp < 0x10000) ||
            (cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF) {
            return false;
        }
        i += extra + 1;
    }
    return true;
}

bool read_bytes(std::istream &input, uint8_t *buf, size_t n, KeyValueError &error) {
    input.read(reinterpret_cast<char *>(buf), static_cast<std::streamsize>(n));
    if (static_cast<size_t>(input.gcount()) != n) {
        error = {KeyValueErrorKind::IO, "Unexpected end of stream"};
        return false;
    }
    return true;
}

template <typename T>
bool read_le(std::istream &input, T &out, KeyValueError &error) {
    uint8_t buf[sizeof(T)];
    if (!read_bytes(input, buf, sizeof(T), error)) {
        return false;
    }
    uint64_t raw = 0;
    for (size_t i = 0; i < sizeof(T); ++i) {
        raw |= uint64_t(buf[i]) << (8 * i);
    }
    if constexpr (std::is_same<T, float>::value) {
        uint32_t bits = static_cast<uint32_t>(raw);
        static_assert(sizeof(float) == sizeof(uint32_t), "float must be 32 bits");
        std::memcpy(&out, &bits, sizeof(out));
    } else {
        out = static_cast<T>(raw);
    }
    return true;
}

bool parse_i32(const std::string &s, int32_t &out) {
    if (s.empty() || std::isspace(static_cast<unsigned char>(s[0]))) {
        return false;
    }
    errno = 0;
    char *end = nullptr;
    long long value = std::strtoll(s.c_str(), &end, 10);
    if (errno != 0 || *end != '\0' || value < std::numeric_limits<int32_t>::min() ||
        value > std::numeric_limits<int32_t>::max()) {
        return false;
    }
    out = static_cast<int32_t>(value);
    return true;
}

bool parse_f32(const std::string &s, float &out) {
    if (s.empty() || std::isspace(static_cast<unsigned char>(s[0]))) {
        return false;
    }
    char *end = nullptr;
    float value = std::strtof(s.c_str(), &end);
    if (*end != '\0') {
        return false;
    }
    out = value;
    return true;
}

// Saturating float -> int32 conversion; NaN becomes 0
int32_t saturate_i32(float f) {
    if (std::isnan(f)) {
        return 0;
    }
    if (f <= static_cast<float>(std::numeric_limits<int32_t>::min())) {
        return std::numeric_limits<int32_t>::min();
    }
    if (f >= static_cast<float>(std::numeric_limits<int32_t>::max())) {
        return std::numeric_limits<int32_t>::max();
    }
    return static_cast<int32_t>(f);
}

// Shortest text that reads back as the same float, never in exponent form
std::string format_float(float f) {
    if (std::isnan(f)) {
        return "NaN";
    }
    if (std::isinf(f)) {
        return f < 0 ? "-inf" : "inf";
    }
    char buffer[64];
    auto result = std::to_chars(buffer, buffer + sizeof(buffer), f, std::chars_format::fixed);
    if (result.ec != std::errc()) {
        std::ostringstream oss;
        oss << std::setprecision(std::numeric_limits<float>::max_digits10) << f;
        return oss.str();
    }
    return std::string(buffer, result.ptr);
}

}  // namespace

const char *key_value_type_to_string(KeyValueType type) {
    switch (type) {
        case KeyValueType::NONE:
            return "None";
        case KeyValueType::STRING:
            return "String";
        case KeyValueType::INT32:
            return "Int32";
        case KeyValueType::FLOAT32:
            return "Float32";
        case KeyValueType::POINTER:
            return "Pointer";
        case KeyValueType::WIDE_STRING:
            return "WideString";
        case KeyValueType::COLOR:
            return "Color";
        case KeyValueType::UINT64:
            return "UInt64";
        case KeyValueType::END:
            return "End";
        default:
            return "Unknown";
    }
}

std::string KeyValueError::to_string() const {
    switch (kind) {
        case KeyValueErrorKind::IO:
            return "IO error: " + message;
        case KeyValueErrorKind::FORMAT:
            return "Format error: " + message;
        case KeyValueErrorKind::UNSUPPORTED_TYPE:
            return "Unsupported type: " + message;
        default:
            return message;
    }
}

bool read_string(std::istream &input, std::string &out, KeyValueError &error) {
    std::vector<char> data(kStringChunk);
    size_t i = 0;

    while (true) {
        if (i + 1 > data.size()) {
            data.resize(data.size() + kStringChunk);
        }
        if (!input.get(data[i])) {
            error = {KeyValueErrorKind::IO, "Unexpected end of stream inside string"};
            return false;
        }
        if (data[i] == '\0') {
            break;
        }
        ++i;
    }

    out.assign(data.data(), i);
    if (!is_valid_utf8(out)) {
        out.clear();
    }
    return true;
}

KeyValue KeyValue::root() { return KeyValue("<root>", true); }

const KeyValue &KeyValue::invalid() {
    static const KeyValue sentinel("<invalid>", false);
    return sentinel;
}

bool KeyValue::decode(std::istream &input, KeyValue &out, KeyValueError &error) {
    KeyValue tree = root();
    if (!tree.read_children(input, 0, error)) {
        return false;
    }
    out = std::move(tree);
    return true;
}

bool KeyValue::load_binary(const std::string &path, KeyValue &out, KeyValueError &error) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        error = {KeyValueErrorKind::IO, "Cannot open " + path};
        return false;
    }
    return decode(file, out, error);
}

bool KeyValue::read_children(std::istream &input, int depth, KeyValueError &error) {
    if (depth > kMaxDepth) {
        error = {KeyValueErrorKind::FORMAT, "Nesting deeper than " + std::to_string(kMaxDepth) + " levels"};
        return false;
    }

    while (true) {
        uint8_t tag = 0;
        if (!read_bytes(input, &tag, 1, error)) {
            return false;
        }
        if (tag > static_cast<uint8_t>(KeyValueType::END)) {
            error = {KeyValueErrorKind::FORMAT, "Invalid KeyValueType: " + std::to_string(tag)};
            return false;
        }

        auto type = static_cast<KeyValueType>(tag);
        if (type == KeyValueType::END) {
            return true;
        }

        std::string name;
        if (!read_string(input, name, error)) {
            return false;
        }
        KeyValue current(name, true);

        switch (type) {
            case KeyValueType::NONE:
                if (!current.read_children(input, depth + 1, error)) {
                    return false;
                }
                break;
            case KeyValueType::STRING: {
                std::string value;
                if (!read_string(input, value, error)) {
                    return false;
                }
                current.data_ = std::move(value);
                break;
            }
            case KeyValueType::WIDE_STRING:
                error = {KeyValueErrorKind::UNSUPPORTED_TYPE, key_value_type_to_string(type)};
                return false;
            case KeyValueType::INT32: {
                int32_t value = 0;
                if (!read_le(input, value, error)) {
                    return false;
                }
                current.data_ = value;
                break;
            }
            case KeyValueType::FLOAT32: {
                float value = 0.0f;
                if (!read_le(input, value, error)) {
                    return false;
                }
                current.data_ = value;
                break;
            }
            case KeyValueType::UINT64: {
                uint64_t value = 0;
                if (!read_le(input, value, error)) {
                    return false;
                }
                current.data_ = value;
                break;
            }
            case KeyValueType::COLOR:
            case KeyValueType::POINTER: {
                uint32_t value = 0;
                if (!read_le(input, value, error)) {
                    return false;
                }
                current.data_ = ColorValue{value};
                break;
            }
            default:
                break;
        }

        children_.insert_or_assign(name, std::move(current));
    }
}

const KeyValue &KeyValue::get(const std::string &key) const {
    auto it = children_.find(key);
    if (it == children_.end()) {
        return invalid();
    }
    return it->second;
}

std::string KeyValue::as_string(const std::string &default_value) const {
    if (!valid_) {
        return default_value;
    }
    if (auto s = std::get_if<std::string>(&data_)) return *s;
    if (auto i = std::get_if<int32_t>(&data_)) return std::to_string(*i);
    if (auto f = std::get_if<float>(&data_)) return format_float(*f);
    if (auto u = std::get_if<uint64_t>(&data_)) return std::to_string(*u);
    if (auto c = std::get_if<ColorValue>(&data_)) return std::to_string(c->value);
    return default_value;
}

int32_t KeyValue::as_i32(int32_t default_value) const {
    if (!valid_) {
        return default_value;
    }
    if (auto s = std::get_if<std::string>(&data_)) {
        int32_t parsed = 0;
        return parse_i32(*s, parsed) ? parsed : default_value;
    }
    if (auto i = std::get_if<int32_t>(&data_)) return *i;
    if (auto f = std::get_if<float>(&data_)) return saturate_i32(*f);
    if (auto u = std::get_if<uint64_t>(&data_)) return static_cast<int32_t>(static_cast<uint32_t>(*u & 0xFFFFFFFFu));
    return default_value;
}

float KeyValue::as_f32(float default_value) const {
    if (!valid_) {
        return default_value;
    }
    if (auto s = std::get_if<std::string>(&data_)) {
        float parsed = 0.0f;
        return parse_f32(*s, parsed) ? parsed : default_value;
    }
    if (auto i = std::get_if<int32_t>(&data_)) return static_cast<float>(*i);
    if (auto f = std::get_if<float>(&data_)) return *f;
    if (auto u = std::get_if<uint64_t>(&data_)) return static_cast<float>(*u & 0xFFFFFFFFu);
    return default_value;
}

bool KeyValue::as_bool(bool default_value) const {
    if (!valid_) {
        return default_value;
    }
    if (auto s = std::get_if<std::string>(&data_)) {
        int32_t parsed = 0;
        return parse_i32(*s, parsed) ? parsed != 0 : default_value;
    }
    if (auto i = std::get_if<int32_t>(&data_)) return *i != 0;
    if (auto f = std::get_if<float>(&data_)) return *f != 0.0f;
    if (auto u = std::get_if<uint64_t>(&data_)) return *u != 0;
    return default_value;
}

std::string KeyValue::to_string() const {
    if (!valid_) {
        return "<invalid>";
    }
    if (std::holds_alternative<std::monostate>(data_) && !children_.empty()) {
        return name_;
    }
    return name_ + " = " + as_string("");
}

std::ostream &operator<<(std::ostream &os, const KeyValue &kv) { return os << kv.to_string(); }

}  // namespace keyvalue
}  // namespace statforge
