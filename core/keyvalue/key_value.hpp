#pragma once

#include <cstdint>
#include <istream>
#include <map>
#include <ostream>
#include <string>
#include <variant>

namespace statforge {
namespace keyvalue {

// Tag byte preceding every node in the binary format
enum class KeyValueType : uint8_t {
    NONE = 0,  // container: children follow, closed by END
    STRING = 1,
    INT32 = 2,
    FLOAT32 = 3,
    POINTER = 4,
    WIDE_STRING = 5,
    COLOR = 6,
    UINT64 = 7,
    END = 8
};

const char *key_value_type_to_string(KeyValueType type);

enum class KeyValueErrorKind { IO, FORMAT, UNSUPPORTED_TYPE };

struct KeyValueError {
    KeyValueErrorKind kind = KeyValueErrorKind::IO;
    std::string message;

    std::string to_string() const;
};

// Color and pointer payloads are stored as a raw 32-bit value
struct ColorValue {
    uint32_t value = 0;

    bool operator==(const ColorValue &other) const { return value == other.value; }
};

using KeyValueData = std::variant<std::monostate, std::string, int32_t, float, uint64_t, ColorValue>;

/**
 * @brief One node of a decoded binary KeyValue tree.
 *
 * Lookups never fail: get() on a missing child returns a shared sentinel
 * whose valid() is false, and every accessor of the sentinel yields the
 * caller's default. Children are keyed by name; a later sibling with the
 * same name replaces the earlier one.
 */
class KeyValue {
public:
    // The "<root>" node: no data, valid, no children
    static KeyValue root();

    // Shared sentinel returned by failed lookups. Never mutated.
    static const KeyValue &invalid();

    // Decodes a stream into a fresh root. On failure `out` is left untouched.
    static bool decode(std::istream &input, KeyValue &out, KeyValueError &error);

    // decode() over a file
    static bool load_binary(const std::string &path, KeyValue &out, KeyValueError &error);

    const std::string &name() const { return name_; }
    const KeyValueData &data() const { return data_; }
    bool valid() const { return valid_; }
    const std::map<std::string, KeyValue> &children() const { return children_; }

    const KeyValue &get(const std::string &key) const;
    const KeyValue &operator[](const std::string &key) const { return get(key); }

    // Coercing accessors: fall back to the default for the sentinel, for
    // nodes without data and for values that cannot be converted
    std::string as_string(const std::string &default_value) const;
    int32_t as_i32(int32_t default_value) const;
    float as_f32(float default_value) const;
    bool as_bool(bool default_value) const;

    // "name = value", the bare name for a pure container, "<invalid>" for the sentinel
    std::string to_string() const;

private:
    KeyValue(std::string name, bool valid) : name_(std::move(name)), valid_(valid) {}

    bool read_children(std::istream &input, int depth, KeyValueError &error);

    std::string name_;
    KeyValueData data_;
    std::map<std::string, KeyValue> children_;
    bool valid_ = false;
};

std::ostream &operator<<(std::ostream &os, const KeyValue &kv);

// Reads a NUL-terminated string. Grows its buffer in 128 byte steps; EOF
// before the terminator is an IO error. Invalid UTF-8 yields an empty string.
bool read_string(std::istream &input, std::string &out, KeyValueError &error);

}  // namespace keyvalue
}  // namespace statforge
