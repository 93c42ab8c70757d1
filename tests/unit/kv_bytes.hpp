#pragma once

#include <cstdint>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <string>

#include "keyvalue/key_value.hpp"

namespace statforge {
namespace tests {

// Builds a binary KeyValue stream in the on-disk layout
class KvBytes {
public:
    using Type = keyvalue::KeyValueType;

    KvBytes &tag(Type type) {
        bytes_.push_back(static_cast<char>(type));
        return *this;
    }

    KvBytes &raw(uint8_t byte) {
        bytes_.push_back(static_cast<char>(byte));
        return *this;
    }

    KvBytes &cstr(const std::string &s) {
        bytes_.append(s);
        bytes_.push_back('\0');
        return *this;
    }

    KvBytes &u32(uint32_t v) {
        for (int i = 0; i < 4; ++i) bytes_.push_back(static_cast<char>((v >> (8 * i)) & 0xFF));
        return *this;
    }

    KvBytes &u64(uint64_t v) {
        for (int i = 0; i < 8; ++i) bytes_.push_back(static_cast<char>((v >> (8 * i)) & 0xFF));
        return *this;
    }

    KvBytes &begin(const std::string &name) { return tag(Type::NONE).cstr(name); }
    KvBytes &end() { return tag(Type::END); }

    KvBytes &string(const std::string &name, const std::string &value) {
        return tag(Type::STRING).cstr(name).cstr(value);
    }

    KvBytes &int32(const std::string &name, int32_t value) {
        return tag(Type::INT32).cstr(name).u32(static_cast<uint32_t>(value));
    }

    KvBytes &float32(const std::string &name, float value) {
        uint32_t bits;
        std::memcpy(&bits, &value, sizeof(bits));
        return tag(Type::FLOAT32).cstr(name).u32(bits);
    }

    KvBytes &uint64(const std::string &name, uint64_t value) { return tag(Type::UINT64).cstr(name).u64(value); }

    KvBytes &color(const std::string &name, uint32_t value) { return tag(Type::COLOR).cstr(name).u32(value); }

    const std::string &str() const { return bytes_; }

    void write_to(const std::filesystem::path &path) const {
        std::ofstream file(path, std::ios::binary | std::ios::trunc);
        file.write(bytes_.data(), static_cast<std::streamsize>(bytes_.size()));
    }

private:
    std::string bytes_;
};

// A small schema for app 480: two achievements, one int stat, one float stat
inline KvBytes sample_schema_bytes() {
    KvBytes b;
    b.begin("480")
        .begin("stats")
        .begin("1")
        .int32("type_int", 1)
        .string("name", "kills")
        .begin("display")
        .begin("name")
        .string("english", "Kills")
        .string("german", "Abschuesse")
        .end()
        .end()
        .int32("min", 0)
        .int32("max", 1000)
        .string("incrementonly", "1")
        .end()
        .begin("2")
        .string("type", "2")
        .string("name", "distance")
        .int32("permission", 2)
        .end()
        .begin("10")
        .int32("type_int", 4)
        .begin("bits")
        .begin("0")
        .string("name", "ACH_WIN")
        .begin("display")
        .begin("name")
        .string("english", "Winner")
        .end()
        .begin("desc")
        .string("english", "Win a game")
        .end()
        .string("icon", "win.jpg")
        .string("icon_gray", "win_gray.jpg")
        .string("hidden", "0")
        .end()
        .end()
        .begin("1")
        .string("name", "ACH_SECRET")
        .begin("display")
        .string("hidden", "1")
        .end()
        .end()
        .end()
        .end()
        .end()
        .end()
        .end();
    return b;
}

}  // namespace tests
}  // namespace statforge
