#pragma once

#include <cstdint>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace statforge {
namespace ipc {

/**
 * @brief Error kinds carried across process boundaries.
 *
 * The set is closed and carries no payload. Wire names are the
 * CamelCase strings returned by error_kind_to_string().
 */
enum class ErrorKind {
    SERIALIZATION_FAILED,
    STEAM_CONNECTION_FAILED,
    APP_LIST_RETRIEVAL_FAILED,
    SOCKET_COMMUNICATION_FAILED,
    APP_MISMATCH,
    UNKNOWN
};

const char *error_kind_to_string(ErrorKind kind);
std::optional<ErrorKind> error_kind_from_string(std::string_view name);
const char *error_kind_description(ErrorKind kind);

enum class CommandType {
    GET_OWNED_APP_LIST,
    LAUNCH_APP,
    STOP_APP,
    STOP_APPS,
    SHUTDOWN,
    STATUS,
    GET_ACHIEVEMENTS,
    GET_STATS,
    SET_ACHIEVEMENT,
    SET_INT_STAT,
    SET_FLOAT_STAT,
    RESET_STATS
};

const char *command_type_to_string(CommandType type);

// A request sent from the front end to the supervisor, or forwarded from the
// supervisor to a worker. Built through the named constructors only.
class Command {
public:
    static Command get_owned_app_list();
    static Command launch_app(uint32_t app_id);
    static Command stop_app(uint32_t app_id);
    static Command stop_apps();
    static Command shutdown();
    static Command status();
    static Command get_achievements(uint32_t app_id);
    static Command get_stats(uint32_t app_id);
    static Command set_achievement(uint32_t app_id, bool unlocked, const std::string &achievement_id);
    static Command set_int_stat(uint32_t app_id, const std::string &stat_id, int32_t value);
    static Command set_float_stat(uint32_t app_id, const std::string &stat_id, float value);
    static Command reset_stats(uint32_t app_id, bool include_achievements);

    CommandType type() const { return type_; }
    uint32_t app_id() const { return app_id_; }

    // True for the commands served by a worker for its own app id
    bool is_app_scoped() const;

    bool unlocked() const { return flag_; }
    bool include_achievements() const { return flag_; }
    const std::string &target_id() const { return target_id_; }
    int32_t int_value() const { return int_value_; }
    float float_value() const { return float_value_; }

    bool operator==(const Command &other) const;
    bool operator!=(const Command &other) const { return !(*this == other); }

private:
    explicit Command(CommandType type, uint32_t app_id = 0) : type_(type), app_id_(app_id) {}

    CommandType type_;
    uint32_t app_id_ = 0;
    bool flag_ = false;
    std::string target_id_;
    int32_t int_value_ = 0;
    float float_value_ = 0.0f;
};

std::ostream &operator<<(std::ostream &os, const Command &command);

// Success(T) or Error(ErrorKind)
template <typename T>
class Response {
public:
    Response() = default;

    static Response success(T value) {
        Response r;
        r.value_ = std::move(value);
        return r;
    }

    static Response error(ErrorKind kind) {
        Response r;
        r.error_ = kind;
        return r;
    }

    bool ok() const { return value_.has_value(); }
    const T &value() const { return *value_; }
    T &value() { return *value_; }
    ErrorKind error_kind() const { return error_; }

private:
    std::optional<T> value_;
    ErrorKind error_ = ErrorKind::UNKNOWN;
};

/**
 * @brief One length-prefixed message, kept opaque.
 *
 * The supervisor relays worker replies as Frames so it never has to know
 * which Response<T> a payload holds.
 */
struct Frame {
    std::vector<uint8_t> payload;

    size_t size() const { return payload.size(); }
    std::string text() const { return std::string(payload.begin(), payload.end()); }

    static Frame from_text(const std::string &text) {
        Frame frame;
        frame.payload.assign(text.begin(), text.end());
        return frame;
    }
};

// Command codec. Encoding fails on values JSON cannot carry (invalid UTF-8,
// non-finite floats); the caller then sends error_frame() instead.
bool encode_command(const Command &command, Frame &out, std::string &error);
bool decode_command(const Frame &frame, Command &out, std::string &error);

// Always succeeds: error responses have no payload to fail on.
Frame error_frame(ErrorKind kind);

namespace detail {
bool dump_json(const nlohmann::json &value, Frame &out, std::string &error);
bool parse_json(const Frame &frame, nlohmann::json &out, std::string &error);
}  // namespace detail

template <typename T>
bool encode_response(const Response<T> &response, Frame &out, std::string &error) {
    if (!response.ok()) {
        out = error_frame(response.error_kind());
        return true;
    }
    nlohmann::json payload;
    try {
        payload = response.value();
    } catch (const nlohmann::json::exception &e) {
        error = std::string("Cannot encode response payload: ") + e.what();
        return false;
    }
    return detail::dump_json(nlohmann::json{{"Success", std::move(payload)}}, out, error);
}

template <typename T>
bool decode_response(const Frame &frame, Response<T> &out, std::string &error) {
    nlohmann::json json;
    if (!detail::parse_json(frame, json, error)) {
        return false;
    }
    if (!json.is_object() || json.size() != 1) {
        error = "Response must be an object with exactly one tag";
        return false;
    }

    auto it = json.begin();
    if (it.key() == "Error") {
        if (!it.value().is_string()) {
            error = "Error tag must hold a string";
            return false;
        }
        auto kind = error_kind_from_string(it.value().template get<std::string>());
        if (!kind) {
            error = "Unknown error kind: " + it.value().template get<std::string>();
            return false;
        }
        out = Response<T>::error(*kind);
        return true;
    }
    if (it.key() != "Success") {
        error = "Unknown response tag: " + it.key();
        return false;
    }

    try {
        out = Response<T>::success(it.value().template get<T>());
    } catch (const std::exception &e) {
        // nlohmann::json::exception, or a payload type rejecting a value
        error = std::string("Success payload has unexpected shape: ") + e.what();
        return false;
    }
    return true;
}

// encode_response(), degrading to Error(SerializationFailed) when the
// payload cannot be encoded
template <typename T>
Frame reply_frame(const Response<T> &response) {
    Frame frame;
    std::string error;
    if (!encode_response(response, frame, error)) {
        return error_frame(ErrorKind::SERIALIZATION_FAILED);
    }
    return frame;
}

}  // namespace ipc
}  // namespace statforge
