#include "protocol.hpp"

#include <cmath>
#include <limits>

namespace statforge {
namespace ipc {

using nlohmann::json;

const char *error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::SERIALIZATION_FAILED:
            return "SerializationFailed";
        case ErrorKind::STEAM_CONNECTION_FAILED:
            return "SteamConnectionFailed";
        case ErrorKind::APP_LIST_RETRIEVAL_FAILED:
            return "AppListRetrievalFailed";
        case ErrorKind::SOCKET_COMMUNICATION_FAILED:
            return "SocketCommunicationFailed";
        case ErrorKind::APP_MISMATCH:
            return "AppMismatchError";
        case ErrorKind::UNKNOWN:
        default:
            return "UnknownError";
    }
}

std::optional<ErrorKind> error_kind_from_string(std::string_view name) {
    if (name == "SerializationFailed") return ErrorKind::SERIALIZATION_FAILED;
    if (name == "SteamConnectionFailed") return ErrorKind::STEAM_CONNECTION_FAILED;
    if (name == "AppListRetrievalFailed") return ErrorKind::APP_LIST_RETRIEVAL_FAILED;
    if (name == "SocketCommunicationFailed") return ErrorKind::SOCKET_COMMUNICATION_FAILED;
    if (name == "AppMismatchError") return ErrorKind::APP_MISMATCH;
    if (name == "UnknownError") return ErrorKind::UNKNOWN;
    return std::nullopt;
}

const char *error_kind_description(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::SERIALIZATION_FAILED:
            return "Serialization failed";
        case ErrorKind::STEAM_CONNECTION_FAILED:
            return "Steam connection failed";
        case ErrorKind::APP_LIST_RETRIEVAL_FAILED:
            return "App list retrieval failed";
        case ErrorKind::SOCKET_COMMUNICATION_FAILED:
            return "Socket communication failed";
        case ErrorKind::APP_MISMATCH:
            return "App mismatch";
        case ErrorKind::UNKNOWN:
        default:
            return "Unknown error";
    }
}

const char *command_type_to_string(CommandType type) {
    switch (type) {
        case CommandType::GET_OWNED_APP_LIST:
            return "GetOwnedAppList";
        case CommandType::LAUNCH_APP:
            return "LaunchApp";
        case CommandType::STOP_APP:
            return "StopApp";
        case CommandType::STOP_APPS:
            return "StopApps";
        case CommandType::SHUTDOWN:
            return "Shutdown";
        case CommandType::STATUS:
            return "Status";
        case CommandType::GET_ACHIEVEMENTS:
            return "GetAchievements";
        case CommandType::GET_STATS:
            return "GetStats";
        case CommandType::SET_ACHIEVEMENT:
            return "SetAchievement";
        case CommandType::SET_INT_STAT:
            return "SetIntStat";
        case CommandType::SET_FLOAT_STAT:
            return "SetFloatStat";
        case CommandType::RESET_STATS:
            return "ResetStats";
        default:
            return "Unknown";
    }
}

Command Command::get_owned_app_list() { return Command(CommandType::GET_OWNED_APP_LIST); }
Command Command::launch_app(uint32_t app_id) { return Command(CommandType::LAUNCH_APP, app_id); }
Command Command::stop_app(uint32_t app_id) { return Command(CommandType::STOP_APP, app_id); }
Command Command::stop_apps() { return Command(CommandType::STOP_APPS); }
Command Command::shutdown() { return Command(CommandType::SHUTDOWN); }
Command Command::status() { return Command(CommandType::STATUS); }
Command Command::get_achievements(uint32_t app_id) { return Command(CommandType::GET_ACHIEVEMENTS, app_id); }
Command Command::get_stats(uint32_t app_id) { return Command(CommandType::GET_STATS, app_id); }

Command Command::set_achievement(uint32_t app_id, bool unlocked, const std::string &achievement_id) {
    Command c(CommandType::SET_ACHIEVEMENT, app_id);
    c.flag_ = unlocked;
    c.target_id_ = achievement_id;
    return c;
}

Command Command::set_int_stat(uint32_t app_id, const std::string &stat_id, int32_t value) {
    Command c(CommandType::SET_INT_STAT, app_id);
    c.target_id_ = stat_id;
    c.int_value_ = value;
    return c;
}

Command Command::set_float_stat(uint32_t app_id, const std::string &stat_id, float value) {
    Command c(CommandType::SET_FLOAT_STAT, app_id);
    c.target_id_ = stat_id;
    c.float_value_ = value;
    return c;
}

Command Command::reset_stats(uint32_t app_id, bool include_achievements) {
    Command c(CommandType::RESET_STATS, app_id);
    c.flag_ = include_achievements;
    return c;
}

bool Command::is_app_scoped() const {
    switch (type_) {
        case CommandType::GET_ACHIEVEMENTS:
        case CommandType::GET_STATS:
        case CommandType::SET_ACHIEVEMENT:
        case CommandType::SET_INT_STAT:
        case CommandType::SET_FLOAT_STAT:
        case CommandType::RESET_STATS:
            return true;
        default:
            return false;
    }
}

bool Command::operator==(const Command &other) const {
    if (type_ != other.type_ || app_id_ != other.app_id_) {
        return false;
    }
    switch (type_) {
        case CommandType::SET_ACHIEVEMENT:
            return flag_ == other.flag_ && target_id_ == other.target_id_;
        case CommandType::SET_INT_STAT:
            return target_id_ == other.target_id_ && int_value_ == other.int_value_;
        case CommandType::SET_FLOAT_STAT:
            return target_id_ == other.target_id_ && float_value_ == other.float_value_;
        case CommandType::RESET_STATS:
            return flag_ == other.flag_;
        default:
            return true;
    }
}

std::ostream &operator<<(std::ostream &os, const Command &command) {
    os << command_type_to_string(command.type());
    switch (command.type()) {
        case CommandType::LAUNCH_APP:
        case CommandType::STOP_APP:
        case CommandType::GET_ACHIEVEMENTS:
        case CommandType::GET_STATS:
            os << "(" << command.app_id() << ")";
            break;
        case CommandType::SET_ACHIEVEMENT:
            os << "(" << command.app_id() << ", " << (command.unlocked() ? "true" : "false") << ", "
               << command.target_id() << ")";
            break;
        case CommandType::SET_INT_STAT:
            os << "(" << command.app_id() << ", " << command.target_id() << ", " << command.int_value() << ")";
            break;
        case CommandType::SET_FLOAT_STAT:
            os << "(" << command.app_id() << ", " << command.target_id() << ", " << command.float_value() << ")";
            break;
        case CommandType::RESET_STATS:
            os << "(" << command.app_id() << ", " << (command.include_achievements() ? "true" : "false") << ")";
            break;
        default:
            break;
    }
    return os;
}

namespace detail {

namespace {

bool has_non_finite(const json &value) {
    if (value.is_number_float()) {
        return !std::isfinite(value.get<double>());
    }
    if (value.is_structured()) {
        for (const auto &child : value) {
            if (has_non_finite(child)) {
                return true;
            }
        }
    }
    return false;
}

}  // namespace

bool dump_json(const json &value, Frame &out, std::string &error) {
    // JSON has no NaN/Inf; nlohmann would silently write null
    if (has_non_finite(value)) {
        error = "Cannot encode non-finite number";
        return false;
    }
    try {
        out = Frame::from_text(value.dump());
    } catch (const json::type_error &e) {
        error = std::string("Cannot encode message: ") + e.what();
        return false;
    }
    return true;
}

bool parse_json(const Frame &frame, json &out, std::string &error) {
    try {
        out = json::parse(frame.payload.begin(), frame.payload.end());
    } catch (const json::parse_error &e) {
        error = std::string("Malformed message: ") + e.what();
        return false;
    }
    return true;
}

}  // namespace detail

namespace {

bool read_app_id(const json &value, uint32_t &out) {
    if (!value.is_number_unsigned()) {
        return false;
    }
    auto raw = value.get<uint64_t>();
    if (raw > std::numeric_limits<uint32_t>::max()) {
        return false;
    }
    out = static_cast<uint32_t>(raw);
    return true;
}

bool read_i32(const json &value, int32_t &out) {
    if (!value.is_number_integer()) {
        return false;
    }
    if (value.is_number_unsigned()) {
        auto raw = value.get<uint64_t>();
        if (raw > static_cast<uint64_t>(std::numeric_limits<int32_t>::max())) {
            return false;
        }
        out = static_cast<int32_t>(raw);
        return true;
    }
    auto raw = value.get<int64_t>();
    if (raw < std::numeric_limits<int32_t>::min() || raw > std::numeric_limits<int32_t>::max()) {
        return false;
    }
    out = static_cast<int32_t>(raw);
    return true;
}

bool read_f32(const json &value, float &out) {
    if (!value.is_number()) {
        return false;
    }
    out = value.get<float>();
    return true;
}

bool read_tuple(const json &value, size_t arity) { return value.is_array() && value.size() == arity; }

}  // namespace

bool encode_command(const Command &command, Frame &out, std::string &error) {
    const char *tag = command_type_to_string(command.type());
    json body;

    switch (command.type()) {
        case CommandType::GET_OWNED_APP_LIST:
        case CommandType::STOP_APPS:
        case CommandType::SHUTDOWN:
        case CommandType::STATUS:
            return detail::dump_json(json(tag), out, error);
        case CommandType::LAUNCH_APP:
        case CommandType::STOP_APP:
        case CommandType::GET_ACHIEVEMENTS:
        case CommandType::GET_STATS:
            body = command.app_id();
            break;
        case CommandType::SET_ACHIEVEMENT:
            body = json::array({command.app_id(), command.unlocked(), command.target_id()});
            break;
        case CommandType::SET_INT_STAT:
            body = json::array({command.app_id(), command.target_id(), command.int_value()});
            break;
        case CommandType::SET_FLOAT_STAT:
            body = json::array({command.app_id(), command.target_id(), command.float_value()});
            break;
        case CommandType::RESET_STATS:
            body = json::array({command.app_id(), command.include_achievements()});
            break;
        default:
            error = "Unknown command type";
            return false;
    }

    json message;
    message[tag] = std::move(body);
    return detail::dump_json(message, out, error);
}

bool decode_command(const Frame &frame, Command &out, std::string &error) {
    json message;
    if (!detail::parse_json(frame, message, error)) {
        return false;
    }

    if (message.is_string()) {
        const auto tag = message.get<std::string>();
        if (tag == "GetOwnedAppList") {
            out = Command::get_owned_app_list();
        } else if (tag == "StopApps") {
            out = Command::stop_apps();
        } else if (tag == "Shutdown") {
            out = Command::shutdown();
        } else if (tag == "Status") {
            out = Command::status();
        } else {
            error = "Unknown unit command: " + tag;
            return false;
        }
        return true;
    }

    if (!message.is_object() || message.size() != 1) {
        error = "Command must be a string or an object with exactly one tag";
        return false;
    }

    const auto &tag = message.begin().key();
    const auto &body = message.begin().value();
    uint32_t app_id = 0;

    if (tag == "LaunchApp" || tag == "StopApp" || tag == "GetAchievements" || tag == "GetStats") {
        if (!read_app_id(body, app_id)) {
            error = tag + " expects an unsigned 32-bit app id";
            return false;
        }
        if (tag == "LaunchApp") {
            out = Command::launch_app(app_id);
        } else if (tag == "StopApp") {
            out = Command::stop_app(app_id);
        } else if (tag == "GetAchievements") {
            out = Command::get_achievements(app_id);
        } else {
            out = Command::get_stats(app_id);
        }
        return true;
    }

    if (tag == "SetAchievement") {
        if (!read_tuple(body, 3) || !read_app_id(body[0], app_id) || !body[1].is_boolean() || !body[2].is_string()) {
            error = "SetAchievement expects [app_id, unlocked, achievement_id]";
            return false;
        }
        out = Command::set_achievement(app_id, body[1].get<bool>(), body[2].get<std::string>());
        return true;
    }

    if (tag == "SetIntStat") {
        int32_t value = 0;
        if (!read_tuple(body, 3) || !read_app_id(body[0], app_id) || !body[1].is_string() ||
            !read_i32(body[2], value)) {
            error = "SetIntStat expects [app_id, stat_id, i32]";
            return false;
        }
        out = Command::set_int_stat(app_id, body[1].get<std::string>(), value);
        return true;
    }

    if (tag == "SetFloatStat") {
        float value = 0.0f;
        if (!read_tuple(body, 3) || !read_app_id(body[0], app_id) || !body[1].is_string() ||
            !read_f32(body[2], value)) {
            error = "SetFloatStat expects [app_id, stat_id, f32]";
            return false;
        }
        out = Command::set_float_stat(app_id, body[1].get<std::string>(), value);
        return true;
    }

    if (tag == "ResetStats") {
        if (!read_tuple(body, 2) || !read_app_id(body[0], app_id) || !body[1].is_boolean()) {
            error = "ResetStats expects [app_id, include_achievements]";
            return false;
        }
        out = Command::reset_stats(app_id, body[1].get<bool>());
        return true;
    }

    error = "Unknown command tag: " + tag;
    return false;
}

Frame error_frame(ErrorKind kind) {
    return Frame::from_text(std::string("{\"Error\":\"") + error_kind_to_string(kind) + "\"}");
}

}  // namespace ipc
}  // namespace statforge
