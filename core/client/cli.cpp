#include "cli.hpp"

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <limits>

#include "catalog/app_model.hpp"
#include "keyvalue/key_value.hpp"
#include "logging/logger.hpp"
#include "stats/stat_definitions.hpp"

namespace statforge {
namespace client {

using ipc::Command;
using ipc::Response;

namespace {

bool parse_app_id(const std::string &text, uint32_t &out, std::string &error) {
    char *end = nullptr;
    errno = 0;
    unsigned long long value = std::strtoull(text.c_str(), &end, 10);
    if (text.empty() || *end != '\0' || errno != 0 || text[0] == '-' || value == 0 ||
        value > std::numeric_limits<uint32_t>::max()) {
        error = "Invalid app id: " + text;
        return false;
    }
    out = static_cast<uint32_t>(value);
    return true;
}

bool parse_int(const std::string &text, int32_t &out, std::string &error) {
    char *end = nullptr;
    errno = 0;
    long long value = std::strtoll(text.c_str(), &end, 10);
    if (text.empty() || *end != '\0' || errno != 0 || value < std::numeric_limits<int32_t>::min() ||
        value > std::numeric_limits<int32_t>::max()) {
        error = "Invalid integer value: " + text;
        return false;
    }
    out = static_cast<int32_t>(value);
    return true;
}

bool parse_float(const std::string &text, float &out, std::string &error) {
    char *end = nullptr;
    errno = 0;
    float value = std::strtof(text.c_str(), &end);
    if (text.empty() || *end != '\0' || errno != 0 || !std::isfinite(value)) {
        error = "Invalid float value: " + text;
        return false;
    }
    out = value;
    return true;
}

bool expect_operands(const std::vector<std::string> &words, size_t count, const std::string &usage,
                     std::string &error) {
    if (words.size() != count + 1) {
        error = "Usage: statforge " + usage;
        return false;
    }
    return true;
}

std::string format_time(uint64_t seconds) {
    std::time_t t = static_cast<std::time_t>(seconds);
    std::tm tm_buf{};
    localtime_r(&t, &tm_buf);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M", &tm_buf);
    return buf;
}

int report_error(const char *what, ipc::ErrorKind kind, std::ostream &out) {
    out << what << " failed: " << ipc::error_kind_description(kind) << " (" << ipc::error_kind_to_string(kind)
        << ")\n";
    return kExitFailed;
}

int list_apps(SupervisorClient &client, std::ostream &out) {
    auto apps = client.request<std::vector<catalog::AppModel>>(Command::get_owned_app_list());
    if (!apps.ok()) {
        return report_error("Listing apps", apps.error_kind(), out);
    }
    for (const auto &app : apps.value()) {
        out << std::setw(10) << app.app_id << "  " << std::setw(4) << std::left
            << catalog::app_type_to_string(app.app_type) << std::right << "  " << app.app_name << "\n";
    }
    out << apps.value().size() << " owned apps\n";
    return kExitOk;
}

void print_achievements(const std::vector<stats::AchievementInfo> &achievements, std::ostream &out) {
    size_t unlocked = 0;
    for (const auto &achievement : achievements) {
        out << (achievement.is_achieved ? "[x] " : "[ ] ") << achievement.id << "  " << achievement.name;
        if (!achievement.description.empty()) {
            out << " - " << achievement.description;
        }
        if (achievement.unlock_time) {
            out << "  (" << format_time(*achievement.unlock_time) << ")";
        }
        if (achievement.permission & stats::kPermissionProtected) {
            out << "  [protected]";
        }
        out << "\n";
        if (achievement.is_achieved) {
            ++unlocked;
        }
    }
    out << unlocked << "/" << achievements.size() << " unlocked\n";
}

void print_stats(const std::vector<stats::StatInfo> &stats_list, std::ostream &out) {
    for (const auto &stat : stats_list) {
        out << stat.id() << "  " << (stat.is_integer() ? "int  " : "float") << "  " << stat.value_string() << "  "
            << stat.display_name();
        uint32_t flags = stat.flags();
        if (flags & stats::kStatFlagIncrementOnly) {
            out << "  [increment only]";
        }
        if (flags & stats::kStatFlagProtected) {
            out << "  [protected]";
        }
        out << "\n";
    }
}

// App-scoped requests run inside a LaunchApp / StopApp bracket
int run_app_request(const CliRequest &request, SupervisorClient &client, std::ostream &out) {
    auto launched = client.request<bool>(Command::launch_app(request.app_id));
    if (!launched.ok()) {
        return report_error("Launching the app worker", launched.error_kind(), out);
    }

    int status = kExitOk;
    switch (request.verb) {
        case CliVerb::ACHIEVEMENTS: {
            auto reply = client.request<std::vector<stats::AchievementInfo>>(Command::get_achievements(request.app_id));
            if (reply.ok()) {
                print_achievements(reply.value(), out);
            } else {
                status = report_error("Reading achievements", reply.error_kind(), out);
            }
            break;
        }
        case CliVerb::STATS: {
            auto reply = client.request<std::vector<stats::StatInfo>>(Command::get_stats(request.app_id));
            if (reply.ok()) {
                print_stats(reply.value(), out);
            } else {
                status = report_error("Reading stats", reply.error_kind(), out);
            }
            break;
        }
        case CliVerb::UNLOCK:
        case CliVerb::LOCK: {
            bool unlock = request.verb == CliVerb::UNLOCK;
            auto reply = client.request<bool>(Command::set_achievement(request.app_id, unlock, request.target));
            if (reply.ok()) {
                out << request.target << (unlock ? " unlocked\n" : " locked\n");
            } else {
                status = report_error(unlock ? "Unlocking" : "Locking", reply.error_kind(), out);
            }
            break;
        }
        case CliVerb::SET_INT: {
            auto reply =
                client.request<int32_t>(Command::set_int_stat(request.app_id, request.target, request.int_value));
            if (reply.ok()) {
                out << request.target << " = " << reply.value() << "\n";
            } else {
                status = report_error("Setting the stat", reply.error_kind(), out);
            }
            break;
        }
        case CliVerb::SET_FLOAT: {
            auto reply =
                client.request<float>(Command::set_float_stat(request.app_id, request.target, request.float_value));
            if (reply.ok()) {
                out << request.target << " = " << reply.value() << "\n";
            } else {
                status = report_error("Setting the stat", reply.error_kind(), out);
            }
            break;
        }
        case CliVerb::RESET: {
            auto reply = client.request<bool>(Command::reset_stats(request.app_id, request.include_achievements));
            if (!reply.ok()) {
                status = report_error("Resetting stats", reply.error_kind(), out);
            } else if (!reply.value()) {
                out << "The client refused the reset\n";
                status = kExitFailed;
            } else {
                out << "Stats reset" << (request.include_achievements ? " (achievements included)\n" : "\n");
            }
            break;
        }
        default:
            break;
    }

    auto stopped = client.request<bool>(Command::stop_app(request.app_id));
    if (!stopped.ok()) {
        LOG_WARN("[Client] Stopping the worker for app " << request.app_id
                                                         << " failed: " << ipc::error_kind_to_string(stopped.error_kind()));
    }
    return status;
}

void dump_node(const keyvalue::KeyValue &node, int depth, std::ostream &out) {
    out << std::string(static_cast<size_t>(depth) * 2, ' ') << node << "\n";
    for (const auto &child : node.children()) {
        dump_node(child.second, depth + 1, out);
    }
}

}  // namespace

void print_usage(std::ostream &out) {
    out << "Usage: statforge [--config=PATH] COMMAND [ARGS]\n\n"
        << "Commands:\n"
        << "  apps                            List owned apps\n"
        << "  achievements APP_ID             List achievements of an app\n"
        << "  stats APP_ID                    List stats of an app\n"
        << "  unlock APP_ID ACHIEVEMENT       Unlock an achievement\n"
        << "  lock APP_ID ACHIEVEMENT         Lock an achievement\n"
        << "  set-int APP_ID STAT VALUE       Set an integer stat\n"
        << "  set-float APP_ID STAT VALUE     Set a float stat\n"
        << "  reset APP_ID [--achievements]   Reset all stats (and achievements)\n"
        << "  status                          Check that the supervisor responds\n"
        << "  dump-schema FILE                Print a binary KeyValue file\n\n"
        << "Options:\n"
        << "  --config=PATH    Configuration file\n"
        << "  --help, -h       Show this help\n";
}

bool parse_cli(const std::vector<std::string> &words, CliRequest &out, std::string &error) {
    if (words.empty()) {
        error = "No command given";
        return false;
    }

    CliRequest request;
    const std::string &verb = words[0];

    if (verb == "apps") {
        request.verb = CliVerb::APPS;
        if (!expect_operands(words, 0, "apps", error)) return false;
    } else if (verb == "status") {
        request.verb = CliVerb::STATUS;
        if (!expect_operands(words, 0, "status", error)) return false;
    } else if (verb == "dump-schema") {
        request.verb = CliVerb::DUMP_SCHEMA;
        if (!expect_operands(words, 1, "dump-schema FILE", error)) return false;
        request.target = words[1];
    } else if (verb == "achievements" || verb == "stats") {
        request.verb = verb == "stats" ? CliVerb::STATS : CliVerb::ACHIEVEMENTS;
        if (!expect_operands(words, 1, verb + " APP_ID", error)) return false;
        if (!parse_app_id(words[1], request.app_id, error)) return false;
    } else if (verb == "unlock" || verb == "lock") {
        request.verb = verb == "unlock" ? CliVerb::UNLOCK : CliVerb::LOCK;
        if (!expect_operands(words, 2, verb + " APP_ID ACHIEVEMENT", error)) return false;
        if (!parse_app_id(words[1], request.app_id, error)) return false;
        request.target = words[2];
    } else if (verb == "set-int") {
        request.verb = CliVerb::SET_INT;
        if (!expect_operands(words, 3, "set-int APP_ID STAT VALUE", error)) return false;
        if (!parse_app_id(words[1], request.app_id, error)) return false;
        request.target = words[2];
        if (!parse_int(words[3], request.int_value, error)) return false;
    } else if (verb == "set-float") {
        request.verb = CliVerb::SET_FLOAT;
        if (!expect_operands(words, 3, "set-float APP_ID STAT VALUE", error)) return false;
        if (!parse_app_id(words[1], request.app_id, error)) return false;
        request.target = words[2];
        if (!parse_float(words[3], request.float_value, error)) return false;
    } else if (verb == "reset") {
        request.verb = CliVerb::RESET;
        if (words.size() == 3 && words[2] == "--achievements") {
            request.include_achievements = true;
        } else if (!expect_operands(words, 1, "reset APP_ID [--achievements]", error)) {
            return false;
        }
        if (!parse_app_id(words[1], request.app_id, error)) return false;
    } else {
        error = "Unknown command: " + verb;
        return false;
    }

    out = request;
    return true;
}

bool needs_supervisor(const CliRequest &request) { return request.verb != CliVerb::DUMP_SCHEMA; }

int run_cli(const CliRequest &request, SupervisorClient &client, std::ostream &out) {
    switch (request.verb) {
        case CliVerb::APPS:
            return list_apps(client, out);

        case CliVerb::STATUS: {
            auto reply = client.request<bool>(Command::status());
            if (!reply.ok()) {
                return report_error("Status", reply.error_kind(), out);
            }
            out << "Supervisor is running\n";
            return kExitOk;
        }

        case CliVerb::DUMP_SCHEMA:
            return dump_schema(request.target, out);

        default:
            return run_app_request(request, client, out);
    }
}

int dump_schema(const std::string &path, std::ostream &out) {
    keyvalue::KeyValue root = keyvalue::KeyValue::root();
    keyvalue::KeyValueError error;
    if (!keyvalue::KeyValue::load_binary(path, root, error)) {
        out << "Cannot decode " << path << ": " << error.to_string() << "\n";
        return kExitFailed;
    }
    dump_node(root, 0, out);
    return kExitOk;
}

}  // namespace client
}  // namespace statforge
