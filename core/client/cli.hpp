#pragma once

#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

#include "supervisor_client.hpp"

namespace statforge {
namespace client {

enum class CliVerb {
    APPS,
    ACHIEVEMENTS,
    STATS,
    UNLOCK,
    LOCK,
    SET_INT,
    SET_FLOAT,
    RESET,
    STATUS,
    DUMP_SCHEMA
};

// One front-end invocation, e.g. `unlock 480 ACH_WIN_ONE_GAME`
struct CliRequest {
    CliVerb verb = CliVerb::STATUS;
    uint32_t app_id = 0;
    std::string target;  // achievement or stat id; schema path for dump-schema
    int32_t int_value = 0;
    float float_value = 0.0f;
    bool include_achievements = false;
};

// Exit statuses of the front end
constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;
constexpr int kExitFailed = 2;

void print_usage(std::ostream &out);

bool parse_cli(const std::vector<std::string> &words, CliRequest &out, std::string &error);

// dump-schema works on a file alone; everything else talks to a supervisor
bool needs_supervisor(const CliRequest &request);

// Runs one request against the supervisor, printing results to `out`
int run_cli(const CliRequest &request, SupervisorClient &client, std::ostream &out);

// Prints a decoded schema file as an indented tree
int dump_schema(const std::string &path, std::ostream &out);

}  // namespace client
}  // namespace statforge
