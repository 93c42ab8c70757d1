/**
 * endpoint_args_test.cpp - launch argument parsing and endpoint reconstruction
 */

#include "ipc/endpoint_args.hpp"

#include <gtest/gtest.h>
#include <fcntl.h>
#include <unistd.h>

#include <string>
#include <vector>

using namespace statforge::ipc;

class EndpointArgsTest : public ::testing::Test {
protected:
    int fds[2] = {-1, -1};

    void SetUp() override { ASSERT_EQ(pipe(fds), 0); }

    void TearDown() override {
        for (int fd : fds) {
            if (fd >= 0) ::close(fd);
        }
    }

    bool parse(const std::vector<std::string> &words, LaunchArguments &out, std::string &error) {
        std::vector<const char *> argv = {"statforge"};
        for (const auto &word : words) {
            argv.push_back(word.c_str());
        }
        return parse_launch_arguments(static_cast<int>(argv.size()), argv.data(), out, error);
    }

    std::string tx() const { return "--tx=" + std::to_string(fds[1]); }
    std::string rx() const { return "--rx=" + std::to_string(fds[0]); }
};

TEST_F(EndpointArgsTest, NoFlagsIsFrontEnd) {
    LaunchArguments args;
    std::string error;
    ASSERT_TRUE(parse({}, args, error)) << error;
    EXPECT_EQ(args.role(), ProcessRole::FRONT_END);
    EXPECT_FALSE(args.has_endpoints());
    EXPECT_TRUE(args.rest.empty());
}

TEST_F(EndpointArgsTest, FrontEndKeepsCommandWords) {
    LaunchArguments args;
    std::string error;
    ASSERT_TRUE(parse({"--config", "/tmp/x.yaml", "reset", "480", "--achievements"}, args, error)) << error;
    EXPECT_EQ(args.config_path, "/tmp/x.yaml");
    EXPECT_EQ(args.rest, (std::vector<std::string>{"reset", "480", "--achievements"}));
}

TEST_F(EndpointArgsTest, SupervisorRole) {
    LaunchArguments args;
    std::string error;
    ASSERT_TRUE(parse({"--orchestrator", tx(), rx()}, args, error)) << error;
    EXPECT_EQ(args.role(), ProcessRole::SUPERVISOR);
    EXPECT_EQ(args.tx_fd, fds[1]);
    EXPECT_EQ(args.rx_fd, fds[0]);
    EXPECT_STREQ(process_role_to_string(args.role()), "supervisor");
}

TEST_F(EndpointArgsTest, WorkerRole) {
    LaunchArguments args;
    std::string error;
    ASSERT_TRUE(parse({"--app=480", tx(), rx()}, args, error)) << error;
    EXPECT_EQ(args.role(), ProcessRole::WORKER);
    EXPECT_EQ(args.app_id, 480u);
}

TEST_F(EndpointArgsTest, OnlyOneEndpointIsAnError) {
    LaunchArguments args;
    std::string error;
    EXPECT_FALSE(parse({"--orchestrator", tx()}, args, error));
    EXPECT_NE(error.find("--tx and --rx"), std::string::npos) << error;
    EXPECT_FALSE(parse({rx()}, args, error));
}

TEST_F(EndpointArgsTest, ChildRolesRequireEndpoints) {
    LaunchArguments args;
    std::string error;
    EXPECT_FALSE(parse({"--orchestrator"}, args, error));
    EXPECT_FALSE(parse({"--app=10"}, args, error));
}

TEST_F(EndpointArgsTest, RejectsBadValues) {
    LaunchArguments args;
    std::string error;
    EXPECT_FALSE(parse({"--app=0", tx(), rx()}, args, error));
    EXPECT_FALSE(parse({"--app=4294967296", tx(), rx()}, args, error));
    EXPECT_FALSE(parse({"--app=-1", tx(), rx()}, args, error));
    EXPECT_FALSE(parse({"--app=12abc", tx(), rx()}, args, error));
    EXPECT_FALSE(parse({"--orchestrator", "--tx=abc", rx()}, args, error));
    EXPECT_FALSE(parse({"--orchestrator", "--app=5", tx(), rx()}, args, error));
}

TEST_F(EndpointArgsTest, RejectsClosedDescriptor) {
    int spare[2];
    ASSERT_EQ(pipe(spare), 0);
    ::close(spare[0]);
    ::close(spare[1]);

    LaunchArguments args;
    std::string error;
    EXPECT_FALSE(parse({"--orchestrator", "--tx=" + std::to_string(spare[1]), rx()}, args, error));
    EXPECT_NE(error.find("not open"), std::string::npos) << error;
}

TEST_F(EndpointArgsTest, HelpFlag) {
    LaunchArguments args;
    std::string error;
    ASSERT_TRUE(parse({"-h"}, args, error));
    EXPECT_TRUE(args.show_help);
}

TEST_F(EndpointArgsTest, ParentChannelCarriesFrames) {
    int back[2];
    ASSERT_EQ(pipe(back), 0);

    // Child view: reads fds[0], writes back[1]
    LaunchArguments args;
    std::string error;
    ASSERT_TRUE(parse({"--app=7", "--tx=" + std::to_string(back[1]), rx()}, args, error)) << error;

    FrameChannel child = open_parent_channel(args);
    fds[0] = -1;  // owned by the channel now
    EXPECT_TRUE(fcntl(child.read_fd(), F_GETFD) & FD_CLOEXEC);
    EXPECT_TRUE(fcntl(child.write_fd(), F_GETFD) & FD_CLOEXEC);

    FrameChannel parent(back[0], fds[1]);
    fds[1] = -1;

    ASSERT_TRUE(parent.write_frame(Frame::from_text("\"Status\"")));
    Frame received;
    ASSERT_TRUE(child.read_frame(received, 1000)) << child.last_error();
    EXPECT_EQ(received.text(), "\"Status\"");

    ASSERT_TRUE(child.write_frame(Frame::from_text("{\"Success\":true}")));
    ASSERT_TRUE(parent.read_frame(received, 1000)) << parent.last_error();
    EXPECT_EQ(received.text(), "{\"Success\":true}");
}
