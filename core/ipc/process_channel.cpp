#include "process_channel.hpp"

#include <errno.h>
#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <chrono>
#include <cstring>
#include <filesystem>
#include <thread>

#include "logging/logger.hpp"

namespace statforge {
namespace ipc {

namespace {

struct PipePair {
    int fds[2] = {-1, -1};

    ~PipePair() { reset(); }

    bool open() { return pipe2(fds, O_CLOEXEC) == 0; }

    // Hands one end to the caller; the destructor no longer closes it
    int release(int index) {
        int fd = fds[index];
        fds[index] = -1;
        return fd;
    }

    void reset() {
        for (int &fd : fds) {
            if (fd >= 0) {
                ::close(fd);
                fd = -1;
            }
        }
    }
};

}  // namespace

std::unique_ptr<ChildHandle> ChildHandle::spawn(const std::string &tag, const std::string &executable_path,
                                                const std::vector<std::string> &args, std::string &error) {
    LOG_DEBUG("[" << tag << "] Spawning: " << executable_path);

    std::error_code ec;
    if (!std::filesystem::exists(executable_path, ec)) {
        error = "Executable not found: " + executable_path;
        LOG_ERROR("[" << tag << "] " << error);
        return nullptr;
    }

    PipePair to_child;    // [0] child reads, [1] parent writes
    PipePair from_child;  // [0] parent reads, [1] child writes
    PipePair exec_status;  // reports exec failure; closed by a successful exec

    if (!to_child.open() || !from_child.open() || !exec_status.open()) {
        error = "Failed to create pipe: " + std::string(strerror(errno));
        LOG_ERROR("[" << tag << "] " << error);
        return nullptr;
    }

    // argv is built before fork so the child only calls async-signal-safe functions
    std::vector<std::string> full_args;
    full_args.reserve(args.size() + 3);
    full_args.push_back(executable_path);
    full_args.insert(full_args.end(), args.begin(), args.end());
    full_args.push_back("--tx=" + std::to_string(from_child.fds[1]));
    full_args.push_back("--rx=" + std::to_string(to_child.fds[0]));

    std::vector<char *> argv;
    for (auto &arg : full_args) {
        argv.push_back(const_cast<char *>(arg.c_str()));
    }
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        error = "Fork failed: " + std::string(strerror(errno));
        LOG_ERROR("[" << tag << "] " << error);
        return nullptr;
    }

    if (pid == 0) {
        // Child: only the two child-facing ends survive exec
        fcntl(from_child.fds[1], F_SETFD, 0);
        fcntl(to_child.fds[0], F_SETFD, 0);

        execv(argv[0], argv.data());

        int exec_errno = errno;
        ssize_t ignored = ::write(exec_status.fds[1], &exec_errno, sizeof(exec_errno));
        (void)ignored;
        _exit(127);
    }

    // Parent
    ::close(exec_status.release(1));
    ::close(to_child.release(0));
    ::close(from_child.release(1));

    int exec_errno = 0;
    ssize_t n;
    do {
        n = ::read(exec_status.fds[0], &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);

    if (n > 0) {
        int status = 0;
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
        error = "exec failed for " + executable_path + ": " + std::string(strerror(exec_errno));
        LOG_ERROR("[" << tag << "] " << error);
        return nullptr;
    }

    FrameChannel channel(from_child.release(0), to_child.release(1));
    LOG_INFO("[" << tag << "] Process spawned successfully (PID=" << pid << ")");
    return std::unique_ptr<ChildHandle>(new ChildHandle(tag, pid, std::move(channel)));
}

ChildHandle::ChildHandle(std::string tag, pid_t pid, FrameChannel channel)
    : tag_(std::move(tag)), pid_(pid), channel_(std::move(channel)) {}

ChildHandle::~ChildHandle() {
    if (pid_ <= 0) {
        return;
    }

    LOG_DEBUG("[" << tag_ << "] Releasing child process");

    // 1. Send EOF: the child's blocking read fails and its loop ends
    channel_.close();

    // 2. Wait with timeout
    if (wait_for_exit(shutdown_timeout_ms_)) {
        return;
    }

    // 3. Forced kill
    LOG_WARN("[" << tag_ << "] Timeout - forcing termination");
    terminate();
}

bool ChildHandle::send(const Frame &frame, int timeout_ms) { return channel_.write_frame(frame, timeout_ms); }

bool ChildHandle::receive(Frame &out, int timeout_ms) { return channel_.read_frame(out, timeout_ms); }

bool ChildHandle::is_running() const {
    if (pid_ <= 0) return false;
    // kill(0) tests existence without reaping
    return kill(pid_, 0) == 0;
}

int ChildHandle::wait() {
    if (pid_ <= 0) {
        return -1;
    }

    int status = 0;
    pid_t result;
    do {
        result = waitpid(pid_, &status, 0);
    } while (result < 0 && errno == EINTR);

    pid_ = -1;
    if (result < 0) {
        LOG_WARN("[" << tag_ << "] waitpid failed: " << strerror(errno));
        return -1;
    }
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        LOG_WARN("[" << tag_ << "] Terminated by signal " << WTERMSIG(status));
    }
    return -1;
}

bool ChildHandle::wait_for_exit(int timeout_ms) {
    if (pid_ <= 0) {
        return true;
    }

    auto start = std::chrono::steady_clock::now();
    while (true) {
        int status;
        pid_t result = waitpid(pid_, &status, WNOHANG);
        if (result == pid_) {
            pid_ = -1;
            return true;
        }
        if (result == -1) {
            if (errno == ECHILD) {
                pid_ = -1;
                return true;
            }
            if (errno == EINTR) {
                continue;
            }
            return false;
        }

        if (timeout_ms >= 0) {
            auto elapsed = std::chrono::steady_clock::now() - start;
            if (std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count() >= timeout_ms) {
                return false;
            }
        }

        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

void ChildHandle::terminate() {
    if (pid_ <= 0) {
        return;
    }
    LOG_WARN("[" << tag_ << "] Killing PID " << pid_);
    kill(pid_, SIGKILL);
    channel_.close();
    wait();
}

ProcessWorkerSpawner::ProcessWorkerSpawner(std::string executable_path, uint64_t max_frame_size,
                                           int shutdown_timeout_ms)
    : executable_path_(std::move(executable_path)),
      max_frame_size_(max_frame_size),
      shutdown_timeout_ms_(shutdown_timeout_ms) {}

std::unique_ptr<IChildHandle> ProcessWorkerSpawner::spawn_worker(uint32_t app_id, std::string &error) {
    auto child = ChildHandle::spawn("worker:" + std::to_string(app_id), executable_path_,
                                    {"--app=" + std::to_string(app_id)}, error);
    if (!child) {
        return nullptr;
    }
    child->channel().set_max_frame_size(max_frame_size_);
    child->set_shutdown_timeout(shutdown_timeout_ms_);
    return child;
}

}  // namespace ipc
}  // namespace statforge
