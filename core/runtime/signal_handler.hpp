#pragma once

namespace statforge {
namespace runtime {

// Signal dispositions per process role. A dead peer must surface as EPIPE on
// write, so SIGPIPE is ignored everywhere.
class SignalHandler {
public:
    // Front end: SIGINT/SIGTERM keep their default action. When the front end
    // dies the supervisor reads EOF, and its teardown closes every worker.
    static void install();

    // Supervisor and workers also ignore SIGINT: a terminal Ctrl+C reaches
    // the whole process group, and children must be torn down through their
    // pipes in order.
    static void install_for_child();
};

}  // namespace runtime
}  // namespace statforge
