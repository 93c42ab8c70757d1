#include "signal_handler.hpp"

#include <csignal>

namespace statforge {
namespace runtime {

void SignalHandler::install() { std::signal(SIGPIPE, SIG_IGN); }

void SignalHandler::install_for_child() {
    std::signal(SIGPIPE, SIG_IGN);
    std::signal(SIGINT, SIG_IGN);
}

}  // namespace runtime
}  // namespace statforge
