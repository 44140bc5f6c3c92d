#include "stop_signal.h"
#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <string>
#include <signal.h>

namespace interrupt_filter {

namespace {

std::atomic<bool> g_stop_requested{false};

void on_stop_signal(int) {
    g_stop_requested = true;
}

} // anonymous namespace

Result<void> install_stop_handlers() {
    struct sigaction sa;
    std::memset(&sa, 0, sizeof(sa));
    sa.sa_handler = on_stop_signal;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;  // no SA_RESTART

    for (int sig : {SIGINT, SIGTERM}) {
        if (sigaction(sig, &sa, nullptr) == -1) {
            return make_error(ErrorType::Unknown, "sigaction(" + std::to_string(sig) + ") failed: " +
                              std::strerror(errno));
        }
    }
    return {};
}

bool stop_requested() {
    return g_stop_requested.load();
}

void clear_stop_request() {
    g_stop_requested = false;
}

} // namespace interrupt_filter
