#include "platform/linux/signal_interrupt.hpp"

#include <cerrno>
#include <cstring>
#include <poll.h>
#include <print>
#include <signal.h>
#include <sys/signalfd.h>
#include <unistd.h>

SignalInterrupt::SignalInterrupt() {
    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    sigprocmask(SIG_BLOCK, &mask, nullptr);

    signal_fd_ = signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);
    if (signal_fd_ < 0) {
        std::println(stderr, "signalfd failed: {}", std::strerror(errno));
    }
}

SignalInterrupt::~SignalInterrupt() {
    if (signal_fd_ >= 0) ::close(signal_fd_);
}

bool SignalInterrupt::wait(std::chrono::milliseconds timeout) {
    if (signal_fd_ < 0) {
        ::poll(nullptr, 0, static_cast<int>(timeout.count()));
        return false;
    }

    pollfd pfd{.fd = signal_fd_, .events = POLLIN, .revents = 0};
    int n = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
    if (n <= 0) return false;

    signalfd_siginfo info;
    ssize_t got = ::read(signal_fd_, &info, sizeof(info));
    return got == static_cast<ssize_t>(sizeof(info));
}
