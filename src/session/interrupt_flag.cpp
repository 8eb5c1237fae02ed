#include "session/interrupt_flag.hpp"
#include "utils/logger.hpp"
#include <cerrno>
#include <signal.h>
#include <cstring>
#include <stdexcept>
#include <string>

namespace ActivePref {
namespace Session {

namespace {

InterruptFlag g_interrupt_flag;

struct sigaction g_previous_action;
bool g_handler_installed = false;

void handle_sigint(int) {
    g_interrupt_flag.request();
}

} // namespace

InterruptFlag& InterruptFlag::instance() {
    return g_interrupt_flag;
}

void InterruptFlag::install_signal_handler() {
    if (g_handler_installed) {
        return;
    }

    struct sigaction action;
    std::memset(&action, 0, sizeof(action));
    action.sa_handler = handle_sigint;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;

    if (sigaction(SIGINT, &action, &g_previous_action) != 0) {
        throw std::runtime_error(std::string("Failed to install SIGINT handler: ") + std::strerror(errno));
    }
    g_handler_installed = true;
    LOG_DEBUG("SESSION", "SIGINT handler installed");
}

void InterruptFlag::restore_signal_handler() {
    if (!g_handler_installed) {
        return;
    }
    if (sigaction(SIGINT, &g_previous_action, nullptr) != 0) {
        throw std::runtime_error(std::string("Failed to restore SIGINT handler: ") + std::strerror(errno));
    }
    g_handler_installed = false;
}

} // namespace Session
} // namespace ActivePref
