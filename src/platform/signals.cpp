#include "signals.hpp"
#include <signal.h>

namespace platform {

static volatile sig_atomic_t g_interrupt_flag = 0;
static struct sigaction g_old_int;
static struct sigaction g_old_term;
static bool g_installed = false;

static void interrupt_handler(int) {
    g_interrupt_flag = 1;
}

void install_interrupt_handlers() {
    if (g_installed) return;

    struct sigaction sa;
    sa.sa_handler = interrupt_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, &g_old_int);
    sigaction(SIGTERM, &sa, &g_old_term);
    g_installed = true;
}

void remove_interrupt_handlers() {
    if (!g_installed) return;
    sigaction(SIGINT, &g_old_int, nullptr);
    sigaction(SIGTERM, &g_old_term, nullptr);
    g_installed = false;
}

bool interrupt_requested() {
    return g_interrupt_flag != 0;
}

void request_interrupt() {
    g_interrupt_flag = 1;
}

void clear_interrupt() {
    g_interrupt_flag = 0;
}

} // namespace platform
