#include "terminal.hpp"

#include <unistd.h>
#include <signal.h>

namespace platform {

// ── SIGINT ───────────────────────────────────────────────────

static volatile sig_atomic_t g_interrupt_flag = 0;
static struct sigaction g_old_sa;
static bool g_installed = false;

static void sigint_handler(int) {
    g_interrupt_flag = 1;
}

void install_interrupt_handler() {
    g_interrupt_flag = 0;
    if (g_installed) return;

    struct sigaction sa;
    sa.sa_handler = sigint_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;  // no SA_RESTART: blocking reads return EINTR
    sigaction(SIGINT, &sa, &g_old_sa);
    g_installed = true;
}

void remove_interrupt_handler() {
    if (!g_installed) return;
    sigaction(SIGINT, &g_old_sa, nullptr);
    g_installed = false;
}

bool interrupted() {
    return g_interrupt_flag != 0;
}

void reset_interrupted() {
    g_interrupt_flag = 0;
}

// ── TTY checks ───────────────────────────────────────────────

bool stderr_is_tty() {
    return isatty(STDERR_FILENO) == 1;
}

} // namespace platform
