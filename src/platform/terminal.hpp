#pragma once

namespace platform {

// Install a SIGINT handler that only raises a flag. Long-running loops
// poll interrupted() and tear their child down themselves.
void install_interrupt_handler();

// Restore the handler that was active before install_interrupt_handler().
void remove_interrupt_handler();

// True once SIGINT has been received since install / the last reset.
bool interrupted();

void reset_interrupted();

// True if stderr is a terminal (colour output is only used then).
bool stderr_is_tty();

} // namespace platform
