#pragma once

namespace platform {

// Route SIGINT and SIGTERM to an interrupt flag instead of terminating the
// process, so scoped cleanup (the running marker) still executes.
void install_interrupt_handlers();

// Restore the handlers that were active before install_interrupt_handlers().
void remove_interrupt_handlers();

// True once SIGINT or SIGTERM has been received.
bool interrupt_requested();

// Set or clear the interrupt flag directly.
void request_interrupt();
void clear_interrupt();

} // namespace platform
