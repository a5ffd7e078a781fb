// Linux capability helpers (best-effort; compile-time gated)
#pragma once
#include <string>
namespace plug_scan {
// Clears every capability set. Discovery only needs unprivileged TCP/UDP sockets.
bool drop_capabilities();
void log_capabilities(const std::string& context);
bool is_privilege_available();
}
