#pragma once

#include <expected>
#include <string>

namespace platform {

// Detach into the background. Only the detached process returns; the
// launching process exits 0 once detaching succeeded, or prints the
// failure and exits 1. An error is returned only when nothing has been
// forked yet.
std::expected<void, std::string> daemonize();

} // namespace platform
