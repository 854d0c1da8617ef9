#pragma once

namespace platform {

// Detach from the controlling terminal with the classic double fork.
// Only the grandchild returns; returns false if the session could not be
// detached.
bool daemonize();

} // namespace platform
