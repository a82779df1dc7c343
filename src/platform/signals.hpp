#pragma once

#include <functional>

namespace platform {

// Block SIGINT and SIGTERM in the calling thread (and every thread it
// creates afterwards) and deliver them to `handler` on a dedicated thread,
// where it is safe to take locks and do I/O. Call once, early in main().
void install_shutdown_handler(std::function<void(int)> handler);

} // namespace platform
