#include "signals.hpp"
#include <csignal>
#include <pthread.h>
#include <signal.h>
#include <thread>

namespace platform {

void install_shutdown_handler(std::function<void(int)> handler) {
    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, SIGINT);
    sigaddset(&set, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &set, nullptr);

    std::thread([set, handler]() {
        int sig = 0;
        if (sigwait(&set, &sig) == 0) {
            handler(sig);
        }
    }).detach();
}

} // namespace platform
