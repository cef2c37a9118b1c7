#include <runbox/logger.h>

#include <pthread.h>
#include <spdlog/spdlog.h>
#include <spdlog/details/console_globals.h>

// The supervisor forks while other request threads may be logging.
// Hold the console mutex (shared by all console sinks) across fork so no child inherits it locked.

namespace {

void Prepare() {
  spdlog::details::console_mutex::mutex().lock();
}

void Release() {
  spdlog::details::console_mutex::mutex().unlock();
}

} // namespace

void InitLogger() {
  spdlog::debug("Setup logger pthread_atfork");
  pthread_atfork(Prepare, Release, Release);
}
