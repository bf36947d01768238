#include "core/CrashHandler.hpp"

#include <backward.hpp>

#include "core/Log.hpp"

namespace CrashHandler {

// Lives until process exit so the handlers stay registered.
static backward::SignalHandling *s_SignalHandler = nullptr;

void Init() {
  if (s_SignalHandler) {
    return;
  }
  s_SignalHandler = new backward::SignalHandling();
  if (!s_SignalHandler->loaded()) {
    LOG_WARN("Crash handler could not register signal handlers");
  }
}

bool IsInstalled() {
  return s_SignalHandler != nullptr && s_SignalHandler->loaded();
}

} // namespace CrashHandler
