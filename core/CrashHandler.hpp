#pragma once

// Installs backward-cpp signal handlers that print a symbolized stack
// trace on SIGSEGV/SIGABRT and friends. Safe to call more than once.
namespace CrashHandler {

void Init();
bool IsInstalled();

} // namespace CrashHandler
