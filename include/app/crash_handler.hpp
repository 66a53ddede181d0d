#pragma once

namespace app {

/// Install handlers for SIGSEGV, SIGFPE, SIGILL and SIGBUS that print the
/// signal name and a stack trace before re-raising
void InitializeCrashHandlers();

/// Stop for debugger attachment if CSMAP_WAIT_FOR_GDB is set
void WaitForDebuggerIfRequested();

}  // namespace app
