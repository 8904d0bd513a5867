#pragma once

namespace OnsetAnalyzer {
namespace Util {

/**
 * Installs a process-wide terminate handler that reports the active
 * exception through the logger before aborting.
 *
 * Meant to be called once by the host application during start-up.
 * Repeated calls are no-ops. Returns true if this call installed the handler.
 */
bool installCrashDiagnostics();

// True once installCrashDiagnostics() has run.
bool crashDiagnosticsInstalled();

} // namespace Util
} // namespace OnsetAnalyzer
