#include "util/diagnostics.h"
#include "util/logging.h"
#include <atomic>
#include <cstdlib>
#include <exception>
#include <stdexcept>

namespace OnsetAnalyzer {
namespace Util {

namespace {

std::atomic<bool> s_installed(false);

void terminateHandler() {
    std::exception_ptr current = std::current_exception();
    if (current) {
        try {
            std::rethrow_exception(current);
        } catch (const std::exception& e) {
            LOG_FATAL(std::string("Unhandled exception: ") + e.what());
        } catch (...) {
            LOG_FATAL("Unhandled exception of unknown type");
        }
    } else {
        LOG_FATAL("std::terminate called without an active exception");
    }
    std::abort();
}

} // namespace

bool installCrashDiagnostics() {
    bool expected = false;
    if (!s_installed.compare_exchange_strong(expected, true)) {
        return false;
    }
    std::set_terminate(terminateHandler);
    LOG_DEBUG("Crash diagnostics installed");
    return true;
}

bool crashDiagnosticsInstalled() {
    return s_installed.load();
}

} // namespace Util
} // namespace OnsetAnalyzer
