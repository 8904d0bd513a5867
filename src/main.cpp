/**
 * Onset Monitor - Hauptanwendung
 *
 * - Audio Input via JACK (Mono oder mehrere Ports, gemischt)
 * - Energie-basierte Onset Detection mit adaptivem Threshold
 * - Onsets werden mit Zeitstempel geloggt
 */

#include "app/onset_monitor_app.h"
#include "config/env_config.h"
#include "config/onset_config.h"
#include "util/diagnostics.h"
#include "util/logging.h"

#include <atomic>
#include <csignal>
#include <iostream>
#include <string>

using namespace OnsetAnalyzer;
using namespace OnsetAnalyzer::Util;

// ============================================================================
// Globale Signal-Handling
// ============================================================================

namespace OnsetAnalyzer {
std::atomic<bool> g_running(true);
}

void signalHandler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_running = false;
    }
}

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " [-h|--help]\n";
    std::cout << "\nKonfiguration über .env (oder Environment):\n";
    std::cout << "  LOG_LEVEL=1                 0=debug 1=info 2=warn 3=error 4=fatal\n";
    std::cout << "  JACK_CLIENT_NAME=onset-monitor\n";
    std::cout << "  NUM_INPUT_CHANNELS=1        Eingänge, werden zu Mono gemischt\n";
    std::cout << "  JACK_CONNECT_PORT_1=system:capture_1\n";
    std::cout << "  ONSET_LAMBDA=1.0            Gewicht Median\n";
    std::cout << "  ONSET_ALPHA=0.7             Gewicht Mittelwert\n";
    std::cout << "  ONSET_PEAK_WEIGHT=0.05      Gewicht höchster Peak\n";
    std::cout << "  ONSET_DEBUG_CONSOLE=0       Jeden ODF-Wert loggen (LOG_LEVEL=0)\n";
    std::cout << "\n";
}

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    if (argc > 1 && (std::string(argv[1]) == "-h" || std::string(argv[1]) == "--help")) {
        printUsage(argv[0]);
        return 0;
    }

    installCrashDiagnostics();

    auto& env = EnvConfig::instance();
    std::string envFile = Config::loadEnvFiles(env);
    Config::OnsetConfig config = Config::loadOnsetConfig(env);
    if (!envFile.empty()) {
        LOG_INFO("Konfiguration geladen: " + envFile);
    }

    OnsetMonitorApp app;

    if (!app.initialize(config)) {
        LOG_ERROR("Initialisierung fehlgeschlagen");
        return 1;
    }

    if (!app.run()) {
        LOG_ERROR("Ausführung fehlgeschlagen");
        return 1;
    }

    app.shutdown();

    return 0;
}
