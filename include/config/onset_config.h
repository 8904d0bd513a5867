#pragma once

#include <string>
#include <vector>
#include "analysis/onset_frame_processor.h"
#include "config/env_config.h"
#include "util/logging.h"

namespace OnsetAnalyzer {
namespace Config {

/**
 * Settings of the onset-monitor host, read from .env / environment.
 */
struct OnsetConfig {
    Util::LogLevel logLevel = Util::LogLevel::Info;
    std::string jackClientName = "onset-monitor";
    int numInputChannels = 1;                 // Downmixed to mono
    std::vector<std::string> connectPorts;    // Index = input channel, empty = manual
    Analysis::ThresholdParams threshold;
    bool debugConsole = false;                // Log every ODF value
};

// Reads LOG_LEVEL, JACK_CLIENT_NAME, NUM_INPUT_CHANNELS, JACK_CONNECT_PORT_<n>,
// ONSET_LAMBDA, ONSET_ALPHA, ONSET_PEAK_WEIGHT, ONSET_DEBUG_CONSOLE.
// Out-of-range values fall back to defaults with a warning.
OnsetConfig loadOnsetConfig(const EnvConfig& env);

// Loads .env, ../.env or .env.example (first one found) into the singleton.
// Returns the path that was loaded, empty if none.
std::string loadEnvFiles(EnvConfig& env);

} // namespace Config
} // namespace OnsetAnalyzer
