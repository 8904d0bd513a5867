#include "config/onset_config.h"
#include <cmath>
#include <string>

namespace OnsetAnalyzer {
namespace Config {

namespace {

constexpr int kMaxInputChannels = 8;

float readWeight(const EnvConfig& env, const std::string& key, float defaultValue) {
    float value = env.getFloat(key, defaultValue);
    if (!(value >= 0.0f) || !std::isfinite(value)) {
        LOG_WARN(key + " invalid (" + env.getString(key) + "), using " +
                 std::to_string(defaultValue));
        return defaultValue;
    }
    return value;
}

} // namespace

std::string loadEnvFiles(EnvConfig& env) {
    for (const char* path : {".env", "../.env", ".env.example"}) {
        if (env.load(path)) {
            return path;
        }
    }
    return "";
}

OnsetConfig loadOnsetConfig(const EnvConfig& env) {
    OnsetConfig config;

    int logLevel = env.getInt("LOG_LEVEL", static_cast<int>(config.logLevel));
    if (logLevel < static_cast<int>(Util::LogLevel::Debug) ||
        logLevel > static_cast<int>(Util::LogLevel::Fatal)) {
        LOG_WARN("LOG_LEVEL out of range (" + std::to_string(logLevel) + "), using INFO");
        logLevel = static_cast<int>(Util::LogLevel::Info);
    }
    config.logLevel = static_cast<Util::LogLevel>(logLevel);

    config.jackClientName = env.getString("JACK_CLIENT_NAME", config.jackClientName);
    if (config.jackClientName.empty()) {
        config.jackClientName = "onset-monitor";
    }

    int channels = env.getInt("NUM_INPUT_CHANNELS", config.numInputChannels);
    if (channels < 1 || channels > kMaxInputChannels) {
        LOG_WARN("NUM_INPUT_CHANNELS must be 1-" + std::to_string(kMaxInputChannels) +
                 ", using 1");
        channels = 1;
    }
    config.numInputChannels = channels;

    // JACK_CONNECT_PORT_1 .. JACK_CONNECT_PORT_n
    config.connectPorts.resize(channels);
    for (int i = 0; i < channels; ++i) {
        config.connectPorts[i] = env.getString("JACK_CONNECT_PORT_" + std::to_string(i + 1), "");
    }

    Analysis::ThresholdParams defaults;
    config.threshold.lambda = readWeight(env, "ONSET_LAMBDA", defaults.lambda);
    config.threshold.alpha = readWeight(env, "ONSET_ALPHA", defaults.alpha);
    config.threshold.highestPeakWeight =
        readWeight(env, "ONSET_PEAK_WEIGHT", defaults.highestPeakWeight);

    config.debugConsole = env.getBool("ONSET_DEBUG_CONSOLE", false);

    return config;
}

} // namespace Config
} // namespace OnsetAnalyzer
