#pragma once

#include <jack/jack.h>
#include <atomic>
#include <memory>
#include <vector>
#include <string>
#include <functional>
#include "audio_types.h"

namespace OnsetAnalyzer {
namespace Audio {

/**
 * JACK audio client with N mono input ports.
 * The process callback receives one buffer per port and runs in the JACK
 * realtime thread.
 */
class JackClient {
public:
    using ProcessCallback = std::function<void(
        const std::vector<const CSAMPLE*>& inputBuffers,
        int frameCount)>;

    explicit JackClient(const std::string& clientName = "onset-monitor",
                        int numInputChannels = 1);
    ~JackClient();

    // Non-copyable
    JackClient(const JackClient&) = delete;
    JackClient& operator=(const JackClient&) = delete;

    // Open JACK client and register input ports
    bool initialize();

    // Activate JACK client
    bool activate();

    // Deactivate JACK client
    bool deactivate();

    // Must be set before activate()
    void setProcessCallback(ProcessCallback callback);

    // Get available physical output ports
    std::vector<std::string> getAvailablePorts(
        const std::string& portFilter = "");

    // Connect a source port to one of our inputs (requires activate())
    bool connectInputPort(int channelIndex, const std::string& portName);

    // Properties
    SampleRate getSampleRate() const;
    int getBufferSize() const;
    int getNumInputChannels() const { return m_numInputChannels; }
    bool isConnected() const { return m_connected.load(); }

    // Static JACK callbacks
    static int processCallback(jack_nframes_t nframes, void* arg);
    static void shutdownCallback(void* arg);

private:
    std::string m_clientName;
    int m_numInputChannels;
    jack_client_t* m_client;
    bool m_active;
    std::vector<jack_port_t*> m_inputPorts;
    std::vector<const CSAMPLE*> m_inputBuffers;  // Preallocated for the RT thread
    ProcessCallback m_processCallback;
    std::atomic<bool> m_connected;

    int processInternal(jack_nframes_t frameCount);
    std::string inputPortName(int channelIndex) const;
};

using JackClientPtr = std::shared_ptr<JackClient>;

} // namespace Audio
} // namespace OnsetAnalyzer
