#include "audio/jack_client.h"
#include "util/logging.h"
#include <algorithm>

namespace OnsetAnalyzer {
namespace Audio {

JackClient::JackClient(const std::string& clientName, int numInputChannels)
    : m_clientName(clientName),
      m_numInputChannels(std::max(1, numInputChannels)),
      m_client(nullptr),
      m_active(false),
      m_connected(false) {
}

JackClient::~JackClient() {
    if (m_client) {
        if (m_active) {
            jack_deactivate(m_client);
        }
        jack_client_close(m_client);
    }
}

std::string JackClient::inputPortName(int channelIndex) const {
    return "input_" + std::to_string(channelIndex + 1);
}

bool JackClient::initialize() {
    jack_options_t options = JackNullOption;
    jack_status_t status;

    m_client = jack_client_open(m_clientName.c_str(), options, &status);
    if (!m_client) {
        LOG_ERROR("Failed to open JACK client (status 0x" +
                  std::to_string(static_cast<int>(status)) + ")");
        return false;
    }

    // JACK may have renamed us if the name was taken
    if (status & JackNameNotUnique) {
        m_clientName = jack_get_client_name(m_client);
        LOG_WARN("JACK client name not unique, using: " + m_clientName);
    }

    for (int i = 0; i < m_numInputChannels; ++i) {
        std::string portName = inputPortName(i);
        jack_port_t* port = jack_port_register(
            m_client,
            portName.c_str(),
            JACK_DEFAULT_AUDIO_TYPE,
            JackPortIsInput,
            0);

        if (!port) {
            LOG_ERROR("Failed to create JACK port: " + portName);
            return false;
        }
        m_inputPorts.push_back(port);
    }
    m_inputBuffers.assign(m_inputPorts.size(), nullptr);

    jack_set_process_callback(m_client, processCallback, this);
    jack_on_shutdown(m_client, shutdownCallback, this);

    m_connected = true;
    LOG_INFO("JACK client initialized: " + m_clientName + " (" +
             std::to_string(m_numInputChannels) + " input ports)");
    return true;
}

bool JackClient::activate() {
    if (!m_client) return false;

    if (jack_activate(m_client)) {
        LOG_ERROR("Failed to activate JACK client");
        return false;
    }

    m_active = true;
    LOG_INFO("JACK client activated");
    return true;
}

bool JackClient::deactivate() {
    if (!m_client || !m_active) return false;

    if (jack_deactivate(m_client)) {
        LOG_ERROR("Failed to deactivate JACK client");
        return false;
    }

    m_active = false;
    LOG_INFO("JACK client deactivated");
    return true;
}

void JackClient::setProcessCallback(ProcessCallback callback) {
    m_processCallback = std::move(callback);
}

SampleRate JackClient::getSampleRate() const {
    if (!m_client) return SampleRate(44100);
    return SampleRate(static_cast<int>(jack_get_sample_rate(m_client)));
}

int JackClient::getBufferSize() const {
    if (!m_client) return static_cast<int>(kChunkSize);
    return static_cast<int>(jack_get_buffer_size(m_client));
}

std::vector<std::string> JackClient::getAvailablePorts(
    const std::string& portFilter) {
    std::vector<std::string> ports;
    if (!m_client) return ports;

    const char** jackPorts = jack_get_ports(
        m_client,
        portFilter.empty() ? nullptr : portFilter.c_str(),
        JACK_DEFAULT_AUDIO_TYPE,
        JackPortIsOutput | JackPortIsPhysical);

    if (jackPorts) {
        for (int i = 0; jackPorts[i]; ++i) {
            ports.push_back(jackPorts[i]);
        }
        jack_free(jackPorts);
    }

    return ports;
}

bool JackClient::connectInputPort(int channelIndex, const std::string& portName) {
    if (!m_client || channelIndex < 0 ||
        channelIndex >= static_cast<int>(m_inputPorts.size())) {
        return false;
    }

    std::string ourPort = m_clientName + ":" + inputPortName(channelIndex);

    if (jack_connect(m_client, portName.c_str(), ourPort.c_str())) {
        LOG_ERROR("Failed to connect port: " + portName + " -> " + ourPort);
        return false;
    }

    LOG_INFO("Connected port: " + portName + " -> " + ourPort);
    return true;
}

int JackClient::processCallback(jack_nframes_t nframes, void* arg) {
    JackClient* client = static_cast<JackClient*>(arg);
    return client->processInternal(nframes);
}

void JackClient::shutdownCallback(void* arg) {
    JackClient* client = static_cast<JackClient*>(arg);
    client->m_connected = false;
    LOG_WARN("JACK server shutdown");
}

int JackClient::processInternal(jack_nframes_t frameCount) {
    // RT thread: no allocation, buffers vector is sized in initialize()
    for (size_t i = 0; i < m_inputPorts.size(); ++i) {
        m_inputBuffers[i] = static_cast<const CSAMPLE*>(
            jack_port_get_buffer(m_inputPorts[i], frameCount));
    }

    if (m_processCallback) {
        m_processCallback(m_inputBuffers, static_cast<int>(frameCount));
    }

    return 0;
}

} // namespace Audio
} // namespace OnsetAnalyzer
