#ifndef COLORMORSE_AUDIO_INPUT_HPP
#define COLORMORSE_AUDIO_INPUT_HPP

#ifdef COLORMORSE_HAS_AUDIO

#include <vector>

#include <portaudio.h>

namespace colormorse {

/// Configuration for audio capture.
struct AudioConfig {
    double sample_rate  = 44100.0;
    int    input_device = -1;       // -1 = default
};

/// PortAudio wrapper for receiving a Morse tone from a microphone.
class AudioInput {
public:
    AudioInput();
    ~AudioInput();

    AudioInput(const AudioInput&) = delete;
    AudioInput& operator=(const AudioInput&) = delete;

    /// Initialise PortAudio and open the input device.
    bool open(const AudioConfig& cfg);

    /// Shut down PortAudio.
    void close();

    /// Record `duration_sec` seconds of mono float PCM. Empty on failure.
    std::vector<float> capture(double duration_sec);

    /// Frames in `duration_sec` at `sample_rate`; 0 for non-positive or NaN input.
    static unsigned long frame_count(double sample_rate, double duration_sec);

    /// List available audio devices and their indices.
    static void list_devices();

private:
    PaStream*   stream_      = nullptr;
    AudioConfig cfg_;
    bool        initialized_ = false;
};

} // namespace colormorse

#endif // COLORMORSE_HAS_AUDIO
#endif // COLORMORSE_AUDIO_INPUT_HPP
