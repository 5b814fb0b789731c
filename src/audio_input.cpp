#ifdef COLORMORSE_HAS_AUDIO

#include "audio_input.hpp"

#include <cstdio>
#include <limits>

namespace colormorse {

AudioInput::AudioInput() = default;

AudioInput::~AudioInput() { close(); }

bool AudioInput::open(const AudioConfig& cfg) {
    cfg_ = cfg;

    PaError err = Pa_Initialize();
    if (err != paNoError) {
        std::fprintf(stderr, "[audio] Pa_Initialize failed: %s\n",
                     Pa_GetErrorText(err));
        return false;
    }
    initialized_ = true;

    PaStreamParameters in_params{};
    in_params.device = (cfg_.input_device >= 0)
                           ? cfg_.input_device
                           : Pa_GetDefaultInputDevice();
    if (in_params.device == paNoDevice) {
        std::fprintf(stderr, "[audio] no input device available\n");
        return false;
    }
    in_params.channelCount = 1;
    in_params.sampleFormat = paFloat32;
    in_params.suggestedLatency =
        Pa_GetDeviceInfo(in_params.device)->defaultLowInputLatency;

    err = Pa_OpenStream(&stream_, &in_params, nullptr,
                        cfg_.sample_rate, paFramesPerBufferUnspecified,
                        paClipOff, nullptr, nullptr);
    if (err != paNoError) {
        std::fprintf(stderr, "[audio] input stream open failed: %s\n",
                     Pa_GetErrorText(err));
        stream_ = nullptr;
        return false;
    }
    return true;
}

void AudioInput::close() {
    if (stream_)      { Pa_CloseStream(stream_); stream_ = nullptr; }
    if (initialized_) { Pa_Terminate(); initialized_ = false; }
}

std::vector<float> AudioInput::capture(double duration_sec) {
    const unsigned long num_frames = frame_count(cfg_.sample_rate, duration_sec);
    if (!stream_ || num_frames == 0) return {};

    std::vector<float> buf(num_frames, 0.0f);

    PaError err = Pa_StartStream(stream_);
    if (err != paNoError) {
        std::fprintf(stderr, "[audio] start failed: %s\n", Pa_GetErrorText(err));
        return {};
    }

    err = Pa_ReadStream(stream_, buf.data(), num_frames);
    Pa_StopStream(stream_);
    if (err != paNoError && err != paInputOverflowed) {
        std::fprintf(stderr, "[audio] read failed: %s\n", Pa_GetErrorText(err));
        return {};
    }
    return buf;
}

unsigned long AudioInput::frame_count(double sample_rate, double duration_sec) {
    const double frames = sample_rate * duration_sec;
    if (!(frames >= 1.0)) return 0;
    if (frames >= static_cast<double>(std::numeric_limits<unsigned long>::max())) return 0;
    return static_cast<unsigned long>(frames);
}

void AudioInput::list_devices() {
    if (Pa_Initialize() != paNoError) {
        std::fprintf(stderr, "[audio] Pa_Initialize failed\n");
        return;
    }
    int n = Pa_GetDeviceCount();
    for (int i = 0; i < n; ++i) {
        const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
        std::printf("  [%d] %s  (in:%d out:%d)\n",
                    i, info->name,
                    info->maxInputChannels,
                    info->maxOutputChannels);
    }
    Pa_Terminate();
}

} // namespace colormorse

#endif // COLORMORSE_HAS_AUDIO
