#ifndef COLORMORSE_TONE_SAMPLER_HPP
#define COLORMORSE_TONE_SAMPLER_HPP

#include <cstddef>
#include <cstdint>
#include <vector>

#include "signal_types.hpp"

namespace colormorse {

/// Parameters for reading a Morse tone instead of colored tape.
struct ToneConfig {
    double      sample_rate  = 44100.0;
    double      tone_freq_hz = 750.0;
    std::size_t block_size   = 441;   // 10 ms at 44100 Hz
    double      threshold    = 0.0;   // 0 = auto (median * 3.0 of the first buffer)
    int         wpm          = 20;    // keying speed; 0 = first tone is a one-dot leader
};

/// Dot length in seconds at `wpm` words per minute (PARIS, 50 units per word).
inline double unit_duration(int wpm) {
    return 1.2 / static_cast<double>(wpm);
}

/// Turns mono PCM into a ColorSample stream, one sample per block.
///
/// Goertzel power at the tone frequency with hysteresis decides between
/// SignalMark (tone) and SignalGap (silence). Silence before the first tone
/// is reported as Background so it cannot calibrate the decoder.
/// Partial blocks are carried over between process() calls.
class ToneSampler {
public:
    explicit ToneSampler(const ToneConfig& cfg = {});

    /// Append one sample per complete block in `pcm` to `out`.
    void process(const float* pcm, std::size_t count, std::vector<ColorSample>& out);

    void process(const std::vector<float>& pcm, std::vector<ColorSample>& out) {
        process(pcm.data(), pcm.size(), out);
    }

    double threshold() const noexcept { return thresh_on_; }
    double block_duration() const noexcept;
    uint64_t blocks_processed() const noexcept { return block_index_; }

private:
    ToneConfig cfg_;
    double     coeff_;          // 2 * cos(2*pi * k / N)
    double     thresh_on_ = 0.0;

    bool       tone_on_    = false;
    bool       heard_tone_ = false;
    uint64_t   block_index_ = 0;

    std::vector<float> pending_;

    double magnitude(const float* samples, std::size_t count) const;
    void calibrate_threshold(const float* pcm, std::size_t blocks);
    ColorSample classify_block(double power);
};

} // namespace colormorse

#endif // COLORMORSE_TONE_SAMPLER_HPP
