#include "tone_sampler.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>

namespace colormorse {

namespace {
// Auto threshold never drops below this, so digital silence stays OFF.
constexpr double kMinThreshold = 1e-6;
} // namespace

ToneSampler::ToneSampler(const ToneConfig& cfg) : cfg_(cfg), thresh_on_(cfg.threshold) {
    // k = round(N * f / fs), integer bin index for bin-centered detection
    double k = std::round(static_cast<double>(cfg_.block_size) * cfg_.tone_freq_hz /
                          cfg_.sample_rate);
    coeff_ = 2.0 * std::cos(2.0 * M_PI * k / static_cast<double>(cfg_.block_size));
}

double ToneSampler::block_duration() const noexcept {
    return static_cast<double>(cfg_.block_size) / cfg_.sample_rate;
}

double ToneSampler::magnitude(const float* samples, std::size_t count) const {
    double s0 = 0.0;
    double s1 = 0.0;
    double s2 = 0.0;

    for (std::size_t i = 0; i < count; ++i) {
        s0 = static_cast<double>(samples[i]) + coeff_ * s1 - s2;
        s2 = s1;
        s1 = s0;
    }

    // Power = s1^2 + s2^2 - coeff * s1 * s2
    return s1 * s1 + s2 * s2 - coeff_ * s1 * s2;
}

void ToneSampler::calibrate_threshold(const float* pcm, std::size_t blocks) {
    std::vector<double> mags(blocks);
    for (std::size_t i = 0; i < blocks; ++i) {
        mags[i] = magnitude(pcm + i * cfg_.block_size, cfg_.block_size);
    }
    std::nth_element(mags.begin(), mags.begin() + blocks / 2, mags.end());
    thresh_on_ = std::max(mags[blocks / 2] * 3.0, kMinThreshold);

    std::fprintf(stderr, "[tone] auto threshold %.3g from %zu blocks\n", thresh_on_, blocks);
}

ColorSample ToneSampler::classify_block(double power) {
    // Hysteresis: OFF threshold is 70% of ON threshold.
    if (tone_on_) {
        if (power < thresh_on_ * 0.7) tone_on_ = false;
    } else if (power >= thresh_on_) {
        tone_on_    = true;
        heard_tone_ = true;
    }

    ColorSample sample;
    sample.timestamp = static_cast<double>(block_index_) * block_duration();
    if (tone_on_) {
        sample.color = ColorClass::SignalMark;
    } else {
        sample.color = heard_tone_ ? ColorClass::SignalGap : ColorClass::Background;
    }
    ++block_index_;
    return sample;
}

void ToneSampler::process(const float* pcm, std::size_t count, std::vector<ColorSample>& out) {
    if (cfg_.block_size == 0 || count == 0) return;

    pending_.insert(pending_.end(), pcm, pcm + count);
    const std::size_t blocks = pending_.size() / cfg_.block_size;
    if (blocks == 0) return;

    if (thresh_on_ <= 0.0) calibrate_threshold(pending_.data(), blocks);

    out.reserve(out.size() + blocks);
    for (std::size_t i = 0; i < blocks; ++i) {
        out.push_back(classify_block(
            magnitude(pending_.data() + i * cfg_.block_size, cfg_.block_size)));
    }

    pending_.erase(pending_.begin(),
                   pending_.begin() + static_cast<std::ptrdiff_t>(blocks * cfg_.block_size));
}

} // namespace colormorse
