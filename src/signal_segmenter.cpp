#include "signal_segmenter.hpp"

namespace colormorse {

const char* color_name(ColorClass color) noexcept {
    switch (color) {
        case ColorClass::Background:   return "background";
        case ColorClass::SignalMark:   return "mark";
        case ColorClass::SignalGap:    return "gap";
        case ColorClass::SteeringHint: return "steering";
        case ColorClass::Ignored:      return "ignored";
    }
    return "unknown";
}

std::optional<Interval> SignalSegmenter::observe(const ColorSample& sample) {
    if (!seeded_) {
        seeded_         = true;
        current_color_  = sample.color;
        interval_start_ = sample.timestamp;
        return std::nullopt;
    }

    if (sample.color == current_color_) return std::nullopt;

    Interval closed{current_color_, sample.timestamp - interval_start_};
    current_color_  = sample.color;
    interval_start_ = sample.timestamp;
    return closed;
}

void SignalSegmenter::reset() {
    seeded_         = false;
    current_color_  = ColorClass::Background;
    interval_start_ = 0.0;
}

} // namespace colormorse
