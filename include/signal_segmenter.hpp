#ifndef COLORMORSE_SIGNAL_SEGMENTER_HPP
#define COLORMORSE_SIGNAL_SEGMENTER_HPP

#include <optional>

#include "signal_types.hpp"

namespace colormorse {

/// Turns a color sample stream into closed intervals.
///
/// Emits one Interval per color change. Durations are always the difference
/// of two sample timestamps; there is no free-running counter.
class SignalSegmenter {
public:
    SignalSegmenter() = default;

    /// Feed one sample. Returns the interval that just closed, if any.
    /// The first sample only seeds the state.
    std::optional<Interval> observe(const ColorSample& sample);

    /// Forget the open run. The next sample seeds again.
    void reset();

    bool seeded() const noexcept { return seeded_; }
    ColorClass current_color() const noexcept { return current_color_; }
    double interval_start() const noexcept { return interval_start_; }

private:
    bool       seeded_         = false;
    ColorClass current_color_  = ColorClass::Background;
    double     interval_start_ = 0.0;
};

} // namespace colormorse

#endif // COLORMORSE_SIGNAL_SEGMENTER_HPP
