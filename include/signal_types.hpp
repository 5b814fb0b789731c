#ifndef COLORMORSE_SIGNAL_TYPES_HPP
#define COLORMORSE_SIGNAL_TYPES_HPP

#include <cstdint>

namespace colormorse {

/// Hardware-agnostic color classes seen by the decoder.
/// Raw sensor codes are mapped onto these by ColorSensorAdapter.
enum class ColorClass : uint8_t {
    Background,
    SignalMark,    // "on" signal: dots and dashes
    SignalGap,     // "off" signal: pauses
    SteeringHint,  // line / heading markers, forwarded untouched
    Ignored
};

/// One sensor reading.
struct ColorSample {
    ColorClass color     = ColorClass::Background;
    double     timestamp = 0.0;   // seconds, monotonic
    int        raw_code  = -1;    // raw hardware code, -1 if unknown
};

/// A maximal run of one color class with its elapsed time.
struct Interval {
    ColorClass color    = ColorClass::Background;
    double     duration = 0.0;    // seconds
};

/// True for the two classes that carry Morse timing.
inline bool is_signal(ColorClass color) noexcept {
    return color == ColorClass::SignalMark || color == ColorClass::SignalGap;
}

const char* color_name(ColorClass color) noexcept;

} // namespace colormorse

#endif // COLORMORSE_SIGNAL_TYPES_HPP
