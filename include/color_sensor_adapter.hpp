#ifndef COLORMORSE_COLOR_SENSOR_ADAPTER_HPP
#define COLORMORSE_COLOR_SENSOR_ADAPTER_HPP

#include <vector>

#include "signal_types.hpp"

namespace colormorse {

/// Raw color codes reported by EV3-style color sensors.
namespace raw_color {
constexpr int kNone   = 0;
constexpr int kBlack  = 1;
constexpr int kBlue   = 2;
constexpr int kGreen  = 3;
constexpr int kYellow = 4;
constexpr int kRed    = 5;
constexpr int kWhite  = 6;
constexpr int kBrown  = 7;
} // namespace raw_color

/// A raw code that the sensor reports for a color it confuses with another.
struct ColorAlias {
    int from;
    int to;
};

/// Which raw codes mean what on the course.
struct AdapterConfig {
    int mark_code       = raw_color::kRed;
    int gap_code        = raw_color::kWhite;
    int background_code = raw_color::kNone;
    std::vector<int> steering_codes = {raw_color::kGreen, raw_color::kBlack};

    // Yellow and brown are read off red tape under uneven light.
    std::vector<ColorAlias> aliases = {
        {raw_color::kYellow, raw_color::kRed},
        {raw_color::kBrown,  raw_color::kRed},
    };
};

/// Maps hardware color codes onto the decoder's ColorClass.
class ColorSensorAdapter {
public:
    explicit ColorSensorAdapter(const AdapterConfig& cfg = {});

    /// Raw code after alias resolution.
    int resolve(int raw_code) const;

    ColorClass map(int raw_code) const;

    /// Build a sample, keeping the resolved raw code for steering.
    ColorSample sample(int raw_code, double timestamp) const;

private:
    AdapterConfig cfg_;
};

} // namespace colormorse

#endif // COLORMORSE_COLOR_SENSOR_ADAPTER_HPP
