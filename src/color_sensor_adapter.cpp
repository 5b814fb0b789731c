#include "color_sensor_adapter.hpp"

#include <algorithm>

namespace colormorse {

ColorSensorAdapter::ColorSensorAdapter(const AdapterConfig& cfg) : cfg_(cfg) {}

int ColorSensorAdapter::resolve(int raw_code) const {
    for (const auto& alias : cfg_.aliases) {
        if (alias.from == raw_code) return alias.to;
    }
    return raw_code;
}

ColorClass ColorSensorAdapter::map(int raw_code) const {
    const int code = resolve(raw_code);

    if (code == cfg_.mark_code)       return ColorClass::SignalMark;
    if (code == cfg_.gap_code)        return ColorClass::SignalGap;
    if (code == cfg_.background_code) return ColorClass::Background;

    if (std::find(cfg_.steering_codes.begin(), cfg_.steering_codes.end(), code) !=
        cfg_.steering_codes.end()) {
        return ColorClass::SteeringHint;
    }
    return ColorClass::Ignored;
}

ColorSample ColorSensorAdapter::sample(int raw_code, double timestamp) const {
    return {map(raw_code), timestamp, resolve(raw_code)};
}

} // namespace colormorse
