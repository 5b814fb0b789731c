#ifndef COLORMORSE_TIMING_REFERENCE_HPP
#define COLORMORSE_TIMING_REFERENCE_HPP

#include <optional>

namespace colormorse {

/// Unit duration against which marks and gaps are measured.
///
/// Set once, from the first Morse-carrying interval of a session, and
/// immutable afterwards. A rolling or adaptive calibration would replace
/// this type without touching the classifier's symbol rules.
class TimingReference {
public:
    TimingReference() = default;

    bool calibrated() const noexcept { return unit_.has_value(); }

    /// Unit duration in seconds. Only meaningful once calibrated().
    double unit_duration() const noexcept { return unit_.value_or(0.0); }

    /// Store the unit if none is set yet. Returns true if this call set it.
    bool calibrate(double unit_sec) {
        if (unit_) return false;
        unit_ = unit_sec;
        return true;
    }

    /// Duration expressed in units. Caller must check calibrated().
    double ratio(double duration_sec) const noexcept {
        return duration_sec / *unit_;
    }

    /// Start of a new decoding session.
    void reset() { unit_.reset(); }

private:
    std::optional<double> unit_;
};

} // namespace colormorse

#endif // COLORMORSE_TIMING_REFERENCE_HPP
