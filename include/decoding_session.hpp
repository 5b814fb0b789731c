#ifndef COLORMORSE_DECODING_SESSION_HPP
#define COLORMORSE_DECODING_SESSION_HPP

#include <cstddef>
#include <functional>
#include <string>

#include "morse_classifier.hpp"
#include "signal_segmenter.hpp"
#include "signal_types.hpp"
#include "symbol_stream.hpp"
#include "timing_reference.hpp"

namespace colormorse {

/// Receives samples that do not carry Morse timing (line markers etc.).
using SteeringHandler = std::function<void(const ColorSample&)>;

/// Lifecycle of one decoding session.
enum class SessionState {
    Calibrating,   // no unit duration yet
    Decoding,
    Terminated     // end pattern seen or stopped from outside
};

/// Why a session ended.
enum class Termination {
    None,
    EndPattern,    // classifier reported Terminate
    Stopped        // stop() called by the driving loop
};

struct SessionConfig {
    ClassifierConfig classifier;
    SteeringHandler  steering;   // optional
    double           unit_duration = 0.0;   // > 0: known unit, no calibration interval
};

/// All mutable decoding state for one pass over a sample stream.
///
/// Owned by the driving loop and fed one sample at a time; it never loops
/// or blocks on its own. Not thread-safe.
class DecodingSession {
public:
    explicit DecodingSession(const SessionConfig& cfg = {});

    /// Process one sample: forward it to steering if it is not a Morse
    /// color, segment it, and classify any interval that closed.
    ///
    /// After termination, samples are ignored and Terminate is returned.
    /// A rejected interval leaves state untouched and returns ok = false.
    ClassifyResult feed(const ColorSample& sample);

    /// External stop (obstacle, operator). Legal between any two samples.
    void stop();

    /// Discard everything and start a new session. A preset unit
    /// duration is applied again.
    void reset();

    /// Text decoded from the symbols gathered so far.
    std::string translate() const;

    /// Hand the symbol stream to the caller by value.
    SymbolStream take_symbols();

    SessionState state() const noexcept { return state_; }
    Termination termination() const noexcept { return termination_; }
    bool terminated() const noexcept { return state_ == SessionState::Terminated; }

    const SymbolStream& symbols() const noexcept { return symbols_; }
    const TimingReference& reference() const noexcept { return reference_; }

    std::size_t samples_seen() const noexcept { return samples_seen_; }
    std::size_t intervals_seen() const noexcept { return intervals_seen_; }
    std::size_t intervals_rejected() const noexcept { return intervals_rejected_; }

private:
    SteeringHandler steering_;
    double          preset_unit_;
    MorseClassifier classifier_;
    SignalSegmenter segmenter_;
    TimingReference reference_;
    SymbolStream    symbols_;

    SessionState state_       = SessionState::Calibrating;
    Termination  termination_ = Termination::None;

    std::size_t samples_seen_       = 0;
    std::size_t intervals_seen_     = 0;
    std::size_t intervals_rejected_ = 0;
};

const char* state_name(SessionState state) noexcept;
const char* termination_name(Termination termination) noexcept;

} // namespace colormorse

#endif // COLORMORSE_DECODING_SESSION_HPP
