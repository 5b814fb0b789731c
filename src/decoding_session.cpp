#include "decoding_session.hpp"

#include <cstdio>
#include <utility>

#include "translator.hpp"

namespace colormorse {

const char* state_name(SessionState state) noexcept {
    switch (state) {
        case SessionState::Calibrating: return "calibrating";
        case SessionState::Decoding:    return "decoding";
        case SessionState::Terminated:  return "terminated";
    }
    return "unknown";
}

const char* termination_name(Termination termination) noexcept {
    switch (termination) {
        case Termination::None:       return "none";
        case Termination::EndPattern: return "end_pattern";
        case Termination::Stopped:    return "stopped";
    }
    return "unknown";
}

DecodingSession::DecodingSession(const SessionConfig& cfg)
    : steering_(cfg.steering), preset_unit_(cfg.unit_duration), classifier_(cfg.classifier) {
    reset();
}

ClassifyResult DecodingSession::feed(const ColorSample& sample) {
    ClassifyResult result;
    if (state_ == SessionState::Terminated) {
        result.outcome = ClassifyOutcome::Terminate;
        return result;
    }

    ++samples_seen_;

    if (steering_ && !is_signal(sample.color)) {
        steering_(sample);
    }

    auto interval = segmenter_.observe(sample);
    if (!interval) return result;

    ++intervals_seen_;
    result = classifier_.classify(*interval, reference_, symbols_);
    if (!result.ok) {
        ++intervals_rejected_;
        return result;
    }

    if (state_ == SessionState::Calibrating && reference_.calibrated()) {
        state_ = SessionState::Decoding;
    }

    if (result.outcome == ClassifyOutcome::Terminate) {
        state_       = SessionState::Terminated;
        termination_ = Termination::EndPattern;
        std::fprintf(stderr, "[session] end pattern after %zu symbols\n", symbols_.size());
    }
    return result;
}

void DecodingSession::stop() {
    if (state_ == SessionState::Terminated) return;
    state_       = SessionState::Terminated;
    termination_ = Termination::Stopped;
    std::fprintf(stderr, "[session] stopped externally after %zu samples\n", samples_seen_);
}

void DecodingSession::reset() {
    segmenter_.reset();
    reference_.reset();
    symbols_ = SymbolStream{};

    state_       = SessionState::Calibrating;
    termination_ = Termination::None;

    samples_seen_       = 0;
    intervals_seen_     = 0;
    intervals_rejected_ = 0;

    if (preset_unit_ > 0.0) {
        reference_.calibrate(preset_unit_);
        state_ = SessionState::Decoding;
    }
}

std::string DecodingSession::translate() const {
    return Translator::translate(symbols_);
}

SymbolStream DecodingSession::take_symbols() {
    return std::exchange(symbols_, SymbolStream{});
}

} // namespace colormorse
