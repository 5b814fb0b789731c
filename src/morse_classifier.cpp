#include "morse_classifier.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>

namespace colormorse {

const char* outcome_name(ClassifyOutcome outcome) noexcept {
    switch (outcome) {
        case ClassifyOutcome::Calibrating: return "calibrating";
        case ClassifyOutcome::Continue:    return "continue";
        case ClassifyOutcome::Terminate:   return "terminate";
    }
    return "unknown";
}

ClassifierConfig cw_classifier_config() {
    ClassifierConfig cfg;
    cfg.dot_dash_ratio    = 2.0;
    cfg.symbol_gap_ratio  = 2.0;
    cfg.word_gap_ratio    = 5.0;
    cfg.termination_ratio = 14.0;
    return cfg;
}

MorseClassifier::MorseClassifier(const ClassifierConfig& cfg) : cfg_(cfg) {}

ClassifyResult MorseClassifier::classify(const Interval& interval,
                                         TimingReference& reference,
                                         SymbolStream& symbols) const {
    ClassifyResult result;

    if (!(interval.duration > 0.0)) {
        result.ok    = false;
        result.error = "invalid interval: non-positive duration";
        std::fprintf(stderr, "[classifier] rejected %s interval of %.6f s\n",
                     color_name(interval.color), interval.duration);
        return result;
    }

    if (!is_signal(interval.color)) return result;

    // The first Morse interval defines the unit for the whole session.
    if (!reference.calibrated()) {
        reference.calibrate(interval.duration);
        result.outcome = ClassifyOutcome::Calibrating;
        std::fprintf(stderr, "[classifier] unit duration calibrated to %.3f s from %s\n",
                     interval.duration, color_name(interval.color));
        return result;
    }

    const double ratio = reference.ratio(interval.duration);

    if (interval.color == ColorClass::SignalMark) {
        result.emitted = classify_mark(ratio, symbols);
    } else {
        result.emitted = classify_gap(ratio, symbols);
    }

    if (cfg_.verbose) {
        std::fprintf(stderr, "[classifier] %s %.3f s (%.2f units) -> +%zu, stream '%s'\n",
                     color_name(interval.color), interval.duration, ratio,
                     result.emitted, to_code_string(symbols).c_str());
    }

    const bool long_pause = interval.color == ColorClass::SignalGap &&
                            ratio >= cfg_.termination_ratio;
    if (long_pause || symbols.trailing_gap_run() >= cfg_.termination_gap_run) {
        result.outcome = ClassifyOutcome::Terminate;
    }
    return result;
}

std::size_t MorseClassifier::classify_mark(double ratio, SymbolStream& symbols) const {
    symbols.append(ratio < cfg_.dot_dash_ratio ? Symbol::Dot : Symbol::Dash);
    return 1;
}

std::size_t MorseClassifier::classify_gap(double ratio, SymbolStream& symbols) const {
    if (ratio < cfg_.symbol_gap_ratio) {
        // Spacing inside a letter is implied between elements.
        return 0;
    }
    if (ratio < cfg_.word_gap_ratio) {
        const auto count = static_cast<std::size_t>(std::max(1L, std::lround(ratio)));
        symbols.append(Symbol::SymbolGap, count);
        return count;
    }
    symbols.append(Symbol::WordGap);
    return 1;
}

} // namespace colormorse
