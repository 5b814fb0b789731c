#ifndef COLORMORSE_MORSE_CLASSIFIER_HPP
#define COLORMORSE_MORSE_CLASSIFIER_HPP

#include <cstddef>
#include <string>

#include "signal_types.hpp"
#include "symbol_stream.hpp"
#include "timing_reference.hpp"

namespace colormorse {

/// Thresholds, all expressed in calibrated units.
///
/// Marks:  ratio <  dot_dash_ratio              -> Dot
///         ratio >= dot_dash_ratio              -> Dash
/// Gaps:   ratio <  symbol_gap_ratio            -> nothing (intra-letter)
///         symbol_gap_ratio <= ratio < word_gap -> SymbolGap x round(ratio)
///         ratio >= word_gap_ratio              -> WordGap
struct ClassifierConfig {
    double      dot_dash_ratio      = 1.0;
    double      symbol_gap_ratio    = 1.0;
    double      word_gap_ratio      = 3.0;
    double      termination_ratio   = 7.0;  // single gap long enough to end the message
    std::size_t termination_gap_run = 7;    // trailing gap symbols that end the message
    bool        verbose             = false;
};

/// What the caller should do after an interval.
enum class ClassifyOutcome {
    Calibrating,  // interval consumed to set the unit duration
    Continue,
    Terminate
};

/// Result of a single classify() call.
struct ClassifyResult {
    bool            ok       = true;     // false: InvalidInterval, nothing mutated
    ClassifyOutcome outcome  = ClassifyOutcome::Continue;
    std::size_t     emitted  = 0;        // symbols appended by this call
    std::string     error;
};

/// Online interval -> Morse symbol classifier.
///
/// Holds only its thresholds; calibration and output live in the
/// TimingReference and SymbolStream owned by the caller.
class MorseClassifier {
public:
    explicit MorseClassifier(const ClassifierConfig& cfg = {});

    /// Classify one interval, appending any symbols it yields.
    ///
    /// Non-Morse colors return Continue untouched. The first Morse interval
    /// of a session calibrates `reference` and returns Calibrating.
    /// Non-positive durations are rejected before any mutation.
    ClassifyResult classify(const Interval& interval,
                            TimingReference& reference,
                            SymbolStream& symbols) const;

    const ClassifierConfig& config() const noexcept { return cfg_; }

private:
    ClassifierConfig cfg_;

    std::size_t classify_mark(double ratio, SymbolStream& symbols) const;
    std::size_t classify_gap(double ratio, SymbolStream& symbols) const;
};

/// Thresholds for keyed CW, in dot lengths: dash from 2 units, letter gap
/// from 2, word gap from 5. A pause of 14 units (two word spaces) ends the
/// message, so ordinary 7-unit word spaces do not.
ClassifierConfig cw_classifier_config();

const char* outcome_name(ClassifyOutcome outcome) noexcept;

} // namespace colormorse

#endif // COLORMORSE_MORSE_CLASSIFIER_HPP
