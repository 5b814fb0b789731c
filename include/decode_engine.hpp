#ifndef COLORMORSE_DECODE_ENGINE_HPP
#define COLORMORSE_DECODE_ENGINE_HPP

#include <cstddef>
#include <functional>
#include <istream>
#include <string>
#include <vector>

#include "color_sensor_adapter.hpp"
#include "decoding_session.hpp"
#include "signal_types.hpp"
#include "tone_sampler.hpp"

namespace colormorse {

/// Pulls the next sample. Returns false when the source is exhausted.
using SampleSource = std::function<bool(ColorSample&)>;

/// Polled between samples; returning true stops decoding (obstacle ahead).
using StopSignal = std::function<bool()>;

/// Stages of a decode run.
enum class DecodeStage {
    None,
    Sampling,
    Decoding,
    Translate,
    Complete
};

/// Result of a decode run, with staged error reporting.
struct DecodeReport {
    DecodeStage stage_reached = DecodeStage::None;
    bool        success       = false;
    Termination termination   = Termination::None;

    std::size_t samples   = 0;
    std::size_t intervals = 0;
    std::size_t rejected  = 0;
    double      unit_duration = 0.0;   // 0 if never calibrated

    SymbolStream symbols;
    std::string  code_string;   // ".- |..."
    std::string  spoken;        // "dot dash, ..."
    std::string  text;

    std::string error;
};

/// Driving loop around a DecodingSession.
///
/// Each run starts a fresh session, feeds it until the source runs dry, the
/// end pattern is seen or the stop signal fires, then translates whatever
/// was gathered.
///
/// Sources:
///   run()           any pull-based sample source
///   replay()        recorded "timestamp,raw_code" sensor log
///   decode_tone()   mono PCM with a Morse tone (Goertzel)
class DecodeEngine {
public:
    explicit DecodeEngine(const SessionConfig& cfg = {});

    DecodeReport run(const SampleSource& source, const StopSignal& stop = {}) const;

    DecodeReport decode_samples(const std::vector<ColorSample>& samples,
                                const StopSignal& stop = {}) const;

    DecodeReport replay(std::istream& log, const ColorSensorAdapter& adapter,
                        const StopSignal& stop = {}) const;

    /// Decode keyed CW. Uses the CW thresholds and, when `tone.wpm` is set,
    /// the dot length at that speed, so the first element is decoded too.
    DecodeReport decode_tone(const std::vector<float>& pcm, const ToneConfig& tone) const;

private:
    SessionConfig cfg_;
};

const char* stage_name(DecodeStage stage) noexcept;

} // namespace colormorse

#endif // COLORMORSE_DECODE_ENGINE_HPP
