#include "decode_engine.hpp"

#include <cstdio>

#include "sample_log.hpp"

namespace colormorse {

const char* stage_name(DecodeStage stage) noexcept {
    switch (stage) {
        case DecodeStage::None:      return "none";
        case DecodeStage::Sampling:  return "sampling";
        case DecodeStage::Decoding:  return "decoding";
        case DecodeStage::Translate: return "translate";
        case DecodeStage::Complete:  return "complete";
    }
    return "unknown";
}

DecodeEngine::DecodeEngine(const SessionConfig& cfg) : cfg_(cfg) {}

DecodeReport DecodeEngine::run(const SampleSource& source, const StopSignal& stop) const {
    DecodeReport report;
    DecodingSession session(cfg_);

    // Stage 1: pull samples until the source is dry or the session ends.
    report.stage_reached = DecodeStage::Sampling;
    ColorSample sample;
    while (!session.terminated()) {
        if (stop && stop()) {
            session.stop();
            break;
        }
        if (!source(sample)) break;

        auto result = session.feed(sample);
        if (!result.ok) {
            std::fprintf(stderr, "[engine] skipping sample at %.3f s: %s\n",
                         sample.timestamp, result.error.c_str());
        }
    }

    report.samples     = session.samples_seen();
    report.intervals   = session.intervals_seen();
    report.rejected    = session.intervals_rejected();
    report.termination = session.termination();
    report.unit_duration = session.reference().unit_duration();

    // Stage 2: the stream must have carried Morse timing at all.
    report.stage_reached = DecodeStage::Decoding;
    report.code_string = to_code_string(session.symbols());
    report.spoken      = to_spoken(session.symbols());
    if (!session.reference().calibrated()) {
        report.error = "decode: no Morse signal found";
        return report;
    }

    // Stage 3: translate.
    report.stage_reached = DecodeStage::Translate;
    report.text    = session.translate();
    report.symbols = session.take_symbols();
    if (report.text.empty()) {
        report.error = "translate: no text recovered";
        return report;
    }

    report.stage_reached = DecodeStage::Complete;
    report.success = true;
    return report;
}

DecodeReport DecodeEngine::decode_samples(const std::vector<ColorSample>& samples,
                                          const StopSignal& stop) const {
    std::size_t next = 0;
    return run([&](ColorSample& out) {
        if (next >= samples.size()) return false;
        out = samples[next++];
        return true;
    }, stop);
}

DecodeReport DecodeEngine::replay(std::istream& log, const ColorSensorAdapter& adapter,
                                  const StopSignal& stop) const {
    SampleLogReader reader(log, adapter);
    DecodeReport report = run([&](ColorSample& out) { return reader.next(out); }, stop);

    if (reader.failed()) {
        report.stage_reached = DecodeStage::Sampling;
        report.success = false;
        report.error = "sample log: " + reader.error();
    }
    return report;
}

DecodeReport DecodeEngine::decode_tone(const std::vector<float>& pcm,
                                       const ToneConfig& tone) const {
    ToneSampler sampler(tone);
    std::vector<ColorSample> samples;
    sampler.process(pcm, samples);
    if (samples.empty()) {
        DecodeReport report;
        report.stage_reached = DecodeStage::Sampling;
        report.error = "tone: no blocks to analyze";
        return report;
    }

    // Keyed CW is measured against the dot, at a known speed when given.
    SessionConfig session = cfg_;
    session.classifier = cw_classifier_config();
    session.classifier.verbose = cfg_.classifier.verbose;
    session.unit_duration = tone.wpm > 0 ? unit_duration(tone.wpm) : 0.0;

    return DecodeEngine(session).decode_samples(samples);
}

} // namespace colormorse
