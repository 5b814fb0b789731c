#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <string>

#include "decode_engine.hpp"
#include "symbol_stream.hpp"
#include "translator.hpp"

#ifdef COLORMORSE_HAS_AUDIO
#include "audio_input.hpp"
#endif

static void print_usage() {
    std::puts(
        "colormorse v1.0.0\n"
        "Usage:\n"
        "  colormorse replay <log>          Decode a recorded sensor log (timestamp,raw_code)\n"
        "  colormorse translate \"<code>\"    Translate a code string ('.', '-', ' ', '|')\n"
#ifdef COLORMORSE_HAS_AUDIO
        "  colormorse listen <seconds> [wpm]\n"
        "                                   Decode a Morse tone from the microphone\n"
        "                                   (wpm 0: start with a one-dot leader tone)\n"
        "  colormorse devices               List available audio devices\n"
#endif
    );
}

static void print_report(const char* tag, const colormorse::DecodeReport& report) {
    std::printf("[%s] %zu samples, %zu intervals, %zu rejected, unit %.3f s\n",
                tag, report.samples, report.intervals, report.rejected,
                report.unit_duration);
    std::printf("[%s] ended by: %s\n", tag,
                colormorse::termination_name(report.termination));
    std::printf("[%s] morse:   '%s'\n", tag, report.code_string.c_str());
    std::printf("[%s] spoken:  %s\n", tag, report.spoken.c_str());

    if (report.success) {
        std::printf("[%s] decoded: %s\n", tag, report.text.c_str());
    } else {
        std::fprintf(stderr, "[%s] decode failed at stage '%s': %s\n", tag,
                     colormorse::stage_name(report.stage_reached),
                     report.error.c_str());
    }
}

// ---------------------------------------------------------------------------
// Commands
// ---------------------------------------------------------------------------

static int cmd_replay(const char* path) {
    std::ifstream in(path);
    if (!in) {
        std::fprintf(stderr, "error: cannot open '%s'\n", path);
        return 1;
    }

    colormorse::SessionConfig cfg;
    colormorse::DecodeEngine engine(cfg);
    colormorse::ColorSensorAdapter adapter;

    auto report = engine.replay(in, adapter);
    print_report("replay", report);
    return report.success ? 0 : 1;
}

static int cmd_translate(const char* code) {
    auto symbols = colormorse::parse_code_string(code);
    if (!symbols) {
        std::fprintf(stderr, "error: code string may only contain '.', '-', ' ' and '|'\n");
        return 1;
    }
    std::printf("%s\n", colormorse::Translator::translate(*symbols).c_str());
    return 0;
}

#ifdef COLORMORSE_HAS_AUDIO
static int cmd_listen(double seconds, int wpm) {
    colormorse::AudioConfig audio_cfg;
    colormorse::AudioInput audio;
    if (!audio.open(audio_cfg)) {
        std::fprintf(stderr, "error: failed to open audio input\n");
        return 1;
    }

    std::printf("[listen] capturing %.1f seconds of audio...\n", seconds);
    auto pcm = audio.capture(seconds);
    audio.close();
    std::printf("[listen] captured %zu samples\n", pcm.size());

    colormorse::ToneConfig tone;
    tone.sample_rate = audio_cfg.sample_rate;
    tone.wpm         = wpm;

    colormorse::DecodeEngine engine;
    auto report = engine.decode_tone(pcm, tone);
    print_report("listen", report);
    return report.success ? 0 : 1;
}
#endif

// ---------------------------------------------------------------------------
// Main
// ---------------------------------------------------------------------------

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    const char* cmd = argv[1];
    int rc = 1;

    if (std::strcmp(cmd, "replay") == 0 && argc >= 3) {
        rc = cmd_replay(argv[2]);
    } else if (std::strcmp(cmd, "translate") == 0 && argc >= 3) {
        rc = cmd_translate(argv[2]);
#ifdef COLORMORSE_HAS_AUDIO
    } else if (std::strcmp(cmd, "listen") == 0 && argc >= 3) {
        char* end = nullptr;
        double seconds = std::strtod(argv[2], &end);
        int wpm = (argc >= 4) ? std::atoi(argv[3]) : colormorse::ToneConfig{}.wpm;
        if (end == argv[2] || *end != '\0' || !(seconds > 0.0) || wpm < 0) {
            std::fprintf(stderr, "error: listen needs seconds > 0 and wpm >= 0\n");
        } else {
            rc = cmd_listen(seconds, wpm);
        }
    } else if (std::strcmp(cmd, "devices") == 0) {
        colormorse::AudioInput::list_devices();
        rc = 0;
#endif
    } else {
        print_usage();
    }

    return rc;
}
