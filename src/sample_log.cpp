#include "sample_log.hpp"

#include <cerrno>
#include <climits>
#include <cstdio>
#include <cstdlib>

namespace colormorse {

SampleLogReader::SampleLogReader(std::istream& in, const ColorSensorAdapter& adapter)
    : in_(in), adapter_(adapter) {}

bool SampleLogReader::next(ColorSample& out) {
    if (failed()) return false;

    std::string line;
    while (std::getline(in_, line)) {
        ++line_no_;
        if (!line.empty() && line.back() == '\r') line.pop_back();

        std::size_t start = line.find_first_not_of(" \t");
        if (start == std::string::npos || line[start] == '#') continue;

        return parse_line(line.substr(start), out);
    }
    return false;
}

bool SampleLogReader::parse_line(const std::string& line, ColorSample& out) {
    const char* text = line.c_str();
    char*       end  = nullptr;

    errno = 0;
    double timestamp = std::strtod(text, &end);
    if (end == text || errno != 0) {
        error_ = "line " + std::to_string(line_no_) + ": bad timestamp";
        std::fprintf(stderr, "[log] %s: '%s'\n", error_.c_str(), line.c_str());
        return false;
    }

    while (*end == ' ' || *end == '\t') ++end;
    if (*end != ',') {
        error_ = "line " + std::to_string(line_no_) + ": expected ','";
        std::fprintf(stderr, "[log] %s: '%s'\n", error_.c_str(), line.c_str());
        return false;
    }

    const char* code_text = end + 1;
    errno = 0;
    long raw = std::strtol(code_text, &end, 10);
    const bool converted = end != code_text && errno == 0 &&
                           raw >= INT_MIN && raw <= INT_MAX;
    while (*end == ' ' || *end == '\t') ++end;
    if (!converted || *end != '\0') {
        error_ = "line " + std::to_string(line_no_) + ": bad color code";
        std::fprintf(stderr, "[log] %s: '%s'\n", error_.c_str(), line.c_str());
        return false;
    }

    out = adapter_.sample(static_cast<int>(raw), timestamp);
    return true;
}

} // namespace colormorse
