#ifndef COLORMORSE_SAMPLE_LOG_HPP
#define COLORMORSE_SAMPLE_LOG_HPP

#include <cstddef>
#include <istream>
#include <string>

#include "color_sensor_adapter.hpp"
#include "signal_types.hpp"

namespace colormorse {

/// Streams samples out of a recorded sensor log.
///
/// Format: one "timestamp,raw_code" pair per line, timestamp in seconds.
/// Blank lines and lines starting with '#' are skipped.
class SampleLogReader {
public:
    SampleLogReader(std::istream& in, const ColorSensorAdapter& adapter);

    /// Read the next sample. Returns false at end of input or on a
    /// malformed line; check failed() to tell them apart.
    bool next(ColorSample& out);

    bool failed() const noexcept { return !error_.empty(); }
    const std::string& error() const noexcept { return error_; }
    std::size_t line_number() const noexcept { return line_no_; }

private:
    std::istream&             in_;
    const ColorSensorAdapter& adapter_;
    std::size_t               line_no_ = 0;
    std::string               error_;

    bool parse_line(const std::string& line, ColorSample& out);
};

} // namespace colormorse

#endif // COLORMORSE_SAMPLE_LOG_HPP
