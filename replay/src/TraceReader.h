#pragma once
#include "GeoTypes.h"

#include <cstddef>
#include <cstdint>
#include <istream>
#include <optional>
#include <string>

/// <summary>
/// One line of a recorded sensor trace.
///   timestamp_us,fix,lat,lon[,alt]
///   timestamp_us,orient,alpha,beta,gamma[,compass]
///   timestamp_us,tick
/// Empty fields are missing readings. A fix with a missing latitude or
/// longitude is kept (as NaN) so the engine sees the bad fix.
/// </summary>
struct TraceEvent
{
    enum class Type : uint8_t
    {
        FIX,
        ORIENTATION,
        TICK
    } type = Type::TICK;

    uint64_t timestamp = 0;
    GeoPoint fix;
    HeadingSample sample;
};

class TraceReader
{
public:
    explicit TraceReader(std::istream &in) : m_in(in), m_line_number(0), m_malformed(0) {}

    // False at end of input. Blank lines and '#' comments are skipped,
    // malformed lines are skipped and counted.
    bool next(TraceEvent &event);

    size_t getLineNumber() const { return m_line_number; }
    size_t getMalformedCount() const { return m_malformed; }

    static std::optional<TraceEvent> parseLine(const std::string &line);

private:
    std::istream &m_in;
    size_t m_line_number;
    size_t m_malformed;
};
