#include "TraceReader.h"

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <iostream>
#include <vector>

static std::string trim(const std::string &s)
{
    const char *ws = " \t\r\n";
    size_t begin = s.find_first_not_of(ws);
    if (begin == std::string::npos)
        return "";
    size_t end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}

static std::vector<std::string> split(const std::string &line)
{
    std::vector<std::string> fields;
    size_t start = 0;
    while (true)
    {
        size_t comma = line.find(',', start);
        fields.push_back(trim(line.substr(start, comma - start)));
        if (comma == std::string::npos)
            break;
        start = comma + 1;
    }
    return fields;
}

// Empty field -> present but missing; garbage -> parse failure
static bool parseNumber(const std::string &field, std::optional<double> &out)
{
    out.reset();
    if (field.empty())
        return true;

    errno = 0;
    char *end = nullptr;
    double value = std::strtod(field.c_str(), &end);
    if (end != field.c_str() + field.size() || errno == ERANGE)
        return false;
    out = value;
    return true;
}

static bool parseTimestamp(const std::string &field, uint64_t &out)
{
    if (field.empty() || field[0] == '-')
        return false;
    errno = 0;
    char *end = nullptr;
    unsigned long long value = std::strtoull(field.c_str(), &end, 10);
    if (end != field.c_str() + field.size() || errno == ERANGE)
        return false;
    out = value;
    return true;
}

static std::optional<float> toFloat(const std::optional<double> &value)
{
    if (!value)
        return std::nullopt;
    return static_cast<float>(*value);
}

std::optional<TraceEvent> TraceReader::parseLine(const std::string &line)
{
    std::vector<std::string> fields = split(line);
    if (fields.size() < 2)
        return std::nullopt;

    TraceEvent event;
    if (!parseTimestamp(fields[0], event.timestamp))
        return std::nullopt;

    const std::string &kind = fields[1];
    if (kind == "tick")
    {
        if (fields.size() != 2)
            return std::nullopt;
        event.type = TraceEvent::Type::TICK;
        return event;
    }

    if (kind == "fix")
    {
        if (fields.size() < 4 || fields.size() > 5)
            return std::nullopt;
        std::optional<double> lat, lon, alt;
        if (!parseNumber(fields[2], lat) || !parseNumber(fields[3], lon))
            return std::nullopt;
        if (fields.size() == 5 && !parseNumber(fields[4], alt))
            return std::nullopt;

        event.type = TraceEvent::Type::FIX;
        event.fix = GeoPoint(lat.value_or(NAN), lon.value_or(NAN), alt.value_or(NAN));
        return event;
    }

    if (kind == "orient")
    {
        if (fields.size() < 5 || fields.size() > 6)
            return std::nullopt;
        std::optional<double> alpha, beta, gamma, compass;
        if (!parseNumber(fields[2], alpha) || !parseNumber(fields[3], beta) || !parseNumber(fields[4], gamma))
            return std::nullopt;
        if (fields.size() == 6 && !parseNumber(fields[5], compass))
            return std::nullopt;

        event.type = TraceEvent::Type::ORIENTATION;
        event.sample.timestamp = event.timestamp;
        event.sample.alpha = toFloat(alpha);
        event.sample.beta = toFloat(beta);
        event.sample.gamma = toFloat(gamma);
        event.sample.compass_heading = toFloat(compass);
        return event;
    }

    return std::nullopt;
}

bool TraceReader::next(TraceEvent &event)
{
    std::string line;
    while (std::getline(m_in, line))
    {
        m_line_number++;
        std::string content = trim(line);
        if (content.empty() || content[0] == '#')
            continue;

        std::optional<TraceEvent> parsed = parseLine(content);
        if (!parsed)
        {
            std::cerr << "[TraceReader] Skipping malformed line " << m_line_number << ": " << content << std::endl;
            m_malformed++;
            continue;
        }
        event = *parsed;
        return true;
    }
    return false;
}
