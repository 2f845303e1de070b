#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <string>
#include "BearingEngine.h"
#include "Geodesy.h"
#include "Logger.h"
#include "TraceReader.h"

// Default destination: the summit marker the app was first built for
static const GeoPoint DEFAULT_TARGET(69.705561, 18.832721, 488.8);

uint64_t g_current_time;
uint64_t getCurrentTimeUs()
{
    return g_current_time;
}

static bool parseCoordinate(const char *arg, double &out)
{
    char *end = nullptr;
    out = std::strtod(arg, &end);
    return end != arg && *end == '\0';
}

static void printTick(const BearingEngine &engine)
{
    Projection projection = engine.currentProjection();
    std::cout << std::setw(12) << g_current_time << "  ";
    if (!projection.available)
    {
        std::cout << "waiting (" << BearingEngine::statusName(engine.status()) << ")" << std::endl;
        return;
    }

    DisplayReadout readout = engine.readout();
    const BearingResult &bearing = projection.bearing;
    std::cout << std::fixed << std::setprecision(1)
              << "heading " << std::setw(5) << readout.heading_deg
              << "  rel " << std::setw(6) << bearing.relative_bearing_deg
              << "  elev " << std::setw(5) << geodesy::toDegrees(bearing.elevation_rad)
              << "  marker (" << projection.direction.x() << ", " << projection.direction.y() << ", "
              << projection.direction.z() << ")"
              << "  " << readout.rounded_distance_m << "m away" << std::endl;
    std::cout.unsetf(std::ios::floatfield);
}

int main(int argc, char *argv[])
{
    std::string input_trace;
    if (argc > 1)
    {
        input_trace = argv[1];
    }
    else
    {
        std::cout << "No file specified." << std::endl;
        std::cout << "Usage: " << argv[0] << " <trace.csv> [target_lat target_lon target_alt]" << std::endl;
        return -1;
    }

    GeoPoint target = DEFAULT_TARGET;
    if (argc > 2)
    {
        if (argc < 4 || !parseCoordinate(argv[2], target.latitude) || !parseCoordinate(argv[3], target.longitude) ||
            (argc > 4 && !parseCoordinate(argv[4], target.altitude)))
        {
            std::cerr << "Target must be given as <lat> <lon> [alt]" << std::endl;
            return -1;
        }
        if (argc == 4)
            target.altitude = 0.0;
    }

    std::ifstream trace_file(input_trace);
    if (!trace_file.is_open())
    {
        std::cerr << "Failed to open file: " << input_trace << std::endl;
        return -1;
    }

    // Setup order: logging, engine with its destination, then the sensor stream
    Logger logger;
    BearingEngine engine(EngineConfig(), &logger);
    if (!engine.setTarget(target))
    {
        std::cerr << "Invalid target " << target.latitude << ", " << target.longitude << std::endl;
        return -1;
    }
    engine.setTimeSource(getCurrentTimeUs);

    TraceReader reader(trace_file);
    TraceEvent event;
    int records_processed = 0;
    int records_rejected = 0;
    std::cout << "Starting Replay..." << std::endl;
    while (reader.next(event))
    {
        g_current_time = event.timestamp;
        records_processed++;

        switch (event.type)
        {
        case TraceEvent::Type::FIX:
            if (!engine.onPositionFix(event.fix, event.timestamp))
                records_rejected++;
            break;
        case TraceEvent::Type::ORIENTATION:
            if (!engine.onOrientationSample(event.sample))
                records_rejected++;
            break;
        case TraceEvent::Type::TICK:
            printTick(engine);
            break;
        }
    }
    logger.flush();

    std::cout << "Replay finished: " << records_processed << " records, "
              << records_rejected << " rejected by engine, "
              << reader.getMalformedCount() << " malformed lines." << std::endl;
    std::cout << "Traces written to " << logger.getSessionDir() << std::endl;
    return 0;
}
