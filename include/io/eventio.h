#ifndef PPAGG_EVENTIO_H
#define PPAGG_EVENTIO_H

#include "common.h"
#include "analytics/population.h"
#include "protocol/sampling.h"
#include <string>
#include <fstream>
#include <stdexcept>

namespace ppagg {

/**
 * File I/O for populations, category markers and reports (text only).
 *
 * Population format:
 *   # Population: <num_users> users, <num_events> events
 *   @user <user_id>
 *   <timestamp> <site>
 *   <timestamp> <site>
 *   @user <user_id>
 *   ...
 *
 * Category format (one marker per line, '#' starts a comment):
 *   a youtube.com/shorts
 *   b amazon.com
 *
 * Report format: "key: value" lines.
 */
class EventLogIO {
public:
    /**
     * Write a population to file.
     * @throws std::runtime_error if the file cannot be opened
     */
    static void WritePopulation(const std::string& filename,
                                const InMemoryPopulation& population);

    /**
     * Read a population. Each user's events are stably sorted by timestamp.
     * @throws std::runtime_error on open failure or a malformed line
     */
    static InMemoryPopulation ReadPopulation(const std::string& filename);

    /**
     * Read category markers.
     * @throws std::runtime_error on open failure or a malformed line
     */
    static CategoryConfig ReadCategories(const std::string& filename);

    static void WriteCategories(const std::string& filename, const CategoryConfig& config);

    /**
     * Write an analysis report.
     */
    static void WriteReport(const std::string& filename, const AnalysisReport& report);

private:
    static std::string Trim(const std::string& s);
    static std::runtime_error ParseError(const std::string& filename, size_t line_no,
                                         const std::string& what);
};

} // namespace ppagg

#endif // PPAGG_EVENTIO_H
