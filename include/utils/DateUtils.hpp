#ifndef DATE_UTILS_HPP
#define DATE_UTILS_HPP

#include <string>
#include <vector>
#include <boost/date_time/gregorian/gregorian.hpp>

namespace episim {
namespace DateUtils {

    /**
     * @brief Parses an ISO date ("YYYY-MM-DD").
     * @throws InvalidParameterException If the string is not a valid calendar date.
     */
    boost::gregorian::date parseDate(const std::string& text);

    /// @brief Formats a date as "YYYY-MM-DD".
    std::string formatDate(const boost::gregorian::date& date);

    /**
     * @brief Number of simulated days between two dates, both included.
     * @throws InvalidParameterException If end precedes start.
     */
    int horizonLength(const boost::gregorian::date& start, const boost::gregorian::date& end);

    /// @brief Signed number of days from @p from to @p to.
    int daysBetween(const boost::gregorian::date& from, const boost::gregorian::date& to);

    /**
     * @brief Date of a 1-based simulation step.
     */
    boost::gregorian::date dateOfStep(const boost::gregorian::date& start, int step);

    /**
     * @brief ISO strings for the T consecutive days starting at @p start.
     */
    std::vector<std::string> dateCoordinates(const boost::gregorian::date& start, int T);

} // namespace DateUtils
} // namespace episim

#endif // DATE_UTILS_HPP
