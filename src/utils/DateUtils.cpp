#include "utils/DateUtils.hpp"
#include "exceptions/Exceptions.hpp"
#include <exception>

namespace episim {
namespace DateUtils {

namespace greg = boost::gregorian;

greg::date parseDate(const std::string& text) {
    if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
        THROW_INVALID_PARAM("DateUtils::parseDate", "Expected a date formatted as YYYY-MM-DD, got '" + text + "'");
    }
    try {
        return greg::from_simple_string(text);
    } catch (const std::exception& e) {
        THROW_INVALID_PARAM("DateUtils::parseDate", "Invalid calendar date '" + text + "': " + e.what());
    }
}

std::string formatDate(const greg::date& date) {
    return greg::to_iso_extended_string(date);
}

int daysBetween(const greg::date& from, const greg::date& to) {
    return static_cast<int>((to - from).days());
}

int horizonLength(const greg::date& start, const greg::date& end) {
    int days = daysBetween(start, end);
    if (days < 0) {
        THROW_INVALID_PARAM("DateUtils::horizonLength",
            "end_date " + formatDate(end) + " precedes start_date " + formatDate(start));
    }
    return days + 1;
}

greg::date dateOfStep(const greg::date& start, int step) {
    return start + greg::days(step - 1);
}

std::vector<std::string> dateCoordinates(const greg::date& start, int T) {
    std::vector<std::string> dates;
    dates.reserve(T > 0 ? static_cast<size_t>(T) : 0);
    greg::day_iterator it(start);
    for (int t = 0; t < T; ++t, ++it) {
        dates.push_back(formatDate(*it));
    }
    return dates;
}

} // namespace DateUtils
} // namespace episim
