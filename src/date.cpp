#include <reconcile/date.hpp>
#include <reconcile/errors.hpp>

#include <ctime>
#include <iomanip>
#include <sstream>

namespace reconcile {

namespace {

std::tm to_local_tm(Date date) {
    const std::time_t t = std::chrono::system_clock::to_time_t(date);
    std::tm tm_buf{};
#if defined(_MSC_VER)
    localtime_s(&tm_buf, &t);
#else
    localtime_r(&t, &tm_buf);
#endif
    return tm_buf;
}

}  // namespace

Date make_date(int year, unsigned month, unsigned day) {
    std::tm tm_buf{};
    tm_buf.tm_year = year - 1900;
    tm_buf.tm_mon = static_cast<int>(month) - 1;
    tm_buf.tm_mday = static_cast<int>(day);
    tm_buf.tm_isdst = -1;
    return std::chrono::system_clock::from_time_t(std::mktime(&tm_buf));
}

std::chrono::sys_days local_day(Date date) {
    const std::tm tm_buf = to_local_tm(date);
    return std::chrono::sys_days{std::chrono::year_month_day{
        std::chrono::year{tm_buf.tm_year + 1900},
        std::chrono::month{static_cast<unsigned>(tm_buf.tm_mon + 1)},
        std::chrono::day{static_cast<unsigned>(tm_buf.tm_mday)}}};
}

// Counts calendar days rather than elapsed 24h periods, so a DST transition
// between the dates does not lose a day
int day_difference(Date a, Date b) {
    const auto diff = (local_day(a) - local_day(b)).count();
    return static_cast<int>(diff < 0 ? -diff : diff);
}

Date parse_date(std::string_view text) {
    const std::string input(text);
    if (input.size() < 10) {
        throw ParseError("date '" + input + "'", "expected YYYY-MM-DD");
    }
    if (input.size() > 10 && input[10] != 'T' && input[10] != ' ') {
        throw ParseError("date '" + input + "'", "unexpected text after the date");
    }

    for (std::size_t i = 0; i < 10; ++i) {
        const bool separator = i == 4 || i == 7;
        const char c = input[i];
        if (separator ? c != '-' : (c < '0' || c > '9')) {
            throw ParseError("date '" + input + "'", "expected YYYY-MM-DD");
        }
    }

    std::tm tm_buf{};
    std::istringstream stream(input.substr(0, 10));
    stream >> std::get_time(&tm_buf, "%Y-%m-%d");
    if (stream.fail()) {
        throw ParseError("date '" + input + "'", "expected YYYY-MM-DD");
    }

    const std::chrono::year_month_day ymd{
        std::chrono::year{tm_buf.tm_year + 1900},
        std::chrono::month{static_cast<unsigned>(tm_buf.tm_mon + 1)},
        std::chrono::day{static_cast<unsigned>(tm_buf.tm_mday)}};
    if (!ymd.ok()) {
        throw ParseError("date '" + input + "'", "no such calendar day");
    }

    return make_date(static_cast<int>(ymd.year()), static_cast<unsigned>(ymd.month()),
                     static_cast<unsigned>(ymd.day()));
}

std::string format_date(Date date) {
    const std::chrono::year_month_day ymd{local_day(date)};
    std::ostringstream out;
    out << std::setfill('0') << std::setw(4) << static_cast<int>(ymd.year()) << '-'
        << std::setw(2) << static_cast<unsigned>(ymd.month()) << '-' << std::setw(2)
        << static_cast<unsigned>(ymd.day());
    return out.str();
}

}  // namespace reconcile
