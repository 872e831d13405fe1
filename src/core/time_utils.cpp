#include "core/time_utils.hpp"
#include "core/errors.hpp"
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace sem {

namespace {

// timegm is not part of the C++ standard; compute days from civil date directly
long long days_from_civil(int y, unsigned m, unsigned d) {
    y -= m <= 2 ? 1 : 0;
    const long long era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<long long>(doe) - 719468;
}

unsigned days_in_month(int y, unsigned m) {
    static const unsigned kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    bool leap = (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
    return m == 2 && leap ? 29 : kDays[m - 1];
}

// Fractional seconds, then "Z", "+00:00" or nothing
bool valid_suffix(const std::string& rest) {
    size_t pos = 0;
    if (pos < rest.size() && rest[pos] == '.') {
        ++pos;
        size_t digits = 0;
        while (pos < rest.size() && std::isdigit(static_cast<unsigned char>(rest[pos]))) {
            ++pos;
            ++digits;
        }
        if (digits == 0) return false;
    }
    std::string zone = rest.substr(pos);
    return zone.empty() || zone == "Z" || zone == "+00:00";
}

} // anonymous namespace

Timestamp parse_iso8601(const std::string& text) {
    std::tm tm{};
    std::istringstream ss(text);

    if (text.size() == 10) {
        ss >> std::get_time(&tm, "%Y-%m-%d");
    } else {
        ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    }

    if (ss.fail()) {
        throw ValidationError("Invalid ISO-8601 timestamp: '" + text + "'");
    }

    std::string rest;
    std::getline(ss, rest);
    if (!valid_suffix(rest)) {
        throw ValidationError("Invalid ISO-8601 timestamp: '" + text + "' (unexpected '" + rest + "')");
    }

    const int year = tm.tm_year + 1900;
    const unsigned month = static_cast<unsigned>(tm.tm_mon + 1);
    const unsigned day = static_cast<unsigned>(tm.tm_mday);
    if (day > days_in_month(year, month)) {
        throw ValidationError("Invalid ISO-8601 timestamp: '" + text + "' (no such day)");
    }

    long long days = days_from_civil(year, month, day);
    long long seconds = days * 86400LL + tm.tm_hour * 3600LL + tm.tm_min * 60LL + tm.tm_sec;

    return Timestamp(std::chrono::seconds(seconds));
}

std::string format_iso8601(Timestamp ts) {
    auto time = Clock::to_time_t(ts);
    std::stringstream ss;
    ss << std::put_time(std::gmtime(&time), "%Y-%m-%dT%H:%M:%SZ");
    return ss.str();
}

double to_epoch_seconds(Timestamp ts) {
    return std::chrono::duration<double>(ts.time_since_epoch()).count();
}

} // namespace sem
