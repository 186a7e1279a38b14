// ==============================================================================
// datetime.cpp - Разбор дат EVE API
// ==============================================================================

#include <eveapi/datetime.hpp>

#include <cstdio>

namespace eveapi {

namespace {

/// Длина "YYYY-MM-DD HH:MM:SS"
constexpr std::size_t EVE_DATE_LENGTH = 19;

bool parse_int(std::string_view s, int& out) {
    if (s.empty())
        return false;
    out = 0;
    for (char c : s) {
        if (c < '0' || c > '9')
            return false;
        out = out * 10 + (c - '0');
    }
    return true;
}

bool is_leap_year(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int days_in_month(int year, int month) {
    static constexpr int DAYS[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && is_leap_year(year)) {
        return 29;
    }
    return DAYS[month - 1];
}

/// Число дней от 1970-01-01 (алгоритм days_from_civil, H. Hinnant)
std::int64_t days_from_civil(int y, int m, int d) {
    y -= m <= 2 ? 1 : 0;
    const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * static_cast<unsigned>(m + (m > 2 ? -3 : 9)) + 2) / 5 +
                         static_cast<unsigned>(d) - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

}  // namespace

std::optional<DateTime> parse_eve_datetime(std::string_view text) {
    if (text.size() < EVE_DATE_LENGTH) {
        return std::nullopt;
    }
    std::string_view str = text.substr(0, EVE_DATE_LENGTH);

    if (str[4] != '-' || str[7] != '-' || str[10] != ' ' || str[13] != ':' || str[16] != ':') {
        return std::nullopt;
    }

    DateTime dt;
    if (!parse_int(str.substr(0, 4), dt.year) || !parse_int(str.substr(5, 2), dt.month) ||
        !parse_int(str.substr(8, 2), dt.day) || !parse_int(str.substr(11, 2), dt.hour) ||
        !parse_int(str.substr(14, 2), dt.minute) || !parse_int(str.substr(17, 2), dt.second)) {
        return std::nullopt;
    }

    if (dt.month < 1 || dt.month > 12)
        return std::nullopt;
    if (dt.day < 1 || dt.day > days_in_month(dt.year, dt.month))
        return std::nullopt;
    if (dt.hour > 23 || dt.minute > 59 || dt.second > 59)
        return std::nullopt;

    return dt;
}

std::optional<DateTime> parse_eve_datetime(const std::string* text) {
    if (text == nullptr) {
        return std::nullopt;
    }
    return parse_eve_datetime(std::string_view(*text));
}

bool DateTime::operator<(const DateTime& other) const {
    return to_epoch_seconds() < other.to_epoch_seconds();
}

bool DateTime::operator<=(const DateTime& other) const {
    return !(other < *this);
}

bool DateTime::operator>(const DateTime& other) const {
    return other < *this;
}

bool DateTime::operator>=(const DateTime& other) const {
    return !(*this < other);
}

bool DateTime::operator==(const DateTime& other) const {
    return year == other.year && month == other.month && day == other.day && hour == other.hour &&
           minute == other.minute && second == other.second;
}

std::int64_t DateTime::to_epoch_seconds() const {
    return days_from_civil(year, month, day) * 86400 + hour * 3600 + minute * 60 + second;
}

std::string DateTime::to_string() const {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d %02d:%02d:%02d", year, month, day, hour,
                  minute, second);
    return buf;
}

std::int64_t seconds_between(const DateTime& a, const DateTime& b) {
    return b.to_epoch_seconds() - a.to_epoch_seconds();
}

}  // namespace eveapi
