// ==============================================================================
// eveapi/datetime.hpp - Даты EVE API ("YYYY-MM-DD HH:MM:SS")
// ==============================================================================
//
// Значения в результате конверсии остаются строками. Этот модуль разбирает
// их по запросу: например, чтобы посчитать cachedUntil - currentTime.
//
// ==============================================================================

#ifndef EVEAPI_DATETIME_HPP
#define EVEAPI_DATETIME_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace eveapi {

/// Дата и время без timezone (сервер EVE отдаёт UTC)
struct DateTime {
    int year = 0;
    int month = 1;   // 1-12
    int day = 1;     // 1-31
    int hour = 0;    // 0-23
    int minute = 0;  // 0-59
    int second = 0;  // 0-59

    bool operator<(const DateTime& other) const;
    bool operator<=(const DateTime& other) const;
    bool operator>(const DateTime& other) const;
    bool operator>=(const DateTime& other) const;
    bool operator==(const DateTime& other) const;
    bool operator!=(const DateTime& other) const { return !(*this == other); }

    /// Секунды от 1970-01-01 00:00:00 (UTC)
    std::int64_t to_epoch_seconds() const;

    /// "YYYY-MM-DD HH:MM:SS"
    std::string to_string() const;
};

/// Разобрать дату EVE API.
///
/// Берутся первые 19 символов, дробная часть секунд отбрасывается:
/// "2011-08-30 22:34:41.123456" -> 2011-08-30 22:34:41.
///
/// @return std::nullopt для пустой строки или строки не в формате
std::optional<DateTime> parse_eve_datetime(std::string_view text);

/// Вариант для отсутствующего значения (например результат find_string)
std::optional<DateTime> parse_eve_datetime(const std::string* text);

/// Разница b - a в секундах
std::int64_t seconds_between(const DateTime& a, const DateTime& b);

}  // namespace eveapi

#endif  // EVEAPI_DATETIME_HPP
