#include "quant-forecast/utils/dates.hpp"

#include <array>
#include <ctime>
#include <iomanip>
#include <locale>
#include <sstream>
#include <stdexcept>

namespace quantforecast::utils {

namespace {

using Days = std::chrono::duration<long long, std::ratio<86400>>;

// Days since 1970-01-01 in the proleptic Gregorian calendar.
long long daysFromCivil(long long y, unsigned m, unsigned d) {
	y -= m <= 2 ? 1 : 0;
	const long long era = (y >= 0 ? y : y - 399) / 400;
	const auto yoe = static_cast<unsigned>(y - era * 400);
	const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
	const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
	return era * 146097 + static_cast<long long>(doe) - 719468;
}

struct CivilDate {
	long long year;
	unsigned month;
	unsigned day;
};

CivilDate civilFromDays(long long z) {
	z += 719468;
	const long long era = (z >= 0 ? z : z - 146096) / 146097;
	const auto doe = static_cast<unsigned>(z - era * 146097);
	const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
	const long long y = static_cast<long long>(yoe) + era * 400;
	const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
	const unsigned mp = (5 * doy + 2) / 153;
	const unsigned d = doy - (153 * mp + 2) / 5 + 1;
	const unsigned m = mp < 10 ? mp + 3 : mp - 9;
	return CivilDate{y + (m <= 2 ? 1 : 0), m, d};
}

constexpr std::array<const char *, 5> kLayouts{"%Y-%m-%d %H:%M:%S", "%Y-%m-%dT%H:%M:%S", "%Y-%m-%d", "%Y/%m/%d",
                                                "%m/%d/%Y"};

std::optional<std::tm> parseWithLayout(const std::string &text, const char *layout) {
	std::tm tm{};
	std::istringstream stream(text);
	stream.imbue(std::locale::classic());
	stream >> std::ws >> std::get_time(&tm, layout);
	if (stream.fail()) {
		return std::nullopt;
	}
	stream >> std::ws;
	if (!stream.eof()) {
		return std::nullopt;
	}
	return tm;
}

// Whole days on either side of the epoch that a TimePoint can hold.
long long dayLimit() {
	return std::chrono::duration_cast<Days>(TimePoint::duration::max()).count();
}

bool representable(long long days) {
	const long long limit = dayLimit();
	return days > -limit && days < limit;
}

} // namespace

TimePoint makeTimePoint(int year, unsigned month, unsigned day, int hour, int minute, int second) {
	const long long days = daysFromCivil(year, month, day);
	if (!representable(days)) {
		throw std::out_of_range("Date is outside the representable time range.");
	}
	return TimePoint{} + std::chrono::duration_cast<TimePoint::duration>(Days{days} + std::chrono::hours{hour} +
	                                                                      std::chrono::minutes{minute} +
	                                                                      std::chrono::seconds{second});
}

std::optional<TimePoint> parseTimestamp(const std::string &text) {
	for (const char *layout : kLayouts) {
		auto tm = parseWithLayout(text, layout);
		if (!tm) {
			continue;
		}
		const int year = tm->tm_year + 1900;
		const auto month = static_cast<unsigned>(tm->tm_mon + 1);
		const auto day = static_cast<unsigned>(tm->tm_mday);
		if (month < 1 || month > 12 || day < 1 || day > 31) {
			return std::nullopt;
		}
		// Reject dates such as 2023-02-30 that do not survive a round trip.
		const long long days = daysFromCivil(year, month, day);
		const auto civil = civilFromDays(days);
		if (civil.year != year || civil.month != month || civil.day != day) {
			return std::nullopt;
		}
		if (!representable(days)) {
			return std::nullopt;
		}
		return makeTimePoint(year, month, day, tm->tm_hour, tm->tm_min, tm->tm_sec);
	}
	return std::nullopt;
}

std::string formatDate(const TimePoint &tp) {
	const auto days = std::chrono::floor<Days>(tp.time_since_epoch()).count();
	const auto civil = civilFromDays(days);

	std::ostringstream out;
	out << std::setfill('0') << std::setw(4) << civil.year << '-' << std::setw(2) << civil.month << '-'
	    << std::setw(2) << civil.day;
	return out.str();
}

TimePoint addDays(const TimePoint &tp, long long days) {
	const long long limit = dayLimit();
	const long long current = std::chrono::floor<Days>(tp.time_since_epoch()).count();
	if (days >= 2 * limit || days <= -2 * limit || !representable(current + days)) {
		throw std::out_of_range("Shifted date is outside the representable time range.");
	}
	return tp + std::chrono::duration_cast<TimePoint::duration>(Days{days});
}

} // namespace quantforecast::utils
