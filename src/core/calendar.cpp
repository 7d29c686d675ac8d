#include "atsa/core/calendar.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>

namespace atsa::core::calendar {

namespace {

constexpr std::int64_t kSecondsPerDay = 86400;

std::int64_t toSeconds(TimePoint tp) {
	return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

TimePoint fromSeconds(std::int64_t seconds) {
	return TimePoint {std::chrono::seconds {seconds}};
}

std::int64_t floorDiv(std::int64_t a, std::int64_t b) {
	std::int64_t q = a / b;
	if ((a % b != 0) && ((a < 0) != (b < 0))) {
		--q;
	}
	return q;
}

bool readNumber(const std::string &text, std::size_t &pos, std::size_t digits, int &out) {
	if (pos + digits > text.size()) {
		return false;
	}
	int value = 0;
	for (std::size_t i = 0; i < digits; ++i) {
		const char c = text[pos + i];
		if (!std::isdigit(static_cast<unsigned char>(c))) {
			return false;
		}
		value = value * 10 + (c - '0');
	}
	pos += digits;
	out = value;
	return true;
}

bool expect(const std::string &text, std::size_t &pos, char c) {
	if (pos < text.size() && text[pos] == c) {
		++pos;
		return true;
	}
	return false;
}

struct Decomposed {
	CivilDate date;
	std::int64_t seconds_of_day = 0;
};

Decomposed decompose(TimePoint tp) {
	const auto total = toSeconds(tp);
	const auto days = floorDiv(total, kSecondsPerDay);
	return {civilFromDays(days), total - days * kSecondsPerDay};
}

int monthIndex(const CivilDate &date) {
	return date.year * 12 + static_cast<int>(date.month) - 1;
}

} // namespace

std::int64_t daysFromCivil(int year, unsigned month, unsigned day) {
	// Howard Hinnant's days_from_civil.
	year -= month <= 2 ? 1 : 0;
	const std::int64_t era = (year >= 0 ? year : year - 399) / 400;
	const unsigned yoe = static_cast<unsigned>(year - era * 400);
	const unsigned doy = (153 * (month > 2 ? month - 3 : month + 9) + 2) / 5 + day - 1;
	const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
	return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

CivilDate civilFromDays(std::int64_t days) {
	days += 719468;
	const std::int64_t era = (days >= 0 ? days : days - 146096) / 146097;
	const unsigned doe = static_cast<unsigned>(days - era * 146097);
	const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
	const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
	const unsigned mp = (5 * doy + 2) / 153;
	const unsigned day = doy - (153 * mp + 2) / 5 + 1;
	const unsigned month = mp < 10 ? mp + 3 : mp - 9;
	const int year = static_cast<int>(yoe) + static_cast<int>(era) * 400 + (month <= 2 ? 1 : 0);
	return {year, month, day};
}

unsigned daysInMonth(int year, unsigned month) {
	static const unsigned table[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
	if (month == 2) {
		const bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
		return leap ? 29 : 28;
	}
	return table[month - 1];
}

std::optional<TimePoint> parseTimestamp(const std::string &raw) {
	std::size_t begin = 0;
	std::size_t end = raw.size();
	while (begin < end && std::isspace(static_cast<unsigned char>(raw[begin]))) {
		++begin;
	}
	while (end > begin && std::isspace(static_cast<unsigned char>(raw[end - 1]))) {
		--end;
	}
	const std::string text = raw.substr(begin, end - begin);

	std::size_t pos = 0;
	int year = 0;
	int month = 0;
	int day = 1;
	if (!readNumber(text, pos, 4, year)) {
		return std::nullopt;
	}
	if (pos >= text.size() || (text[pos] != '-' && text[pos] != '/')) {
		return std::nullopt;
	}
	const char separator = text[pos++];
	if (!readNumber(text, pos, 2, month)) {
		return std::nullopt;
	}
	if (pos < text.size()) {
		if (!expect(text, pos, separator) || !readNumber(text, pos, 2, day)) {
			return std::nullopt;
		}
	} else if (separator != '-') {
		return std::nullopt;
	}
	if (month < 1 || month > 12 || day < 1 ||
	    static_cast<unsigned>(day) > daysInMonth(year, static_cast<unsigned>(month))) {
		return std::nullopt;
	}

	int hour = 0;
	int minute = 0;
	int second = 0;
	if (pos < text.size()) {
		if (text[pos] != 'T' && text[pos] != ' ') {
			return std::nullopt;
		}
		++pos;
		if (!readNumber(text, pos, 2, hour) || !expect(text, pos, ':') || !readNumber(text, pos, 2, minute)) {
			return std::nullopt;
		}
		if (expect(text, pos, ':') && !readNumber(text, pos, 2, second)) {
			return std::nullopt;
		}
		// Fractional seconds are truncated.
		if (expect(text, pos, '.')) {
			while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
				++pos;
			}
		}
		expect(text, pos, 'Z');
		if (pos != text.size() || hour > 23 || minute > 59 || second > 60) {
			return std::nullopt;
		}
	}

	const auto days = daysFromCivil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
	return fromSeconds(days * kSecondsPerDay + hour * 3600 + minute * 60 + second);
}

TimePoint fromEpochSeconds(double seconds) {
	return fromSeconds(static_cast<std::int64_t>(std::llround(seconds)));
}

std::string formatDate(TimePoint tp) {
	const auto parts = decompose(tp);
	char buffer[16];
	std::snprintf(buffer, sizeof(buffer), "%04d-%02u-%02u", parts.date.year, parts.date.month, parts.date.day);
	return buffer;
}

TimePoint TimeStep::advance(TimePoint from, int steps) const {
	if (kind == Kind::Fixed) {
		return from + fixed * steps;
	}
	const auto parts = decompose(from);
	const int target = monthIndex(parts.date) + months * steps;
	const int year = static_cast<int>(floorDiv(target, 12));
	const unsigned month = static_cast<unsigned>(target - year * 12 + 1);
	const unsigned last = daysInMonth(year, month);
	const unsigned day = month_end ? last : std::min(parts.date.day, last);
	return fromSeconds(daysFromCivil(year, month, day) * kSecondsPerDay + parts.seconds_of_day);
}

std::optional<TimeStep> inferStep(const std::vector<TimePoint> &timestamps) {
	if (timestamps.size() < 2) {
		return std::nullopt;
	}

	const auto first = timestamps[1] - timestamps[0];
	bool fixed = first > TimePoint::duration::zero();
	for (std::size_t i = 1; fixed && i + 1 < timestamps.size(); ++i) {
		fixed = (timestamps[i + 1] - timestamps[i]) == first;
	}
	if (fixed) {
		TimeStep step;
		step.kind = TimeStep::Kind::Fixed;
		step.fixed = std::chrono::duration_cast<std::chrono::seconds>(first);
		if (step.fixed.count() > 0) {
			return step;
		}
		return std::nullopt;
	}

	// Calendar-month spacing: same time of day, same day of month (or always
	// the last day of the month) and a constant month delta.
	std::vector<Decomposed> parts;
	parts.reserve(timestamps.size());
	for (const auto &tp : timestamps) {
		parts.push_back(decompose(tp));
	}
	const int delta = monthIndex(parts[1].date) - monthIndex(parts[0].date);
	if (delta <= 0) {
		return std::nullopt;
	}
	bool same_day = true;
	bool month_end = true;
	for (std::size_t i = 0; i < parts.size(); ++i) {
		const auto &p = parts[i];
		if (p.seconds_of_day != parts[0].seconds_of_day) {
			return std::nullopt;
		}
		if (i > 0 && monthIndex(p.date) - monthIndex(parts[i - 1].date) != delta) {
			return std::nullopt;
		}
		same_day = same_day && p.date.day == parts[0].date.day;
		month_end = month_end && p.date.day == daysInMonth(p.date.year, p.date.month);
	}
	if (!same_day && !month_end) {
		return std::nullopt;
	}
	TimeStep step;
	step.kind = TimeStep::Kind::Months;
	step.months = delta;
	step.month_end = !same_day || (month_end && parts[0].date.day >= 28);
	return step;
}

} // namespace atsa::core::calendar
