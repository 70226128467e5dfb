/*
This file is part of Telegram Desktop,
the official desktop application for the Telegram messaging service.

For license and copyright information please follow this link:
https://github.com/telegramdesktop/tdesktop/blob/master/LEGAL
*/
#include "chart/chart_data.h"

#include <cmath>

namespace Chart {
namespace {

// Accepts "<text>%[flags][width][.precision]<f|F|e|E|g|G><text>",
// where <text> may only contain escaped "%%".
[[nodiscard]] bool IsFloatSpecifier(const QByteArray &specifier) {
	auto conversions = 0;
	const auto end = specifier.constData() + specifier.size();
	for (auto from = specifier.constData(); from != end; ++from) {
		if (*from != '%') {
			continue;
		} else if (++from == end) {
			return false;
		} else if (*from == '%') {
			continue;
		}
		while (from != end
			&& (*from == '-'
				|| *from == '+'
				|| *from == ' '
				|| *from == '#'
				|| *from == '0')) {
			++from;
		}
		while (from != end && *from >= '0' && *from <= '9') {
			++from;
		}
		if (from != end && *from == '.') {
			++from;
			while (from != end && *from >= '0' && *from <= '9') {
				++from;
			}
		}
		if (from == end) {
			return false;
		}
		switch (*from) {
		case 'f': case 'F':
		case 'e': case 'E':
		case 'g': case 'G': ++conversions; break;
		default: return false;
		}
	}
	return (conversions == 1);
}

} // namespace

std::vector<DataPoint> DistributeAngles(
		std::vector<DataPoint> points,
		float64 origin) {
	auto total = 0.;
	for (const auto &point : points) {
		if (std::isfinite(point.value) && point.value > 0.) {
			total += point.value;
		}
	}
	auto angle = origin;
	for (auto &point : points) {
		const auto value = (std::isfinite(point.value) && point.value > 0.)
			? point.value
			: 0.;
		point.startAngle = angle;
		point.amount = (total > 0.) ? (value / total) * kFullTurn : 0.;
		angle += point.amount;
	}
	return points;
}

QString FormatValue(float64 value, const ValueFormat &format) {
	if (format.formatter) {
		return format.formatter(value, format.specifier);
	}
	const auto utf8 = format.specifier.toUtf8();
	if (IsFloatSpecifier(utf8)) {
		return QString::asprintf(utf8.constData(), value);
	}
	return QString::number(value);
}

QString AccessibilityValue(
		const DataPoint &point,
		const ValueFormat &format) {
	return (FormatValue(point.value, format)
		+ ' '
		+ point.description).trimmed();
}

} // namespace Chart
