/*
This file is part of Telegram Desktop,
the official desktop application for the Telegram messaging service.

For license and copyright information please follow this link:
https://github.com/telegramdesktop/tdesktop/blob/master/LEGAL
*/
#pragma once

#include "base/basic_types.h"

#include <QtCore/QString>
#include <QtGui/QColor>

#include <vector>

namespace Chart {

using PointId = uint64;

struct DataPoint {
	PointId id = 0;
	float64 value = 0.;
	QString description;
	QColor colour;

	// Radians, clockwise on screen from the positive x axis.
	float64 startAngle = 0.;
	float64 amount = 0.;
};

// Points are the same segment when their ids match.
inline bool operator==(const DataPoint &a, const DataPoint &b) {
	return (a.id == b.id);
}
inline bool operator!=(const DataPoint &a, const DataPoint &b) {
	return !(a == b);
}

struct Metadata {
	QString title;
	QString subtitle;
};

struct ValueFormat {
	QString specifier = QString("%.0f");
	Fn<QString(float64 value, const QString &specifier)> formatter;
};

inline constexpr auto kTopAngle = -1.5707963267948966;
inline constexpr auto kFullTurn = 6.283185307179586;

// Fills startAngle / amount proportionally to the values, going clockwise
// from origin. Negative values count as zero.
[[nodiscard]] std::vector<DataPoint> DistributeAngles(
	std::vector<DataPoint> points,
	float64 origin = kTopAngle);

[[nodiscard]] QString FormatValue(float64 value, const ValueFormat &format);
[[nodiscard]] QString AccessibilityValue(
	const DataPoint &point,
	const ValueFormat &format);

} // namespace Chart
