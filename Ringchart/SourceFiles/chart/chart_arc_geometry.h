/*
This file is part of Telegram Desktop,
the official desktop application for the Telegram messaging service.

For license and copyright information please follow this link:
https://github.com/telegramdesktop/tdesktop/blob/master/LEGAL
*/
#pragma once

#include "base/basic_types.h"
#include "chart/chart_style.h"

#include <QtCore/QPointF>
#include <QtCore/QRectF>
#include <QtGui/QPainterPath>
#include <QtGui/QPen>

#include <optional>

namespace Chart {

// All angles are radians, clockwise on screen from the positive x axis.
struct ArcSpec {
	QPointF center;
	float64 outerRadius = 0.;
	float64 insetAmount = 0.;
	float64 startAngle = 0.;
	float64 angularShare = 0.;
	float64 gap = 0.;

	[[nodiscard]] float64 radius() const {
		return outerRadius - insetAmount;
	}
};

struct TrimmedArc {
	float64 start = 0.;
	float64 span = 0.;
};

// Removes gap / 2 from both ends, nullopt if nothing is left.
[[nodiscard]] std::optional<TrimmedArc> TrimArc(
	float64 startAngle,
	float64 angularShare,
	float64 gap);

[[nodiscard]] QPainterPath ArcPath(const ArcSpec &spec);
[[nodiscard]] QPainterPath ArcPath(
	QPointF center,
	float64 outerRadius,
	float64 insetAmount,
	float64 startAngle,
	float64 angularShare,
	float64 gap);

// Angle that makes a strokeWidth-long gap on a circle of the given radius,
// scaled by factor. Zero when the radius is collapsed.
[[nodiscard]] float64 AngularGap(
	float64 strokeWidth,
	float64 radius,
	float64 factor = kDefaultGapFactor);

[[nodiscard]] QPen StrokePen(const QColor &colour, float64 strokeWidth);

// Maps any angle to [0, 2 * pi).
[[nodiscard]] float64 NormalizeAngle(float64 angle);
[[nodiscard]] bool AngleInside(
	float64 angle,
	float64 startAngle,
	float64 angularShare);

class SegmentShape final {
public:
	SegmentShape(float64 startAngle, float64 amount, float64 angularGap);

	[[nodiscard]] SegmentShape inset(float64 amount) const;

	[[nodiscard]] float64 insetAmount() const {
		return _insetAmount;
	}
	[[nodiscard]] float64 effectiveRadius(const QRectF &rect) const;
	[[nodiscard]] ArcSpec spec(const QRectF &rect) const;
	[[nodiscard]] QPainterPath path(const QRectF &rect) const;

private:
	float64 _startAngle = 0.;
	float64 _amount = 0.;
	float64 _angularGap = 0.;
	float64 _insetAmount = 0.;

};

} // namespace Chart
