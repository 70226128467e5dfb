/*
This file is part of Telegram Desktop,
the official desktop application for the Telegram messaging service.

For license and copyright information please follow this link:
https://github.com/telegramdesktop/tdesktop/blob/master/LEGAL
*/
#include "chart/chart_arc_geometry.h"

#include "chart/chart_data.h"

#include <algorithm>
#include <cmath>
#include <initializer_list>

namespace Chart {
namespace {

[[nodiscard]] float64 ToQtDegrees(float64 radians) {
	// Qt counts degrees counter-clockwise on screen.
	return -radians * 180. / M_PI;
}

[[nodiscard]] bool AllFinite(std::initializer_list<float64> values) {
	for (const auto value : values) {
		if (!std::isfinite(value)) {
			return false;
		}
	}
	return true;
}

} // namespace

std::optional<TrimmedArc> TrimArc(
		float64 startAngle,
		float64 angularShare,
		float64 gap) {
	if (!AllFinite({ startAngle, angularShare, gap })) {
		return std::nullopt;
	}
	const auto trimmed = TrimmedArc{
		startAngle + gap / 2.,
		angularShare - gap,
	};
	if (trimmed.span <= 0.) {
		return std::nullopt;
	}
	return trimmed;
}

QPainterPath ArcPath(const ArcSpec &spec) {
	auto result = QPainterPath();
	const auto radius = spec.radius();
	if (!AllFinite({ spec.center.x(), spec.center.y(), radius })
		|| radius <= 0.) {
		return result;
	}
	const auto trimmed = TrimArc(spec.startAngle, spec.angularShare, spec.gap);
	if (!trimmed) {
		return result;
	}
	const auto rect = QRectF(
		spec.center.x() - radius,
		spec.center.y() - radius,
		radius * 2.,
		radius * 2.);
	const auto from = ToQtDegrees(trimmed->start);
	result.arcMoveTo(rect, from);
	result.arcTo(rect, from, ToQtDegrees(trimmed->span));
	return result;
}

QPainterPath ArcPath(
		QPointF center,
		float64 outerRadius,
		float64 insetAmount,
		float64 startAngle,
		float64 angularShare,
		float64 gap) {
	return ArcPath(ArcSpec{
		center,
		outerRadius,
		insetAmount,
		startAngle,
		angularShare,
		gap,
	});
}

float64 AngularGap(float64 strokeWidth, float64 radius, float64 factor) {
	if (!AllFinite({ strokeWidth, radius, factor })
		|| radius <= 0.
		|| strokeWidth <= 0.
		|| factor <= 0.) {
		return 0.;
	}
	return (strokeWidth / radius) * factor;
}

QPen StrokePen(const QColor &colour, float64 strokeWidth) {
	auto pen = QPen(colour);
	pen.setWidthF(strokeWidth);
	pen.setCapStyle(Qt::RoundCap);
	pen.setJoinStyle(Qt::RoundJoin);
	return pen;
}

float64 NormalizeAngle(float64 angle) {
	if (!std::isfinite(angle)) {
		return 0.;
	}
	const auto result = std::fmod(angle, kFullTurn);
	return (result < 0.) ? (result + kFullTurn) : result;
}

bool AngleInside(float64 angle, float64 startAngle, float64 angularShare) {
	if (angularShare <= 0.) {
		return false;
	} else if (angularShare >= kFullTurn) {
		return true;
	}
	const auto offset = NormalizeAngle(angle - startAngle);
	return (offset < angularShare);
}

SegmentShape::SegmentShape(
	float64 startAngle,
	float64 amount,
	float64 angularGap)
: _startAngle(startAngle)
, _amount(amount)
, _angularGap(angularGap) {
}

SegmentShape SegmentShape::inset(float64 amount) const {
	auto result = *this;
	result._insetAmount += amount;
	return result;
}

float64 SegmentShape::effectiveRadius(const QRectF &rect) const {
	return std::min(rect.width(), rect.height()) / 2. - _insetAmount;
}

ArcSpec SegmentShape::spec(const QRectF &rect) const {
	return ArcSpec{
		rect.center(),
		std::min(rect.width(), rect.height()) / 2.,
		_insetAmount,
		_startAngle,
		_amount,
		_angularGap,
	};
}

QPainterPath SegmentShape::path(const QRectF &rect) const {
	return ArcPath(spec(rect));
}

} // namespace Chart
