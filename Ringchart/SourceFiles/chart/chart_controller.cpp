/*
This file is part of Telegram Desktop,
the official desktop application for the Telegram messaging service.

For license and copyright information please follow this link:
https://github.com/telegramdesktop/tdesktop/blob/master/LEGAL
*/
#include "chart/chart_controller.h"

#include "base/assertion.h"
#include "base/debug_log.h"

#include <rpl/map.h>

#include <QtGui/QPainter>

#include <algorithm>
#include <cmath>

namespace Chart {
namespace {

[[nodiscard]] QRectF CenterRect(QSizeF size, float64 strokeWidth) {
	const auto side = std::max(
		std::min(size.width(), size.height()) - strokeWidth * 2.,
		0.);
	return QRectF(
		(size.width() - side) / 2.,
		(size.height() - side) / 2.,
		side,
		side);
}

} // namespace

Controller::Controller(not_null<DataSource*> source, CenterRenderer center)
: _source(source)
, _center(std::move(center))
, _reveal(source->style())
, _selection(source->style()) {
	_source->dataChanges(
	) | rpl::start_with_next([=] {
		dataChanged();
	}, _lifetime);

	_source->styleChanges(
	) | rpl::start_with_next([=] {
		styleChanged();
	}, _lifetime);
}

const std::vector<DataPoint> &Controller::points() const {
	return _source->points();
}

const Style &Controller::style() const {
	return _source->style();
}

void Controller::resize(QSizeF size) {
	if (_size == size) {
		return;
	}
	_size = size;
	requestRepaint();
}

float64 Controller::radius() const {
	return std::max(std::min(_size.width(), _size.height()) / 2., 0.);
}

float64 Controller::angularGap() const {
	const auto &st = style();
	return AngularGap(st.strokeWidth, radius(), st.gapFactor);
}

void Controller::appear(crl::time now) {
	_shown = true;
	if (style().disableAnimation) {
		return;
	}
	_reveal.start(true, now, int(points().size()));
	requestRepaint();
}

void Controller::disappear(crl::time now) {
	_shown = false;
	if (style().disableAnimation) {
		return;
	}
	_reveal.start(false, now, int(points().size()));
	requestRepaint();
}

bool Controller::entered() const {
	return _shown;
}

void Controller::tap(QPointF position, crl::time now) {
	if (const auto index = segmentAt(position, now)) {
		tapSegment(*index, now);
	} else {
		tapBackground(now);
	}
}

void Controller::tapSegment(int index, crl::time now) {
	Expects(index >= 0 && index < int(points().size()));

	const auto &point = points()[index];
	const auto current = selected();
	if (current && *current == point) {
		select(std::nullopt, now);
	} else {
		select(point, now);
	}
}

void Controller::tapBackground(crl::time now) {
	select(std::nullopt, now);
}

std::optional<int> Controller::segmentAt(
		QPointF position,
		crl::time now) const {
	const auto current = frame(now);
	const auto half = style().strokeWidth / 2.;
	if (current.radius <= 0.) {
		return std::nullopt;
	}
	const auto cap = half / current.radius;
	const auto &segments = current.segments;
	for (auto i = segments.rbegin(); i != segments.rend(); ++i) {
		if (i->path.isEmpty() || i->scale <= 0.) {
			continue;
		}
		const auto trimmed = TrimArc(
			i->point.startAngle,
			i->point.amount,
			current.angularGap);
		if (!trimmed) {
			continue;
		}
		const auto delta = (position - current.center) / i->scale;
		const auto distance = std::hypot(delta.x(), delta.y());
		if (std::abs(distance - current.radius) > half) {
			continue;
		}
		const auto angle = std::atan2(delta.y(), delta.x());
		if (AngleInside(
				angle,
				trimmed->start - cap,
				trimmed->span + cap * 2.)) {
			return i->index;
		}
	}
	return std::nullopt;
}

std::optional<DataPoint> Controller::resolve(
		const std::optional<DataPoint> &point) const {
	if (!point) {
		return std::nullopt;
	}
	const auto &list = points();
	const auto i = std::find(begin(list), end(list), *point);
	if (i == end(list)) {
		return std::nullopt;
	}
	return *i;
}

std::optional<DataPoint> Controller::selected() const {
	return resolve(_selected.current());
}

rpl::producer<std::optional<DataPoint>> Controller::selectedValue() const {
	return _selected.value(
	) | rpl::map([=](const std::optional<DataPoint> &point) {
		return resolve(point);
	});
}

void Controller::select(std::optional<DataPoint> point, crl::time now) {
	const auto was = selected();
	if (was == point) {
		return;
	}
	const auto id = [](const std::optional<DataPoint> &value) {
		return value
			? std::optional<PointId>(value->id)
			: std::optional<PointId>();
	};
	_selection.change(id(was), id(point), now);
	DEBUG_LOG(("Chart: selection changed to %1."
		).arg(point ? QString::number(point->id) : QString("none")));
	_selected = std::move(point);
	requestRepaint();
}

void Controller::dataChanged() {
	DEBUG_LOG(("Chart: data set replaced, %1 points."
		).arg(points().size()));
	_selection.clear();
	_selected = std::nullopt;
	requestRepaint();
}

void Controller::styleChanged() {
	const auto wasEnabled = _reveal.enabled();
	_reveal.setStyle(style());
	_selection.setStyle(style());
	if (!wasEnabled && _reveal.enabled()) {
		// Appear / disappear were not tracked while disabled.
		_reveal.settle(_shown);
	}
	requestRepaint();
}

void Controller::requestRepaint() {
	_repaintRequests.fire({});
}

Frame Controller::frame(crl::time now) const {
	const auto &st = style();
	const auto &metadata = _source->metadata();
	const auto &format = _source->valueFormat();
	const auto &list = points();

	auto result = Frame();
	result.rect = QRectF(QPointF(), _size);
	result.center = result.rect.center();
	result.radius = radius();
	result.angularGap = angularGap();
	result.centerRect = CenterRect(_size, st.strokeWidth);
	result.selected = selected();

	result.segments.reserve(list.size());
	for (auto i = 0, count = int(list.size()); i != count; ++i) {
		const auto &point = list[i];
		auto segment = SegmentFrame();
		segment.index = i;
		segment.point = point;
		segment.path = SegmentShape(
			point.startAngle,
			point.amount,
			result.angularGap).path(result.rect);
		segment.pen = StrokePen(point.colour, st.strokeWidth);
		segment.reveal = _reveal.value(i, now);
		segment.emphasis = _selection.progress(point.id, now);
		segment.selected = (result.selected && *result.selected == point);
		segment.scale = segment.reveal * anim::interpolateF(
			1.,
			st.selectedScale,
			segment.emphasis);
		segment.opacity = std::clamp(segment.reveal, 0., 1.);
		segment.z = segment.selected ? 1 : 0;
		segment.accessibleName = metadata.title;
		segment.accessibleValue = AccessibilityValue(point, format);
		result.segments.push_back(std::move(segment));
	}
	std::stable_sort(
		begin(result.segments),
		end(result.segments),
		[](const SegmentFrame &a, const SegmentFrame &b) {
			return a.z < b.z;
		});
	return result;
}

void Controller::paint(QPainter &p, crl::time now) const {
	const auto current = frame(now);

	p.save();
	p.setRenderHint(QPainter::Antialiasing, true);
	p.setBrush(Qt::NoBrush);
	for (const auto &segment : current.segments) {
		if (segment.path.isEmpty()) {
			continue;
		}
		p.save();
		p.translate(current.center);
		p.scale(segment.scale, segment.scale);
		p.translate(-current.center);
		p.setOpacity(segment.opacity);
		p.strokePath(segment.path, segment.pen);
		p.restore();
	}
	p.restore();

	if (_center) {
		_center(p, current.centerRect, current.selected);
	}
}

bool Controller::animating(crl::time now) const {
	return _reveal.animating(int(points().size()), now)
		|| _selection.animating(now);
}

rpl::producer<> Controller::repaintRequests() const {
	return _repaintRequests.events();
}

} // namespace Chart
