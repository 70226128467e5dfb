/*
This file is part of Telegram Desktop,
the official desktop application for the Telegram messaging service.

For license and copyright information please follow this link:
https://github.com/telegramdesktop/tdesktop/blob/master/LEGAL
*/
#pragma once

#include "chart/chart_animations.h"
#include "chart/chart_arc_geometry.h"
#include "chart/chart_data_source.h"

#include <rpl/variable.h>
#include <rpl/lifetime.h>

#include <QtCore/QSizeF>

class QPainter;

namespace Chart {

using CenterRenderer = Fn<void(
	QPainter &p,
	const QRectF &rect,
	const std::optional<DataPoint> &selected)>;

struct SegmentFrame {
	int index = 0;
	DataPoint point;
	QPainterPath path;
	QPen pen;
	float64 reveal = 1.;
	float64 emphasis = 0.;
	float64 scale = 1.;
	float64 opacity = 1.;
	int z = 0;
	bool selected = false;
	QString accessibleName;
	QString accessibleValue;
};

struct Frame {
	QRectF rect;
	QPointF center;
	float64 radius = 0.;
	float64 angularGap = 0.;

	// In paint order, the selected segment goes last.
	std::vector<SegmentFrame> segments;

	QRectF centerRect;
	std::optional<DataPoint> selected;
};

class Controller final {
public:
	Controller(not_null<DataSource*> source, CenterRenderer center);

	void resize(QSizeF size);
	[[nodiscard]] QSizeF size() const {
		return _size;
	}
	[[nodiscard]] float64 radius() const;
	[[nodiscard]] float64 angularGap() const;

	void appear(crl::time now);
	void disappear(crl::time now);
	[[nodiscard]] bool entered() const;

	void tap(QPointF position, crl::time now);
	void tapSegment(int index, crl::time now);
	void tapBackground(crl::time now);
	[[nodiscard]] std::optional<int> segmentAt(
		QPointF position,
		crl::time now) const;

	[[nodiscard]] std::optional<DataPoint> selected() const;
	[[nodiscard]] rpl::producer<std::optional<DataPoint>> selectedValue() const;

	[[nodiscard]] Frame frame(crl::time now) const;
	void paint(QPainter &p, crl::time now) const;

	[[nodiscard]] bool animating(crl::time now) const;
	[[nodiscard]] rpl::producer<> repaintRequests() const;

	[[nodiscard]] rpl::lifetime &lifetime() {
		return _lifetime;
	}

private:
	[[nodiscard]] const std::vector<DataPoint> &points() const;
	[[nodiscard]] const Style &style() const;
	[[nodiscard]] std::optional<DataPoint> resolve(
		const std::optional<DataPoint> &point) const;

	void select(std::optional<DataPoint> point, crl::time now);
	void dataChanged();
	void styleChanged();
	void requestRepaint();

	const not_null<DataSource*> _source;
	const CenterRenderer _center;

	QSizeF _size;
	bool _shown = false;
	RevealAnimation _reveal;
	SelectionAnimation _selection;
	rpl::variable<std::optional<DataPoint>> _selected;
	rpl::event_stream<> _repaintRequests;

	rpl::lifetime _lifetime;

};

} // namespace Chart
