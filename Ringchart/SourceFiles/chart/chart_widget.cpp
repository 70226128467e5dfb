/*
This file is part of Telegram Desktop,
the official desktop application for the Telegram messaging service.

For license and copyright information please follow this link:
https://github.com/telegramdesktop/tdesktop/blob/master/LEGAL
*/
#include "chart/chart_widget.h"

#include <crl/crl_time.h>

#include <QtGui/QMouseEvent>
#include <QtGui/QPainter>

#include <algorithm>

namespace Chart {
namespace {

constexpr auto kFrameInterval = 16;

} // namespace

Widget::Widget(
	QWidget *parent,
	not_null<DataSource*> source,
	CenterRenderer center)
: QWidget(parent)
, _source(source)
, _controller(std::make_unique<Controller>(source, std::move(center))) {
	setup();
}

Widget::~Widget() = default;

void Widget::setup() {
	setAttribute(Qt::WA_OpaquePaintEvent, false);
	setAccessibleName(_source->metadata().title);

	_timer.setInterval(kFrameInterval);
	connect(&_timer, &QTimer::timeout, this, [=] { animationStep(); });

	_controller->repaintRequests(
	) | rpl::start_with_next([=] {
		update();
		startAnimating();
	}, _controller->lifetime());

	_source->styleChanges(
	) | rpl::start_with_next([=] {
		_controller->resize(chartRect().size());
	}, _controller->lifetime());

	_controller->selectedValue(
	) | rpl::start_with_next([=](const std::optional<DataPoint> &selected) {
		refreshAccessibility(selected);
	}, _controller->lifetime());
}

void Widget::refreshAccessibility(const std::optional<DataPoint> &selected) {
	setAccessibleDescription(selected
		? AccessibilityValue(*selected, _source->valueFormat())
		: _source->metadata().subtitle);
}

QRectF Widget::chartRect() const {
	const auto &st = _source->style();
	const auto full = QRectF(rect());
	const auto stroke = SegmentShape(0., 0., 0.).inset(st.strokeWidth / 2.);
	const auto radius = std::max(
		stroke.effectiveRadius(full) / std::max(st.selectedScale, 1.),
		0.);
	return QRectF(
		full.center() - QPointF(radius, radius),
		QSizeF(radius * 2., radius * 2.));
}

void Widget::paintEvent(QPaintEvent *e) {
	auto p = QPainter(this);
	const auto chart = chartRect();
	p.translate(chart.topLeft());
	_controller->paint(p, crl::now());
}

void Widget::mouseReleaseEvent(QMouseEvent *e) {
	if (e->button() != Qt::LeftButton) {
		return;
	}
	_controller->tap(
		QPointF(e->pos()) - chartRect().topLeft(),
		crl::now());
}

void Widget::showEvent(QShowEvent *e) {
	QWidget::showEvent(e);
	_controller->appear(crl::now());
}

void Widget::hideEvent(QHideEvent *e) {
	_controller->disappear(crl::now());
	QWidget::hideEvent(e);
}

void Widget::resizeEvent(QResizeEvent *e) {
	_controller->resize(chartRect().size());
}

void Widget::startAnimating() {
	if (!_timer.isActive() && _controller->animating(crl::now())) {
		_timer.start();
	}
}

void Widget::animationStep() {
	update();
	if (!_controller->animating(crl::now())) {
		_timer.stop();
	}
}

} // namespace Chart
