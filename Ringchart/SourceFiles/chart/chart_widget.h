/*
This file is part of Telegram Desktop,
the official desktop application for the Telegram messaging service.

For license and copyright information please follow this link:
https://github.com/telegramdesktop/tdesktop/blob/master/LEGAL
*/
#pragma once

#include "chart/chart_controller.h"

#include <QtCore/QTimer>
#include <QtWidgets/QWidget>

#include <memory>

namespace Chart {

class Widget final : public QWidget {
public:
	Widget(
		QWidget *parent,
		not_null<DataSource*> source,
		CenterRenderer center);
	~Widget();

	[[nodiscard]] not_null<Controller*> controller() const {
		return _controller.get();
	}
	[[nodiscard]] bool animating() const {
		return _timer.isActive();
	}

	// Leaves room for the emphasized ring inside the widget.
	[[nodiscard]] QRectF chartRect() const;

protected:
	void paintEvent(QPaintEvent *e) override;
	void mouseReleaseEvent(QMouseEvent *e) override;
	void showEvent(QShowEvent *e) override;
	void hideEvent(QHideEvent *e) override;
	void resizeEvent(QResizeEvent *e) override;

private:
	void setup();
	void refreshAccessibility(const std::optional<DataPoint> &selected);
	void startAnimating();
	void animationStep();

	const not_null<DataSource*> _source;
	const std::unique_ptr<Controller> _controller;
	QTimer _timer;

};

} // namespace Chart
