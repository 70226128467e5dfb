/*
This file is part of Telegram Desktop,
the official desktop application for the Telegram messaging service.

For license and copyright information please follow this link:
https://github.com/telegramdesktop/tdesktop/blob/master/LEGAL
*/
#include "chart/chart_data_source.h"

namespace Chart {

StaticDataSource::StaticDataSource(
	std::vector<DataPoint> points,
	Style style,
	Metadata metadata,
	ValueFormat format)
: _points(std::move(points))
, _style(std::move(style))
, _metadata(std::move(metadata))
, _format(std::move(format)) {
}

void StaticDataSource::setPoints(std::vector<DataPoint> points) {
	_points = std::move(points);
	_dataChanges.fire({});
}

void StaticDataSource::setStyle(Style style) {
	_style = std::move(style);
	_styleChanges.fire({});
}

const std::vector<DataPoint> &StaticDataSource::points() const {
	return _points;
}

const Style &StaticDataSource::style() const {
	return _style;
}

const Metadata &StaticDataSource::metadata() const {
	return _metadata;
}

const ValueFormat &StaticDataSource::valueFormat() const {
	return _format;
}

rpl::producer<> StaticDataSource::dataChanges() const {
	return _dataChanges.events();
}

rpl::producer<> StaticDataSource::styleChanges() const {
	return _styleChanges.events();
}

} // namespace Chart
