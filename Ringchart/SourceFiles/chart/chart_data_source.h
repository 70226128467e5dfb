/*
This file is part of Telegram Desktop,
the official desktop application for the Telegram messaging service.

For license and copyright information please follow this link:
https://github.com/telegramdesktop/tdesktop/blob/master/LEGAL
*/
#pragma once

#include "chart/chart_data.h"
#include "chart/chart_style.h"

#include <rpl/producer.h>
#include <rpl/event_stream.h>

namespace Chart {

class DataSource {
public:
	virtual ~DataSource() = default;

	[[nodiscard]] virtual const std::vector<DataPoint> &points() const = 0;
	[[nodiscard]] virtual const Style &style() const = 0;
	[[nodiscard]] virtual const Metadata &metadata() const = 0;
	[[nodiscard]] virtual const ValueFormat &valueFormat() const = 0;

	// Fires when the point set is replaced by another one.
	[[nodiscard]] virtual rpl::producer<> dataChanges() const = 0;
	[[nodiscard]] virtual rpl::producer<> styleChanges() const = 0;

};

class StaticDataSource final : public DataSource {
public:
	StaticDataSource(
		std::vector<DataPoint> points,
		Style style,
		Metadata metadata,
		ValueFormat format = ValueFormat());

	void setPoints(std::vector<DataPoint> points);
	void setStyle(Style style);

	const std::vector<DataPoint> &points() const override;
	const Style &style() const override;
	const Metadata &metadata() const override;
	const ValueFormat &valueFormat() const override;
	rpl::producer<> dataChanges() const override;
	rpl::producer<> styleChanges() const override;

private:
	std::vector<DataPoint> _points;
	Style _style;
	Metadata _metadata;
	ValueFormat _format;

	rpl::event_stream<> _dataChanges;
	rpl::event_stream<> _styleChanges;

};

} // namespace Chart
