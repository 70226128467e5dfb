/*
This file is part of Telegram Desktop,
the official desktop application for the Telegram messaging service.

For license and copyright information please follow this link:
https://github.com/telegramdesktop/tdesktop/blob/master/LEGAL
*/
#include "core/launcher.h"

#include "base/assertion.h"
#include "base/debug_log.h"
#include "chart/chart_widget.h"
#include "logs.h"

#include <QtCore/QDir>
#include <QtCore/QMap>
#include <QtGui/QPainter>
#include <QtGui/QTextOption>
#include <QtWidgets/QApplication>

#include <algorithm>
#include <map>

namespace Core {
namespace {

[[nodiscard]] std::vector<Chart::DataPoint> SpendingPoints() {
	auto id = Chart::PointId();
	const auto make = [&](float64 value, QString description, QColor c) {
		auto result = Chart::DataPoint();
		result.id = ++id;
		result.value = value;
		result.description = std::move(description);
		result.colour = c;
		return result;
	};
	return Chart::DistributeAngles({
		make(800., "Food", QColor::fromRgbF(0.96, 0.42, 0.36)),
		make(450., "Shopping", QColor::fromRgbF(0.95, 0.58, 0.29)),
		make(250., "Transport", QColor::fromRgbF(0.95, 0.76, 0.30)),
	});
}

[[nodiscard]] Chart::CenterRenderer SpendingCenter(
		not_null<Chart::DataSource*> source) {
	return [=](
			QPainter &p,
			const QRectF &rect,
			const std::optional<Chart::DataPoint> &selected) {
		const auto title = selected
			? selected->description
			: QString("Total");
		const auto value = selected
			? Chart::FormatValue(selected->value, source->valueFormat())
			: source->metadata().subtitle;

		auto headline = p.font();
		headline.setBold(true);
		headline.setPixelSize(std::max(int(rect.height() / 8.), 1));
		auto subline = headline;
		subline.setBold(false);
		subline.setPixelSize(std::max(int(rect.height() / 11.), 1));

		const auto half = rect.height() / 2.;
		p.setPen(Qt::black);
		p.setFont(headline);
		p.drawText(
			QRectF(rect.x(), rect.y(), rect.width(), half),
			title,
			QTextOption(Qt::AlignHCenter | Qt::AlignBottom));
		p.setFont(subline);
		p.drawText(
			QRectF(rect.x(), rect.y() + half, rect.width(), half),
			value,
			QTextOption(Qt::AlignHCenter | Qt::AlignTop));
	};
}

} // namespace

Launcher::Launcher(int argc, char *argv[])
: _argc(argc)
, _argv(argv)
, _arguments(readArguments(_argc, _argv))
, _baseIntegration(_argc, _argv)
, _workingDir(QDir::currentPath() + '/') {
	base::Integration::Set(&_baseIntegration);
}

Launcher::~Launcher() = default;

QStringList Launcher::readArguments(int argc, char *argv[]) const {
	Expects(argc >= 0);

	auto result = QStringList();
	result.reserve(argc);
	for (auto i = 0; i != argc; ++i) {
		result.push_back(QString::fromUtf8(argv[i]));
	}
	return result;
}

const QStringList &Launcher::arguments() const {
	return _arguments;
}

int Launcher::exec() {
	processArguments();
	return executeApplication();
}

void Launcher::processArguments() {
	enum class KeyFormat {
		NoValues,
		OneValue,
	};
	auto parseMap = std::map<QByteArray, KeyFormat> {
		{ "-debug"          , KeyFormat::NoValues },
		{ "-noanimation"    , KeyFormat::NoValues },
		{ "-style"          , KeyFormat::OneValue },
		{ "-workdir"        , KeyFormat::OneValue },
	};
	auto parseResult = QMap<QByteArray, QStringList>();
	auto parsingKey = QByteArray();
	auto parsingFormat = KeyFormat::NoValues;
	for (const auto &argument : std::as_const(_arguments)) {
		switch (parsingFormat) {
		case KeyFormat::OneValue: {
			parseResult[parsingKey] = QStringList(argument.mid(0, 8192));
			parsingFormat = KeyFormat::NoValues;
		} break;
		case KeyFormat::NoValues: {
			parsingKey = argument.toLatin1();
			auto it = parseMap.find(parsingKey);
			if (it != parseMap.end()) {
				parsingFormat = it->second;
				parseResult[parsingKey] = QStringList();
			}
		} break;
		}
	}

	Logs::SetDebugEnabled(parseResult.contains("-debug"));
	_noAnimation = parseResult.contains("-noanimation");
	_stylePath = parseResult.value("-style", {}).join(QString());
	const auto workingDir = parseResult.value("-workdir", {}).join(QString());
	if (!workingDir.isEmpty()) {
		_workingDir = QDir(workingDir).absolutePath() + '/';
	}
}

int Launcher::executeApplication() {
	QApplication application(_argc, _argv);
	QApplication::setApplicationName("Ringchart");

	Logs::start(_workingDir);
	DEBUG_LOG(("Launched with debug logs, working dir '%1'."
		).arg(_workingDir));

	auto style = _stylePath.isEmpty()
		? Chart::Style()
		: Chart::LoadStyle(_stylePath);
	if (_noAnimation) {
		style.disableAnimation = true;
	}
	auto format = Chart::ValueFormat();
	format.specifier = "$%.0f";
	auto source = Chart::StaticDataSource(
		SpendingPoints(),
		style,
		Chart::Metadata{ "Total Spending", "$ 1,500.00" },
		std::move(format));

	auto widget = Chart::Widget(nullptr, &source, SpendingCenter(&source));
	widget.setWindowTitle(source.metadata().title);
	widget.resize(320, 320);
	widget.show();

	const auto result = application.exec();
	LOG(("Application finished with code %1.").arg(result));
	Logs::finish();
	return result;
}

} // namespace Core
