/*
This file is part of Telegram Desktop,
the official desktop application for the Telegram messaging service.

For license and copyright information please follow this link:
https://github.com/telegramdesktop/tdesktop/blob/master/LEGAL
*/
#include "chart/chart_style.h"

#include "base/assertion.h"
#include "base/parse_helper.h"
#include "base/debug_log.h"

#include <QtCore/QFile>
#include <QtCore/QJsonDocument>
#include <QtCore/QJsonObject>
#include <QtCore/QJsonValue>

#include <cmath>

namespace Chart {
namespace {

constexpr auto kMaxDuration = crl::time(60 * 1000);

bool ReadOption(
		const QJsonObject &object,
		const QString &key,
		Fn<void(QJsonValue)> callback) {
	const auto i = object.constFind(key);
	if (i == object.constEnd()) {
		return false;
	}
	callback(*i);
	return true;
}

void ReadNumber(
		const QJsonObject &object,
		const QString &key,
		float64 &field,
		bool positive,
		QStringList &errors) {
	ReadOption(object, key, [&](QJsonValue value) {
		const auto number = value.toDouble(-1.);
		const auto good = value.isDouble()
			&& std::isfinite(number)
			&& (positive ? (number > 0.) : (number >= 0.));
		if (good) {
			field = number;
		} else {
			errors.push_back(QString("Bad value for '%1'! Expected %2 number."
			).arg(key, positive ? "a positive" : "a non-negative"));
		}
	});
}

void ReadDuration(
		const QJsonObject &object,
		const QString &key,
		crl::time &field,
		QStringList &errors) {
	auto value = float64(field);
	ReadNumber(object, key, value, false, errors);
	if (value > kMaxDuration) {
		errors.push_back(QString("Bad value for '%1'! Limit is %2 ms."
		).arg(key).arg(kMaxDuration));
	} else {
		field = crl::time(std::round(value));
	}
}

void ReadCurve(
		const QJsonObject &object,
		AnimationCurve &field,
		QStringList &errors) {
	ReadOption(object, "animation", [&](QJsonValue value) {
		const auto name = value.toString();
		for (const auto curve : {
				AnimationCurve::Spring,
				AnimationCurve::EaseInOut,
				AnimationCurve::Linear }) {
			if (name == CurveName(curve)) {
				field = curve;
				return;
			}
		}
		errors.push_back(QString("Bad value for 'animation'! "
			"Expected \"spring\", \"ease_in_out\" or \"linear\"."));
	});
}

} // namespace

Style ReadStyle(const QByteArray &content, QStringList *errors) {
	auto result = Style();
	auto list = QStringList();
	const auto guard = gsl::finally([&] {
		if (errors) {
			*errors = list;
		}
	});

	auto error = QJsonParseError{ 0, QJsonParseError::NoError };
	const auto document = QJsonDocument::fromJson(
		base::parse::stripComments(content),
		&error);
	if (error.error != QJsonParseError::NoError) {
		list.push_back(QString("Failed to parse! Error: %1"
		).arg(error.errorString()));
		return result;
	} else if (!document.isObject()) {
		list.push_back("Failed to parse! Error: object expected");
		return result;
	}
	const auto object = document.object();
	static const auto known = QStringList{
		"stroke_width",
		"gap_factor",
		"selected_scale",
		"hidden_scale",
		"stagger",
		"reveal_duration",
		"selection_duration",
		"disable_animation",
		"animation",
	};
	for (auto i = object.constBegin(); i != object.constEnd(); ++i) {
		if (!known.contains(i.key())) {
			list.push_back(QString("Unknown key '%1' skipped.").arg(i.key()));
		}
	}

	ReadNumber(object, "stroke_width", result.strokeWidth, false, list);
	ReadNumber(object, "gap_factor", result.gapFactor, false, list);
	ReadNumber(object, "selected_scale", result.selectedScale, true, list);
	ReadNumber(object, "hidden_scale", result.hiddenScale, true, list);
	ReadDuration(object, "stagger", result.staggerInterval, list);
	ReadDuration(object, "reveal_duration", result.revealDuration, list);
	ReadDuration(object, "selection_duration", result.selectionDuration, list);
	ReadOption(object, "disable_animation", [&](QJsonValue value) {
		if (value.isBool()) {
			result.disableAnimation = value.toBool();
		} else {
			list.push_back("Bad value for 'disable_animation'! "
				"Expected a boolean.");
		}
	});
	ReadCurve(object, result.globalAnimation, list);
	return result;
}

Style LoadStyle(const QString &path) {
	auto file = QFile(path);
	if (!file.open(QIODevice::ReadOnly)) {
		LOG(("Chart Warning: could not read style file '%1'.").arg(path));
		return Style();
	}
	auto errors = QStringList();
	auto result = ReadStyle(file.readAll(), &errors);
	for (const auto &error : errors) {
		LOG(("Chart Warning: while reading style file '%1'. %2"
			).arg(path, error));
	}
	return result;
}

QString CurveName(AnimationCurve curve) {
	switch (curve) {
	case AnimationCurve::Spring: return "spring";
	case AnimationCurve::EaseInOut: return "ease_in_out";
	case AnimationCurve::Linear: return "linear";
	}
	Unexpected("Curve value in Chart::CurveName.");
}

} // namespace Chart
