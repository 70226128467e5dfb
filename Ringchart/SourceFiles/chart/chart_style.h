/*
This file is part of Telegram Desktop,
the official desktop application for the Telegram messaging service.

For license and copyright information please follow this link:
https://github.com/telegramdesktop/tdesktop/blob/master/LEGAL
*/
#pragma once

#include "base/basic_types.h"

#include <crl/crl_time.h>

#include <QtCore/QStringList>

namespace Chart {

inline constexpr auto kDefaultGapFactor = 1.15;

enum class AnimationCurve {
	Spring,
	EaseInOut,
	Linear,
};

struct Style {
	float64 strokeWidth = 42.;
	float64 gapFactor = kDefaultGapFactor;
	float64 selectedScale = 1.12;
	float64 hiddenScale = 0.001;
	crl::time staggerInterval = 60;
	crl::time revealDuration = 800;
	crl::time selectionDuration = 350;
	bool disableAnimation = false;
	AnimationCurve globalAnimation = AnimationCurve::Spring;
};

// Missing keys keep their defaults, every rejected entry adds a message.
[[nodiscard]] Style ReadStyle(
	const QByteArray &content,
	QStringList *errors = nullptr);
[[nodiscard]] Style LoadStyle(const QString &path);

[[nodiscard]] QString CurveName(AnimationCurve curve);

} // namespace Chart
