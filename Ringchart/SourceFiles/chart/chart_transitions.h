/*
This file is part of Telegram Desktop,
the official desktop application for the Telegram messaging service.

For license and copyright information please follow this link:
https://github.com/telegramdesktop/tdesktop/blob/master/LEGAL
*/
#pragma once

#include "base/basic_types.h"
#include "chart/chart_style.h"

namespace Chart {
namespace anim {

// Maps dt in [0, 1] to the part of delta passed by that moment.
using transition = float64(*)(const float64 &delta, const float64 &dt);

float64 linear(const float64 &delta, const float64 &dt);
float64 sineInOut(const float64 &delta, const float64 &dt);
float64 easeOutCirc(const float64 &delta, const float64 &dt);

// Damped spring released at dt == 0, settled at dt == 1.
// May overshoot delta on the way.
float64 spring(const float64 &delta, const float64 &dt);

[[nodiscard]] transition ForCurve(AnimationCurve curve);

inline float64 interpolateF(float64 a, float64 b, float64 progress) {
	return a + (b - a) * progress;
}

} // namespace anim
} // namespace Chart
