/*
This file is part of Telegram Desktop,
the official desktop application for the Telegram messaging service.

For license and copyright information please follow this link:
https://github.com/telegramdesktop/tdesktop/blob/master/LEGAL
*/
#include "chart/chart_transitions.h"

#include "base/assertion.h"

#include <cmath>

namespace Chart {
namespace anim {
namespace {

// Response and damping of a default UI spring, the whole motion is
// squeezed into the dt range [0, 1] as kSpringSeconds.
constexpr auto kSpringResponse = 0.55;
constexpr auto kSpringDamping = 0.825;
constexpr auto kSpringSeconds = 0.8;

} // namespace

float64 linear(const float64 &delta, const float64 &dt) {
	return delta * dt;
}

float64 sineInOut(const float64 &delta, const float64 &dt) {
	return -(delta / 2) * (cos(M_PI * dt) - 1);
}

float64 easeOutCirc(const float64 &delta, const float64 &dt) {
	const float64 t = dt - 1;
	return delta * sqrt(1 - t * t);
}

float64 spring(const float64 &delta, const float64 &dt) {
	if (dt <= 0.) {
		return 0.;
	} else if (dt >= 1.) {
		return delta;
	}
	const float64 omega = 2 * M_PI / kSpringResponse;
	const float64 decay = kSpringDamping * omega;
	const float64 damped = omega
		* sqrt(1 - kSpringDamping * kSpringDamping);
	const float64 t = dt * kSpringSeconds;
	const float64 envelope = exp(-decay * t);
	return delta * (1
		- envelope * (cos(damped * t) + (decay / damped) * sin(damped * t)));
}

transition ForCurve(AnimationCurve curve) {
	switch (curve) {
	case AnimationCurve::Spring: return spring;
	case AnimationCurve::EaseInOut: return sineInOut;
	case AnimationCurve::Linear: return linear;
	}
	Unexpected("Curve value in Chart::anim::ForCurve.");
}

} // namespace anim
} // namespace Chart
