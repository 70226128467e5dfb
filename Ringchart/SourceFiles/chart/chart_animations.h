/*
This file is part of Telegram Desktop,
the official desktop application for the Telegram messaging service.

For license and copyright information please follow this link:
https://github.com/telegramdesktop/tdesktop/blob/master/LEGAL
*/
#pragma once

#include "chart/chart_data.h"
#include "chart/chart_style.h"
#include "chart/chart_transitions.h"

#include <optional>
#include <vector>

namespace Chart {

// Staggered reveal of all segments, segment i starts i * stagger later.
class RevealAnimation final {
public:
	explicit RevealAnimation(const Style &style);

	void setStyle(const Style &style);

	// Retargets every segment from the value it has at now.
	void start(bool entered, crl::time now, int count);

	// Jumps to the final state without animating.
	void settle(bool entered);

	[[nodiscard]] bool entered() const {
		return _entered;
	}
	[[nodiscard]] bool enabled() const {
		return _enabled;
	}
	[[nodiscard]] float64 value(int index, crl::time now) const;
	[[nodiscard]] bool animating(int count, crl::time now) const;

private:
	[[nodiscard]] float64 target() const;
	[[nodiscard]] float64 from(int index) const;
	[[nodiscard]] crl::time delay(int index) const;

	anim::transition _transition = anim::spring;
	float64 _hidden = 0.;
	crl::time _stagger = 0;
	crl::time _duration = 0;
	bool _enabled = true;

	bool _entered = false;
	std::optional<crl::time> _started;
	std::vector<float64> _from;

};

// Emphasis progress per point, 1 for the selected one.
class SelectionAnimation final {
public:
	explicit SelectionAnimation(const Style &style);

	void setStyle(const Style &style);
	void change(
		std::optional<PointId> was,
		std::optional<PointId> now,
		crl::time time);
	void clear();

	[[nodiscard]] float64 progress(PointId id, crl::time now) const;
	[[nodiscard]] bool animating(crl::time now) const;

private:
	struct Transition {
		PointId id = 0;
		float64 from = 0.;
		float64 to = 0.;
		crl::time started = 0;
	};

	void retarget(PointId id, float64 to, crl::time time);

	std::vector<Transition> _transitions;
	crl::time _duration = 0;
	bool _enabled = true;

};

} // namespace Chart
