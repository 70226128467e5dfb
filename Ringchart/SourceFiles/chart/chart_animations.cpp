/*
This file is part of Telegram Desktop,
the official desktop application for the Telegram messaging service.

For license and copyright information please follow this link:
https://github.com/telegramdesktop/tdesktop/blob/master/LEGAL
*/
#include "chart/chart_animations.h"

#include <algorithm>

namespace Chart {

RevealAnimation::RevealAnimation(const Style &style) {
	setStyle(style);
}

void RevealAnimation::setStyle(const Style &style) {
	_transition = anim::ForCurve(style.globalAnimation);
	_hidden = style.hiddenScale;
	_stagger = style.staggerInterval;
	_duration = style.revealDuration;
	_enabled = !style.disableAnimation;
}

void RevealAnimation::start(bool entered, crl::time now, int count) {
	if (!_enabled || (_started && _entered == entered)) {
		_entered = entered;
		return;
	}
	auto from = std::vector<float64>();
	from.reserve(std::max(count, 0));
	for (auto i = 0; i < count; ++i) {
		from.push_back(value(i, now));
	}
	_from = std::move(from);
	_entered = entered;
	_started = now;
}

void RevealAnimation::settle(bool entered) {
	_entered = entered;
	_started = std::nullopt;
	_from.clear();
}

float64 RevealAnimation::value(int index, crl::time now) const {
	if (!_enabled) {
		return 1.;
	} else if (!_started) {
		return target();
	}
	const auto from = this->from(index);
	const auto elapsed = now - *_started - delay(index);
	if (elapsed <= 0) {
		return from;
	} else if (elapsed >= _duration) {
		return target();
	}
	const auto dt = float64(elapsed) / _duration;
	const auto result = from + _transition(target() - from, dt);
	return std::max(result, _hidden);
}

bool RevealAnimation::animating(int count, crl::time now) const {
	if (!_enabled || !_started) {
		return false;
	}
	const auto last = std::max(count - 1, 0);
	return (now < *_started + delay(last) + _duration);
}

float64 RevealAnimation::target() const {
	return _entered ? 1. : _hidden;
}

float64 RevealAnimation::from(int index) const {
	if (index >= 0 && index < int(_from.size())) {
		return _from[index];
	}
	return _entered ? _hidden : 1.;
}

crl::time RevealAnimation::delay(int index) const {
	return std::max(index, 0) * _stagger;
}

SelectionAnimation::SelectionAnimation(const Style &style) {
	setStyle(style);
}

void SelectionAnimation::setStyle(const Style &style) {
	_duration = style.selectionDuration;
	_enabled = !style.disableAnimation;
}

void SelectionAnimation::change(
		std::optional<PointId> was,
		std::optional<PointId> now,
		crl::time time) {
	if (was == now) {
		return;
	}
	_transitions.erase(
		std::remove_if(begin(_transitions), end(_transitions), [&](
				const Transition &transition) {
			return !transition.to
				&& (time >= transition.started + _duration);
		}),
		end(_transitions));
	if (was) {
		retarget(*was, 0., time);
	}
	if (now) {
		retarget(*now, 1., time);
	}
}

void SelectionAnimation::clear() {
	_transitions.clear();
}

void SelectionAnimation::retarget(PointId id, float64 to, crl::time time) {
	const auto from = progress(id, time);
	const auto i = std::find_if(
		begin(_transitions),
		end(_transitions),
		[&](const Transition &transition) { return transition.id == id; });
	if (i != end(_transitions)) {
		*i = Transition{ id, from, to, time };
	} else {
		_transitions.push_back({ id, from, to, time });
	}
}

float64 SelectionAnimation::progress(PointId id, crl::time now) const {
	const auto i = std::find_if(
		begin(_transitions),
		end(_transitions),
		[&](const Transition &transition) { return transition.id == id; });
	if (i == end(_transitions)) {
		return 0.;
	} else if (!_enabled || _duration <= 0) {
		return i->to;
	}
	const auto elapsed = now - i->started;
	if (elapsed <= 0) {
		return i->from;
	} else if (elapsed >= _duration) {
		return i->to;
	}
	const auto dt = float64(elapsed) / _duration;
	return i->from + anim::sineInOut(i->to - i->from, dt);
}

bool SelectionAnimation::animating(crl::time now) const {
	if (!_enabled || _duration <= 0) {
		return false;
	}
	return std::any_of(
		begin(_transitions),
		end(_transitions),
		[&](const Transition &transition) {
			return (now < transition.started + _duration);
		});
}

} // namespace Chart
