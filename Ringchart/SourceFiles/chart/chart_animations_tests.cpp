/*
This file is part of Telegram Desktop,
the official desktop application for the Telegram messaging service.

For license and copyright information please follow this link:
https://github.com/telegramdesktop/tdesktop/blob/master/LEGAL
*/
#include "catch.hpp"

#include "chart/chart_animations.h"

namespace {

using namespace Chart;

constexpr auto kStart = crl::time(10000);

Style TestStyle() {
	auto result = Style();
	result.staggerInterval = 60;
	result.revealDuration = 800;
	result.selectionDuration = 350;
	result.hiddenScale = 0.001;
	return result;
}

} // namespace

TEST_CASE("spring settles on its target", "[animations]") {
	CHECK(anim::spring(1., 0.) == 0.);
	CHECK(anim::spring(1., 1.) == 1.);
	CHECK(anim::spring(2., 0.999) == Approx(2.).margin(0.01));

	auto overshoot = false;
	for (auto i = 1; i != 100; ++i) {
		if (anim::spring(1., i / 100.) > 1.) {
			overshoot = true;
		}
	}
	CHECK(overshoot);
}

TEST_CASE("ease in out is symmetric", "[animations]") {
	CHECK(anim::sineInOut(1., 0.) == Approx(0.).margin(1e-9));
	CHECK(anim::sineInOut(1., 0.5) == Approx(0.5));
	CHECK(anim::sineInOut(1., 1.) == Approx(1.));
	CHECK(anim::sineInOut(1., 0.25) + anim::sineInOut(1., 0.75)
		== Approx(1.));
}

TEST_CASE("reveal starts hidden and staggers segments", "[animations]") {
	auto reveal = RevealAnimation(TestStyle());
	CHECK(reveal.value(0, kStart) == Approx(0.001));
	CHECK(!reveal.entered());

	reveal.start(true, kStart, 3);
	CHECK(reveal.entered());

	SECTION("later segments wait for their delay") {
		const auto now = kStart + 100;
		CHECK(reveal.value(0, now) > 0.001);
		CHECK(reveal.value(1, now) > 0.001);
		CHECK(reveal.value(2, now) == Approx(0.001));
		CHECK(reveal.value(0, now) > reveal.value(1, now));
	}
	SECTION("every segment is fully shown after the last delay") {
		const auto now = kStart + 2 * 60 + 800;
		CHECK(reveal.value(0, now) == 1.);
		CHECK(reveal.value(2, now) == 1.);
		CHECK(!reveal.animating(3, now));
		CHECK(reveal.animating(3, now - 1));
	}
	SECTION("value never drops below the hidden scale") {
		for (auto now = kStart; now != kStart + 1000; now += 10) {
			CHECK(reveal.value(0, now) >= 0.001);
		}
	}
}

TEST_CASE("reveal retargets from the current value", "[animations]") {
	auto reveal = RevealAnimation(TestStyle());
	reveal.start(true, kStart, 2);

	const auto middle = kStart + 300;
	const auto before = reveal.value(0, middle);
	reveal.start(false, middle, 2);
	CHECK(!reveal.entered());
	CHECK(reveal.value(0, middle) == Approx(before));

	const auto done = middle + 60 + 800;
	CHECK(reveal.value(0, done) == Approx(0.001));
	CHECK(reveal.value(1, done) == Approx(0.001));
}

TEST_CASE("repeated start with the same target is ignored", "[animations]") {
	auto reveal = RevealAnimation(TestStyle());
	reveal.start(true, kStart, 1);
	const auto value = reveal.value(0, kStart + 200);
	reveal.start(true, kStart + 100, 1);
	CHECK(reveal.value(0, kStart + 200) == Approx(value));
}

TEST_CASE("disabled reveal is always fully shown", "[animations]") {
	auto style = TestStyle();
	style.disableAnimation = true;
	auto reveal = RevealAnimation(style);
	CHECK(reveal.value(0, kStart) == 1.);
	CHECK(reveal.value(5, kStart) == 1.);

	reveal.start(false, kStart, 6);
	CHECK(reveal.value(3, kStart + 100) == 1.);
	CHECK(!reveal.animating(6, kStart + 100));
}

TEST_CASE("settled reveal jumps to its final state", "[animations]") {
	auto reveal = RevealAnimation(TestStyle());
	reveal.start(true, kStart, 3);

	reveal.settle(false);
	CHECK(!reveal.entered());
	CHECK(reveal.value(2, kStart + 10) == Approx(0.001));
	CHECK(!reveal.animating(3, kStart + 10));

	reveal.settle(true);
	CHECK(reveal.entered());
	CHECK(reveal.value(0, kStart + 10) == 1.);
	CHECK(reveal.value(2, kStart + 10) == 1.);

	reveal.start(false, kStart + 100, 3);
	CHECK(reveal.value(0, kStart + 100) == 1.);
	CHECK(reveal.animating(3, kStart + 200));
}

TEST_CASE("linear reveal curve follows the style", "[animations]") {
	auto style = TestStyle();
	style.globalAnimation = AnimationCurve::Linear;
	style.hiddenScale = 0.5;
	auto reveal = RevealAnimation(style);
	reveal.start(true, kStart, 1);
	CHECK(reveal.value(0, kStart + 400) == Approx(0.75));
}

TEST_CASE("selection emphasis eases between points", "[animations]") {
	auto selection = SelectionAnimation(TestStyle());
	CHECK(selection.progress(1, kStart) == 0.);

	selection.change(std::nullopt, PointId(1), kStart);
	CHECK(selection.animating(kStart + 10));
	CHECK(selection.progress(1, kStart + 175) == Approx(0.5));
	CHECK(selection.progress(1, kStart + 350) == 1.);
	CHECK(!selection.animating(kStart + 350));

	selection.change(PointId(1), PointId(2), kStart + 1000);
	CHECK(selection.progress(1, kStart + 1000) == Approx(1.));
	CHECK(selection.progress(2, kStart + 1000) == Approx(0.));
	CHECK(selection.progress(1, kStart + 1350) == 0.);
	CHECK(selection.progress(2, kStart + 1350) == 1.);

	selection.clear();
	CHECK(selection.progress(2, kStart + 1350) == 0.);
}

TEST_CASE("selection emphasis jumps when animation is disabled", "[animations]") {
	auto style = TestStyle();
	style.disableAnimation = true;
	auto selection = SelectionAnimation(style);
	selection.change(std::nullopt, PointId(7), kStart);
	CHECK(selection.progress(7, kStart) == 1.);
	CHECK(!selection.animating(kStart));
}
