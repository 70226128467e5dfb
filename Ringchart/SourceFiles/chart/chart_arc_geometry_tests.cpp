/*
This file is part of Telegram Desktop,
the official desktop application for the Telegram messaging service.

For license and copyright information please follow this link:
https://github.com/telegramdesktop/tdesktop/blob/master/LEGAL
*/
#include "catch.hpp"

#include "chart/chart_arc_geometry.h"
#include "chart/chart_data.h"

#include <cmath>
#include <limits>

namespace {

using namespace Chart;

constexpr auto kEpsilon = 1e-3;

int CountSubpaths(const QPainterPath &path) {
	auto result = 0;
	for (auto i = 0; i != path.elementCount(); ++i) {
		if (path.elementAt(i).isMoveTo()) {
			++result;
		}
	}
	return result;
}

QPointF PointAt(QPointF center, float64 radius, float64 angle) {
	return center + QPointF(std::cos(angle), std::sin(angle)) * radius;
}

void CheckNear(QPointF a, QPointF b) {
	CHECK(a.x() == Approx(b.x()).margin(kEpsilon));
	CHECK(a.y() == Approx(b.y()).margin(kEpsilon));
}

} // namespace

TEST_CASE("arc trimming removes half of the gap on both ends", "[arc]") {
	const auto trimmed = TrimArc(1., 2., 0.4);
	REQUIRE(trimmed.has_value());
	CHECK(trimmed->start == Approx(1.2));
	CHECK(trimmed->span == Approx(1.6));

	SECTION("gap wider than the share collapses the segment") {
		CHECK(!TrimArc(0., 0.01, 0.05).has_value());
	}
	SECTION("gap equal to the share collapses the segment") {
		CHECK(!TrimArc(0., 0.3, 0.3).has_value());
	}
	SECTION("negative share collapses the segment") {
		CHECK(!TrimArc(0., -1., 0.).has_value());
	}
}

TEST_CASE("arc path is a single clockwise arc", "[arc]") {
	const auto center = QPointF(100., 100.);
	const auto start = 0.25;
	const auto share = 1.5;
	const auto gap = 0.1;
	const auto path = ArcPath(center, 80., 5., start, share, gap);

	REQUIRE(!path.isEmpty());
	CHECK(CountSubpaths(path) == 1);

	const auto radius = 75.;
	CheckNear(
		QPointF(path.elementAt(0).x, path.elementAt(0).y),
		PointAt(center, radius, start + gap / 2.));
	CheckNear(
		path.currentPosition(),
		PointAt(center, radius, start + share - gap / 2.));
}

TEST_CASE("arc path degenerates to an empty path", "[arc]") {
	const auto center = QPointF(50., 50.);

	SECTION("gap exceeds the amount") {
		CHECK(ArcPath(center, 100., 0., 0., 0.01, 0.05).isEmpty());
	}
	SECTION("zero share") {
		CHECK(ArcPath(center, 100., 0., 1., 0., 0.).isEmpty());
	}
	SECTION("inset eats the whole radius") {
		CHECK(ArcPath(center, 10., 10., 0., 1., 0.).isEmpty());
		CHECK(ArcPath(center, 10., 12., 0., 1., 0.).isEmpty());
	}
	SECTION("zero radius") {
		CHECK(ArcPath(center, 0., 0., 0., 1., 0.).isEmpty());
	}
	SECTION("non-finite input") {
		const auto nan = std::numeric_limits<float64>::quiet_NaN();
		CHECK(ArcPath(center, 100., 0., nan, 1., 0.).isEmpty());
		CHECK(ArcPath(center, nan, 0., 0., 1., 0.).isEmpty());
	}
}

TEST_CASE("segment shape insets accumulate", "[arc]") {
	const auto rect = QRectF(0., 0., 300., 200.);
	const auto shape = SegmentShape(0., 2., 0.1);

	const auto twice = shape.inset(7.).inset(5.);
	const auto once = shape.inset(12.);

	CHECK(twice.insetAmount() == Approx(12.));
	CHECK(twice.effectiveRadius(rect) == Approx(once.effectiveRadius(rect)));
	CHECK(twice.effectiveRadius(rect) == Approx(88.));
	CHECK(shape.insetAmount() == Approx(0.));

	const auto a = twice.path(rect);
	const auto b = once.path(rect);
	REQUIRE(a.elementCount() == b.elementCount());
	for (auto i = 0; i != a.elementCount(); ++i) {
		CheckNear(
			QPointF(a.elementAt(i).x, a.elementAt(i).y),
			QPointF(b.elementAt(i).x, b.elementAt(i).y));
	}
}

TEST_CASE("segment shape is centered in its rect", "[arc]") {
	const auto rect = QRectF(10., 20., 200., 100.);
	const auto spec = SegmentShape(0., 1., 0.).spec(rect);
	CheckNear(spec.center, QPointF(110., 70.));
	CHECK(spec.outerRadius == Approx(50.));
}

TEST_CASE("angular gap keeps a constant linear size", "[arc][gap]") {
	const auto strokeWidth = 42.;
	for (const auto radius : { 50., 100., 200. }) {
		const auto gap = AngularGap(strokeWidth, radius);
		CHECK(gap * radius
			== Approx(strokeWidth * kDefaultGapFactor).margin(1e-9));
	}
	CHECK(AngularGap(10., 100., 2.) == Approx(0.2));
}

TEST_CASE("angular gap never divides by zero", "[arc][gap]") {
	CHECK(AngularGap(42., 0.) == 0.);
	CHECK(AngularGap(42., -5.) == 0.);
	CHECK(AngularGap(0., 100.) == 0.);
	CHECK(AngularGap(42., std::numeric_limits<float64>::infinity()) == 0.);
}

TEST_CASE("stroke pen has round caps", "[arc]") {
	const auto pen = StrokePen(Qt::red, 42.);
	CHECK(pen.capStyle() == Qt::RoundCap);
	CHECK(pen.widthF() == Approx(42.));
	CHECK(pen.color() == QColor(Qt::red));
}

TEST_CASE("angles are tested with wraparound", "[arc]") {
	CHECK(NormalizeAngle(-0.5) == Approx(kFullTurn - 0.5));
	CHECK(NormalizeAngle(kFullTurn + 1.) == Approx(1.));
	CHECK(AngleInside(0.1, kFullTurn - 0.2, 0.5));
	CHECK(AngleInside(-0.1, 6., 0.5));
	CHECK(!AngleInside(1., 0., 0.5));
	CHECK(!AngleInside(0.2, 0., 0.));
	CHECK(AngleInside(3., 10., kFullTurn));
}

TEST_CASE("three segment doughnut keeps its smallest segment", "[arc][gap]") {
	const auto radius = 125.;
	const auto gap = AngularGap(42., radius);
	CHECK(gap == Approx(0.386).margin(1e-3));

	const auto center = QPointF(radius, radius);
	auto start = kTopAngle;
	for (const auto share : { 0.53 * M_PI, 0.30 * M_PI, 0.17 * M_PI }) {
		const auto path = ArcPath(center, radius, 0., start, share, gap);
		CHECK(!path.isEmpty());
		start += share;
	}
	const auto smallest = TrimArc(0., 0.17 * M_PI, gap);
	REQUIRE(smallest.has_value());
	CHECK(smallest->span == Approx(0.148).margin(1e-3));

	SECTION("a thick stroke collapses the smallest segment") {
		const auto wide = AngularGap(200., radius);
		CHECK(wide > 0.17 * M_PI);
		CHECK(ArcPath(center, radius, 0., 0., 0.17 * M_PI, wide).isEmpty());
	}
	SECTION("proportional shares of 800, 450 and 250") {
		auto points = std::vector<DataPoint>(3);
		points[0].value = 800.;
		points[1].value = 450.;
		points[2].value = 250.;
		points = DistributeAngles(std::move(points));
		for (const auto &point : points) {
			CHECK(!ArcPath(
				center,
				radius,
				0.,
				point.startAngle,
				point.amount,
				gap).isEmpty());
		}
		CHECK(ArcPath(
			center,
			radius,
			0.,
			points[2].startAngle,
			points[2].amount,
			AngularGap(200., radius)).isEmpty());
	}
}
