/*
This file is part of Telegram Desktop,
the official desktop application for the Telegram messaging service.

For license and copyright information please follow this link:
https://github.com/telegramdesktop/tdesktop/blob/master/LEGAL
*/
#include "catch.hpp"

#include "core/base_integration.h"
#include "logs.h"

#include <QtCore/QDir>
#include <QtCore/QFile>
#include <QtCore/QTemporaryDir>

namespace {

QString ReadFile(const QString &path) {
	auto file = QFile(path);
	return file.open(QIODevice::ReadOnly)
		? QString::fromUtf8(file.readAll())
		: QString();
}

} // namespace

TEST_CASE("debug entries go to their own log", "[logs]") {
	const auto enabled = Logs::DebugEnabled();
	const auto restore = gsl::finally([&] {
		Logs::SetDebugEnabled(enabled);
	});
	Logs::SetDebugEnabled(true);

	Logs::writeDebug("Debug only entry.");
	CHECK(Logs::debugFull().contains("Debug only entry."));
	CHECK(!Logs::full().contains("Debug only entry."));

	Logs::writeMain("Main entry.");
	CHECK(Logs::full().contains("Main entry."));
	CHECK(Logs::debugFull().contains("Main entry."));

	SECTION("crash annotations are written to the debug log") {
		char name[] = "ringchart_tests";
		char *arguments[] = { name, nullptr };
		auto integration = Core::BaseIntegration(1, arguments);
		integration.setCrashAnnotation("Chart", "Food");
		CHECK(Logs::debugFull().contains("Crash annotation 'Chart': Food"));
	}
}

TEST_CASE("log files receive entries written before start", "[logs]") {
	REQUIRE(!Logs::started());

	const auto enabled = Logs::DebugEnabled();
	const auto restore = gsl::finally([&] {
		Logs::finish();
		Logs::SetDebugEnabled(enabled);
	});
	Logs::SetDebugEnabled(true);
	Logs::writeMain("Written early.");
	Logs::writeDebug("Debug written early.");

	auto directory = QTemporaryDir();
	REQUIRE(directory.isValid());
	Logs::start(directory.path());
	REQUIRE(Logs::started());

	Logs::writeDebug("Debug written late.");

	const auto folder = QDir(directory.path());
	const auto mainLog = ReadFile(folder.filePath("log.txt"));
	const auto debugLog = ReadFile(folder.filePath("debug.txt"));
	CHECK(mainLog.contains("Written early."));
	CHECK(mainLog.contains("Logs started"));
	CHECK(!mainLog.contains("Debug written"));
	CHECK(debugLog.contains("Debug written early."));
	CHECK(debugLog.contains("Debug written late."));
	CHECK(Logs::debugFull() == debugLog);
}
