/*
This file is part of Telegram Desktop,
the official desktop application for the Telegram messaging service.

For license and copyright information please follow this link:
https://github.com/telegramdesktop/tdesktop/blob/master/LEGAL
*/
#define CATCH_CONFIG_RUNNER
#include "catch.hpp"

#include "core/base_integration.h"

#include <QtWidgets/QApplication>

int main(int argc, char *argv[]) {
	// For LOG() / DEBUG_LOG() and assertion violations to be written.
	auto integration = Core::BaseIntegration(argc, argv);
	base::Integration::Set(&integration);

	// Widget tests need an application, run with QT_QPA_PLATFORM=offscreen.
	QApplication application(argc, argv);

	return Catch::Session().run(argc, argv);
}
