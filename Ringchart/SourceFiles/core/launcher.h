/*
This file is part of Telegram Desktop,
the official desktop application for the Telegram messaging service.

For license and copyright information please follow this link:
https://github.com/telegramdesktop/tdesktop/blob/master/LEGAL
*/
#pragma once

#include "core/base_integration.h"

#include <QtCore/QStringList>

namespace Core {

class Launcher final {
public:
	Launcher(int argc, char *argv[]);
	~Launcher();

	int exec();

	[[nodiscard]] const QStringList &arguments() const;

private:
	[[nodiscard]] QStringList readArguments(int argc, char *argv[]) const;
	void processArguments();
	int executeApplication();

	int _argc = 0;
	char **_argv = nullptr;
	QStringList _arguments;
	BaseIntegration _baseIntegration;

	QString _workingDir;
	QString _stylePath;
	bool _noAnimation = false;

};

} // namespace Core
