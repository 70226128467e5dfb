/*
This file is part of Telegram Desktop,
the official desktop application for the Telegram messaging service.

For license and copyright information please follow this link:
https://github.com/telegramdesktop/tdesktop/blob/master/LEGAL
*/
#pragma once

#include "base/basic_types.h"
#include "base/assertion.h"
#include "base/debug_log.h"

#include <QtCore/QString>

namespace Logs {

void SetDebugEnabled(bool enabled);
bool DebugEnabled();

// Entries written before start() are kept in memory and flushed into
// log.txt (and debug.txt when debug logs are enabled) once opened.
void start(const QString &workingDir);
bool started();
void finish();

void writeMain(const QString &v);
void writeDebug(const QString &v);

[[nodiscard]] QString full();
[[nodiscard]] QString debugFull();

inline const char *b(bool v) {
	return v ? "[TRUE]" : "[FALSE]";
}

} // namespace Logs
