/*
This file is part of Telegram Desktop,
the official desktop application for the Telegram messaging service.

For license and copyright information please follow this link:
https://github.com/telegramdesktop/tdesktop/blob/master/LEGAL
*/
#include "logs.h"

#include <QtCore/QDateTime>
#include <QtCore/QDir>
#include <QtCore/QFile>
#include <QtCore/QMutex>
#include <QtCore/QMutexLocker>
#include <QtCore/QStringList>

#include <atomic>
#include <iostream>
#include <memory>

namespace Logs {
namespace {

std::atomic<int> ThreadCounter/* = 0*/;
bool DebugModeEnabled = false;

QString EntryStart() {
	static thread_local auto threadId = ThreadCounter++;
	static auto index = std::atomic<int>();

	const auto tm = QDateTime::currentDateTime();
	return QString("[%1 %2-%3]").arg(
		tm.toString("hh:mm:ss.zzz"),
		QString("%1").arg(threadId, 2, 10, QChar('0'))
	).arg(++index, 7, 10, QChar('0'));
}

enum LogDataType {
	LogDataMain,
	LogDataDebug,

	LogDataCount
};

const char *LogFileName(LogDataType type) {
	switch (type) {
	case LogDataMain: return "log.txt";
	case LogDataDebug: return "debug.txt";
	case LogDataCount: break;
	}
	Unexpected("Type in Logs::LogFileName.");
}

class LogsData final {
public:
	explicit LogsData(const QString &path) : _file(path) {
	}

	bool open() {
		return _file.open(QIODevice::WriteOnly | QIODevice::Text);
	}

	void write(const QString &msg) {
		if (_file.isOpen()) {
			_file.write(msg.toUtf8());
			_file.flush();
		}
	}

	QString full() const {
		auto in = QFile(_file.fileName());
		return in.open(QIODevice::ReadOnly)
			? QString::fromUtf8(in.readAll())
			: QString();
	}

private:
	QFile _file;

};

QMutex Mutex;
bool Started = false;
std::unique_ptr<LogsData> Data[LogDataCount];
QStringList InMemory[LogDataCount];

void Write(LogDataType type, const QString &msg) {
	QMutexLocker lock(&Mutex);
	if (Data[type]) {
		Data[type]->write(msg);
	} else if (!Started) {
		InMemory[type].push_back(msg);
	}
}

QString Full(LogDataType type) {
	QMutexLocker lock(&Mutex);
	return Data[type]
		? Data[type]->full()
		: InMemory[type].join(QString());
}

} // namespace

void SetDebugEnabled(bool enabled) {
	DebugModeEnabled = enabled;
}

bool DebugEnabled() {
#if defined _DEBUG
	return true;
#else
	return DebugModeEnabled;
#endif
}

void start(const QString &workingDir) {
	Expects(!started());

	const auto open = [&](LogDataType type) {
		auto result = std::make_unique<LogsData>(
			QDir(workingDir).absoluteFilePath(LogFileName(type)));
		if (!result->open()) {
			std::cerr
				<< "Could not open '"
				<< LogFileName(type)
				<< "' in '"
				<< workingDir.toStdString()
				<< "'."
				<< std::endl;
			return std::unique_ptr<LogsData>();
		}
		return result;
	};
	auto mainData = open(LogDataMain);
	if (!mainData) {
		return;
	}
	auto debugData = DebugEnabled()
		? open(LogDataDebug)
		: std::unique_ptr<LogsData>();
	{
		QMutexLocker lock(&Mutex);
		Started = true;
		Data[LogDataMain] = std::move(mainData);
		Data[LogDataDebug] = std::move(debugData);
		for (auto type = 0; type != LogDataCount; ++type) {
			if (Data[type]) {
				for (const auto &entry : std::as_const(InMemory[type])) {
					Data[type]->write(entry);
				}
			}
			InMemory[type].clear();
		}
	}
	LOG(("Logs started, debug logs %1.").arg(b(DebugEnabled())));
}

bool started() {
	QMutexLocker lock(&Mutex);
	return Started;
}

void finish() {
	QMutexLocker lock(&Mutex);
	Started = false;
	for (auto type = 0; type != LogDataCount; ++type) {
		Data[type] = nullptr;
		InMemory[type].clear();
	}
}

void writeMain(const QString &v) {
	const auto tm = QDateTime::currentDateTime();
	Write(LogDataMain, QString("[%1] %2\n").arg(
		tm.toString("yyyy.MM.dd hh:mm:ss"),
		v));

	writeDebug(v);
}

void writeDebug(const QString &v) {
	if (!DebugEnabled()) {
		return;
	}
	Write(LogDataDebug, QString("%1 %2\n").arg(EntryStart(), v));
}

QString full() {
	return Full(LogDataMain);
}

QString debugFull() {
	return Full(LogDataDebug);
}

} // namespace Logs
