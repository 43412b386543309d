#pragma once
#include <QDir>
#include <QFileInfo>
#include <QString>
#include <QThread>

#include "include/common_path.hpp"

namespace SqlCommon {
	inline QString baseConnName() { return QStringLiteral("cactus_flasher"); }

	inline QString& dbFileStorage()
	{
		static QString path = QStringLiteral(DB_PATH DB);
		return path;
	}

	// Call once at startup, before any connection is opened
	inline void setDbFilePath(const QString& path) { dbFileStorage() = path; }

    inline QString dbFilePath()
    {
        const QString path = dbFileStorage();
        QDir().mkpath(QFileInfo(path).absolutePath());
        return path;
    }

    inline QString connectionNameForCurrentThread()
    {
        return QString("%1_%2").arg(baseConnName())
							   .arg(static_cast<qulonglong>(reinterpret_cast<quintptr>(QThread::currentThreadId())));
    }
} // namespace SqlCommon
