#pragma once
#include <QDateTime>
#include <QVector>
#include <QString>
#include <QMutex>
#include "log/SystemLogTypes.hpp"


class QSqliteService {
public:
    bool initializeDatabase();

    bool insertSystemLog(int level, const QString& tag, const QString& message,
                         const QDateTime& timestamp, const QString& extra = QString());

    // 조회(페이징/필터), newest first
    bool selectSystemLogs(int offset, int limit,
                          int minLevel, const QString& tagLike, const QString& sinceIso,
                          QVector<SystemLogRow>* outRows,
                          int* outTotal);

	// Retention: drops rows older than cutoff, returns removed count or -1
	int purgeSystemLogsBefore(const QDateTime& cutoff);

private:
	QMutex dbMutex;
};
