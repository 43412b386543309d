#pragma once
#include <QString>
#include <QDateTime>
#include <QJsonObject>
#include <QMetaType>

enum class SysLogLevel { Debug=0, Info=1, Warn=2, Error=3, Critical=4 };

struct SystemLogEntry {
    SysLogLevel level;
    QString tag;        // "SCAN", "DISCOVER", "OTA", "STORE", "APP"
    QString message;
    QDateTime ts;
    QString extra;
};

// Row read back from system_logs
struct SystemLogRow {
    int id{};
    int level{};        // 0~4
    QString tag;
    QString message;
    QDateTime timestamp;
    QString extra;

    QJsonObject toJson() const {
        QJsonObject o;
        o["id"]      = id;
        o["level"]   = level;
        o["tag"]     = tag;
        o["message"] = message;
        o["ts"]      = timestamp.toString(Qt::ISODateWithMs);
        if (!extra.isEmpty()) o["extra"] = extra;
        return o;
    }
};

Q_DECLARE_METATYPE(SystemLogEntry)
