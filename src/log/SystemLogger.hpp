#pragma once
#include <QObject>
#include <QThread>

#include "SystemLogTypes.hpp"

namespace syslog_detail { class SystemLogWriter; }

class SystemLogger final : public QObject {
    Q_OBJECT
public:
    static SystemLogger& instance();
    static void init();      // 앱 시작시 1회
    static void shutdown();
    static bool isRunning();

    // 어디서든 한 줄로 호출. init() 전에는 qDebug로만 남긴다
    static void debug(const QString& tag, const QString& msg, const QString& extra = {});
    static void info (const QString& tag, const QString& msg, const QString& extra = {});
    static void warn (const QString& tag, const QString& msg, const QString& extra = {});
    static void error(const QString& tag, const QString& msg, const QString& extra = {});
    static void critical(const QString& tag, const QString& msg, const QString& extra = {});

    // Drop rows older than maxAgeDays on the writer thread
    static void purgeOlderThan(int maxAgeDays);

signals:
    void appendRequested(const SystemLogEntry& e);
    void purgeRequested(const QDateTime& cutoff);

private:
	QThread* th = nullptr;
	syslog_detail::SystemLogWriter* wr = nullptr;

    explicit SystemLogger(QObject* parent=nullptr);
    ~SystemLogger() override;
};
