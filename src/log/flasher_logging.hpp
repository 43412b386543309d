#pragma once
#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(LC_SCAN)
Q_DECLARE_LOGGING_CATEGORY(LC_DISCOVER)
Q_DECLARE_LOGGING_CATEGORY(LC_OTA)
Q_DECLARE_LOGGING_CATEGORY(LC_STORE)
