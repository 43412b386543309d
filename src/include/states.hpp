#pragma once
#include <QObject>
#include <QString>

namespace States {
	enum class DeviceEvent     { Online, Offline };
	enum class OperationKind   { Build, Flash };
	enum class OperationStatus { Pending, Running, Success, Failed };

	inline QString toString(DeviceEvent e)
	{
		return e == DeviceEvent::Online ? QStringLiteral("online") : QStringLiteral("offline");
	}

	inline QString toString(OperationKind k)
	{
		return k == OperationKind::Build ? QStringLiteral("build") : QStringLiteral("flash");
	}

	inline QString toString(OperationStatus s)
	{
		switch (s) {
			case OperationStatus::Pending: return QStringLiteral("pending");
			case OperationStatus::Running: return QStringLiteral("running");
			case OperationStatus::Success: return QStringLiteral("success");
			case OperationStatus::Failed:  return QStringLiteral("failed");
		}
		return QStringLiteral("unknown");
	}

	inline bool isTerminal(OperationStatus s)
	{
		return s == OperationStatus::Success || s == OperationStatus::Failed;
	}
}

Q_DECLARE_METATYPE(States::DeviceEvent)
Q_DECLARE_METATYPE(States::OperationStatus)
