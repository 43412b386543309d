#pragma once
#include <QList>
#include <QMap>
#include <QMutex>
#include <QString>
#include <optional>

#include "include/flasher_params.hpp"
#include "include/types.hpp"

// Durable journal of online/offline transitions.
// Document: {"last_status": {name: event}, "logs": [{timestamp, board_name, event, details}]}
// A device whose event equals last_status[name] is not written again.
class StatusTransitionLog {
public:
		explicit StatusTransitionLog(QString filePath, int maxEntries = flasher::STATUS_LOG_MAX_ENTRIES);

		// Returns true when a new entry was appended. *persisted (optional)
		// reports whether the document reached the disk. An existing file that
		// cannot be read is left untouched: nothing is appended, *persisted is false.
		bool recordIfChanged(const QString& deviceName, States::DeviceEvent event,
							 const QString& details, bool* persisted = nullptr);

		// Newest first, optionally only one device, at most limit entries
		QList<StatusLogEntry> query(int limit, const QString& deviceName = QString()) const;

		QMap<QString, QString> lastStatuses() const;

		const QString& filePath() const { return path_; }

private:
		struct Document {
				QMap<QString, QString> lastStatus;
				QList<StatusLogEntry> logs;
		};

		// nullopt when the file exists but cannot be opened or parsed
		std::optional<Document> load_() const;
		bool save_(const Document& doc) const;

		QString path_;
		int maxEntries_;
		mutable QMutex mutex_;
};
