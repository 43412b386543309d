#pragma once
#include <functional>
#include <optional>

#include <QList>
#include <QMap>
#include <QMutex>
#include <QString>
#include <QStringList>

#include "include/flasher_params.hpp"
#include "include/types.hpp"

// In-memory store of build/flash operations.
// pending -> running -> {success, failed}; terminal states are sinks and
// progress never decreases. Terminal operations past maxAgeSecs, and the
// oldest terminal ones beyond maxEntries, are evicted. Pending/running
// operations are never evicted.
class OperationTracker {
public:
		struct Limits {
				int maxEntries = flasher::OPERATION_MAX_ENTRIES;
				qint64 maxAgeSecs = flasher::OPERATION_MAX_AGE_SEC;
		};

		using Mutator = std::function<void(Operation&)>;

		OperationTracker();
		explicit OperationTracker(Limits limits);

		Operation create(States::OperationKind kind, const QString& deviceName);

		std::optional<Operation> get(const QString& id) const;
		QList<Operation> list() const;			// creation order

		// Applies mutator to a copy and commits it if the transition is legal.
		// Returns false for an unknown id or a rejected transition.
		bool update(const QString& id, const Mutator& mutator);

		// Returns the number of evicted operations
		int evictExpired(const QDateTime& now = QDateTime::currentDateTimeUtc());

		static bool isLegalTransition(States::OperationStatus from, States::OperationStatus to);

private:
		int evictLocked_(const QDateTime& now, int reserve);
		QString newId_() const;

		Limits limits_;
		QMap<QString, Operation> ops_;
		QStringList order_;
		mutable QMutex mutex_;
};
