#include "OperationTracker.hpp"

#include <QMutexLocker>
#include <QUuid>

#include "logger.hpp"

using States::OperationStatus;

OperationTracker::OperationTracker() : limits_(Limits{}) {}

OperationTracker::OperationTracker(Limits limits) : limits_(limits)
{
		if (limits_.maxEntries < 1) limits_.maxEntries = 1;
}

bool OperationTracker::isLegalTransition(OperationStatus from, OperationStatus to)
{
		if (from == to)
				return !States::isTerminal(from);
		switch (from) {
			case OperationStatus::Pending:
					// failed straight from pending is an abort before the work started
					return to == OperationStatus::Running || to == OperationStatus::Failed;
			case OperationStatus::Running:
					return States::isTerminal(to);
			case OperationStatus::Success:
			case OperationStatus::Failed:
					return false;
		}
		return false;
}

QString OperationTracker::newId_() const
{
		QString id;
		do {
				id = QUuid::createUuid().toString(QUuid::Id128).left(8);
		} while (ops_.contains(id));
		return id;
}

Operation OperationTracker::create(States::OperationKind kind, const QString& deviceName)
{
		QMutexLocker lock(&mutex_);

		const QDateTime now = QDateTime::currentDateTimeUtc();
		evictLocked_(now, 1);

		Operation op;
		op.id         = newId_();
		op.kind       = kind;
		op.status     = OperationStatus::Pending;
		op.deviceName = deviceName;
		op.createdAt  = now;
		op.updatedAt  = now;

		ops_.insert(op.id, op);
		order_.append(op.id);
		return op;
}

std::optional<Operation> OperationTracker::get(const QString& id) const
{
		QMutexLocker lock(&mutex_);
		auto it = ops_.constFind(id);
		if (it == ops_.cend())
				return std::nullopt;
		return it.value();
}

QList<Operation> OperationTracker::list() const
{
		QMutexLocker lock(&mutex_);
		QList<Operation> out;
		out.reserve(order_.size());
		for (const QString& id : order_)
				out.append(ops_.value(id));
		return out;
}

bool OperationTracker::update(const QString& id, const Mutator& mutator)
{
		QMutexLocker lock(&mutex_);

		auto it = ops_.find(id);
		if (it == ops_.end()) {
				LOG_WARN(QString("unknown operation %1").arg(id));
				return false;
		}

		const Operation before = it.value();
		Operation after = before;
		if (mutator) mutator(after);

		if (after.status != before.status && !isLegalTransition(before.status, after.status)) {
				LOG_WARN(QString("operation %1: rejected %2 -> %3")
						 .arg(id, States::toString(before.status), States::toString(after.status)));
				return false;
		}
		if (after.status == before.status && States::isTerminal(before.status)) {
				LOG_WARN(QString("operation %1 is already %2").arg(id, States::toString(before.status)));
				return false;
		}

		// Identity fields are owned by the tracker
		after.id        = before.id;
		after.kind      = before.kind;
		after.createdAt = before.createdAt;
		after.progress  = qBound(before.progress, after.progress, 100);
		after.updatedAt = QDateTime::currentDateTimeUtc();

		it.value() = after;
		return true;
}

int OperationTracker::evictExpired(const QDateTime& now)
{
		QMutexLocker lock(&mutex_);
		return evictLocked_(now, 0);
}

int OperationTracker::evictLocked_(const QDateTime& now, int reserve)
{
		int evicted = 0;

		for (int i = 0; i < order_.size();) {
				const Operation& op = ops_[order_[i]];
				if (States::isTerminal(op.status) && op.updatedAt.secsTo(now) > limits_.maxAgeSecs) {
						ops_.remove(order_[i]);
						order_.removeAt(i);
						++evicted;
				} else {
						++i;
				}
		}

		// Oldest terminal first
		for (int i = 0; ops_.size() + reserve > limits_.maxEntries && i < order_.size();) {
				if (States::isTerminal(ops_[order_[i]].status)) {
						ops_.remove(order_[i]);
						order_.removeAt(i);
						++evicted;
				} else {
						++i;
				}
		}

		if (evicted > 0)
				LOG_DEBUG(QString("evicted %1 operation(s)").arg(evicted));
		return evicted;
}
