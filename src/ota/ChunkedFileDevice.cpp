#include "ChunkedFileDevice.hpp"

ChunkedFileDevice::ChunkedFileDevice(const QString& path, qint64 chunkSize, QObject* parent)
		: QIODevice(parent), file_(path), chunkSize_(qMax<qint64>(1, chunkSize))
{
}

bool ChunkedFileDevice::open(OpenMode mode)
{
		if (mode & QIODevice::WriteOnly)
				return false;
		if (!file_.open(QIODevice::ReadOnly))
				return false;
		bytesRead_ = 0;
		return QIODevice::open(QIODevice::ReadOnly | QIODevice::Unbuffered);
}

void ChunkedFileDevice::close()
{
		file_.close();
		QIODevice::close();
}

qint64 ChunkedFileDevice::size() const
{
		return file_.size();
}

bool ChunkedFileDevice::seek(qint64 pos)
{
		if (!file_.seek(pos))
				return false;
		bytesRead_ = pos;
		return QIODevice::seek(pos);
}

qint64 ChunkedFileDevice::readData(char* data, qint64 maxlen)
{
		const qint64 n = file_.read(data, qMin(maxlen, chunkSize_));
		if (n > 0) {
				bytesRead_ += n;
				emit chunkRead(bytesRead_, file_.size());
		}
		return n;
}
