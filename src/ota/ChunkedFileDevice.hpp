#pragma once
#include <QFile>
#include <QIODevice>

// Read-only view of a firmware file that hands out at most chunkSize bytes
// per read, so the network stack pulls the image in fixed-size pieces.
class ChunkedFileDevice : public QIODevice {
		Q_OBJECT
public:
		ChunkedFileDevice(const QString& path, qint64 chunkSize, QObject* parent = nullptr);

		bool open(OpenMode mode) override;
		void close() override;
		bool isSequential() const override { return false; }
		qint64 size() const override;
		bool seek(qint64 pos) override;

		QString errorText() const { return file_.errorString(); }

signals:
		void chunkRead(qint64 totalRead, qint64 totalSize);

protected:
		qint64 readData(char* data, qint64 maxlen) override;
		qint64 writeData(const char*, qint64) override { return -1; }

private:
		QFile file_;
		qint64 chunkSize_;
		qint64 bytesRead_ = 0;
};
