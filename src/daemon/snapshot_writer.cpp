#include "daemon/snapshot_writer.hpp"

#include <QDir>
#include <QFileInfo>
#include <QSaveFile>
#include <QString>

#include "common/logging.hpp"

namespace ccmonitor {

namespace {

void logWriteFailure(const std::string &path, const std::string &error)
{
    CMLOG_WARN(QStringLiteral("DataFileWriter"),
               QStringLiteral("write"),
               QStringLiteral("data_file_write_failed"),
               QStringLiteral("collection_cycle"),
               QStringLiteral("atomic_save"),
               ccmonitor::logging::defaultWho(),
               QString(),
               nlohmann::json{{"path", path}, {"error", error}});
}

} // namespace

DataFileWriter::DataFileWriter(std::string path)
    : m_path(std::move(path))
{
}

const std::string &DataFileWriter::path() const
{
    return m_path;
}

bool DataFileWriter::write(const nlohmann::json &record)
{
    std::string payload;
    try {
        payload = record.dump(2);
    } catch (const nlohmann::json::exception &ex) {
        logWriteFailure(m_path, ex.what());
        return false;
    }

    const QString path = QString::fromStdString(m_path);
    if (!QDir().mkpath(QFileInfo(path).absolutePath())) {
        logWriteFailure(m_path, "cannot create parent directory");
        return false;
    }

    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        logWriteFailure(m_path, file.errorString().toStdString());
        return false;
    }

    const QByteArray bytes = QByteArray::fromStdString(payload);
    if (file.write(bytes) != bytes.size()) {
        logWriteFailure(m_path, file.errorString().toStdString());
        file.cancelWriting();
        return false;
    }

    if (!file.commit()) {
        logWriteFailure(m_path, file.errorString().toStdString());
        return false;
    }
    return true;
}

} // namespace ccmonitor
