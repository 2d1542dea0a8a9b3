#pragma once

#include <string>

#include <nlohmann/json.hpp>

namespace ccmonitor {

// Persistence boundary for the plain snapshot record read by the display client.
class SnapshotWriter
{
public:
    virtual ~SnapshotWriter() = default;

    // Never throws; false means the record was not persisted.
    virtual bool write(const nlohmann::json &record) = 0;
};

// Writes the record atomically (temp file + rename) to a fixed path.
class DataFileWriter : public SnapshotWriter
{
public:
    explicit DataFileWriter(std::string path);

    bool write(const nlohmann::json &record) override;

    const std::string &path() const;

private:
    std::string m_path;
};

} // namespace ccmonitor
