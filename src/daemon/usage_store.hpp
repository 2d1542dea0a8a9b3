#pragma once

#include <memory>
#include <optional>
#include <string>

namespace ccmonitor {

// UsageStore is the SQLite access layer for state that must survive daemon
// restarts, such as the largest token count seen in one usage session.
class UsageStore {
public:
    UsageStore();
    ~UsageStore();

    UsageStore(const UsageStore &) = delete;
    UsageStore &operator=(const UsageStore &) = delete;

    std::optional<std::string> getMeta(const std::string &key) const;
    void setMeta(const std::string &key, const std::string &value);

    bool integrityCheck(std::string *message) const;

    // $HOME/.local/share/ccmonitor/ccmonitor.db
    static std::string databasePath();

private:
    struct Impl;
    std::unique_ptr<Impl> impl;
};

} // namespace ccmonitor
