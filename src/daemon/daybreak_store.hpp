#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "daemon/document_store.hpp"

namespace daybreak {

// DaybreakStore is the SQLite access layer behind DocumentStore. Key/value
// entries live in the kv table; records live in the records table as JSON
// bodies with their date pulled out into an indexed column.
class DaybreakStore : public DocumentStore {
public:
    // Opens $HOME/.local/share/daybreak/daybreak.db.
    DaybreakStore();
    explicit DaybreakStore(const std::filesystem::path &dbPath);
    ~DaybreakStore() override;

    static std::filesystem::path defaultDbPath();

    std::optional<nlohmann::json> get(const std::string &key) const override;
    void set(const std::string &key, const nlohmann::json &value) override;
    void remove(const std::string &key) override;

    std::vector<nlohmann::json> getAllFromStore(
        const std::string &storeName) const override;
    std::vector<nlohmann::json> getAllFromStore(
        const std::string &storeName,
        const std::string &field,
        const nlohmann::json &value) const override;

    nlohmann::json saveToStore(const std::string &storeName,
                               nlohmann::json record) override;
    void deleteFromStore(const std::string &storeName,
                         const std::string &id) override;
    void clearStore(const std::string &storeName) override;

    bool integrityCheck(std::string *message) const;
    std::size_t countRecords(const std::string &storeName) const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl;
};

} // namespace daybreak
