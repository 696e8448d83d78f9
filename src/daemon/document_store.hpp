#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace daybreak {

// Named record stores and keys shared with the tracker's other collaborators.
namespace stores {
constexpr const char *kChecklistItems = "checklistItems";
constexpr const char *kTodos = "todos";
constexpr const char *kMeetings = "meetings";
constexpr const char *kJournals = "journals";
} // namespace stores

namespace keys {
constexpr const char *kResetBookkeeping = "reset_bookkeeping";
constexpr const char *kAppSettings = "app_settings";
constexpr const char *kCustomChecklistItems = "checklist-custom-items";
constexpr const char *kSessionState = "daily_reset_session";
constexpr const char *kTimeZone = "app_timezone";
} // namespace keys

// DocumentStore is the persistence collaborator the reset engine runs
// against: a key/value area plus named stores of JSON records keyed by "id".
// Implementations report failures by throwing std::runtime_error; a missing
// key or empty store is never reported for a read that did not complete.
class DocumentStore {
public:
    virtual ~DocumentStore() = default;

    virtual std::optional<nlohmann::json> get(const std::string &key) const = 0;
    virtual void set(const std::string &key, const nlohmann::json &value) = 0;
    virtual void remove(const std::string &key) = 0;

    virtual std::vector<nlohmann::json> getAllFromStore(
        const std::string &storeName) const = 0;
    // Records whose top-level 'field' equals 'value'.
    virtual std::vector<nlohmann::json> getAllFromStore(
        const std::string &storeName,
        const std::string &field,
        const nlohmann::json &value) const = 0;

    // Upsert by "id"; a record without an id is assigned one. Returns the
    // record as stored.
    virtual nlohmann::json saveToStore(const std::string &storeName,
                                       nlohmann::json record) = 0;
    virtual void deleteFromStore(const std::string &storeName,
                                 const std::string &id) = 0;
    virtual void clearStore(const std::string &storeName) = 0;
};

} // namespace daybreak
