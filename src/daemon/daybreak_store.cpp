#include "daemon/daybreak_store.hpp"

#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <random>
#include <sstream>
#include <stdexcept>

#include <sqlite3.h>

#include "common/logging.hpp"

namespace daybreak {

namespace {

constexpr const char *kCreateKvTable =
    "CREATE TABLE IF NOT EXISTS kv ("
    "    key TEXT PRIMARY KEY,"
    "    value TEXT NOT NULL"
    ");";

constexpr const char *kCreateRecordsTable =
    "CREATE TABLE IF NOT EXISTS records ("
    "    store TEXT NOT NULL,"
    "    id TEXT NOT NULL,"
    "    date TEXT,"
    "    body TEXT NOT NULL,"
    "    PRIMARY KEY (store, id)"
    ");";

constexpr const char *kCreateRecordsDateIndex =
    "CREATE INDEX IF NOT EXISTS records_store_date ON records (store, date);";

const std::vector<std::string> &knownStores()
{
    static const std::vector<std::string> names = {
        stores::kChecklistItems,
        stores::kTodos,
        stores::kMeetings,
        stores::kJournals,
    };
    return names;
}

void requireKnownStore(const std::string &storeName)
{
    const auto &names = knownStores();
    if (std::find(names.begin(), names.end(), storeName) == names.end()) {
        throw std::runtime_error("unknown store: " + storeName);
    }
}

class Statement {
public:
    Statement(sqlite3 *db, const char *sql)
    {
        if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            throw std::runtime_error(std::string("sqlite prepare failed: ")
                                     + sqlite3_errmsg(db));
        }
    }

    ~Statement()
    {
        if (stmt) {
            sqlite3_finalize(stmt);
        }
    }

    Statement(const Statement &) = delete;
    Statement &operator=(const Statement &) = delete;

    sqlite3_stmt *get() const
    {
        return stmt;
    }

private:
    sqlite3_stmt *stmt = nullptr;
};

void execOrThrow(sqlite3 *db, const char *sql)
{
    char *error = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &error) != SQLITE_OK) {
        std::string message = error ? error : "sqlite exec failed";
        sqlite3_free(error);
        throw std::runtime_error(message);
    }
}

void bindText(sqlite3_stmt *stmt, int index, const std::string &value)
{
    sqlite3_bind_text(stmt, index, value.c_str(), -1, SQLITE_TRANSIENT);
}

void bindOptionalText(sqlite3_stmt *stmt, int index, const std::string &value)
{
    if (value.empty()) {
        sqlite3_bind_null(stmt, index);
        return;
    }
    bindText(stmt, index, value);
}

std::string columnText(sqlite3_stmt *stmt, int index)
{
    const unsigned char *text = sqlite3_column_text(stmt, index);
    if (!text) {
        return {};
    }
    return reinterpret_cast<const char *>(text);
}

std::string generateUuid()
{
    std::random_device rd;
    std::mt19937_64 gen(rd());
    std::uniform_int_distribution<uint64_t> dist;

    const uint64_t part1 = dist(gen);
    const uint64_t part2 = dist(gen);

    std::ostringstream out;
    out << std::hex;
    out << (part1 >> 32);
    out << "-";
    out << ((part1 >> 16) & 0xFFFF);
    out << "-";
    out << (part1 & 0xFFFF);
    out << "-";
    out << (part2 >> 48);
    out << "-";
    out << (part2 & 0xFFFFFFFFFFFFULL);
    return out.str();
}

// Rows whose body no longer parses are skipped rather than failing the
// whole read; the reset phases treat the store as best-effort input.
std::optional<nlohmann::json> parseBody(const std::string &storeName,
                                        const std::string &id,
                                        const std::string &body)
{
    try {
        nlohmann::json parsed = nlohmann::json::parse(body);
        if (parsed.is_object()) {
            return parsed;
        }
    } catch (const nlohmann::json::parse_error &) {
    }
    DLOG_WARN(QStringLiteral("DaybreakStore"),
              QStringLiteral("getAllFromStore"),
              QStringLiteral("record_unreadable"),
              QStringLiteral("corrupt_json"),
              QStringLiteral("skip_record"),
              logging::defaultWho(),
              QString(),
              (nlohmann::json{{"store", storeName}, {"id", id}}));
    return std::nullopt;
}

// A busy or locked database ends the loop early; that must not read as a
// shorter store.
std::vector<nlohmann::json> readRecords(sqlite3 *db,
                                        sqlite3_stmt *stmt,
                                        const std::string &storeName)
{
    std::vector<nlohmann::json> records;
    int rc = sqlite3_step(stmt);
    while (rc == SQLITE_ROW) {
        auto record = parseBody(storeName, columnText(stmt, 0),
                                columnText(stmt, 1));
        if (record) {
            records.push_back(std::move(*record));
        }
        rc = sqlite3_step(stmt);
    }
    if (rc != SQLITE_DONE) {
        throw std::runtime_error("failed to read records from " + storeName
                                 + ": " + sqlite3_errmsg(db));
    }
    return records;
}

std::string dateColumnValue(const nlohmann::json &record)
{
    auto it = record.find("date");
    if (it == record.end() || !it->is_string()) {
        return {};
    }
    return it->get<std::string>();
}

} // namespace

struct DaybreakStore::Impl {
    sqlite3 *db = nullptr;

    ~Impl()
    {
        if (db) {
            sqlite3_close(db);
            db = nullptr;
        }
    }

    void open(const std::filesystem::path &dbPath)
    {
        if (dbPath.has_parent_path()) {
            std::filesystem::create_directories(dbPath.parent_path());
        }
        if (sqlite3_open(dbPath.string().c_str(), &db) != SQLITE_OK) {
            const std::string message = db ? sqlite3_errmsg(db) : "out of memory";
            if (db) {
                sqlite3_close(db);
                db = nullptr;
            }
            throw std::runtime_error("failed to open daybreak database: " + message);
        }

        execOrThrow(db, kCreateKvTable);
        execOrThrow(db, kCreateRecordsTable);
        execOrThrow(db, kCreateRecordsDateIndex);
    }
};

DaybreakStore::DaybreakStore()
    : DaybreakStore(defaultDbPath())
{
}

DaybreakStore::DaybreakStore(const std::filesystem::path &dbPath)
    : impl(std::make_unique<Impl>())
{
    impl->open(dbPath);
}

DaybreakStore::~DaybreakStore() = default;

std::filesystem::path DaybreakStore::defaultDbPath()
{
    const char *home = std::getenv("HOME");
    std::filesystem::path basePath = home ? home : ".";
    basePath /= ".local/share/daybreak";
    return basePath / "daybreak.db";
}

std::optional<nlohmann::json> DaybreakStore::get(const std::string &key) const
{
    Statement stmt(impl->db, "SELECT value FROM kv WHERE key = ? LIMIT 1;");
    bindText(stmt.get(), 1, key);

    const int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_DONE) {
        return std::nullopt;
    }
    if (rc != SQLITE_ROW) {
        throw std::runtime_error("failed to read value for " + key + ": "
                                 + sqlite3_errmsg(impl->db));
    }

    const std::string text = columnText(stmt.get(), 0);
    try {
        return nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error &) {
        DLOG_WARN(QStringLiteral("DaybreakStore"),
                  QStringLiteral("get"),
                  QStringLiteral("value_unreadable"),
                  QStringLiteral("corrupt_json"),
                  QStringLiteral("treat_as_missing"),
                  logging::defaultWho(),
                  QString(),
                  (nlohmann::json{{"key", key}}));
        return std::nullopt;
    }
}

void DaybreakStore::set(const std::string &key, const nlohmann::json &value)
{
    Statement stmt(impl->db,
                   "INSERT OR REPLACE INTO kv (key, value) VALUES (?, ?);");
    bindText(stmt.get(), 1, key);
    bindText(stmt.get(), 2, value.dump());

    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        throw std::runtime_error("failed to set value for " + key);
    }
}

void DaybreakStore::remove(const std::string &key)
{
    Statement stmt(impl->db, "DELETE FROM kv WHERE key = ?;");
    bindText(stmt.get(), 1, key);

    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        throw std::runtime_error("failed to remove value for " + key);
    }
}

std::vector<nlohmann::json> DaybreakStore::getAllFromStore(
    const std::string &storeName) const
{
    requireKnownStore(storeName);
    Statement stmt(impl->db,
                   "SELECT id, body FROM records WHERE store = ? ORDER BY id;");
    bindText(stmt.get(), 1, storeName);

    return readRecords(impl->db, stmt.get(), storeName);
}

std::vector<nlohmann::json> DaybreakStore::getAllFromStore(
    const std::string &storeName,
    const std::string &field,
    const nlohmann::json &value) const
{
    requireKnownStore(storeName);

    // Date lookups use the indexed column; other fields are matched on the
    // parsed body.
    if (field == "date" && value.is_string()) {
        Statement stmt(impl->db,
                       "SELECT id, body FROM records WHERE store = ? AND date = ? "
                       "ORDER BY id;");
        bindText(stmt.get(), 1, storeName);
        bindText(stmt.get(), 2, value.get<std::string>());

        return readRecords(impl->db, stmt.get(), storeName);
    }

    std::vector<nlohmann::json> records = getAllFromStore(storeName);
    records.erase(std::remove_if(records.begin(), records.end(),
                                 [&](const nlohmann::json &record) {
                                     auto it = record.find(field);
                                     return it == record.end() || *it != value;
                                 }),
                  records.end());
    return records;
}

nlohmann::json DaybreakStore::saveToStore(const std::string &storeName,
                                          nlohmann::json record)
{
    requireKnownStore(storeName);
    if (!record.is_object()) {
        throw std::runtime_error("record for " + storeName + " is not an object");
    }

    auto idIt = record.find("id");
    if (idIt == record.end() || !idIt->is_string() || idIt->get<std::string>().empty()) {
        record["id"] = generateUuid();
    }
    const std::string id = record.at("id").get<std::string>();

    Statement stmt(impl->db,
                   "INSERT OR REPLACE INTO records (store, id, date, body) "
                   "VALUES (?, ?, ?, ?);");
    bindText(stmt.get(), 1, storeName);
    bindText(stmt.get(), 2, id);
    bindOptionalText(stmt.get(), 3, dateColumnValue(record));
    bindText(stmt.get(), 4, record.dump());

    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        throw std::runtime_error("failed to save record " + id + " to " + storeName);
    }
    return record;
}

void DaybreakStore::deleteFromStore(const std::string &storeName,
                                    const std::string &id)
{
    requireKnownStore(storeName);
    Statement stmt(impl->db, "DELETE FROM records WHERE store = ? AND id = ?;");
    bindText(stmt.get(), 1, storeName);
    bindText(stmt.get(), 2, id);

    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        throw std::runtime_error("failed to delete record " + id + " from " + storeName);
    }
}

void DaybreakStore::clearStore(const std::string &storeName)
{
    requireKnownStore(storeName);
    Statement stmt(impl->db, "DELETE FROM records WHERE store = ?;");
    bindText(stmt.get(), 1, storeName);

    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        throw std::runtime_error("failed to clear store " + storeName);
    }
}

bool DaybreakStore::integrityCheck(std::string *message) const
{
    Statement stmt(impl->db, "PRAGMA integrity_check;");

    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        if (message) {
            *message = "integrity_check failed to return a result";
        }
        return false;
    }

    const std::string result = columnText(stmt.get(), 0);
    if (message) {
        *message = result;
    }
    return result == "ok";
}

std::size_t DaybreakStore::countRecords(const std::string &storeName) const
{
    requireKnownStore(storeName);
    Statement stmt(impl->db, "SELECT COUNT(*) FROM records WHERE store = ?;");
    bindText(stmt.get(), 1, storeName);

    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        throw std::runtime_error("failed to count records in " + storeName);
    }
    return static_cast<std::size_t>(sqlite3_column_int64(stmt.get(), 0));
}

} // namespace daybreak
