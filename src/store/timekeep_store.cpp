#include "store/timekeep_store.hpp"

#include <filesystem>
#include <iostream>

#include <QString>

#include <nlohmann/json.hpp>
#include <sqlite3.h>

#include "common/errors.hpp"
#include "common/logging.hpp"
#include "common/paths.hpp"

namespace timekeep {

namespace {

constexpr const char *kCreateProjectsTable =
    "CREATE TABLE IF NOT EXISTS projects ("
    "    id INTEGER PRIMARY KEY,"
    "    name TEXT NOT NULL UNIQUE"
    ");";

constexpr const char *kCreateEntriesTable =
    "CREATE TABLE IF NOT EXISTS entries ("
    "    id INTEGER PRIMARY KEY,"
    "    project_id INTEGER NOT NULL,"
    "    task TEXT NOT NULL,"
    "    notes TEXT,"
    "    start_ts TEXT NOT NULL,"
    "    end_ts TEXT,"
    "    duration_s INTEGER,"
    "    FOREIGN KEY(project_id) REFERENCES projects(id)"
    ");";

constexpr const char *kCreateStartIndex =
    "CREATE INDEX IF NOT EXISTS idx_entries_start ON entries(start_ts);";

constexpr const char *kCreateMetaTable =
    "CREATE TABLE IF NOT EXISTS meta ("
    "    key TEXT PRIMARY KEY,"
    "    value TEXT NOT NULL"
    ");";

constexpr const char *kSchemaVersion = "1";
constexpr int kBusyTimeoutMs = 2000;
constexpr const char *kUntitledTask = "(untitled)";

constexpr const char *kSelectEntryColumns =
    "SELECT e.id, e.project_id, p.name, e.task, e.notes, e.start_ts, "
    "e.end_ts, e.duration_s "
    "FROM entries e JOIN projects p ON e.project_id = p.id ";

std::string sqliteMessage(sqlite3 *db, const std::string &what)
{
    return what + ": " + sqlite3_errmsg(db);
}

class Statement {
public:
    Statement(sqlite3 *db, const std::string &sql)
        : m_db(db)
    {
        if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
            throw StorageError(sqliteMessage(db, "sqlite prepare failed"));
        }
    }

    ~Statement()
    {
        if (stmt) {
            sqlite3_finalize(stmt);
        }
    }

    sqlite3_stmt *get() const
    {
        return stmt;
    }

    // Steps a statement that must not return rows.
    void run(const char *what)
    {
        if (sqlite3_step(stmt) != SQLITE_DONE) {
            throw StorageError(sqliteMessage(m_db, what));
        }
    }

    // Steps a query; false once the result set is exhausted.
    bool next(const char *what)
    {
        const int rc = sqlite3_step(stmt);
        if (rc == SQLITE_ROW) {
            return true;
        }
        if (rc != SQLITE_DONE) {
            throw StorageError(sqliteMessage(m_db, what));
        }
        return false;
    }

private:
    sqlite3 *m_db = nullptr;
    sqlite3_stmt *stmt = nullptr;
};

void execOrThrow(sqlite3 *db, const char *sql)
{
    char *error = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &error) != SQLITE_OK) {
        std::string message = error ? error : "sqlite exec failed";
        sqlite3_free(error);
        throw StorageError(message);
    }
}

// BEGIN IMMEDIATE on construction, ROLLBACK on destruction unless committed.
class Transaction {
public:
    explicit Transaction(sqlite3 *db)
        : m_db(db)
    {
        execOrThrow(m_db, "BEGIN IMMEDIATE;");
    }

    ~Transaction()
    {
        if (m_committed) {
            return;
        }
        if (sqlite3_exec(m_db, "ROLLBACK;", nullptr, nullptr, nullptr) != SQLITE_OK) {
            std::cerr << "Timekeep: rollback failed: " << sqlite3_errmsg(m_db) << "\n";
        }
    }

    void commit()
    {
        execOrThrow(m_db, "COMMIT;");
        m_committed = true;
    }

private:
    sqlite3 *m_db = nullptr;
    bool m_committed = false;
};

void bindText(sqlite3_stmt *stmt, int index, const std::string &value)
{
    sqlite3_bind_text(stmt, index, value.c_str(), -1, SQLITE_TRANSIENT);
}

void bindOptionalText(sqlite3_stmt *stmt, int index, const std::optional<std::string> &value)
{
    if (!value) {
        sqlite3_bind_null(stmt, index);
        return;
    }
    bindText(stmt, index, *value);
}

void bindOptionalInt64(sqlite3_stmt *stmt, int index, const std::optional<int64_t> &value)
{
    if (!value) {
        sqlite3_bind_null(stmt, index);
        return;
    }
    sqlite3_bind_int64(stmt, index, *value);
}

std::string columnText(sqlite3_stmt *stmt, int index)
{
    const unsigned char *text = sqlite3_column_text(stmt, index);
    if (!text) {
        return {};
    }
    return reinterpret_cast<const char *>(text);
}

TimePoint columnTimestamp(sqlite3_stmt *stmt, int index)
{
    const std::string text = columnText(stmt, index);
    const auto parsed = fromLocalIso8601(text);
    if (!parsed) {
        throw StorageError("corrupt timestamp in database: '" + text + "'");
    }
    return *parsed;
}

std::string trimmed(const std::string &value)
{
    return QString::fromStdString(value).trimmed().toStdString();
}

TimeEntry readEntry(sqlite3_stmt *stmt)
{
    TimeEntry entry;
    entry.id = sqlite3_column_int64(stmt, 0);
    entry.projectId = sqlite3_column_int64(stmt, 1);
    entry.project = columnText(stmt, 2);
    entry.task = columnText(stmt, 3);
    entry.notes = columnText(stmt, 4);
    entry.start = columnTimestamp(stmt, 5);
    if (sqlite3_column_type(stmt, 6) != SQLITE_NULL) {
        entry.end = columnTimestamp(stmt, 6);
    }
    if (sqlite3_column_type(stmt, 7) != SQLITE_NULL) {
        entry.durationSeconds = sqlite3_column_int64(stmt, 7);
    }
    return entry;
}

ProjectId upsertProject(sqlite3 *db, const std::string &name)
{
    Statement insert(db, "INSERT OR IGNORE INTO projects (name) VALUES (?);");
    bindText(insert.get(), 1, name);
    insert.run("failed to insert project");

    Statement select(db, "SELECT id FROM projects WHERE name = ? LIMIT 1;");
    bindText(select.get(), 1, name);
    if (!select.next("failed to look up project")) {
        throw StorageError("project vanished after insert: " + name);
    }
    return sqlite3_column_int64(select.get(), 0);
}

// Closes every open entry at `end`. Returns the ids that were closed.
std::vector<EntryId> closeOpenEntries(sqlite3 *db, TimePoint end)
{
    std::vector<std::pair<EntryId, TimePoint>> open;
    {
        Statement select(db, "SELECT id, start_ts FROM entries WHERE end_ts IS NULL;");
        while (select.next("failed to read open entries")) {
            open.emplace_back(sqlite3_column_int64(select.get(), 0),
                              columnTimestamp(select.get(), 1));
        }
    }

    std::vector<EntryId> closed;
    for (const auto &[id, start] : open) {
        Statement update(db,
                         "UPDATE entries SET end_ts = ?, duration_s = ? "
                         "WHERE id = ? AND end_ts IS NULL;");
        bindText(update.get(), 1, toLocalIso8601(end));
        sqlite3_bind_int64(update.get(), 2, wholeSecondsBetween(start, end));
        sqlite3_bind_int64(update.get(), 3, id);
        update.run("failed to close running entry");
        closed.push_back(id);
    }
    return closed;
}

} // namespace

struct TimekeepStore::Impl {
    sqlite3 *db = nullptr;
    std::string path;
    Clock clock;

    // Closes the handle even when the store constructor throws half way.
    ~Impl()
    {
        if (db) {
            sqlite3_close(db);
        }
    }
};

TimekeepStore::TimekeepStore()
    : TimekeepStore(defaultDatabasePath().toStdString())
{
}

TimekeepStore::TimekeepStore(const std::string &dbPath, Clock clock)
    : impl(std::make_unique<Impl>())
{
    impl->path = dbPath;
    impl->clock = std::move(clock);

    const std::filesystem::path parent = std::filesystem::path(dbPath).parent_path();
    if (!parent.empty()) {
        std::error_code error;
        std::filesystem::create_directories(parent, error);
        if (error) {
            throw StorageError("failed to create data directory " + parent.string()
                               + ": " + error.message());
        }
    }

    if (sqlite3_open(dbPath.c_str(), &impl->db) != SQLITE_OK) {
        const std::string message = impl->db ? sqlite3_errmsg(impl->db) : "out of memory";
        throw StorageError("failed to open timekeep database " + dbPath + ": " + message);
    }

    sqlite3_busy_timeout(impl->db, kBusyTimeoutMs);
    execOrThrow(impl->db, "PRAGMA foreign_keys = ON;");
    execOrThrow(impl->db, kCreateProjectsTable);
    execOrThrow(impl->db, kCreateEntriesTable);
    execOrThrow(impl->db, kCreateStartIndex);
    execOrThrow(impl->db, kCreateMetaTable);

    if (!getMeta("schema_version")) {
        setMeta("schema_version", kSchemaVersion);
    }

    TIMEKEEP_LOG_DEBUG(QStringLiteral("TimekeepStore"),
                       QStringLiteral("TimekeepStore"),
                       QStringLiteral("store_open"),
                       QStringLiteral("process_start"),
                       QStringLiteral("sqlite_open"),
                       logging::defaultWho(),
                       QString(),
                       (nlohmann::json{{"path", dbPath}}));
}

TimekeepStore::~TimekeepStore() = default;

TimePoint TimekeepStore::now() const
{
    const TimePoint current = impl->clock ? impl->clock() : std::chrono::system_clock::now();
    return truncateToSeconds(current);
}

ProjectId TimekeepStore::upsertProjectByName(const std::string &name)
{
    const std::string projectName = trimmed(name);
    if (projectName.empty()) {
        throw ValidationError("Project name cannot be empty");
    }
    return upsertProject(impl->db, projectName);
}

std::vector<std::string> TimekeepStore::listProjectNames() const
{
    Statement stmt(impl->db,
                   "SELECT name FROM projects ORDER BY name COLLATE NOCASE, name;");

    std::vector<std::string> names;
    while (stmt.next("failed to list projects")) {
        names.push_back(columnText(stmt.get(), 0));
    }
    return names;
}

EntryId TimekeepStore::startEntry(const std::string &projectName,
                                  const std::string &task,
                                  const std::string &notes)
{
    const std::string project = trimmed(projectName);
    if (project.empty()) {
        throw ValidationError("Project name cannot be empty");
    }
    std::string taskText = trimmed(task);
    if (taskText.empty()) {
        taskText = kUntitledTask;
    }
    const std::string notesText = trimmed(notes);

    // One timestamp closes the previous entry and opens the next one.
    const TimePoint timestamp = now();

    Transaction tx(impl->db);
    const std::vector<EntryId> autoClosed = closeOpenEntries(impl->db, timestamp);
    const ProjectId projectId = upsertProject(impl->db, project);

    Statement insert(impl->db,
                     "INSERT INTO entries (project_id, task, notes, start_ts) "
                     "VALUES (?, ?, ?, ?);");
    sqlite3_bind_int64(insert.get(), 1, projectId);
    bindText(insert.get(), 2, taskText);
    bindText(insert.get(), 3, notesText);
    bindText(insert.get(), 4, toLocalIso8601(timestamp));
    insert.run("failed to insert entry");
    const EntryId id = sqlite3_last_insert_rowid(impl->db);
    tx.commit();

    // The auto-close and the start are one user action.
    logging::CorrelationScope corrScope;
    if (!autoClosed.empty()) {
        TIMEKEEP_LOG_INFO(QStringLiteral("TimekeepStore"),
                          QStringLiteral("startEntry"),
                          QStringLiteral("entry_auto_closed"),
                          QStringLiteral("new_entry_started"),
                          QStringLiteral("last_start_wins"),
                          logging::defaultWho(),
                          corrScope.id(),
                          (nlohmann::json{{"closed", autoClosed}, {"next", id}}));
    }
    TIMEKEEP_LOG_INFO(QStringLiteral("TimekeepStore"),
                      QStringLiteral("startEntry"),
                      QStringLiteral("entry_started"),
                      QStringLiteral("user_action"),
                      QStringLiteral("sqlite_insert"),
                      logging::defaultWho(),
                      corrScope.id(),
                      (nlohmann::json{{"id", id},
                                      {"project", project},
                                      {"start", toLocalIso8601(timestamp)}}));
    return id;
}

void TimekeepStore::stopEntry(EntryId id)
{
    Statement select(impl->db,
                     "SELECT start_ts FROM entries WHERE id = ? AND end_ts IS NULL;");
    sqlite3_bind_int64(select.get(), 1, id);
    if (!select.next("failed to read entry")) {
        TIMEKEEP_LOG_DEBUG(QStringLiteral("TimekeepStore"),
                           QStringLiteral("stopEntry"),
                           QStringLiteral("stop_ignored"),
                           QStringLiteral("missing_or_closed"),
                           QStringLiteral("noop"),
                           logging::defaultWho(),
                           QString(),
                           (nlohmann::json{{"id", id}}));
        return;
    }
    const TimePoint start = columnTimestamp(select.get(), 0);
    const TimePoint end = now();
    const int64_t duration = wholeSecondsBetween(start, end);

    Statement update(impl->db,
                     "UPDATE entries SET end_ts = ?, duration_s = ? "
                     "WHERE id = ? AND end_ts IS NULL;");
    bindText(update.get(), 1, toLocalIso8601(end));
    sqlite3_bind_int64(update.get(), 2, duration);
    sqlite3_bind_int64(update.get(), 3, id);
    update.run("failed to stop entry");

    TIMEKEEP_LOG_INFO(QStringLiteral("TimekeepStore"),
                      QStringLiteral("stopEntry"),
                      QStringLiteral("entry_stopped"),
                      QStringLiteral("user_action"),
                      QStringLiteral("sqlite_update"),
                      logging::defaultWho(),
                      QString(),
                      (nlohmann::json{{"id", id}, {"durationSeconds", duration}}));
}

void TimekeepStore::deleteEntry(EntryId id)
{
    Statement stmt(impl->db, "DELETE FROM entries WHERE id = ?;");
    sqlite3_bind_int64(stmt.get(), 1, id);
    stmt.run("failed to delete entry");

    TIMEKEEP_LOG_INFO(QStringLiteral("TimekeepStore"),
                      QStringLiteral("deleteEntry"),
                      QStringLiteral("entry_deleted"),
                      QStringLiteral("user_action"),
                      QStringLiteral("sqlite_delete"),
                      logging::defaultWho(),
                      QString(),
                      (nlohmann::json{{"id", id}, {"rows", sqlite3_changes(impl->db)}}));
}

void TimekeepStore::updateEntry(EntryId id,
                                const std::string &projectName,
                                const std::string &task,
                                const std::string &notes,
                                const std::string &start,
                                const std::optional<std::string> &end)
{
    const std::string project = trimmed(projectName);
    if (project.empty()) {
        throw ValidationError("Project name cannot be empty");
    }

    const auto startTs = fromLocalIso8601(start);
    if (!startTs) {
        throw ValidationError("Invalid start timestamp: '" + start + "'");
    }

    std::optional<TimePoint> endTs;
    if (end && !trimmed(*end).empty()) {
        endTs = fromLocalIso8601(*end);
        if (!endTs) {
            throw ValidationError("Invalid end timestamp: '" + *end + "'");
        }
    }

    std::string taskText = trimmed(task);
    if (taskText.empty()) {
        taskText = kUntitledTask;
    }

    std::optional<std::string> endText;
    std::optional<int64_t> duration;
    if (endTs) {
        endText = toLocalIso8601(*endTs);
        duration = wholeSecondsBetween(*startTs, *endTs);
    }

    Transaction tx(impl->db);

    {
        Statement exists(impl->db, "SELECT 1 FROM entries WHERE id = ? LIMIT 1;");
        sqlite3_bind_int64(exists.get(), 1, id);
        if (!exists.next("failed to read entry")) {
            return;
        }
    }

    if (!endTs) {
        Statement others(impl->db,
                         "SELECT COUNT(*) FROM entries WHERE end_ts IS NULL AND id != ?;");
        sqlite3_bind_int64(others.get(), 1, id);
        if (others.next("failed to count open entries")
            && sqlite3_column_int64(others.get(), 0) > 0) {
            TIMEKEEP_LOG_WARN(QStringLiteral("TimekeepStore"),
                              QStringLiteral("updateEntry"),
                              QStringLiteral("second_open_entry"),
                              QStringLiteral("user_edit_cleared_end"),
                              QStringLiteral("not_guarded"),
                              logging::defaultWho(),
                              QString(),
                              (nlohmann::json{{"id", id}}));
        }
    }

    const ProjectId projectId = upsertProject(impl->db, project);

    Statement update(impl->db,
                     "UPDATE entries SET project_id = ?, task = ?, notes = ?, "
                     "start_ts = ?, end_ts = ?, duration_s = ? WHERE id = ?;");
    sqlite3_bind_int64(update.get(), 1, projectId);
    bindText(update.get(), 2, taskText);
    bindText(update.get(), 3, trimmed(notes));
    bindText(update.get(), 4, toLocalIso8601(*startTs));
    bindOptionalText(update.get(), 5, endText);
    bindOptionalInt64(update.get(), 6, duration);
    sqlite3_bind_int64(update.get(), 7, id);
    update.run("failed to update entry");
    tx.commit();

    TIMEKEEP_LOG_INFO(QStringLiteral("TimekeepStore"),
                      QStringLiteral("updateEntry"),
                      QStringLiteral("entry_updated"),
                      QStringLiteral("user_edit"),
                      QStringLiteral("sqlite_update"),
                      logging::defaultWho(),
                      QString(),
                      (nlohmann::json{{"id", id},
                                      {"project", project},
                                      {"durationSeconds", duration ? nlohmann::json(*duration)
                                                                   : nlohmann::json()}}));
}

std::optional<TimeEntry> TimekeepStore::getRunningEntry() const
{
    Statement stmt(impl->db,
                   std::string(kSelectEntryColumns)
                       + "WHERE e.end_ts IS NULL "
                         "ORDER BY e.start_ts DESC, e.id DESC LIMIT 1;");
    if (!stmt.next("failed to read running entry")) {
        return std::nullopt;
    }
    return readEntry(stmt.get());
}

std::optional<TimeEntry> TimekeepStore::getEntry(EntryId id) const
{
    Statement stmt(impl->db,
                   std::string(kSelectEntryColumns) + "WHERE e.id = ? LIMIT 1;");
    sqlite3_bind_int64(stmt.get(), 1, id);
    if (!stmt.next("failed to read entry")) {
        return std::nullopt;
    }
    return readEntry(stmt.get());
}

std::vector<TimeEntry> TimekeepStore::getEntriesStartedBetween(
    TimePoint from,
    TimePoint to,
    const std::optional<std::string> &projectName) const
{
    std::string sql = std::string(kSelectEntryColumns)
        + "WHERE e.start_ts BETWEEN ? AND ?";
    if (projectName) {
        sql += " AND p.name = ?";
    }
    sql += " ORDER BY e.start_ts DESC, e.id DESC;";

    Statement stmt(impl->db, sql);
    bindText(stmt.get(), 1, toLocalIso8601(from));
    bindText(stmt.get(), 2, toLocalIso8601(to));
    if (projectName) {
        bindText(stmt.get(), 3, *projectName);
    }

    std::vector<TimeEntry> entries;
    while (stmt.next("failed to query entries")) {
        entries.push_back(readEntry(stmt.get()));
    }
    return entries;
}

std::vector<TimeEntry> TimekeepStore::getEntriesOverlapping(TimePoint from,
                                                            TimePoint to) const
{
    Statement stmt(impl->db,
                   std::string(kSelectEntryColumns)
                       + "WHERE e.start_ts <= ? AND (e.end_ts IS NULL OR e.end_ts >= ?) "
                         "ORDER BY e.start_ts ASC, e.id ASC;");
    bindText(stmt.get(), 1, toLocalIso8601(to));
    bindText(stmt.get(), 2, toLocalIso8601(from));

    std::vector<TimeEntry> entries;
    while (stmt.next("failed to query overlapping entries")) {
        entries.push_back(readEntry(stmt.get()));
    }
    return entries;
}

std::optional<std::string> TimekeepStore::getMeta(const std::string &key) const
{
    Statement stmt(impl->db, "SELECT value FROM meta WHERE key = ? LIMIT 1;");
    bindText(stmt.get(), 1, key);

    if (!stmt.next("failed to read meta value")) {
        return std::nullopt;
    }
    return columnText(stmt.get(), 0);
}

void TimekeepStore::setMeta(const std::string &key, const std::string &value)
{
    Statement stmt(impl->db, "INSERT OR REPLACE INTO meta (key, value) VALUES (?, ?);");
    bindText(stmt.get(), 1, key);
    bindText(stmt.get(), 2, value);
    stmt.run("failed to set meta value");
}

bool TimekeepStore::integrityCheck(std::string *message) const
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
    if (result != "ok") {
        TIMEKEEP_LOG_WARN(QStringLiteral("TimekeepStore"),
                          QStringLiteral("integrityCheck"),
                          QStringLiteral("integrity_check_failed"),
                          QStringLiteral("sqlite_pragma"),
                          QStringLiteral("integrity_check"),
                          logging::defaultWho(),
                          QString(),
                          (nlohmann::json{{"path", impl->path}, {"result", result}}));
        return false;
    }
    return true;
}

} // namespace timekeep
