#include "store/schema_migration.hpp"

#include <cstdint>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

#include "store/sqlite_helpers.hpp"
#include "utils/common.hpp"

namespace aide::store {
namespace {

constexpr const char* kTasksColumns =
    "id INTEGER PRIMARY KEY AUTOINCREMENT,"
    "chat_id INTEGER NOT NULL,"
    "user_id INTEGER NOT NULL,"
    "username TEXT NOT NULL,"
    "text TEXT NOT NULL,"
    "attachments_json TEXT NOT NULL,"
    "status TEXT NOT NULL,"
    "created_at TEXT NOT NULL,"
    "started_at TEXT,"
    "finished_at TEXT,"
    "result_text TEXT,"
    "error_text TEXT";

// Current column -> expression used when the legacy table lacks it.
const std::vector<std::pair<std::string, std::string>>& CurrentColumns() {
    static const std::vector<std::pair<std::string, std::string>> columns = {
        {"id", "NULL"},
        {"chat_id", "0"},
        {"user_id", "0"},
        {"username", "''"},
        {"text", "''"},
        {"attachments_json", "'[]'"},
        {"status", "'pending'"},
        {"created_at", "''"},
        {"started_at", "NULL"},
        {"finished_at", "NULL"},
        {"result_text", "NULL"},
        {"error_text", "NULL"},
    };
    return columns;
}

std::unordered_set<std::string> TaskColumns(sqlite3* db) {
    std::unordered_set<std::string> columns;
    auto stmt = Prepare(db, "PRAGMA table_info(tasks);");
    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        columns.insert(ColumnText(stmt.get(), 1));
    }
    return columns;
}

bool TableExists(sqlite3* db, const std::string& name) {
    auto stmt = Prepare(db, "SELECT 1 FROM sqlite_master WHERE type = 'table' AND name = ?;");
    BindText(stmt.get(), 1, name);
    return sqlite3_step(stmt.get()) == SQLITE_ROW;
}

std::int64_t ReadSequence(sqlite3* db, const std::string& table) {
    if (!TableExists(db, "sqlite_sequence")) {
        return 0;
    }
    auto stmt = Prepare(db, "SELECT seq FROM sqlite_sequence WHERE name = ?;");
    BindText(stmt.get(), 1, table);
    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        return 0;
    }
    return sqlite3_column_int64(stmt.get(), 0);
}

void RestoreSequence(sqlite3* db, const std::string& table, std::int64_t high_water) {
    if (high_water <= 0) {
        return;
    }
    auto update = Prepare(db, "UPDATE sqlite_sequence SET seq = MAX(seq, ?) WHERE name = ?;");
    sqlite3_bind_int64(update.get(), 1, high_water);
    BindText(update.get(), 2, table);
    StepDone(db, update.get(), "restore task sequence");
    if (sqlite3_changes(db) > 0) {
        return;
    }
    auto insert = Prepare(db, "INSERT INTO sqlite_sequence(name, seq) VALUES(?, ?);");
    BindText(insert.get(), 1, table);
    sqlite3_bind_int64(insert.get(), 2, high_water);
    StepDone(db, insert.get(), "insert task sequence");
}

void MigrateLegacyTasks(sqlite3* db, const aide::utils::Logger& logger) {
    const auto legacy_columns = TaskColumns(db);
    std::vector<std::string> targets;
    std::vector<std::string> sources;
    for (const auto& [column, fallback] : CurrentColumns()) {
        targets.push_back(column);
        if (legacy_columns.count(column) == 0) {
            sources.push_back(fallback);
        } else if (fallback == "NULL") {
            sources.push_back(column);
        } else {
            sources.push_back("COALESCE(" + column + ", " + fallback + ")");
        }
    }

    Exec(db, "BEGIN IMMEDIATE;");
    try {
        const auto high_water = ReadSequence(db, "tasks");
        Exec(db, "DROP TABLE IF EXISTS tasks_v1;");
        Exec(db, std::string("CREATE TABLE tasks_v1 (") + kTasksColumns + ");");
        Exec(db,
             "INSERT INTO tasks_v1 (" + aide::utils::Join(targets, ", ") + ") "
             "SELECT " + aide::utils::Join(sources, ", ") + " FROM tasks ORDER BY id ASC;");
        const auto copied = sqlite3_changes(db);
        Exec(db, "DROP TABLE tasks;");
        Exec(db, "ALTER TABLE tasks_v1 RENAME TO tasks;");
        RestoreSequence(db, "tasks", high_water);
        Exec(db, "COMMIT;");
        logger.Log({aide::utils::LogLevel::kInfo,
                    "migrated legacy tasks table",
                    {{"rows", std::to_string(copied)}, {"sequence", std::to_string(high_water)}}});
    } catch (const StoreError&) {
        sqlite3_exec(db, "ROLLBACK;", nullptr, nullptr, nullptr);
        throw;
    }
}

}  // namespace

int ReadSchemaVersion(sqlite3* db) {
    auto stmt = Prepare(db, "PRAGMA user_version;");
    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        return 0;
    }
    return sqlite3_column_int(stmt.get(), 0);
}

bool HasLegacyTaskColumns(sqlite3* db) {
    const auto columns = TaskColumns(db);
    return columns.count("mode") > 0 || columns.count("inbox_path") > 0;
}

void UpgradeSchema(sqlite3* db, const aide::utils::Logger& logger) {
    const auto version = ReadSchemaVersion(db);
    if (version >= kSchemaVersion) {
        return;
    }
    if (TableExists(db, "tasks") && HasLegacyTaskColumns(db)) {
        MigrateLegacyTasks(db, logger);
    }
    Exec(db, std::string("CREATE TABLE IF NOT EXISTS tasks (") + kTasksColumns + ");");
    Exec(db, "CREATE INDEX IF NOT EXISTS idx_tasks_status_id ON tasks(status, id);");
    Exec(db, "CREATE TABLE IF NOT EXISTS meta ("
             "key TEXT PRIMARY KEY,"
             "value TEXT NOT NULL"
             ");");
    Exec(db, "PRAGMA user_version = " + std::to_string(kSchemaVersion) + ";");
    logger.Info("schema at version " + std::to_string(kSchemaVersion) +
                " (was " + std::to_string(version) + ")");
}

}  // namespace aide::store
