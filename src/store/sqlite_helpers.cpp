#include "store/sqlite_helpers.hpp"

namespace aide::store {

Statement Prepare(sqlite3* db, const std::string& sql) {
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        sqlite3_finalize(stmt);
        throw StoreError("sqlite prepare failed: " + std::string(sqlite3_errmsg(db)) + " [" + sql + "]");
    }
    return Statement(stmt);
}

void Exec(sqlite3* db, const std::string& sql) {
    char* err = nullptr;
    const auto rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::string message = err ? err : sqlite3_errmsg(db);
        sqlite3_free(err);
        throw StoreError("sqlite exec failed: " + message + " [" + sql + "]");
    }
}

void StepDone(sqlite3* db, sqlite3_stmt* stmt, const char* what) {
    const auto rc = sqlite3_step(stmt);
    if (rc != SQLITE_DONE) {
        throw StoreError(std::string(what) + ": " + sqlite3_errmsg(db));
    }
}

void BindText(sqlite3_stmt* stmt, int index, const std::string& value) {
    sqlite3_bind_text(stmt, index, value.c_str(), -1, SQLITE_TRANSIENT);
}

std::string SafeText(const unsigned char* text) {
    return text ? reinterpret_cast<const char*>(text) : std::string();
}

std::string ColumnText(sqlite3_stmt* stmt, int column) {
    return SafeText(sqlite3_column_text(stmt, column));
}

}  // namespace aide::store
