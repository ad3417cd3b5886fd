#pragma once

#include <memory>
#include <stdexcept>
#include <string>

#include "sqlite3.h"

namespace aide::store {

class StoreError : public std::runtime_error {
public:
    explicit StoreError(const std::string& what) : std::runtime_error(what) {}
};

struct StatementDeleter {
    void operator()(sqlite3_stmt* stmt) const { sqlite3_finalize(stmt); }
};

using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

// All helpers throw StoreError with the SQLite message attached.
Statement Prepare(sqlite3* db, const std::string& sql);
void Exec(sqlite3* db, const std::string& sql);
// Steps a statement that is not expected to return rows.
void StepDone(sqlite3* db, sqlite3_stmt* stmt, const char* what);
void BindText(sqlite3_stmt* stmt, int index, const std::string& value);

std::string SafeText(const unsigned char* text);
std::string ColumnText(sqlite3_stmt* stmt, int column);

}  // namespace aide::store
