#pragma once

#include "sqlite3.h"
#include "utils/logging.hpp"

namespace aide::store {

// Version 1: tasks table without the legacy `mode` / `inbox_path` columns, plus meta.
constexpr int kSchemaVersion = 1;

int ReadSchemaVersion(sqlite3* db);
bool HasLegacyTaskColumns(sqlite3* db);

// Brings the database to kSchemaVersion; a no-op when it is already there.
// A legacy tasks table is rebuilt in the current shape inside one transaction,
// keeping row ids and the AUTOINCREMENT high-water mark. Throws StoreError.
void UpgradeSchema(sqlite3* db, const aide::utils::Logger& logger);

}  // namespace aide::store
