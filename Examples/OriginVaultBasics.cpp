#include <sqlite3.h>
#include <filesystem>
#include <string>

#include "OriginVaultCore.h"

using namespace OriginVault::Core;

static bool exec(sqlite3* db, const char* sql) {
    char* err = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        ORIGINVAULT_LOG_ERROR(std::string("SQL failed: ") + (err ? err : "?") + " in " + sql);
        sqlite3_free(err);
        return false;
    }
    return true;
}

static int countRows(sqlite3* db, const char* table) {
    sqlite3_stmt* stmt = nullptr;
    const std::string sql = std::string("SELECT COUNT(*) FROM ") + table;
    int count = -1;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr) == SQLITE_OK && sqlite3_step(stmt) == SQLITE_ROW) {
        count = sqlite3_column_int(stmt, 0);
    }
    sqlite3_finalize(stmt);
    return count;
}

int main() {
    const auto root = std::filesystem::temp_directory_path() / "originvault_basics";

    try {
        // Pooled path: handles stay open, no thread hop
        Pool::HandlePool::Config poolCfg;
        poolCfg.name = "basics-pool";
        poolCfg.root = root;
        auto pool = Pool::PoolRegistry::global().install(poolCfg);

        sqlite3* db = nullptr;
        if (sqlite3_open_v2("/foo.db", &db, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, "basics-pool") != SQLITE_OK) {
            ORIGINVAULT_LOG_ERROR(std::string("open failed: ") + sqlite3_errmsg(db));
            sqlite3_close(db);
            return 1;
        }
        exec(db, "CREATE TABLE IF NOT EXISTS t(a)");
        exec(db, "INSERT INTO t VALUES (1), (2), (3)");
        ORIGINVAULT_LOG_INFO("Pool rows: " + std::to_string(countRows(db, "t")) +
                             ", files: " + std::to_string(pool->getFileCount()));
        sqlite3_close(db);

        auto image = pool->exportFile("/foo.db");

        // Proxied path: every page read/write is a round trip to the I/O thread
        Vfs::ProxyVfs::Config proxyCfg;
        proxyCfg.proxy.root = root / "origin";
        Vfs::ProxyVfs proxyVfs(proxyCfg);
        proxyVfs.importDb("/copy.db", image);

        if (sqlite3_open_v2("/copy.db", &db, SQLITE_OPEN_READWRITE, "origin") != SQLITE_OK) {
            ORIGINVAULT_LOG_ERROR(std::string("open failed: ") + sqlite3_errmsg(db));
            sqlite3_close(db);
            return 1;
        }
        ORIGINVAULT_LOG_INFO("Imported rows: " + std::to_string(countRows(db, "t")));
        sqlite3_close(db);

        for (const auto& entry : proxyVfs.directoryClient().listEntries("/")) {
            ORIGINVAULT_LOG_INFO("  " + entry.path + " (" + std::to_string(entry.size) + " bytes)");
        }

        pool->removeVfs();
    } catch (const IO::StorageException& e) {
        ORIGINVAULT_LOG_ERROR(std::string("Storage error: ") + e.what());
        return 1;
    }

    std::error_code ec;
    std::filesystem::remove_all(root, ec);
    return 0;
}
