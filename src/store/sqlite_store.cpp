#include "sqlite_store.hpp"
#include "cron_json.hpp"
#include "../config.hpp"
#include "../plugin.hpp"
#include "../util.hpp"
#include <nlohmann/json.hpp>
#include <sqlite3.h>
#include <filesystem>
#include <iostream>
#include <stdexcept>

static cronkit::StoreRegistrar reg_sqlite("sqlite",
    [](const cronkit::Config& config) {
        std::string path = config.store_path;
        if (path.empty()) {
            path = cronkit::expand_home("~/.cronkit/cron.db");
        }
        return std::make_unique<cronkit::SqliteEventStore>(path);
    });

namespace cronkit {

static const char* kCronOption = "cron";
static const std::string kTransientPrefix = "_transient_";

// RAII wrapper for sqlite3_stmt
struct StmtGuard {
    sqlite3_stmt* stmt = nullptr;
    ~StmtGuard() { if (stmt) sqlite3_finalize(stmt); }
};

SqliteEventStore::SqliteEventStore(const std::string& path) : path_(path) {
    // Ensure parent directory exists
    auto parent = std::filesystem::path(path_).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            throw std::runtime_error("SqliteEventStore: failed to create directory " +
                                     parent.string() + ": " + ec.message());
        }
    }

    if (sqlite3_open(path_.c_str(), &db_) != SQLITE_OK) {
        std::string err = db_ ? sqlite3_errmsg(db_) : "unknown error";
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        throw std::runtime_error("SqliteEventStore: failed to open database: " + err);
    }

    sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);
    sqlite3_exec(db_, "PRAGMA synchronous=NORMAL;", nullptr, nullptr, nullptr);

    init_schema();
}

SqliteEventStore::~SqliteEventStore() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

void SqliteEventStore::init_schema() {
    const char* create_table =
        "CREATE TABLE IF NOT EXISTS options ("
        "  name  TEXT PRIMARY KEY,"
        "  value TEXT NOT NULL"
        ");";
    char* err = nullptr;
    if (sqlite3_exec(db_, create_table, nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : "unknown error";
        sqlite3_free(err);
        sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("SqliteEventStore: failed to create schema: " + msg);
    }
}

std::optional<std::string> SqliteEventStore::get_option(const std::string& name) {
    StmtGuard g;
    const char* sql = "SELECT value FROM options WHERE name = ?;";
    if (sqlite3_prepare_v2(db_, sql, -1, &g.stmt, nullptr) != SQLITE_OK) return std::nullopt;
    sqlite3_bind_text(g.stmt, 1, name.c_str(), -1, SQLITE_STATIC);
    if (sqlite3_step(g.stmt) == SQLITE_ROW) {
        if (auto* v = sqlite3_column_text(g.stmt, 0)) {
            return std::string(reinterpret_cast<const char*>(v));
        }
    }
    return std::nullopt;
}

bool SqliteEventStore::set_option(const std::string& name, const std::string& value) {
    StmtGuard g;
    const char* sql =
        "INSERT INTO options (name, value) VALUES (?, ?) "
        "ON CONFLICT(name) DO UPDATE SET value = excluded.value;";
    if (sqlite3_prepare_v2(db_, sql, -1, &g.stmt, nullptr) != SQLITE_OK) {
        std::cerr << "[store] Failed to prepare option write: " << sqlite3_errmsg(db_) << "\n";
        return false;
    }
    sqlite3_bind_text(g.stmt, 1, name.c_str(),  -1, SQLITE_STATIC);
    sqlite3_bind_text(g.stmt, 2, value.c_str(), -1, SQLITE_STATIC);
    if (sqlite3_step(g.stmt) != SQLITE_DONE) {
        std::cerr << "[store] Failed to write option " << name << ": "
                  << sqlite3_errmsg(db_) << "\n";
        return false;
    }
    return true;
}

bool SqliteEventStore::delete_option(const std::string& name) {
    StmtGuard g;
    const char* sql = "DELETE FROM options WHERE name = ?;";
    if (sqlite3_prepare_v2(db_, sql, -1, &g.stmt, nullptr) != SQLITE_OK) return false;
    sqlite3_bind_text(g.stmt, 1, name.c_str(), -1, SQLITE_STATIC);
    if (sqlite3_step(g.stmt) != SQLITE_DONE) return false;
    return sqlite3_changes(db_) > 0;
}

CronArray SqliteEventStore::load() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto value = get_option(kCronOption);
    if (!value) return {};
    try {
        return cron_array_from_json(nlohmann::json::parse(*value));
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[store] Corrupt cron option in " << path_ << ": " << e.what() << "\n";
        return {};
    }
}

bool SqliteEventStore::save(const CronArray& crons) {
    std::lock_guard<std::mutex> lock(mutex_);
    return set_option(kCronOption, cron_array_to_json(crons).dump());
}

std::optional<std::string> SqliteEventStore::get_transient(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    return get_option(kTransientPrefix + name);
}

bool SqliteEventStore::set_transient(const std::string& name, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    return set_option(kTransientPrefix + name, value);
}

bool SqliteEventStore::delete_transient(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    return delete_option(kTransientPrefix + name);
}

} // namespace cronkit
