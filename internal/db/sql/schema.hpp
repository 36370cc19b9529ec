#pragma once

#include <string>
#include <vector>

namespace schedstore::db::sql {

/*
  Bootstrap DDL for the four tables.

  Only the uniqueness constraints the data model names are declared:
    processes.process_id, schedulers.url, process_schedulers.process_id
  messages carries plain (non-unique) lookup indexes.
*/

inline const std::vector<std::string>& PostgresSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS processes (id SERIAL PRIMARY KEY, process_id TEXT NOT NULL UNIQUE, process_data JSONB NOT NULL, "
      "bundle BYTEA NOT NULL);",
      "CREATE TABLE IF NOT EXISTS messages (id SERIAL PRIMARY KEY, process_id TEXT NOT NULL, message_id TEXT NOT NULL, assignment_id TEXT, "
      "message_data JSONB NOT NULL, epoch INTEGER NOT NULL, nonce INTEGER NOT NULL, timestamp BIGINT NOT NULL, bundle BYTEA NOT NULL, "
      "hash_chain TEXT NOT NULL);",
      "CREATE INDEX IF NOT EXISTS idx_messages_process_timestamp ON messages (process_id, timestamp);",
      "CREATE INDEX IF NOT EXISTS idx_messages_message_id ON messages (message_id);",
      "CREATE INDEX IF NOT EXISTS idx_messages_assignment_id ON messages (assignment_id);",
      "CREATE INDEX IF NOT EXISTS idx_messages_timestamp ON messages (timestamp);",
      "CREATE TABLE IF NOT EXISTS schedulers (id SERIAL PRIMARY KEY, url TEXT NOT NULL UNIQUE, process_count INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS process_schedulers (id SERIAL PRIMARY KEY, process_id TEXT NOT NULL UNIQUE, scheduler_id INTEGER NOT NULL);"};
  return kSchema;
}

inline const std::vector<std::string>& SqliteSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS processes (id INTEGER PRIMARY KEY AUTOINCREMENT, process_id TEXT NOT NULL UNIQUE, process_data TEXT NOT NULL, "
      "bundle BLOB NOT NULL);",
      "CREATE TABLE IF NOT EXISTS messages (id INTEGER PRIMARY KEY AUTOINCREMENT, process_id TEXT NOT NULL, message_id TEXT NOT NULL, "
      "assignment_id TEXT, message_data TEXT NOT NULL, epoch INTEGER NOT NULL, nonce INTEGER NOT NULL, timestamp INTEGER NOT NULL, "
      "bundle BLOB NOT NULL, hash_chain TEXT NOT NULL);",
      "CREATE INDEX IF NOT EXISTS idx_messages_process_timestamp ON messages (process_id, timestamp);",
      "CREATE INDEX IF NOT EXISTS idx_messages_message_id ON messages (message_id);",
      "CREATE INDEX IF NOT EXISTS idx_messages_assignment_id ON messages (assignment_id);",
      "CREATE INDEX IF NOT EXISTS idx_messages_timestamp ON messages (timestamp);",
      "CREATE TABLE IF NOT EXISTS schedulers (id INTEGER PRIMARY KEY AUTOINCREMENT, url TEXT NOT NULL UNIQUE, process_count INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS process_schedulers (id INTEGER PRIMARY KEY AUTOINCREMENT, process_id TEXT NOT NULL UNIQUE, "
      "scheduler_id INTEGER NOT NULL);"};
  return kSchema;
}

} // namespace schedstore::db::sql
