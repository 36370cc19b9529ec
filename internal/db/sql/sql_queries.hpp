#pragma once

#include <string>

namespace schedstore::db::sql {

/*
  Canonical SQL for the sqlite backend.

  Column order is shared with the postgres prepared statements so both
  backends read rows with the same column indexes:

    0 id, 1 process_id, 2 message_id, 3 assignment_id, 4 message_data,
    5 epoch, 6 nonce, 7 timestamp, 8 bundle, 9 hash_chain

  Header-only selects put NULL in the message_data and bundle slots.
*/

static constexpr const char* MESSAGE_COLUMNS =
    "id,process_id,message_id,assignment_id,message_data,epoch,nonce,timestamp,bundle,hash_chain";

static constexpr const char* MESSAGE_HEADER_COLUMNS =
    "id,process_id,message_id,assignment_id,NULL,epoch,nonce,timestamp,NULL,hash_chain";

inline std::string SelectMessages(const char* columns, const char* tail) {
  return std::string("SELECT ") + columns + " FROM messages " + tail;
}

// processes

static constexpr const char* INSERT_PROCESS =
    "INSERT INTO processes(process_id,process_data,bundle) VALUES(?,?,?)"
    " ON CONFLICT(process_id) DO NOTHING;";

static constexpr const char* SELECT_PROCESS =
    "SELECT id,process_id,process_data,bundle FROM processes WHERE process_id=? LIMIT 1;";

// messages

static constexpr const char* INSERT_MESSAGE =
    "INSERT INTO messages(process_id,message_id,assignment_id,message_data,epoch,nonce,timestamp,bundle,hash_chain)"
    " VALUES(?,?,?,?,?,?,?,?,?);";

inline const std::string SELECT_MESSAGE_BY_ANY_ID =
    SelectMessages(MESSAGE_COLUMNS, "WHERE message_id=?1 OR assignment_id=?1 ORDER BY timestamp ASC, id ASC LIMIT 1;");

inline const std::string SELECT_MESSAGE_EXACT =
    SelectMessages(MESSAGE_COLUMNS, "WHERE message_id=? AND assignment_id=? ORDER BY timestamp ASC, id ASC LIMIT 1;");

inline const std::string SELECT_MESSAGE_BY_MESSAGE_ID =
    SelectMessages(MESSAGE_COLUMNS, "WHERE message_id=? ORDER BY timestamp ASC, id ASC LIMIT 1;");

inline const std::string SELECT_LATEST_MESSAGE =
    SelectMessages(MESSAGE_COLUMNS, "WHERE process_id=? ORDER BY id DESC LIMIT 1;");

static constexpr const char* COUNT_MESSAGES = "SELECT COUNT(*) FROM messages;";

inline const std::string SELECT_MESSAGES_BY_OFFSET =
    SelectMessages(MESSAGE_COLUMNS, "ORDER BY timestamp ASC, id ASC LIMIT ? OFFSET ?;");

inline const std::string SELECT_MESSAGE_FROM_END =
    SelectMessages(MESSAGE_COLUMNS, "ORDER BY timestamp DESC, id DESC LIMIT 1 OFFSET ?;");

// schedulers

static constexpr const char* INSERT_SCHEDULER =
    "INSERT INTO schedulers(url,process_count) VALUES(?,?)"
    " ON CONFLICT(url) DO NOTHING;";

static constexpr const char* UPDATE_SCHEDULER =
    "UPDATE schedulers SET process_count=?,url=? WHERE id=?;";

static constexpr const char* SELECT_SCHEDULER =
    "SELECT id,url,process_count FROM schedulers WHERE id=? LIMIT 1;";

static constexpr const char* SELECT_SCHEDULER_BY_URL =
    "SELECT id,url,process_count FROM schedulers WHERE url=? LIMIT 1;";

static constexpr const char* SELECT_SCHEDULERS =
    "SELECT id,url,process_count FROM schedulers ORDER BY id ASC;";

static constexpr const char* INSERT_PROCESS_SCHEDULER =
    "INSERT INTO process_schedulers(process_id,scheduler_id) VALUES(?,?)"
    " ON CONFLICT(process_id) DO NOTHING;";

static constexpr const char* SELECT_PROCESS_SCHEDULER =
    "SELECT id,process_id,scheduler_id FROM process_schedulers WHERE process_id=? LIMIT 1;";

}
