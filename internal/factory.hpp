#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/core/message_store.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/storage/blob_store.hpp"

namespace schedstore::factory {

/*
  StoreRuntime

  Owns the long-lived objects of one store instance. blob_store is null
  when the blob tier is disabled.
*/
struct StoreRuntime {
  std::shared_ptr<db::Repository>     repository;
  storage::BlobStorePtr               blob_store;
  std::shared_ptr<core::MessageStore> store;
};

/*
  Build

  Constructs the repository for the configured backend, bootstraps its
  schema, opens the blob tier when enabled and runs a startup tail-sync
  unless blob_store.skip_startup_sync is set.

  NOTE:
  This is the composition root. It is the ONLY place allowed to know
  concrete DB and blob-tier types.
*/
StoreRuntime Build(const schedstore::runtime::config::RuntimeConfig& config);

} // namespace schedstore::factory
