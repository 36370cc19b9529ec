#pragma once

#include <google/protobuf/struct.pb.h>

#include <string>

namespace schedstore::model {

/*
  A long-lived process.

  The body is an opaque structured document; only process_id is indexed.
  Processes are immutable once stored.
*/
struct Process {
  std::string process_id;

  google::protobuf::Struct data;
};

} // namespace schedstore::model
