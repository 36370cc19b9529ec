#pragma once

#include <string>
#include <vector>

namespace schedstore::migration {

inline constexpr int kExitOk      = 0;
inline constexpr int kExitUsage   = 1;
inline constexpr int kExitFailure = 2;

/*
  Body of schedstore-migrate.

  args excludes the program name and must hold exactly one
  "<from>[-<to>]" range. Configuration comes from ConfigLoader::Load().

  Returns kExitUsage for a bad argument list or range, kExitFailure for
  any error after that, kExitOk once the range is copied.
*/
int RunMigrateCommand(const std::vector<std::string>& args);

} // namespace schedstore::migration
