#include <string>
#include <vector>

#include "internal/migration/migrate_command.hpp"
#include "internal/observability/logging.hpp"

int main(int argc, char** argv) {
  std::vector<std::string> args(argv + 1, argv + argc);

  const int code = schedstore::migration::RunMigrateCommand(args);
  schedstore::observability::ShutdownLogging();
  return code;
}
