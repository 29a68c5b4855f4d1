#pragma once

#include <ostream>

namespace taskd {

/**
 * Offline task commands against a store, without the HTTP layer:
 *
 *   <data_path> [--backend file|rocksdb] list [status]
 *   <data_path> [--backend file|rocksdb] add <description> [status]
 *   <data_path> [--backend file|rocksdb] status <id> <status>
 *   <data_path> [--backend file|rocksdb] update <id> <description>
 *   <data_path> [--backend file|rocksdb] del <id>
 *
 * Results go to out as JSON, diagnostics to err.
 * Returns 0 on success, 1 if the operation failed, 2 on bad arguments.
 */
int RunCli(int argc, char** argv, std::ostream& out, std::ostream& err);

}  // namespace taskd
