#pragma once
#include <ostream>
#include <string>

namespace labxfer {

class TransferPipeline;

/**
 * Operator commands read from the terminal while the pipeline runs:
 *
 *   list                               suspended conflicts
 *   resolve <overwrite|skip|rename> P  decide one conflict
 *   resolve-all <action>               decide all, now and later
 *   check                              remote integrity check
 *   help
 *
 * Returns false for an unknown or malformed command. Output goes to out.
 */
bool runConsoleCommand(TransferPipeline &pipeline, const std::string &line,
                       std::ostream &out);

} // namespace labxfer
