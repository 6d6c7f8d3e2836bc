#include "ConsoleCommands.hpp"
#include "TransferPipeline.hpp"
#include <optional>
#include <sstream>

namespace labxfer {

namespace {

std::optional<ConflictAction> parseAction(const std::string &word) {
  if (word == "overwrite" || word == "upload")
    return ConflictAction::UploadOverwrite;
  if (word == "skip")
    return ConflictAction::Skip;
  if (word == "rename")
    return ConflictAction::RenameAndUpload;
  return std::nullopt;
}

void printHelp(std::ostream &out) {
  out << "Commands:\n"
      << "  list                                  pending conflicts\n"
      << "  resolve <overwrite|skip|rename> PATH  decide one conflict\n"
      << "  resolve-all <overwrite|skip|rename>   decide every conflict\n"
      << "  check                                 verify uploaded files remotely\n"
      << "  help" << std::endl;
}

std::string restOf(std::istringstream &in) {
  std::string rest;
  std::getline(in >> std::ws, rest);
  while (!rest.empty() && (rest.back() == ' ' || rest.back() == '\r'))
    rest.pop_back();
  return rest;
}

} // namespace

bool runConsoleCommand(TransferPipeline &pipeline, const std::string &line,
                       std::ostream &out) {
  std::istringstream in(line);
  std::string command;
  if (!(in >> command))
    return true;

  if (command == "help") {
    printHelp(out);
    return true;
  }

  if (command == "list") {
    auto paths = pipeline.queue().suspendedPaths();
    if (paths.empty())
      out << "No pending conflicts" << std::endl;
    for (const auto &path : paths)
      out << "  " << path << " -> " << pipeline.remotePathFor(path)
          << std::endl;
    return true;
  }

  if (command == "resolve" || command == "resolve-all") {
    std::string word;
    in >> word;
    auto action = parseAction(word);
    if (!action) {
      out << "Unknown action '" << word << "'" << std::endl;
      return false;
    }
    if (command == "resolve-all") {
      std::size_t pending = pipeline.queue().suspendedPaths().size();
      pipeline.resolver().applyToAll(*action);
      for (const auto &path : pipeline.queue().suspendedPaths())
        pipeline.queue().resume(path, *action);
      out << "Applying " << toString(*action) << " to " << pending
          << " pending and all later conflicts" << std::endl;
      return true;
    }

    std::string path = restOf(in);
    if (path.empty()) {
      out << "resolve needs a path" << std::endl;
      return false;
    }
    if (!pipeline.resolveConflict(path, *action)) {
      out << "No pending conflict for " << path << std::endl;
      return false;
    }
    out << "Resolved " << path << ": " << toString(*action) << std::endl;
    return true;
  }

  if (command == "check") {
    IntegrityReport report = pipeline.checkRemoteIntegrity();
    out << "Checked " << report.total << ": " << report.verified
        << " verified, " << report.missing << " missing, " << report.changed
        << " changed, " << report.errors << " errors" << std::endl;
    return true;
  }

  out << "Unknown command '" << command << "' (try help)" << std::endl;
  return false;
}

} // namespace labxfer
