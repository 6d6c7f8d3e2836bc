#include "Config.hpp"
#include "ConsoleCommands.hpp"
#include "TransferPipeline.hpp"
#include "WebDavClient.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <getopt.h>
#include <iostream>
#include <poll.h>
#include <string>
#include <unistd.h>

std::atomic<bool> running{true};

static void signalHandler(int) { running.store(false); }

namespace fs = std::filesystem;

namespace {

void printUsage(const char *prog) {
  std::cout << "Usage: " << prog << " [options]\n"
            << "  -s, --state-dir DIR     state directory (default "
            << labxfer::defaultStateDirectory() << ")\n"
            << "  -c, --config FILE       configuration file "
               "(default <state-dir>/config.json)\n"
            << "  -l, --local-dir DIR     override local_directory\n"
            << "  -r, --remote-path PATH  override remote_path\n"
            << "  -w, --write-config      write the effective configuration "
               "and exit\n"
            << "  -h, --help              show this help\n"
            << "The WebDAV password is read from LABXFER_PASSWORD."
            << std::endl;
}

void printEvent(const labxfer::StatusEvent &event) {
  using labxfer::StatusType;
  switch (event.type) {
  case StatusType::Progress:
    std::cout << "[Status] " << event.path << ": " << event.bytes << "/"
              << event.total << " bytes" << std::endl;
    break;
  case StatusType::Failed:
    std::cerr << "[Status] FAILED " << event.path << ": " << event.message
              << std::endl;
    break;
  case StatusType::ConflictPending:
    std::cout << "[Status] Conflict on " << event.remotePath
              << "; decide with: resolve <overwrite|skip|rename> "
              << event.path << std::endl;
    break;
  default:
    std::cout << "[Status] " << labxfer::toString(event.type) << " "
              << event.path << (event.message.empty() ? "" : ": ")
              << event.message << std::endl;
    break;
  }
}

// Reads one line when the terminal has input ready.
bool readCommand(std::string &line) {
  pollfd pfd{STDIN_FILENO, POLLIN, 0};
  if (poll(&pfd, 1, 0) <= 0 || !(pfd.revents & (POLLIN | POLLHUP)))
    return false;
  return static_cast<bool>(std::getline(std::cin, line));
}

} // namespace

int main(int argc, char *argv[]) {
  std::string stateDir = labxfer::defaultStateDirectory();
  std::string configPath;
  std::string localDir;
  std::string remotePath;
  bool writeConfig = false;

  static const option longOpts[] = {
      {"state-dir", required_argument, nullptr, 's'},
      {"config", required_argument, nullptr, 'c'},
      {"local-dir", required_argument, nullptr, 'l'},
      {"remote-path", required_argument, nullptr, 'r'},
      {"write-config", no_argument, nullptr, 'w'},
      {"help", no_argument, nullptr, 'h'},
      {nullptr, 0, nullptr, 0}};

  int opt;
  while ((opt = getopt_long(argc, argv, "s:c:l:r:wh", longOpts, nullptr)) != -1) {
    switch (opt) {
    case 's':
      stateDir = optarg;
      break;
    case 'c':
      configPath = optarg;
      break;
    case 'l':
      localDir = optarg;
      break;
    case 'r':
      remotePath = optarg;
      break;
    case 'w':
      writeConfig = true;
      break;
    case 'h':
      printUsage(argv[0]);
      return 0;
    default:
      printUsage(argv[0]);
      return 2;
    }
  }
  if (configPath.empty())
    configPath = (fs::path(stateDir) / "config.json").string();

  std::signal(SIGINT, signalHandler);
  std::signal(SIGTERM, signalHandler);

  try {
    auto loaded = labxfer::loadConfig(configPath);
    if (!loaded)
      std::cerr << "[Main] Using default configuration" << std::endl;
    labxfer::PipelineConfig config = loaded.value_or(labxfer::PipelineConfig{});
    config.stateDirectory = stateDir;
    if (!localDir.empty())
      config.localDirectory = localDir;
    if (!remotePath.empty())
      config.remotePath = remotePath;
    for (const auto &warning : config.validate())
      std::cerr << "[Config] " << warning << std::endl;

    if (writeConfig) {
      if (!labxfer::saveConfig(config, configPath))
        return 1;
      std::cout << "[Main] Configuration written to " << configPath
                << std::endl;
      return 0;
    }

    if (config.webdavUrl.empty()) {
      std::cerr << "[Main] webdav_url is not configured in " << configPath
                << std::endl;
      return 1;
    }
    if (config.localDirectory.empty() || !fs::is_directory(config.localDirectory)) {
      std::cerr << "[Main] local_directory does not exist: "
                << config.localDirectory << std::endl;
      return 1;
    }

    const char *password = std::getenv("LABXFER_PASSWORD");
    labxfer::WebDavClient client(config.webdavUrl, config.username,
                                 password ? password : "", config.authType);
    if (!client.testConnection()) {
      std::cerr << "[Main] Cannot reach WebDAV server at " << config.webdavUrl
                << std::endl;
      return 1;
    }
    std::cout << "[Main] WebDAV client initialized." << std::endl;

    labxfer::TransferPipeline pipeline(config, client);
    if (!pipeline.start()) {
      std::cerr << "[Main] Failed to start monitoring." << std::endl;
      return 1;
    }
    std::cout << "[Main] Running. Type help for commands, Ctrl+C to exit."
              << std::endl;

    bool console = true;
    while (running.load()) {
      if (auto event =
              pipeline.channel().waitFor(std::chrono::milliseconds(500)))
        printEvent(*event);
      std::string line;
      if (console && readCommand(line))
        labxfer::runConsoleCommand(pipeline, line, std::cout);
      else if (console && std::cin.eof())
        console = false;
    }

    std::cout << "[Main] Shutdown signal received" << std::endl;
    pipeline.stop();
    for (const auto &event : pipeline.channel().drain())
      printEvent(event);
    std::cout << "[Main] Finished." << std::endl;

  } catch (const std::exception &e) {
    std::cerr << "[Main] Error: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
