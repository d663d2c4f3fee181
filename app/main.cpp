#include "Lib.h"
#include "EscrowServer.h"
#include "EngineConfig.h"
#include "Logger.h"

#include <cstring>
#include <fstream>
#include <iostream>
#include <string>

void printUsage() {
  std::cout << "Usage: bazaar [--config <file>] [--manual-clock] [requests-file]\n";
  std::cout << "  --config <file>  - JSON configuration file (optional)\n";
  std::cout << "  --manual-clock   - Start the clock at 0 and move it only with\n";
  std::cout << "                     \"tick\" requests\n";
  std::cout << "  requests-file    - One JSON request per line (default: stdin)\n";
  std::cout << "\n";
  std::cout << "Example request lines:\n";
  std::cout << "  {\"type\":\"credit\",\"principal\":\"alice\",\"amount\":500}\n";
  std::cout << "  {\"type\":\"create\",\"principal\":\"alice\",\"item\":\"lamp\","
               "\"quantity\":1,\"price\":100,\"duration\":3600000}\n";
  std::cout << "  {\"type\":\"accept\",\"principal\":\"shop\",\"id\":\"<id>\"}\n";
}

int runRequests(bz::EscrowServer &server, std::istream &in) {
  std::string line;
  while (std::getline(in, line)) {
    if (line.empty() || line[0] == '#') {
      continue;
    }
    std::cout << server.handleRequestLine(line) << "\n";
  }
  std::cout.flush();
  return 0;
}

int main(int argc, char *argv[]) {
  auto rootLogger = bz::logging::getRootLogger();

  std::string configPath;
  std::string requestsPath;
  bool manualClock = false;

  for (int i = 1; i < argc; ++i) {
    if (strcmp(argv[i], "--config") == 0) {
      if (i + 1 < argc) {
        configPath = argv[++i];
      } else {
        std::cerr << "Error: --config option requires a file path.\n";
        printUsage();
        return 1;
      }
    } else if (strcmp(argv[i], "--manual-clock") == 0) {
      manualClock = true;
    } else if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
      printUsage();
      return 0;
    } else if (argv[i][0] == '-') {
      std::cerr << "Error: Unknown argument: " << argv[i] << "\n";
      printUsage();
      return 1;
    } else if (requestsPath.empty()) {
      requestsPath = argv[i];
    } else {
      std::cerr << "Error: Only one requests file may be given.\n";
      printUsage();
      return 1;
    }
  }

  bz::EscrowServer::InitConfig initConfig;
  initConfig.manualClock = manualClock;
  if (!configPath.empty()) {
    auto config = bz::EngineConfig::loadFile(configPath);
    if (!config) {
      std::cerr << "Error: " << config.error().message << "\n";
      return 1;
    }
    initConfig.engine = config.value();
  }

  rootLogger.setLevel(initConfig.engine.logLevel);
  if (!initConfig.engine.logFile.empty()) {
    rootLogger.addFileHandler(initConfig.engine.logFile,
                              bz::logging::Level::DEBUG);
  }
  rootLogger.info << "Bazaar v" << bz::Lib::getVersion();

  bz::EscrowServer server;
  auto result = server.init(initConfig);
  if (!result) {
    rootLogger.error << "Failed to start escrow server: " << result.error();
    std::cerr << "Error: " << result.error().message << "\n";
    return 1;
  }

  if (requestsPath.empty()) {
    return runRequests(server, std::cin);
  }

  std::ifstream requests(requestsPath);
  if (!requests.is_open()) {
    rootLogger.error << "Failed to open requests file: " << requestsPath;
    std::cerr << "Error: Failed to open requests file: " << requestsPath << "\n";
    return 1;
  }
  return runRequests(server, requests);
}
