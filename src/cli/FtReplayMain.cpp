#include <cxxopts.hpp>

#include "LogHandler.hpp"
#include "ReplayHarness.hpp"

using namespace ft;

int main(int argc, char **argv) {
  // Setup easylogging configurations
  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();

  ft::HandleTerminate();

  cxxopts::Options options("ftreplay",
                           "Replays recorded PTY output through the session "
                           "state machine");
  try {
    options.positional_help("[fixture files or directories]");
    options.add_options()             //
        ("h,help", "Print help")      //
        ("version", "Print version")  //
        ("fixtures", "Fixture files or directories",
         cxxopts::value<std::vector<std::string>>())  //
        ("v,verbose", "Enable verbose logging",
         cxxopts::value<int>()->default_value("0"), "LEVEL")  //
        ;
    options.parse_positional({"fixtures"});

    auto result = options.parse(argc, argv);

    if (result.count("help") || !result.count("fixtures")) {
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(result.count("help") ? 0 : 1);
    }
    if (result.count("version")) {
      CLOG(INFO, "stdout") << "ftreplay version " << FT_VERSION << endl;
      exit(0);
    }
    el::Loggers::setVerboseLevel(result["verbose"].as<int>());
    defaultConf.setGlobally(el::ConfigurationType::ToStandardOutput, "false");
    el::Loggers::reconfigureLogger("default", defaultConf);

    vector<string> files;
    for (const auto& path : result["fixtures"].as<vector<string>>()) {
      if (fs::is_directory(path)) {
        auto found = ReplayHarness::listFixtures(path);
        files.insert(files.end(), found.begin(), found.end());
      } else {
        files.push_back(path);
      }
    }
    if (files.empty()) {
      CLOG(ERROR, "stdout") << "[replay] no fixtures found" << endl;
      exit(1);
    }

    int failed = 0;
    for (const auto& file : files) {
      ReplayResult replay = ReplayHarness::runFile(file);
      if (replay.passed) {
        CLOG(INFO, "stdout") << "[replay] pass " << replay.name << endl;
        continue;
      }
      failed++;
      for (const auto& failure : replay.failures) {
        CLOG(INFO, "stdout") << "[replay] FAIL: " << failure << endl;
      }
    }
    CLOG(INFO, "stdout") << "[replay] " << (files.size() - failed) << "/"
                         << files.size() << " fixture(s) passed" << endl;
    return failed == 0 ? 0 : 1;
  } catch (cxxopts::OptionException &oe) {
    CLOG(INFO, "stdout") << "Exception: " << oe.what() << "\n" << endl;
    CLOG(INFO, "stdout") << options.help({}) << endl;
    exit(1);
  }
}
