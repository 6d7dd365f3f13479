#include <cxxopts.hpp>

#include "LogHandler.hpp"
#include "PseudoTerminalProcess.hpp"
#include "StdioBridge.hpp"

using namespace ft;

int main(int argc, char **argv) {
  // Setup easylogging configurations
  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();

  ft::HandleTerminate();

  // Override easylogging handler for sigint
  ::signal(SIGINT, ft::InterruptSignalHandler);
  // A child closing its terminal must not take the engine down with it.
  ::signal(SIGPIPE, SIG_IGN);

  cxxopts::Options options("ftsession",
                           "Runs agent PTY sessions behind a JSON-lines "
                           "protocol on stdin/stdout");
  try {
    options.allow_unrecognised_options();

    options.add_options()             //
        ("h,help", "Print help")      //
        ("version", "Print version")  //
        ("cfgfile", "Location of the config file",
         cxxopts::value<std::string>()->default_value(""))  //
        ("shell", "Shell to spawn for new sessions",
         cxxopts::value<std::string>())  //
        ("max-sessions", "Most sessions alive at once",
         cxxopts::value<int>())  //
        ("sandbox", "Sandbox mode (off, auto, seatbelt, firejail)",
         cxxopts::value<std::string>())  //
        ("logtostdout",
         "Also log to stdout (interleaves with the protocol)")  //
        ("logdir", "Directory for log files",
         cxxopts::value<std::string>())  //
        ("v,verbose", "Enable verbose logging",
         cxxopts::value<int>()->default_value("0"), "LEVEL")  //
        ;

    auto result = options.parse(argc, argv);

    if (result.count("help")) {
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(0);
    }
    if (result.count("version")) {
      CLOG(INFO, "stdout") << "ftsession version " << FT_VERSION << endl;
      exit(0);
    }

    EngineConfig config;
    string cfgfilename = result["cfgfile"].as<string>();
    if (!cfgfilename.empty() && !config.loadIniFile(cfgfilename)) {
      STFATAL << "Invalid config file: " << cfgfilename;
    }
    config.applyEnvironment(EngineConfig::processEnvironment());

    if (result.count("shell")) {
      config.shell = result["shell"].as<string>();
    }
    if (result.count("max-sessions")) {
      config.maxSessions = result["max-sessions"].as<int>();
    }
    if (result.count("sandbox")) {
      config.sandboxMode = result["sandbox"].as<string>();
    }
    if (result.count("logtostdout")) {
      config.logToStdout = true;
    }
    if (result.count("logdir")) {
      config.logDir = result["logdir"].as<string>();
    }
    // prioritize command line option over cfgfile
    if (result["verbose"].as<int>()) {
      config.verbose = result["verbose"].as<int>();
    }
    el::Loggers::setVerboseLevel(config.verbose);

    GOOGLE_PROTOBUF_VERIFY_VERSION;

    string logDir = config.logDir.empty() ? GetTempDirectory() + "fleetterm"
                                          : config.logDir;
    LogHandler::setupLogFiles(&defaultConf, logDir, "ftsession",
                              config.logToStdout, true);
    // Reconfigure default logger to apply settings above
    el::Loggers::reconfigureLogger("default", defaultConf);
    // set thread name
    el::Helpers::setThreadName("ftsession-main");
    // Install log rotation callback
    el::Helpers::installPreRollOutCallback(LogHandler::rolloutHandler);

    auto subprocessUtils = make_shared<SubprocessUtils>();
    auto sandboxLauncher = make_shared<SandboxLauncher>(
        subprocessUtils, config.sandboxMode, config.networkGuard);
    SessionEngine engine(config, make_shared<PseudoTerminalProcessFactory>(),
                         sandboxLauncher);
    auto bridge = make_shared<StdioBridge>(&engine, &std::cout);
    engine.setSubscriberChannel(bridge);
    engine.addLifecycleHook(bridge);

    LOG(INFO) << "ftsession started, max " << config.maxSessions
              << " sessions, ports " << config.portBase << "+"
              << config.portSpan;

    std::thread requestThread([bridge]() {
      el::Helpers::setThreadName("ftsession-requests");
      bridge->readLoop(&std::cin);
    });
    engine.run();
    engine.destroyAll();
    requestThread.join();

    LOG(INFO) << "ftsession finished";
  } catch (cxxopts::OptionException &oe) {
    CLOG(INFO, "stdout") << "Exception: " << oe.what() << "\n" << endl;
    CLOG(INFO, "stdout") << options.help({}) << endl;
    exit(1);
  }

  // Uninstall log rotation callback
  el::Helpers::uninstallPreRollOutCallback();
  return 0;
}
