#include <cxxopts.hpp>

#include "LogHandler.hpp"
#include "PtySessionBackend.hpp"
#include "StepDispatcher.hpp"
#include "TerminalSurface.hpp"
#include "Workspace.hpp"
#include "WorkspaceConfig.hpp"
#include "WorkspaceConsole.hpp"

using namespace pmx;

namespace {
/** @brief Reads whatever stdin has within `timeoutMs`.  False on EOF. */
bool pollStdin(int64_t timeoutMs, WorkspaceConsole* console) {
  fd_set rfd;
  timeval tv;
  FD_ZERO(&rfd);
  FD_SET(STDIN_FILENO, &rfd);
  tv.tv_sec = 0;
  tv.tv_usec = timeoutMs * 1000;
  int rc = select(STDIN_FILENO + 1, &rfd, NULL, NULL, &tv);
  if (rc < 0) {
    if (GetErrno() == EINTR) {
      return true;
    }
    FATAL_FAIL(rc);
  }
  if (rc == 0 || !FD_ISSET(STDIN_FILENO, &rfd)) {
    return true;
  }
  char b[4096];
  ssize_t bytes = ::read(STDIN_FILENO, b, sizeof(b));
  if (bytes < 0) {
    if (GetErrno() == EINTR || GetErrno() == EAGAIN) {
      return true;
    }
    STERROR << "Error reading stdin: " << strerror(GetErrno());
    return false;
  }
  if (bytes == 0) {
    return false;
  }
  console->handleInput(string(b, bytes));
  return true;
}
}  // namespace

int main(int argc, char **argv) {
  // Setup easylogging configurations
  el::Configurations defaultConf = LogHandler::setupLogHandler();
  LogHandler::setupStdoutLogger();

  pmx::HandleTerminate();

  // Override easylogging handler for sigint
  ::signal(SIGINT, pmx::InterruptSignalHandler);

  cxxopts::Options options("panemux",
                           "Tabs and split panes over pseudo-terminals");
  try {
    options.allow_unrecognised_options();

    options.add_options()             //
        ("h,help", "Print help")      //
        ("version", "Print version")  //
        ("cfgfile", "Location of the config file",
         cxxopts::value<std::string>()->default_value(""))  //
        ("rows", "Rows for new sessions", cxxopts::value<int>())  //
        ("cols", "Columns for new sessions", cxxopts::value<int>())  //
        ("idle-threshold-ms",
         "A pane is busy while it produced output this recently",
         cxxopts::value<int64_t>())  //
        ("max-split", "Most panes side by side in one direction",
         cxxopts::value<int>())  //
        ("logdir", "Base directory for log files.",
         cxxopts::value<std::string>())  //
        ("logtostdout", "log to stdout")  //
        ("v,verbose", "Enable verbose logging",
         cxxopts::value<int>()->default_value("0"), "LEVEL")  //
        ;

    auto result = options.parse(argc, argv);
    if (result.count("help")) {
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(0);
    }
    if (result.count("version")) {
      CLOG(INFO, "stdout") << "panemux version " << PANEMUX_VERSION << endl;
      exit(0);
    }

    WorkspaceConfig config;
    if (result.count("cfgfile") && !result["cfgfile"].as<string>().empty()) {
      try {
        config.loadFromFile(result["cfgfile"].as<string>());
      } catch (const std::exception &ex) {
        CLOG(INFO, "stdout") << ex.what() << endl;
        exit(1);
      }
    }

    // Flags win over the config file
    if (result.count("rows")) {
      config.defaultRows = result["rows"].as<int>();
    }
    if (result.count("cols")) {
      config.defaultCols = result["cols"].as<int>();
    }
    if (result.count("idle-threshold-ms")) {
      config.idleThresholdMs = result["idle-threshold-ms"].as<int64_t>();
    }
    if (result.count("max-split")) {
      config.maxSameDirectionPanes = result["max-split"].as<int>();
    }
    if (result.count("logdir")) {
      config.logDir = result["logdir"].as<string>();
    }
    if (result.count("verbose")) {
      config.verbose = result["verbose"].as<int>();
    }
    try {
      config.validate();
    } catch (const std::invalid_argument &ia) {
      CLOG(INFO, "stdout") << "Invalid option: " << ia.what() << endl;
      exit(1);
    }

    string logFile = LogHandler::setupLogFiles(
        &defaultConf, config.logDir, "panemux",
        bool(result.count("logtostdout")), !result.count("logtostdout"));
    // Reconfigure default logger to apply settings above
    el::Loggers::reconfigureLogger("default", defaultConf);
    LogHandler::setVerbosity(config.verbose);
    LOG(INFO) << "panemux " << PANEMUX_VERSION << " logging to " << logFile;

    shared_ptr<Clock> clock(new SteadyClock());
    shared_ptr<EventLoop> loop(new EventLoop(clock));
    shared_ptr<PtySessionBackend> backend(
        new PtySessionBackend(loop, config.shell));
    shared_ptr<ActivityTracker> activityTracker(
        new ActivityTracker(clock, config.idleThresholdMs));
    shared_ptr<SessionRegistry> registry(new SessionRegistry(
        loop, backend, activityTracker, config.defaultRows,
        config.defaultCols, config.scrollbackBytes));
    shared_ptr<Workspace> workspace(new Workspace(registry, config));
    shared_ptr<StepDispatcher> dispatcher(
        new StepDispatcher(loop, registry, config));
    shared_ptr<TerminalSurface> surface(new TerminalSurface());
    WorkspaceConsole console(workspace, dispatcher, surface);

    CLOG(INFO, "stdout") << "panemux " << PANEMUX_VERSION
                         << ", type :quit to leave" << endl;
    console.start();
    while (!loop->isStopped()) {
      backend->poll(10);
      loop->runReady();
      if (!pollStdin(10, &console) || console.isDone()) {
        loop->stop();
      }
    }
    LOG(INFO) << "Shutting down with " << workspace->numPanes() << " panes";
  } catch (cxxopts::OptionException &oe) {
    CLOG(INFO, "stdout") << "Exception: " << oe.what() << "\n" << endl;
    CLOG(INFO, "stdout") << options.help({}) << endl;
    exit(1);
  }

  // Uninstall log rotation callback
  el::Helpers::uninstallPreRollOutCallback();
  return 0;
}
