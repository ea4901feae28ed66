#include "LogHandler.hpp"

INITIALIZE_EASYLOGGINGPP

namespace pmx {
namespace {
const char *const LOG_FORMAT = "[%level %datetime %thread %fbase:%line] %msg";
const char *const VERBOSE_LOG_FORMAT =
    "[%levshort%vlevel %datetime %thread %fbase:%line] %msg";
}  // namespace

el::Configurations LogHandler::setupLogHandler() {
  el::Configurations conf;
  conf.setToDefault();
  conf.setGlobally(el::ConfigurationType::Enabled, "true");
  conf.setGlobally(el::ConfigurationType::Format, LOG_FORMAT);
  conf.set(el::Level::Verbose, el::ConfigurationType::Format,
           VERBOSE_LOG_FORMAT);
  conf.setGlobally(el::ConfigurationType::SubsecondPrecision, "3");
  conf.setGlobally(el::ConfigurationType::PerformanceTracking, "false");
  // Flush every line: a STFATAL must not lose the lines before it
  conf.setGlobally(el::ConfigurationType::LogFlushThreshold, "1");
  el::Helpers::setThreadName("panemux-main");
  return conf;
}

string LogHandler::setupLogFiles(el::Configurations *conf, const string &dir,
                                 const string &prefix, bool logToStdout,
                                 bool captureStderr) {
  string stem = logFileStem(prefix);
  string logPath = createLogFile(dir, stem + ".log");

  el::Loggers::addFlag(el::LoggingFlag::StrictLogFileSizeCheck);
  conf->setGlobally(el::ConfigurationType::ToFile, "true");
  conf->setGlobally(el::ConfigurationType::Filename, logPath);
  conf->setGlobally(el::ConfigurationType::MaxLogFileSize,
                    to_string(MAX_LOG_FILE_BYTES));
  conf->setGlobally(el::ConfigurationType::ToStandardOutput,
                    logToStdout ? "true" : "false");
  el::Helpers::installPreRollOutCallback(LogHandler::removeRolledFile);

  if (captureStderr) {
    string stderrPath = createLogFile(dir, stem + ".stderr");
    FILE *stream = freopen(stderrPath.c_str(), "w", stderr);
    if (!stream) {
      STFATAL << "Cannot redirect stderr to " << stderrPath;
    }
    setvbuf(stream, NULL, _IOLBF, BUFSIZ);
  }
  return logPath;
}

void LogHandler::setVerbosity(int level) {
  el::Loggers::setVerboseLevel(std::max(level, 0));
}

void LogHandler::setupStdoutLogger() {
  el::Configurations conf;
  conf.setToDefault();
  conf.setGlobally(el::ConfigurationType::Format, "%msg");
  conf.setGlobally(el::ConfigurationType::ToStandardOutput, "true");
  conf.setGlobally(el::ConfigurationType::ToFile, "false");
  el::Loggers::reconfigureLogger(el::Loggers::getLogger("stdout"), conf);
}

string LogHandler::logFileStem(const string &prefix) {
  time_t now = time(NULL);
  tm local;
  localtime_r(&now, &local);
  std::ostringstream ss;
  // The pid keeps two multiplexers started in the same second apart
  ss << prefix << "-" << std::put_time(&local, "%Y%m%d-%H%M%S") << "-"
     << getpid();
  return ss.str();
}

string LogHandler::createLogFile(const string &dir, const string &filename) {
  std::error_code ec;
  fs::create_directories(dir, ec);
  if (ec) {
    CLOG(ERROR, "stdout") << "Cannot create log directory " << dir << ": "
                          << ec.message() << endl;
    exit(1);
  }
  string path = (fs::path(dir) / filename).string();
  int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_NOFOLLOW, 0600);
  FATAL_FAIL(fd);
  FATAL_FAIL(::close(fd));
  return path;
}

void LogHandler::removeRolledFile(const char *filename, std::size_t size) {
  // Called while the log file is closed: nothing can be logged here
  std::error_code ec;
  fs::remove(filename, ec);
}
}  // namespace pmx
