#define CATCH_CONFIG_RUNNER

#include "LogHandler.hpp"
#include "TestHeaders.hpp"

using namespace tb;

namespace {
// TB_TEST_VERBOSE=<level> turns on VLOG output in the test log
int testVerbosity() {
  const char *level = ::getenv("TB_TEST_VERBOSE");
  if (level == NULL) {
    return 0;
  }
  return atoi(level);
}
}  // namespace

int main(int argc, char **argv) {
  el::Configurations conf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();
  HandleTerminate();

  // Sessions write to clients that may already be gone
  ::signal(SIGPIPE, SIG_IGN);

  Catch::Session session;
  int parseResult = session.applyCommandLine(argc, argv);
  if (parseResult != 0) {
    return parseResult;
  }

  string pattern = GetTempDirectory() + string("tb_test_XXXXXXXX");
  if (mkdtemp(&pattern[0]) == NULL) {
    STFATAL << "Cannot create a test log directory: " << strerror(errno);
  }
  string logDirectory = pattern;
  string logFile =
      LogHandler::setupLogFiles(&conf, logDirectory, "tbtest", false, true);
  LogHandler::applyVerbosity(&conf, testVerbosity(), false);
  if (!session.configData().listTests) {
    CLOG(INFO, "stdout") << "Test log: " << logFile << endl;
  }

  int result = session.run();

  fs::remove_all(logDirectory);
  return result;
}
