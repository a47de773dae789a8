/*
 * =================================================================================
 * Project:   Tomato Timer - Pomodoro Session Tracker
 * File:      main.cpp
 * Description: Application entry point. One command per invocation:
 *              parse -> resolve directories -> run -> flush log -> exit.
 * =================================================================================
 */

#include <stdio.h>
#include <string>

// --- Module Includes ---
#include "CommandLine.h"
#include "Config.h"
#include "FileSessionHAL.h"
#include "Utils.h"

// --- Session Engine Includes ---
#include "Session.h"

int main(int argc, char *argv[]) {
  // 1. Parse
  CliCommand command;
  std::string errorMsg;
  if (!parseCommandLine(argc, argv, command, errorMsg)) {
    fprintf(stderr, "%s: %s\n", APP_NAME, errorMsg.c_str());
    fprintf(stderr, "Try '%s --help' for usage.\n", APP_NAME);
    return EXIT_USAGE;
  }

  // No storage involved
  if (command.type == CMD_HELP) {
    printUsage(stdout);
    return EXIT_OK;
  }
  if (command.type == CMD_VERSION) {
    printVersion(stdout);
    return EXIT_OK;
  }

  // 2. Locate config + data directories
  std::string configDir;
  std::string dataDir;
  if (!resolveUserDirectories(configDir, dataDir, errorMsg)) {
    fprintf(stderr, "%s: %s\n", APP_NAME, errorMsg.c_str());
    return EXIT_FAILURE_STORAGE;
  }

  // 3. Run
  FileSessionHAL hal(configDir, dataDir);
  PomodoroSession session(hal);

  char logBuf[64];
  snprintf(logBuf, sizeof(logBuf), "Command '%s'", commandToString(command.type));
  hal.logKeyValue("System", logBuf);

  int exitCode = runCommand(command, session, hal, stdout, stderr);

  // 4. Diagnostic log (never changes the outcome)
  if (!hal.flushLog()) {
    fprintf(stderr, "%s: warning: could not write log %s\n", APP_NAME, hal.getLogPath().c_str());
  }

  return exitCode;
}
