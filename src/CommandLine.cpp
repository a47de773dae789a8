/*
 * =================================================================================
 * Project:   Tomato Timer - Pomodoro Session Tracker
 * File:      CommandLine.h / CommandLine.cpp
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * Command line front end. Parses argv into a command, dispatches it to the
 * PomodoroSession, prints the result and maps status codes to exit codes.
 * =================================================================================
 */
#include <string.h>

#include "CommandLine.h"
#include "Config.h"
#include "FileSessionHAL.h"
#include "Session.h"

// =================================================================================
// SECTION: HELPER FUNCTIONS
// =================================================================================

static bool isHelpFlag(const char *arg) { return strcmp(arg, "-h") == 0 || strcmp(arg, "--help") == 0; }

static bool isForceFlag(const char *arg) { return strcmp(arg, "-f") == 0 || strcmp(arg, "--force") == 0; }

const char *commandToString(CommandType c) {
  switch (c) {
  case CMD_INIT:
    return "init";
  case CMD_START:
    return "start";
  case CMD_STOP:
    return "stop";
  case CMD_STATUS:
    return "status";
  case CMD_HELP:
    return "help";
  case CMD_VERSION:
    return "version";
  default:
    return "unknown";
  }
}

void printVersion(FILE *out) { fprintf(out, "%s %s\n", APP_NAME, APP_VERSION); }

void printUsage(FILE *out) {
  printVersion(out);
  fprintf(out, "pomodoro timer\n\n");
  fprintf(out, "Usage: %s <COMMAND>\n\n", APP_NAME);
  fprintf(out, "Commands:\n");
  fprintf(out, "  init [-f|--force]   initialize configuration (writes defaults only with --force)\n");
  fprintf(out, "  start               start a new pomodoro\n");
  fprintf(out, "  stop                stop current pomodoro\n");
  fprintf(out, "  status              current pomodoro status\n");
  fprintf(out, "  help                print this message\n\n");
  fprintf(out, "Options:\n");
  fprintf(out, "  -h, --help          print this message\n");
  fprintf(out, "  -V, --version       print version\n");
}

// =================================================================================
// SECTION: PARSING
// =================================================================================

bool parseCommandLine(int argc, const char *const argv[], CliCommand &outCommand, std::string &errorMsg) {
  outCommand.type = CMD_HELP;
  outCommand.force = false;

  if (argc < 2) {
    errorMsg = "missing command";
    return false;
  }

  // 1. Global flags / command name
  const char *name = argv[1];
  if (isHelpFlag(name) || strcmp(name, "help") == 0) {
    outCommand.type = CMD_HELP;
    return true;
  }
  if (strcmp(name, "-V") == 0 || strcmp(name, "--version") == 0) {
    outCommand.type = CMD_VERSION;
    return true;
  }

  if (strcmp(name, "init") == 0)
    outCommand.type = CMD_INIT;
  else if (strcmp(name, "start") == 0)
    outCommand.type = CMD_START;
  else if (strcmp(name, "stop") == 0)
    outCommand.type = CMD_STOP;
  else if (strcmp(name, "status") == 0)
    outCommand.type = CMD_STATUS;
  else {
    errorMsg = std::string("unknown command '") + name + "'";
    return false;
  }

  // 2. Command arguments. Only 'init' takes one (--force).
  for (int i = 2; i < argc; i++) {
    const char *arg = argv[i];
    if (isHelpFlag(arg)) {
      outCommand.type = CMD_HELP;
      outCommand.force = false;
      return true;
    }
    if (outCommand.type == CMD_INIT && isForceFlag(arg)) {
      outCommand.force = true;
      continue;
    }
    errorMsg = std::string("unexpected argument '") + arg + "' for '" + commandToString(outCommand.type) + "'";
    return false;
  }

  return true;
}

// =================================================================================
// SECTION: DISPATCH
// =================================================================================

int exitCodeForStatus(int statusCode) {
  if (statusCode >= 200 && statusCode < 400)
    return EXIT_OK;
  return EXIT_FAILURE_STORAGE;
}

int runCommand(const CliCommand &command, PomodoroSession &session, FileSessionHAL &hal, FILE *out, FILE *err) {
  int code = 200;

  switch (command.type) {
  case CMD_HELP:
    printUsage(out);
    return EXIT_OK;

  case CMD_VERSION:
    printVersion(out);
    return EXIT_OK;

  case CMD_INIT:
    code = session.init(command.force);
    if (code == 200) {
      fprintf(out, "wrote new config to %s\n", hal.getConfigPath().c_str());
    } else if (code == 304) {
      fprintf(out, "config left unchanged; run '%s init --force' to write defaults to %s\n", APP_NAME,
              hal.getConfigPath().c_str());
    }
    break;

  case CMD_START:
    code = session.start();
    break;

  case CMD_STOP:
    code = session.stop();
    break;

  case CMD_STATUS: {
    char line[PHASE_TEXT_MAX_LENGTH];
    code = session.status(line, sizeof(line));
    if (code == 200) {
      fprintf(out, "%s\n", line);
    }
    break;
  }
  }

  int exitCode = exitCodeForStatus(code);
  if (exitCode != EXIT_OK) {
    const std::string &reason = hal.getLastError();
    fprintf(err, "%s: %s failed: %s\n", APP_NAME, commandToString(command.type),
            reason.empty() ? "storage error" : reason.c_str());
  }
  return exitCode;
}
