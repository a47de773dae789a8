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
 *
 *   tomato init [-f|--force]   write a default config (only with --force)
 *   tomato start               start a new pomodoro
 *   tomato stop                stop the current pomodoro
 *   tomato status              print the current phase
 * =================================================================================
 */
#ifndef COMMANDLINE_H
#define COMMANDLINE_H

#include <stdint.h>
#include <stdio.h>
#include <string>

class FileSessionHAL;
class PomodoroSession;

enum CommandType : uint8_t { CMD_INIT, CMD_START, CMD_STOP, CMD_STATUS, CMD_HELP, CMD_VERSION };

struct CliCommand {
  CommandType type;
  bool force;
};

// --- Exit Codes ---
#define EXIT_OK 0
#define EXIT_FAILURE_STORAGE 1
#define EXIT_USAGE 2

// =================================================================================
// SECTION: PARSING
// =================================================================================

/**
 * Parses argv. Returns false on a usage error and explains it in errorMsg.
 */
bool parseCommandLine(int argc, const char *const argv[], CliCommand &outCommand, std::string &errorMsg);

void printUsage(FILE *out);

// "tomato <version>"
void printVersion(FILE *out);
const char *commandToString(CommandType c);

// =================================================================================
// SECTION: DISPATCH
// =================================================================================

// 2xx/3xx -> EXIT_OK, anything else -> EXIT_FAILURE_STORAGE
int exitCodeForStatus(int statusCode);

/**
 * Runs one parsed command. Command output goes to 'out', failures to 'err'.
 * @return process exit code.
 */
int runCommand(const CliCommand &command, PomodoroSession &session, FileSessionHAL &hal, FILE *out, FILE *err);

#endif
