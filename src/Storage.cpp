/*
 * =================================================================================
 * Project:   Tomato Timer - Pomodoro Session Tracker
 * File:      Storage.h / Storage.cpp
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * File storage abstraction. Reads and atomically replaces small text files,
 * creates the application directories, and saves/loads the session record
 * (state.json) so a running pomodoro survives between invocations.
 * =================================================================================
 */
#include <errno.h>
#include <stdio.h>
#include <string.h>
#include <unistd.h>
#include <sys/stat.h>
#include <sys/types.h>

#include "Config.h"
#include "Logger.h"
#include "SettingsCodec.h"
#include "Storage.h"

// =================================================================================
// SECTION: FILE PRIMITIVES
// =================================================================================

static std::string describeErrno(const char *action, const std::string &path) {
  return std::string(action) + " " + path + ": " + strerror(errno);
}

ReadResult readTextFile(const std::string &path, std::string &out, std::string &errorMsg) {
  FILE *file = fopen(path.c_str(), "r");
  if (file == nullptr) {
    if (errno == ENOENT) {
      return READ_MISSING;
    }
    errorMsg = describeErrno("cannot open", path);
    return READ_FAILED;
  }

  out.clear();
  char chunk[512];
  size_t n;
  while ((n = fread(chunk, 1, sizeof(chunk), file)) > 0) {
    out.append(chunk, n);
  }

  bool failed = ferror(file) != 0;
  if (failed) {
    errorMsg = describeErrno("cannot read", path);
  }
  fclose(file);
  return failed ? READ_FAILED : READ_OK;
}

bool writeTextFileAtomic(const std::string &path, const std::string &text, std::string &errorMsg) {
  std::string tmpPath = path + ".tmp";

  FILE *file = fopen(tmpPath.c_str(), "w");
  if (file == nullptr) {
    errorMsg = describeErrno("cannot create", tmpPath);
    return false;
  }

  bool ok = fwrite(text.data(), 1, text.size(), file) == text.size();
  if (!ok) {
    errorMsg = describeErrno("cannot write", tmpPath);
  }
  if (fflush(file) != 0 && ok) {
    errorMsg = describeErrno("cannot write", tmpPath);
    ok = false;
  }
  if (fclose(file) != 0 && ok) {
    errorMsg = describeErrno("cannot close", tmpPath);
    ok = false;
  }

  if (ok && rename(tmpPath.c_str(), path.c_str()) != 0) {
    errorMsg = describeErrno("cannot replace", path);
    ok = false;
  }

  if (!ok) {
    unlink(tmpPath.c_str());
  }
  return ok;
}

bool ensureDirectory(const std::string &path, std::string &errorMsg) {
  if (path.empty()) {
    errorMsg = "empty directory path";
    return false;
  }

  // Walk every prefix ending at a '/', then the full path
  size_t pos = 1;
  while (true) {
    size_t slash = path.find('/', pos);
    std::string prefix = (slash == std::string::npos) ? path : path.substr(0, slash);

    if (!prefix.empty() && mkdir(prefix.c_str(), APP_DIR_MODE) != 0) {
      if (errno != EEXIST) {
        errorMsg = describeErrno("cannot create directory", prefix);
        return false;
      }
      struct stat st;
      if (stat(prefix.c_str(), &st) != 0 || !S_ISDIR(st.st_mode)) {
        errorMsg = "cannot create directory " + prefix + ": not a directory";
        return false;
      }
    }

    if (slash == std::string::npos)
      break;
    pos = slash + 1;
  }
  return true;
}

// =================================================================================
// SECTION: SESSION STATE
// =================================================================================

LoadResult loadSessionState(const std::string &path, SessionState &state) {
  state = EMPTY_SESSION_STATE;

  std::string text;
  std::string err;
  ReadResult result = readTextFile(path, text, err);

  if (result == READ_MISSING) {
    logKeyValue("Storage", "No session record. Idle.");
    return LOAD_MISSING;
  }
  if (result == READ_FAILED) {
    logKeyValue("Storage", err.c_str());
    return LOAD_UNREADABLE;
  }

  SessionState parsed;
  if (!SettingsCodec::decodeState(text, parsed, err)) {
    std::string msg = "Ignoring malformed " + path + ": " + err;
    logKeyValue("Storage", msg.c_str());
    return LOAD_MALFORMED;
  }

  state = parsed;
  return LOAD_OK;
}

bool saveSessionState(const std::string &path, const SessionState &state, std::string &errorMsg) {
  std::string text;
  SettingsCodec::encodeState(state, text);

  if (!writeTextFileAtomic(path, text, errorMsg)) {
    logKeyValue("Storage", errorMsg.c_str());
    return false;
  }

  logKeyValue("Storage", state.hasStartedAt ? "Saved session record (running)." : "Saved session record (idle).");
  return true;
}
