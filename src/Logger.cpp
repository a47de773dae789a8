#include "Logger.h"
#include "Config.h"

#include <stdio.h>
#include <string.h>
#include <time.h>
#include <sys/stat.h>

// --- Logging System ---
// Bounded queue, drained once per invocation.
static char logQueue[LOG_QUEUE_SIZE][MAX_LOG_LENGTH];
static int logQueueCount = 0;
static int logDropped = 0;

/**
 * Adds a timestamped message to the in-memory queue. NO FILE IO IN THIS FUNCTION.
 * Messages arriving while the queue is full are counted and dropped.
 */
void logMessage(const char *message) {
  if (logQueueCount >= LOG_QUEUE_SIZE) {
    logDropped++;
    return;
  }

  char stamp[24] = "";
  time_t now = time(nullptr);
  struct tm local;
  if (localtime_r(&now, &local) != nullptr) {
    strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", &local);
  }

  snprintf(logQueue[logQueueCount], MAX_LOG_LENGTH, "%s %s", stamp, message ? message : "");
  logQueueCount++;
}

void logKeyValue(const char *key, const char *value) {
  char tempBuf[MAX_LOG_LENGTH];
  snprintf(tempBuf, sizeof(tempBuf), " %-8s : %s", key, value);
  logMessage(tempBuf);
}

int pendingLogCount() { return logQueueCount; }

int droppedLogCount() { return logDropped; }

void clearLogQueue() {
  logQueueCount = 0;
  logDropped = 0;
}

const char *getLogLine(int index) {
  if (index >= 0 && index < logQueueCount)
    return logQueue[index];
  return "";
}

/**
 * Drains the queue to the log file.
 * Called once, after the command finished, so a slow or failing disk never
 * changes the command's outcome.
 */
bool flushLogQueue(const char *path) {
  if (logQueueCount == 0 && logDropped == 0) {
    return true;
  }

  // Start over instead of growing without bound
  const char *mode = "a";
  struct stat st;
  if (stat(path, &st) == 0 && st.st_size > LOG_FILE_MAX_BYTES) {
    mode = "w";
  }

  FILE *file = fopen(path, mode);
  if (file == nullptr) {
    clearLogQueue();
    return false;
  }

  bool ok = true;
  for (int i = 0; i < logQueueCount; i++) {
    if (fprintf(file, "%s\n", logQueue[i]) < 0) {
      ok = false;
      break;
    }
  }
  if (ok && logDropped > 0) {
    ok = fprintf(file, "... %d log line(s) dropped (queue full)\n", logDropped) >= 0;
  }
  if (fclose(file) != 0) {
    ok = false;
  }

  clearLogQueue();
  return ok;
}
