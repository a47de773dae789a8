/*
 * File: test/test_file_storage/test_file_storage.cpp
 * Description: Integration tests for FileSessionHAL on a real filesystem.
 * Each test gets a fresh temporary directory holding config/ and data/.
 */
#include <unity.h>
#include <dirent.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>
#include <sys/stat.h>
#include <string>

#include "Config.h"
#include "FileSessionHAL.h"
#include "Logger.h"
#include "Session.h"
#include "Utils.h"

// --- Fixture ---
static char tempRoot[] = "/tmp/tomato_storage_XXXXXX";
static std::string root;
static std::string configDir;
static std::string dataDir;

// --- Helpers ---
static void removeTree(const std::string& path) {
    DIR* dir = opendir(path.c_str());
    if (dir != nullptr) {
        struct dirent* entry;
        while ((entry = readdir(dir)) != nullptr) {
            if (strcmp(entry->d_name, ".") == 0 || strcmp(entry->d_name, "..") == 0) continue;
            removeTree(path + "/" + entry->d_name);
        }
        closedir(dir);
        rmdir(path.c_str());
    } else {
        unlink(path.c_str());
    }
}

static bool fileExists(const std::string& path) {
    struct stat st;
    return stat(path.c_str(), &st) == 0;
}

static void writeFile(const std::string& path, const char* text) {
    FILE* f = fopen(path.c_str(), "w");
    TEST_ASSERT_NOT_NULL(f);
    fputs(text, f);
    fclose(f);
}

static bool contains(const std::string& text, const char* needle) {
    return text.find(needle) != std::string::npos;
}

static long fileSize(const std::string& path) {
    struct stat st;
    if (stat(path.c_str(), &st) != 0) return -1;
    return (long)st.st_size;
}

static std::string readFile(const std::string& path) {
    std::string out;
    FILE* f = fopen(path.c_str(), "r");
    if (f == nullptr) return out;
    char chunk[256];
    size_t n;
    while ((n = fread(chunk, 1, sizeof(chunk), f)) > 0) out.append(chunk, n);
    fclose(f);
    return out;
}

void setUp(void) {
    strcpy(tempRoot, "/tmp/tomato_storage_XXXXXX");
    TEST_ASSERT_NOT_NULL(mkdtemp(tempRoot));
    root = tempRoot;
    configDir = root + "/config/tomato";
    dataDir = root + "/data/tomato";
    clearLogQueue();
}

void tearDown(void) {
    removeTree(root);
    clearLogQueue();
}

// ============================================================================
// SESSION STATE
// ============================================================================

void test_missing_state_is_idle(void) {
    FileSessionHAL hal(configDir, dataDir);
    SessionState st = { true, 99 };

    TEST_ASSERT_EQUAL(LOAD_MISSING, hal.loadState(st));
    TEST_ASSERT_FALSE(st.hasStartedAt);
}

void test_state_round_trip_creates_directories(void) {
    FileSessionHAL hal(configDir, dataDir);
    SessionState saved = { true, 1700000000ULL };

    TEST_ASSERT_TRUE(hal.saveState(saved));
    TEST_ASSERT_TRUE(fileExists(dataDir + "/state.json"));
    TEST_ASSERT_FALSE(fileExists(dataDir + "/state.json.tmp"));

    SessionState loaded = EMPTY_SESSION_STATE;
    TEST_ASSERT_EQUAL(LOAD_OK, hal.loadState(loaded));
    TEST_ASSERT_TRUE(loaded.hasStartedAt);
    TEST_ASSERT_TRUE(loaded.startedAt == 1700000000ULL);
}

void test_cleared_state_round_trip(void) {
    FileSessionHAL hal(configDir, dataDir);
    SessionState running = { true, 1234 };
    TEST_ASSERT_TRUE(hal.saveState(running));
    TEST_ASSERT_TRUE(hal.saveState(EMPTY_SESSION_STATE));

    SessionState loaded = running;
    TEST_ASSERT_EQUAL(LOAD_OK, hal.loadState(loaded));
    TEST_ASSERT_FALSE(loaded.hasStartedAt);
    TEST_ASSERT_TRUE(readFile(dataDir + "/state.json").find("null") != std::string::npos);
}

void test_malformed_state_falls_back_to_idle(void) {
    FileSessionHAL hal(configDir, dataDir);
    std::string err;
    TEST_ASSERT_TRUE(ensureDirectory(dataDir, err));
    writeFile(dataDir + "/state.json", "started_at = 1234\n");

    SessionState st = { true, 1 };
    TEST_ASSERT_EQUAL(LOAD_MALFORMED, hal.loadState(st));
    TEST_ASSERT_FALSE(st.hasStartedAt);
    TEST_ASSERT_TRUE(pendingLogCount() > 0);
    TEST_ASSERT_TRUE(strstr(getLogLine(pendingLogCount() - 1), "Ignoring malformed") != nullptr);
}

void test_stop_replaces_malformed_record(void) {
    FileSessionHAL hal(configDir, dataDir);
    PomodoroSession session(hal);
    std::string err;
    TEST_ASSERT_TRUE(ensureDirectory(dataDir, err));
    writeFile(dataDir + "/state.json", "{\"started_at\": \"yesterday\"}");

    TEST_ASSERT_EQUAL(200, session.stop());

    SessionState st = { true, 1 };
    TEST_ASSERT_EQUAL(LOAD_OK, hal.loadState(st));
    TEST_ASSERT_FALSE(st.hasStartedAt);

    // Clean record now, so a second stop has nothing to do
    TEST_ASSERT_EQUAL(304, session.stop());
}

void test_state_write_failure_is_reported(void) {
    // A regular file where the data directory should be
    writeFile(root + "/data", "not a directory");
    FileSessionHAL hal(configDir, dataDir);

    SessionState st = { true, 1 };
    TEST_ASSERT_FALSE(hal.saveState(st));
    TEST_ASSERT_FALSE(hal.getLastError().empty());
}

// ============================================================================
// CONFIGURATION
// ============================================================================

void test_missing_config_uses_defaults(void) {
    FileSessionHAL hal(configDir, dataDir);
    PomodoroConfig cfg;
    cfg.workDuration = 1;

    TEST_ASSERT_FALSE(hal.loadConfig(cfg));
    TEST_ASSERT_EQUAL_UINT32(1500, cfg.workDuration);
    TEST_ASSERT_EQUAL_UINT32(300, cfg.restDuration);
    TEST_ASSERT_EQUAL_UINT32(8, cfg.repeatCount);
}

void test_hand_edited_config_is_used(void) {
    FileSessionHAL hal(configDir, dataDir);
    std::string err;
    TEST_ASSERT_TRUE(ensureDirectory(configDir, err));
    writeFile(configDir + "/config.json", "{ \"count\": 4, \"duration\": 50, \"rest\": 10, \"display\": \"compact\" }\n");

    PomodoroConfig cfg;
    TEST_ASSERT_TRUE(hal.loadConfig(cfg));
    TEST_ASSERT_EQUAL_UINT32(3000, cfg.workDuration);
    TEST_ASSERT_EQUAL_UINT32(600, cfg.restDuration);
    TEST_ASSERT_EQUAL_UINT32(4, cfg.repeatCount);
    TEST_ASSERT_EQUAL(DISPLAY_COMPACT, cfg.displayMode);
}

void test_invalid_config_uses_defaults(void) {
    FileSessionHAL hal(configDir, dataDir);
    std::string err;
    TEST_ASSERT_TRUE(ensureDirectory(configDir, err));
    writeFile(configDir + "/config.json", "{ \"duration\": 0 }");

    PomodoroConfig cfg;
    TEST_ASSERT_FALSE(hal.loadConfig(cfg));
    TEST_ASSERT_EQUAL_UINT32(1500, cfg.workDuration);
}

void test_saved_config_uses_original_field_names(void) {
    FileSessionHAL hal(configDir, dataDir);

    TEST_ASSERT_TRUE(hal.saveConfig(DEFAULT_POMODORO_CONFIG));

    std::string text = readFile(hal.getConfigPath());
    TEST_ASSERT_TRUE(text.find("\"count\": 8") != std::string::npos);
    TEST_ASSERT_TRUE(text.find("\"duration\": 25") != std::string::npos);
    TEST_ASSERT_TRUE(text.find("\"rest\": 5") != std::string::npos);

    PomodoroConfig cfg;
    TEST_ASSERT_TRUE(hal.loadConfig(cfg));
    TEST_ASSERT_EQUAL_UINT32(1500, cfg.workDuration);
}

// ============================================================================
// LOGGING
// ============================================================================

void test_log_not_written_before_first_save(void) {
    FileSessionHAL hal(configDir, dataDir);
    hal.log("hello");

    TEST_ASSERT_TRUE(hal.flushLog());
    TEST_ASSERT_FALSE(fileExists(hal.getLogPath()));
    TEST_ASSERT_EQUAL(0, pendingLogCount());
}

void test_log_flushed_after_save(void) {
    FileSessionHAL hal(configDir, dataDir);
    TEST_ASSERT_TRUE(hal.saveState(EMPTY_SESSION_STATE));
    hal.logKeyValue("Test", "marker line");

    TEST_ASSERT_TRUE(hal.flushLog());
    std::string text = readFile(hal.getLogPath());
    TEST_ASSERT_TRUE(text.find("Test     : marker line") != std::string::npos);
    TEST_ASSERT_EQUAL(0, pendingLogCount());
}

void test_full_queue_drops_and_reports(void) {
    FileSessionHAL hal(configDir, dataDir);
    TEST_ASSERT_TRUE(hal.saveState(EMPTY_SESSION_STATE));
    clearLogQueue();

    char line[32];
    for (int i = 0; i < LOG_QUEUE_SIZE + 10; i++) {
        snprintf(line, sizeof(line), "line %d", i);
        hal.log(line);
    }

    TEST_ASSERT_EQUAL(LOG_QUEUE_SIZE, pendingLogCount());
    TEST_ASSERT_EQUAL(10, droppedLogCount());
    TEST_ASSERT_TRUE(strstr(getLogLine(0), " line 0") != nullptr);
    snprintf(line, sizeof(line), " line %d", LOG_QUEUE_SIZE - 1);
    TEST_ASSERT_TRUE(strstr(getLogLine(LOG_QUEUE_SIZE - 1), line) != nullptr);
    TEST_ASSERT_EQUAL_STRING("", getLogLine(LOG_QUEUE_SIZE));
    TEST_ASSERT_EQUAL_STRING("", getLogLine(-1));

    TEST_ASSERT_TRUE(hal.flushLog());
    TEST_ASSERT_EQUAL(0, droppedLogCount());

    std::string text = readFile(hal.getLogPath());
    snprintf(line, sizeof(line), " line %d\n", LOG_QUEUE_SIZE - 1);
    TEST_ASSERT_TRUE(contains(text, line));
    snprintf(line, sizeof(line), " line %d\n", LOG_QUEUE_SIZE);
    TEST_ASSERT_FALSE(contains(text, line));
    TEST_ASSERT_TRUE(contains(text, "... 10 log line(s) dropped (queue full)\n"));
}

void test_log_appends_below_size_limit(void) {
    std::string err;
    TEST_ASSERT_TRUE(ensureDirectory(dataDir, err));
    FileSessionHAL hal(configDir, dataDir);
    writeFile(hal.getLogPath(), "earlier entry\n");

    hal.log("later entry");
    TEST_ASSERT_TRUE(hal.flushLog());

    std::string text = readFile(hal.getLogPath());
    TEST_ASSERT_TRUE(text.compare(0, 14, "earlier entry\n") == 0);
    TEST_ASSERT_TRUE(contains(text, "later entry"));
}

void test_oversized_log_starts_over(void) {
    std::string err;
    TEST_ASSERT_TRUE(ensureDirectory(dataDir, err));
    FileSessionHAL hal(configDir, dataDir);

    std::string filler(LOG_FILE_MAX_BYTES + 4096, 'x');
    writeFile(hal.getLogPath(), filler.c_str());
    TEST_ASSERT_TRUE(fileSize(hal.getLogPath()) > LOG_FILE_MAX_BYTES);

    hal.log("fresh entry");
    TEST_ASSERT_TRUE(hal.flushLog());

    long size = fileSize(hal.getLogPath());
    TEST_ASSERT_TRUE(size > 0);
    TEST_ASSERT_TRUE(size < LOG_FILE_MAX_BYTES);
    std::string text = readFile(hal.getLogPath());
    TEST_ASSERT_TRUE(contains(text, "fresh entry"));
    TEST_ASSERT_FALSE(contains(text, "xxxx"));
}

// ============================================================================
// DIRECTORY RESOLUTION
// ============================================================================

void test_resolve_directories_prefers_xdg(void) {
    setenv("XDG_CONFIG_HOME", "/xdg/config", 1);
    setenv("XDG_DATA_HOME", "/xdg/data", 1);
    setenv("HOME", "/home/someone", 1);

    std::string c, d, err;
    TEST_ASSERT_TRUE(resolveUserDirectories(c, d, err));
    TEST_ASSERT_EQUAL_STRING("/xdg/config/tomato", c.c_str());
    TEST_ASSERT_EQUAL_STRING("/xdg/data/tomato", d.c_str());
}

void test_resolve_directories_falls_back_to_home(void) {
    unsetenv("XDG_CONFIG_HOME");
    setenv("XDG_DATA_HOME", "relative/path", 1);
    setenv("HOME", "/home/someone", 1);

    std::string c, d, err;
    TEST_ASSERT_TRUE(resolveUserDirectories(c, d, err));
    TEST_ASSERT_EQUAL_STRING("/home/someone/.config/tomato", c.c_str());
    TEST_ASSERT_EQUAL_STRING("/home/someone/.local/share/tomato", d.c_str());
}

void test_resolve_directories_without_home_fails(void) {
    unsetenv("XDG_CONFIG_HOME");
    unsetenv("XDG_DATA_HOME");
    unsetenv("HOME");

    std::string c, d, err;
    TEST_ASSERT_FALSE(resolveUserDirectories(c, d, err));
    TEST_ASSERT_FALSE(err.empty());
}

int main(void) {
    UNITY_BEGIN();

    RUN_TEST(test_missing_state_is_idle);
    RUN_TEST(test_state_round_trip_creates_directories);
    RUN_TEST(test_cleared_state_round_trip);
    RUN_TEST(test_malformed_state_falls_back_to_idle);
    RUN_TEST(test_state_write_failure_is_reported);
    RUN_TEST(test_stop_replaces_malformed_record);

    RUN_TEST(test_missing_config_uses_defaults);
    RUN_TEST(test_hand_edited_config_is_used);
    RUN_TEST(test_invalid_config_uses_defaults);
    RUN_TEST(test_saved_config_uses_original_field_names);

    RUN_TEST(test_log_not_written_before_first_save);
    RUN_TEST(test_log_flushed_after_save);
    RUN_TEST(test_full_queue_drops_and_reports);
    RUN_TEST(test_log_appends_below_size_limit);
    RUN_TEST(test_oversized_log_starts_over);

    RUN_TEST(test_resolve_directories_prefers_xdg);
    RUN_TEST(test_resolve_directories_falls_back_to_home);
    RUN_TEST(test_resolve_directories_without_home_fails);

    return UNITY_END();
}
