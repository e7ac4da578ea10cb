/**
 * mesh_log.cpp - Logging implementation
 * 
 */

#include "mesh_log.h"

#include <chrono>
#include <cstdio>
#include <ctime>
#include <mutex>

#ifndef MESHLINK_DEBUG
  #define MESHLINK_DEBUG 0
#endif

#define LOG_LINE_MAX  512

namespace {

MeshLogLevel g_level = MESHLINK_DEBUG ? MESHLINK_LOG_DEBUG : MESHLINK_LOG_INFO;
MeshLogSink g_sink;
std::mutex g_mutex;

// HH:MM:SS.mmm, local time
void formatTimestamp(char* buf, size_t len) {
    using namespace std::chrono;
    system_clock::time_point now = system_clock::now();
    time_t secs = system_clock::to_time_t(now);
    int millis = (int)(duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000);
    struct tm tmv;
    localtime_r(&secs, &tmv);
    snprintf(buf, len, "%02d:%02d:%02d.%03d", tmv.tm_hour, tmv.tm_min, tmv.tm_sec, millis);
}

}  // namespace

void MeshLog::setLevel(MeshLogLevel level) {
    std::lock_guard<std::mutex> lock(g_mutex);
    g_level = level;
}

MeshLogLevel MeshLog::level() {
    std::lock_guard<std::mutex> lock(g_mutex);
    return g_level;
}

bool MeshLog::enabled(MeshLogLevel level) {
    return level != MESHLINK_LOG_NONE && level >= MeshLog::level();
}

void MeshLog::setSink(const MeshLogSink& sink) {
    std::lock_guard<std::mutex> lock(g_mutex);
    g_sink = sink;
}

const char* MeshLog::levelName(MeshLogLevel level) {
    switch (level) {
        case MESHLINK_LOG_DEBUG: return "DEBUG";
        case MESHLINK_LOG_INFO:  return "INFO";
        case MESHLINK_LOG_WARN:  return "WARN";
        case MESHLINK_LOG_ERROR: return "ERROR";
        case MESHLINK_LOG_NONE:  return "NONE";
    }
    return "?";
}

void MeshLog::write(MeshLogLevel level, const char* tag, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vwrite(level, tag, fmt, args);
    va_end(args);
}

void MeshLog::vwrite(MeshLogLevel level, const char* tag, const char* fmt, va_list args) {
    char ts[16];
    formatTimestamp(ts, sizeof(ts));

    char line[LOG_LINE_MAX];
    int prefix = snprintf(line, sizeof(line), "%s %-5s [%s] ", ts, levelName(level), tag ? tag : "-");
    if (prefix < 0) {
        return;
    }
    if ((size_t)prefix < sizeof(line)) {
        vsnprintf(line + prefix, sizeof(line) - prefix, fmt, args);  // truncates long lines
    }

    std::lock_guard<std::mutex> lock(g_mutex);
    if (g_sink) {
        g_sink(level, line);
    } else {
        fprintf(stderr, "%s\n", line);
    }
}
