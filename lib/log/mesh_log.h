/**
 * mesh_log.h - Levelled, tagged logging for meshlink
 * 
 * Lines are formatted as:
 *   HH:MM:SS.mmm LEVEL [tag] message
 * 
 * and written to stderr unless a sink is installed (the console tool and the
 * tests install their own). The level is a runtime setting; building with
 * MESHLINK_DEBUG=1 lowers the default to DEBUG.
 */

#ifndef MESH_LOG_H
#define MESH_LOG_H

#include <cstdarg>
#include <functional>

enum MeshLogLevel {
    MESHLINK_LOG_DEBUG = 0,
    MESHLINK_LOG_INFO  = 1,
    MESHLINK_LOG_WARN  = 2,
    MESHLINK_LOG_ERROR = 3,
    MESHLINK_LOG_NONE  = 4
};

// Receives one fully formatted line, without trailing newline
typedef std::function<void(MeshLogLevel level, const char* line)> MeshLogSink;

class MeshLog {
public:
    static void setLevel(MeshLogLevel level);
    static MeshLogLevel level();
    static bool enabled(MeshLogLevel level);

    /**
     * Route output somewhere other than stderr. Pass an empty function to
     * restore the default.
     */
    static void setSink(const MeshLogSink& sink);

    static const char* levelName(MeshLogLevel level);

#if defined(__GNUC__)
    __attribute__((format(printf, 3, 4)))
#endif
    static void write(MeshLogLevel level, const char* tag, const char* fmt, ...);

    static void vwrite(MeshLogLevel level, const char* tag, const char* fmt, va_list args);
};

#define MESHLINK_LOG_AT(lvl, tag, F, ...) \
    do { if (MeshLog::enabled(lvl)) MeshLog::write(lvl, tag, F, ##__VA_ARGS__); } while (0)

#define MESH_LOGD(tag, F, ...) MESHLINK_LOG_AT(MESHLINK_LOG_DEBUG, tag, F, ##__VA_ARGS__)
#define MESH_LOGI(tag, F, ...) MESHLINK_LOG_AT(MESHLINK_LOG_INFO, tag, F, ##__VA_ARGS__)
#define MESH_LOGW(tag, F, ...) MESHLINK_LOG_AT(MESHLINK_LOG_WARN, tag, F, ##__VA_ARGS__)
#define MESH_LOGE(tag, F, ...) MESHLINK_LOG_AT(MESHLINK_LOG_ERROR, tag, F, ##__VA_ARGS__)

#endif // MESH_LOG_H
