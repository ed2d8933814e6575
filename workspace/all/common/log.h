#ifndef __LOG_H__
#define __LOG_H__

///////////////////////////////
// Logging
// printf-style, callers supply their own trailing newline.
// debug/info go to stdout, warn/error to stderr.
///////////////////////////////

enum {
	LOG_LEVEL_DEBUG,
	LOG_LEVEL_INFO,
	LOG_LEVEL_WARN,
	LOG_LEVEL_ERROR,
};

void LOG_setLevel(int level);
int LOG_getLevel(void);

// Returns -1 for an unknown name ("debug", "info", "warn", "error")
int LOG_levelFromName(const char* name);

void LOG_note(int level, const char* fmt, ...) __attribute__((format(printf, 2, 3)));

#define LOG_debug(fmt, ...) LOG_note(LOG_LEVEL_DEBUG, fmt, ##__VA_ARGS__)
#define LOG_info(fmt, ...) LOG_note(LOG_LEVEL_INFO, fmt, ##__VA_ARGS__)
#define LOG_warn(fmt, ...) LOG_note(LOG_LEVEL_WARN, fmt, ##__VA_ARGS__)
#define LOG_error(fmt, ...) LOG_note(LOG_LEVEL_ERROR, fmt, ##__VA_ARGS__)

#endif // __LOG_H__
