#include "log.h"

#include <cstdarg>
#include <cstdio>
#include <strings.h>

static int log_level = LOG_LEVEL_INFO;

static const char* level_tags[] = {
	"[DEBUG]",
	"[INFO]",
	"[WARN]",
	"[ERROR]",
};

void LOG_setLevel(int level)
{
	if (level < LOG_LEVEL_DEBUG)
		level = LOG_LEVEL_DEBUG;
	if (level > LOG_LEVEL_ERROR)
		level = LOG_LEVEL_ERROR;
	log_level = level;
}

int LOG_getLevel(void)
{
	return log_level;
}

int LOG_levelFromName(const char* name)
{
	if (!name)
		return -1;
	if (strcasecmp(name, "debug") == 0)
		return LOG_LEVEL_DEBUG;
	if (strcasecmp(name, "info") == 0)
		return LOG_LEVEL_INFO;
	if (strcasecmp(name, "warn") == 0 || strcasecmp(name, "warning") == 0)
		return LOG_LEVEL_WARN;
	if (strcasecmp(name, "error") == 0)
		return LOG_LEVEL_ERROR;
	return -1;
}

void LOG_note(int level, const char* fmt, ...)
{
	if (level < LOG_LEVEL_DEBUG || level > LOG_LEVEL_ERROR)
		level = LOG_LEVEL_ERROR;
	if (level < log_level)
		return;

	FILE* out = level >= LOG_LEVEL_WARN ? stderr : stdout;
	fprintf(out, "%s ", level_tags[level]);

	va_list args;
	va_start(args, fmt);
	vfprintf(out, fmt, args);
	va_end(args);

	fflush(out);
}
