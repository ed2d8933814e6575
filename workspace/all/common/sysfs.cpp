#include "sysfs.h"

#include <cstdio>

bool Sysfs_write(const std::string& path, const std::string& value)
{
	FILE* fp = fopen(path.c_str(), "w");
	if (!fp)
		return false;

	int written = fprintf(fp, "%s\n", value.c_str());
	// sysfs reports rejected values on flush, not on fprintf
	int closed = fclose(fp);
	return written >= 0 && closed == 0;
}

bool Sysfs_writeInt(const std::string& path, int value)
{
	char buffer[16];
	snprintf(buffer, sizeof(buffer), "%d", value);
	return Sysfs_write(path, buffer);
}
