#ifndef __SYSFS_H__
#define __SYSFS_H__

#include <string>

// Plain-text control surfaces (governors, backlight, sleep state).
// One value per write, newline terminated. Failures are logged by the caller.

bool Sysfs_write(const std::string& path, const std::string& value);
bool Sysfs_writeInt(const std::string& path, int value);

#endif
