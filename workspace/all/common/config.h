#ifndef __CONFIG_H__
#define __CONFIG_H__

#include <stdint.h>
#include <string>
#include <vector>

#include "defines.h"

// Launcher settings are read-only at runtime.
// Sources, later ones win: CFG_DEFAULT_* below, the config file
// (MIMIKI_CONFIG_PATH or $MIMIKI_CONFIG), MIMIKI_<KEY> environment variables.

struct LauncherSettings
{
	// Content
	std::vector<std::string> romRoots;
	int maxGames;

	// Input
	std::string inputDir;
	uint32_t longPressMs;
	uint32_t wakeDebounceMs;

	// Control surfaces
	std::string cpuRoot;
	std::string gpuGovernorPath;
	std::string backlightPath;
	std::string sleepStatePath;

	// Idle power policy
	std::string idleCpuGovernor;
	std::string idleGpuGovernor;

	// Display
	int brightnessDefault; // percent, 4-100 in steps of 16
	bool backlightEnabled;
	uint32_t frameDelayMs;
	std::string fontPath;
	int fontSize;
	std::string backgroundPath;

	// Power
	bool poweroffOnShutdown;
	std::string poweroffCommand;

	int logLevel;
};

#define CFG_DEFAULT_ROM_ROOTS MIMIKI_ROM_PATH ":" MIMIKI_ROM2_PATH
#define CFG_DEFAULT_MAX_GAMES MAX_GAMES
#define CFG_DEFAULT_INPUT_DIR INPUT_DEVICE_PATH
#define CFG_DEFAULT_LONG_PRESS_MS 1750
#define CFG_DEFAULT_WAKE_DEBOUNCE_MS 500
#define CFG_DEFAULT_CPU_ROOT CPU_SYSFS_PATH
#define CFG_DEFAULT_GPU_GOVERNOR_PATH GPU_GOVERNOR_PATH
#define CFG_DEFAULT_BACKLIGHT_PATH BACKLIGHT_PATH
#define CFG_DEFAULT_SLEEP_STATE_PATH SLEEP_STATE_PATH
#define CFG_DEFAULT_IDLE_CPU_GOVERNOR "powersave"
#define CFG_DEFAULT_IDLE_GPU_GOVERNOR "powersave"
#define CFG_DEFAULT_BRIGHTNESS 52 // ~50%
#define CFG_DEFAULT_BACKLIGHT_ENABLED true
#define CFG_DEFAULT_FRAME_DELAY_MS 100 // ~10 FPS is fine for a basic menu
#define CFG_DEFAULT_FONT_PATH MIMIKI_ASSET_PATH "/font.ttf"
#define CFG_DEFAULT_FONT_SIZE 20
#define CFG_DEFAULT_BACKGROUND_PATH MIMIKI_ASSET_PATH "/bg.png"
#define CFG_DEFAULT_POWEROFF_ON_SHUTDOWN true
#define CFG_DEFAULT_POWEROFF_COMMAND "/sbin/poweroff"
#define CFG_DEFAULT_LOG_LEVEL "info"

LauncherSettings CFG_defaults(void);

// Sets one key from its text form. Unknown keys and malformed values
// are logged and leave the settings untouched.
bool CFG_set(LauncherSettings* settings, const std::string& key, const std::string& value);

// Reads key=value lines, '#' starts a comment. Returns false if the
// file could not be opened (not an error, the defaults stand).
bool CFG_loadFile(LauncherSettings* settings, const std::string& path);

// Applies MIMIKI_<KEY> overrides, e.g. MIMIKI_ROM_ROOTS=/a:/b
void CFG_loadEnvironment(LauncherSettings* settings);

// Defaults, then config file, then environment.
LauncherSettings CFG_load(void);

void CFG_print(const LauncherSettings* settings);

#endif
