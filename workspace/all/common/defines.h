#ifndef __DEFINES_H__
#define __DEFINES_H__

///////////////////////////////////////
// Filesystem layout

#define MIMIKI_ROM_PATH "/mnt/games"
#define MIMIKI_ROM2_PATH "/mnt/games2"
#define MIMIKI_BIN_PATH "/usr/bin"
#define MIMIKI_ASSET_PATH "/usr/share/mimiki/assets"
#define MIMIKI_CONFIG_PATH "/etc/mimiki/launcher.cfg"
#define AMIXER_PATH "/usr/bin/amixer"

#define INPUT_DEVICE_PATH "/dev/input"

///////////////////////////////////////
// Control surfaces

#define CPU_SYSFS_PATH "/sys/devices/system/cpu"
#define GPU_GOVERNOR_PATH "/sys/class/devfreq/fde60000.gpu/governor"
#define BACKLIGHT_PATH "/sys/class/backlight/backlight/brightness"
#define SLEEP_STATE_PATH "/sys/power/state"

///////////////////////////////////////
// Display

#define SCREEN_WIDTH 640
#define SCREEN_HEIGHT 480

#define MAX_GAMES 256
#define GAMES_PER_PAGE 10

#endif
