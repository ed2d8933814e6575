#include "config.h"
#include "log.h"

#include <cctype>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <functional>
#include <sstream>

namespace {
	bool parseInt(const std::string& text, long min, long max, long& out)
	{
		if (text.empty())
			return false;
		char* end = nullptr;
		errno = 0;
		long value = strtol(text.c_str(), &end, 10);
		if (errno != 0 || *end != '\0' || value < min || value > max)
			return false;
		out = value;
		return true;
	}

	bool parseBool(const std::string& text, bool& out)
	{
		if (text == "1" || text == "true" || text == "yes" || text == "on") {
			out = true;
			return true;
		}
		if (text == "0" || text == "false" || text == "no" || text == "off") {
			out = false;
			return true;
		}
		return false;
	}

	std::vector<std::string> splitList(const std::string& text)
	{
		std::vector<std::string> items;
		std::stringstream stream(text);
		std::string item;
		while (std::getline(stream, item, ':')) {
			if (!item.empty())
				items.push_back(item);
		}
		return items;
	}

	std::string trim(const std::string& text)
	{
		size_t start = 0;
		while (start < text.size() && isspace((unsigned char)text[start]))
			start++;
		size_t end = text.size();
		while (end > start && isspace((unsigned char)text[end - 1]))
			end--;
		return text.substr(start, end - start);
	}

	typedef std::function<bool(LauncherSettings*, const std::string&)> Setter;

	Setter stringSetter(std::string LauncherSettings::*field)
	{
		return [field](LauncherSettings* s, const std::string& value) {
			if (value.empty())
				return false;
			s->*field = value;
			return true;
		};
	}

	Setter uintSetter(uint32_t LauncherSettings::*field, long max)
	{
		return [field, max](LauncherSettings* s, const std::string& value) {
			long parsed;
			if (!parseInt(value, 0, max, parsed))
				return false;
			s->*field = (uint32_t)parsed;
			return true;
		};
	}

	Setter intSetter(int LauncherSettings::*field, long min, long max)
	{
		return [field, min, max](LauncherSettings* s, const std::string& value) {
			long parsed;
			if (!parseInt(value, min, max, parsed))
				return false;
			s->*field = (int)parsed;
			return true;
		};
	}

	Setter boolSetter(bool LauncherSettings::*field)
	{
		return [field](LauncherSettings* s, const std::string& value) {
			bool parsed;
			if (!parseBool(value, parsed))
				return false;
			s->*field = parsed;
			return true;
		};
	}

	struct Key {
		const char* name;
		Setter set;
	};

	const std::vector<Key>& keys()
	{
		static const std::vector<Key> table = {
			{"rom_roots", [](LauncherSettings* s, const std::string& value) {
				std::vector<std::string> roots = splitList(value);
				if (roots.empty())
					return false;
				s->romRoots = roots;
				return true;
			}},
			{"max_games", intSetter(&LauncherSettings::maxGames, 1, 65536)},
			{"input_dir", stringSetter(&LauncherSettings::inputDir)},
			{"long_press_ms", uintSetter(&LauncherSettings::longPressMs, 60000)},
			{"wake_debounce_ms", uintSetter(&LauncherSettings::wakeDebounceMs, 60000)},
			{"cpu_root", stringSetter(&LauncherSettings::cpuRoot)},
			{"gpu_governor_path", stringSetter(&LauncherSettings::gpuGovernorPath)},
			{"backlight_path", stringSetter(&LauncherSettings::backlightPath)},
			{"sleep_state_path", stringSetter(&LauncherSettings::sleepStatePath)},
			{"idle_cpu_governor", stringSetter(&LauncherSettings::idleCpuGovernor)},
			{"idle_gpu_governor", stringSetter(&LauncherSettings::idleGpuGovernor)},
			{"brightness_default", intSetter(&LauncherSettings::brightnessDefault, 4, 100)},
			{"backlight_enabled", boolSetter(&LauncherSettings::backlightEnabled)},
			{"frame_delay_ms", uintSetter(&LauncherSettings::frameDelayMs, 1000)},
			{"font_path", stringSetter(&LauncherSettings::fontPath)},
			{"font_size", intSetter(&LauncherSettings::fontSize, 6, 96)},
			{"background_path", stringSetter(&LauncherSettings::backgroundPath)},
			{"poweroff_on_shutdown", boolSetter(&LauncherSettings::poweroffOnShutdown)},
			{"poweroff_command", stringSetter(&LauncherSettings::poweroffCommand)},
			{"log_level", [](LauncherSettings* s, const std::string& value) {
				int level = LOG_levelFromName(value.c_str());
				if (level < 0)
					return false;
				s->logLevel = level;
				return true;
			}},
		};
		return table;
	}
}

LauncherSettings CFG_defaults(void)
{
	LauncherSettings s;
	s.romRoots = splitList(CFG_DEFAULT_ROM_ROOTS);
	s.maxGames = CFG_DEFAULT_MAX_GAMES;
	s.inputDir = CFG_DEFAULT_INPUT_DIR;
	s.longPressMs = CFG_DEFAULT_LONG_PRESS_MS;
	s.wakeDebounceMs = CFG_DEFAULT_WAKE_DEBOUNCE_MS;
	s.cpuRoot = CFG_DEFAULT_CPU_ROOT;
	s.gpuGovernorPath = CFG_DEFAULT_GPU_GOVERNOR_PATH;
	s.backlightPath = CFG_DEFAULT_BACKLIGHT_PATH;
	s.sleepStatePath = CFG_DEFAULT_SLEEP_STATE_PATH;
	s.idleCpuGovernor = CFG_DEFAULT_IDLE_CPU_GOVERNOR;
	s.idleGpuGovernor = CFG_DEFAULT_IDLE_GPU_GOVERNOR;
	s.brightnessDefault = CFG_DEFAULT_BRIGHTNESS;
	s.backlightEnabled = CFG_DEFAULT_BACKLIGHT_ENABLED;
	s.frameDelayMs = CFG_DEFAULT_FRAME_DELAY_MS;
	s.fontPath = CFG_DEFAULT_FONT_PATH;
	s.fontSize = CFG_DEFAULT_FONT_SIZE;
	s.backgroundPath = CFG_DEFAULT_BACKGROUND_PATH;
	s.poweroffOnShutdown = CFG_DEFAULT_POWEROFF_ON_SHUTDOWN;
	s.poweroffCommand = CFG_DEFAULT_POWEROFF_COMMAND;
	s.logLevel = LOG_levelFromName(CFG_DEFAULT_LOG_LEVEL);
	return s;
}

bool CFG_set(LauncherSettings* settings, const std::string& key, const std::string& value)
{
	for (const Key& k : keys()) {
		if (key != k.name)
			continue;
		if (!k.set(settings, value)) {
			LOG_warn("Ignoring invalid value for %s: '%s'\n", key.c_str(), value.c_str());
			return false;
		}
		return true;
	}
	LOG_warn("Unknown setting: %s\n", key.c_str());
	return false;
}

bool CFG_loadFile(LauncherSettings* settings, const std::string& path)
{
	std::ifstream file(path);
	if (!file.is_open())
		return false;

	std::string line;
	int lineno = 0;
	while (std::getline(file, line)) {
		lineno++;
		size_t hash = line.find('#');
		if (hash != std::string::npos)
			line.erase(hash);
		line = trim(line);
		if (line.empty())
			continue;

		size_t eq = line.find('=');
		if (eq == std::string::npos) {
			LOG_warn("%s:%d: expected key=value\n", path.c_str(), lineno);
			continue;
		}
		CFG_set(settings, trim(line.substr(0, eq)), trim(line.substr(eq + 1)));
	}

	LOG_info("Loaded settings from %s\n", path.c_str());
	return true;
}

void CFG_loadEnvironment(LauncherSettings* settings)
{
	for (const Key& k : keys()) {
		std::string var = "MIMIKI_";
		for (const char* c = k.name; *c; c++)
			var += (char)toupper((unsigned char)*c);

		const char* value = getenv(var.c_str());
		if (value)
			CFG_set(settings, k.name, value);
	}
}

LauncherSettings CFG_load(void)
{
	LauncherSettings settings = CFG_defaults();

	const char* path = getenv("MIMIKI_CONFIG");
	CFG_loadFile(&settings, path ? path : MIMIKI_CONFIG_PATH);
	CFG_loadEnvironment(&settings);

	return settings;
}

void CFG_print(const LauncherSettings* s)
{
	std::string roots;
	for (const std::string& root : s->romRoots) {
		if (!roots.empty())
			roots += ":";
		roots += root;
	}

	LOG_debug("rom_roots=%s\n", roots.c_str());
	LOG_debug("max_games=%d\n", s->maxGames);
	LOG_debug("input_dir=%s\n", s->inputDir.c_str());
	LOG_debug("long_press_ms=%u\n", s->longPressMs);
	LOG_debug("wake_debounce_ms=%u\n", s->wakeDebounceMs);
	LOG_debug("cpu_root=%s\n", s->cpuRoot.c_str());
	LOG_debug("gpu_governor_path=%s\n", s->gpuGovernorPath.c_str());
	LOG_debug("backlight_path=%s\n", s->backlightPath.c_str());
	LOG_debug("sleep_state_path=%s\n", s->sleepStatePath.c_str());
	LOG_debug("idle governors=%s/%s\n", s->idleCpuGovernor.c_str(), s->idleGpuGovernor.c_str());
	LOG_debug("brightness_default=%d\n", s->brightnessDefault);
	LOG_debug("backlight_enabled=%d\n", s->backlightEnabled);
	LOG_debug("frame_delay_ms=%u\n", s->frameDelayMs);
	LOG_debug("font_path=%s (%d)\n", s->fontPath.c_str(), s->fontSize);
	LOG_debug("background_path=%s\n", s->backgroundPath.c_str());
	LOG_debug("poweroff=%d %s\n", s->poweroffOnShutdown, s->poweroffCommand.c_str());
}
