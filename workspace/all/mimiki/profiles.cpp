#include "profiles.h"

#include <strings.h>

#include "defines.h"
#include "process.h"

namespace Mimiki {

bool SystemProfile::accepts(const std::string& filename) const
{
	size_t dot = filename.find_last_of('.');
	if (dot == std::string::npos)
		return false;

	const char* ext = filename.c_str() + dot;
	for (const std::string& accepted : extensions) {
		if (strcasecmp(ext, accepted.c_str()) == 0)
			return true;
	}
	return false;
}

std::vector<std::string> SystemProfile::commandLine(const std::string& rom) const
{
	std::vector<std::string> argv;
	argv.push_back(Process_programName(emulator));
	argv.insert(argv.end(), options.begin(), options.end());
	argv.push_back(rom);
	return argv;
}

std::vector<SystemProfile> defaultProfiles(void)
{
	return {
		{"Nintendo 64", "n64", MIMIKI_BIN_PATH "/mupen64plus", {"--fullscreen"},
		 {".z64", ".n64", ".v64"}, {"performance", "performance"}},
		{"Dreamcast", "dreamcast", MIMIKI_BIN_PATH "/flycast", {},
		 {".gdi", ".cdi", ".chd"}, {"schedutil", "performance"}},
		{"PlayStation", "ps1", MIMIKI_BIN_PATH "/duckstation-nogui", {},
		 {".cue", ".chd", ".pbp"}, {"schedutil", "simple_ondemand"}},
		{"PS Portable", "psp", MIMIKI_BIN_PATH "/PPSSPPSDL", {},
		 {".iso", ".cso", ".chd"}, {"schedutil", "performance"}},
	};
}

} // namespace Mimiki
