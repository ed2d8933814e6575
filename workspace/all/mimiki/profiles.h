#ifndef PROFILES_H
#define PROFILES_H

#include <string>
#include <vector>

namespace Mimiki {

// CPU + GPU governor pair
struct PowerPolicy {
	std::string cpuGovernor;
	std::string gpuGovernor;
};

// One emulated console
struct SystemProfile {
	std::string name;					  // "Nintendo 64"
	std::string shortName;				  // "n64", also the ROM subdirectory
	std::string emulator;				  // absolute path to the binary
	std::vector<std::string> options;	  // passed before the ROM path
	std::vector<std::string> extensions; // with leading dot, lowercase
	PowerPolicy policy;					  // applied while the emulator runs

	// Case-insensitive match of the last extension of filename
	bool accepts(const std::string& filename) const;

	// argv for launching rom, argv[0] is the short program name
	std::vector<std::string> commandLine(const std::string& rom) const;
};

std::vector<SystemProfile> defaultProfiles(void);

} // namespace Mimiki

#endif // PROFILES_H
