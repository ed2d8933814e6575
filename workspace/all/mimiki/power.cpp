#include "power.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <dirent.h>
#include <exception>

#include "log.h"
#include "sysfs.h"

namespace Mimiki {

namespace {
	// "cpu12" -> 12, anything else (cpufreq, cpuidle) -> -1
	int cpuIndex(const char* name)
	{
		if (strncmp(name, "cpu", 3) != 0 || name[3] == '\0')
			return -1;
		for (const char* c = name + 3; *c; c++) {
			if (!isdigit((unsigned char)*c))
				return -1;
		}
		return atoi(name + 3);
	}
}

GovernorControl::GovernorControl(std::string cpuRoot, std::string gpuPath)
	: m_cpuRoot(std::move(cpuRoot)), m_gpuPath(std::move(gpuPath))
{
}

std::vector<std::string> GovernorControl::cpuSurfaces() const
{
	std::vector<int> cores;

	DIR* dh = opendir(m_cpuRoot.c_str());
	if (dh) {
		struct dirent* entry;
		while ((entry = readdir(dh)) != NULL) {
			int index = cpuIndex(entry->d_name);
			if (index >= 0)
				cores.push_back(index);
		}
		closedir(dh);
	}
	std::sort(cores.begin(), cores.end());

	std::vector<std::string> paths;
	for (int core : cores)
		paths.push_back(m_cpuRoot + "/cpu" + std::to_string(core) + "/cpufreq/scaling_governor");
	return paths;
}

int GovernorControl::applyCpu(const std::string& governor)
{
	std::vector<std::string> surfaces = cpuSurfaces();
	if (surfaces.empty()) {
		LOG_warn("No CPU governor surface under %s\n", m_cpuRoot.c_str());
		return 0;
	}

	int written = 0;
	for (const std::string& path : surfaces) {
		if (Sysfs_write(path, governor))
			written++;
		else
			LOG_warn("Could not set CPU governor via %s: %s\n", path.c_str(), strerror(errno));
	}

	if (written > 0)
		LOG_info("Set CPU governor to: %s (%d/%zu cores)\n", governor.c_str(), written, surfaces.size());
	else
		LOG_warn("Could not set CPU governor on any core\n");
	return written;
}

bool GovernorControl::applyGpu(const std::string& governor)
{
	if (!Sysfs_write(m_gpuPath, governor)) {
		LOG_warn("Could not set GPU governor via %s: %s\n", m_gpuPath.c_str(), strerror(errno));
		return false;
	}
	LOG_info("Set GPU governor to: %s\n", governor.c_str());
	return true;
}

bool GovernorControl::apply(const PowerPolicy& policy)
{
	bool any = false;
	if (!policy.cpuGovernor.empty())
		any = applyCpu(policy.cpuGovernor) > 0;
	if (!policy.gpuGovernor.empty())
		any = applyGpu(policy.gpuGovernor) || any;
	return any;
}

ScopedPowerPolicy::ScopedPowerPolicy(GovernorControl& governors, const PowerPolicy& active, const PowerPolicy& idle)
	: m_governors(governors), m_idle(idle)
{
	if (active.cpuGovernor == "performance")
		LOG_info("Hyper Clock Up!!!\n");
	else
		LOG_info("Clock Up!\n");

	try {
		m_governors.apply(active);
	}
	catch (const std::exception& e) {
		// no destructor runs for a half-built guard
		LOG_error("Could not apply power policy: %s\n", e.what());
		restoreIdle();
		throw;
	}
}

ScopedPowerPolicy::~ScopedPowerPolicy()
{
	LOG_info("Clock Over...\n");
	restoreIdle();
}

void ScopedPowerPolicy::restoreIdle() noexcept
{
	try {
		m_governors.apply(m_idle);
	}
	catch (const std::exception& e) {
		LOG_error("Could not restore idle power policy: %s\n", e.what());
	}
}

} // namespace Mimiki
