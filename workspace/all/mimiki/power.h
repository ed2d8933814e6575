#ifndef POWER_H
#define POWER_H

#include <string>
#include <vector>

#include "profiles.h"

namespace Mimiki {

// Frequency-scaling governors for every CPU core and the GPU devfreq node
class GovernorControl {
public:
	// cpuRoot holds cpuN/cpufreq/scaling_governor, gpuPath is the devfreq governor file
	GovernorControl(std::string cpuRoot, std::string gpuPath);
	virtual ~GovernorControl() {}

	// Best effort, returns false if no surface at all took the policy
	virtual bool apply(const PowerPolicy& policy);

	// Number of cores written, failures on one core do not stop the rest
	int applyCpu(const std::string& governor);
	bool applyGpu(const std::string& governor);

	// scaling_governor paths of cpu0, cpu1, ... in numeric order
	std::vector<std::string> cpuSurfaces() const;

private:
	std::string m_cpuRoot;
	std::string m_gpuPath;
};

// Applies the active policy for its lifetime, restores idle on every exit path.
// If applying the active policy throws, idle is restored before rethrowing.
class ScopedPowerPolicy {
public:
	ScopedPowerPolicy(GovernorControl& governors, const PowerPolicy& active, const PowerPolicy& idle);
	~ScopedPowerPolicy();

	ScopedPowerPolicy(const ScopedPowerPolicy&) = delete;
	ScopedPowerPolicy& operator=(const ScopedPowerPolicy&) = delete;

private:
	void restoreIdle() noexcept;

	GovernorControl& m_governors;
	PowerPolicy m_idle;
};

} // namespace Mimiki

#endif // POWER_H
