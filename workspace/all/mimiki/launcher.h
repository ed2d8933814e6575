#ifndef LAUNCHER_H
#define LAUNCHER_H

#include "catalog.h"
#include "power.h"
#include "process.h"
#include "profiles.h"

namespace Mimiki {

// Runs one emulator session at a time. The calling thread blocks until
// the emulator exits; the idle policy is back in place when launch returns.
class ProcessSupervisor {
public:
	ProcessSupervisor(GovernorControl& governors, const PowerPolicy& idle);

	ProcessResult launch(const SystemProfile& profile, const Game& game);

	// Startup and standby state
	void applyIdle();

	const PowerPolicy& idlePolicy() const { return m_idle; }

private:
	GovernorControl& m_governors;
	PowerPolicy m_idle;
};

} // namespace Mimiki

#endif // LAUNCHER_H
