#include "launcher.h"

#include "log.h"

namespace Mimiki {

ProcessSupervisor::ProcessSupervisor(GovernorControl& governors, const PowerPolicy& idle)
	: m_governors(governors), m_idle(idle)
{
}

void ProcessSupervisor::applyIdle()
{
	if (!m_governors.apply(m_idle))
		LOG_warn("Idle power policy not applied\n");
}

ProcessResult ProcessSupervisor::launch(const SystemProfile& profile, const Game& game)
{
	LOG_info("Launching: %s (%s)\n", game.name.c_str(), game.path.c_str());

	ProcessResult result = {false, 0, -1, 0};
	{
		ScopedPowerPolicy policy(m_governors, profile.policy, m_idle);
		result = Process_run(profile.emulator, profile.commandLine(game.path));
	}

	if (!result.spawned)
		LOG_error("Could not start %s\n", profile.emulator.c_str());
	else if (result.signal != 0)
		LOG_warn("Emulator killed by signal %d\n", result.signal);
	else if (result.exitCode == PROCESS_EXEC_FAILED)
		LOG_error("Emulator %s could not be executed\n", profile.emulator.c_str());
	else
		LOG_info("Emulator exited with status %d\n", result.exitCode);

	return result;
}

} // namespace Mimiki
