#include "process.h"
#include "log.h"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

ProcessResult Process_run(const std::string& program, const std::vector<std::string>& argv)
{
	ProcessResult result = {false, 0, -1, 0};

	// built before fork so the child does not allocate
	std::vector<char*> args;
	for (const std::string& arg : argv)
		args.push_back(const_cast<char*>(arg.c_str()));
	args.push_back(nullptr);

	fflush(stdout);
	fflush(stderr);

	pid_t pid = fork();
	if (pid < 0) {
		LOG_error("Fork failed: %s\n", strerror(errno));
		return result;
	}

	if (pid == 0) {
		execv(program.c_str(), args.data());
		LOG_error("Failed to launch %s: %s\n", program.c_str(), strerror(errno));
		_exit(PROCESS_EXEC_FAILED);
	}

	result.spawned = true;

	int status = 0;
	while (waitpid(pid, &status, 0) < 0) {
		if (errno != EINTR) {
			LOG_error("waitpid failed for %s: %s\n", program.c_str(), strerror(errno));
			return result;
		}
	}

	result.status = status;
	if (WIFEXITED(status))
		result.exitCode = WEXITSTATUS(status);
	else if (WIFSIGNALED(status))
		result.signal = WTERMSIG(status);

	return result;
}

bool Process_succeeded(const ProcessResult& result)
{
	return result.spawned && result.signal == 0 && result.exitCode == 0;
}

std::string Process_programName(const std::string& path)
{
	size_t slash = path.find_last_of('/');
	if (slash == std::string::npos)
		return path;
	return path.substr(slash + 1);
}
