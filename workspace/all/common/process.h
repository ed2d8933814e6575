#ifndef __PROCESS_H__
#define __PROCESS_H__

#include <string>
#include <vector>

///////////////////////////////
// Child processes
// fork + execv, no shell involved. The caller blocks until the child exits.
///////////////////////////////

// Exit code used by a child whose exec failed
#define PROCESS_EXEC_FAILED 127

typedef struct {
	bool spawned; // false if fork itself failed
	int status;	  // raw wait status
	int exitCode; // -1 unless the child exited normally
	int signal;	  // 0 unless the child was killed by a signal
} ProcessResult;

// argv[0] is passed as given; program is the absolute path to exec.
ProcessResult Process_run(const std::string& program, const std::vector<std::string>& argv);

// True for a normal exit with status 0
bool Process_succeeded(const ProcessResult& result);

// "/usr/bin/flycast" -> "flycast"
std::string Process_programName(const std::string& path);

#endif
