#ifndef SESSION_H
#define SESSION_H

#include <signal.h>
#include <stdint.h>

#include "catalog.h"
#include "hotkeys.h"
#include "launcher.h"
#include "menu.h"
#include "renderer.h"

namespace Mimiki {

// The launcher main loop. Single threaded: one step() drains navigation
// input and hotkeys, draws a frame and sleeps. Launching an emulator
// suspends the loop until it exits.
class MenuSession {
public:
	MenuSession(Renderer& renderer, HotkeyMonitor& hotkeys, ProcessSupervisor& supervisor,
				const std::vector<SystemProfile>& profiles, const Catalog& catalog,
				uint32_t frameDelayMs);

	// One loop iteration, false once a quit was observed
	bool step();

	// Loops until step() fails or *quit becomes non-zero
	void run(const volatile sig_atomic_t* quit);

	bool quitRequested() const { return m_quit; }
	bool shutdownRequested() const { return m_shutdown; }
	int launches() const { return m_launches; }

	const MenuController& menu() const { return m_menu; }

private:
	void handleInput(const InputEvent& event);
	void launchSelected();

	Renderer& m_renderer;
	HotkeyMonitor& m_hotkeys;
	ProcessSupervisor& m_supervisor;
	MenuController m_menu;
	uint32_t m_frameDelayMs;
	bool m_quit = false;
	bool m_shutdown = false;
	int m_launches = 0;
};

} // namespace Mimiki

#endif // SESSION_H
