#include "session.h"

#include <stdexcept>

#include "log.h"

namespace Mimiki {

MenuSession::MenuSession(Renderer& renderer, HotkeyMonitor& hotkeys, ProcessSupervisor& supervisor,
						 const std::vector<SystemProfile>& profiles, const Catalog& catalog,
						 uint32_t frameDelayMs)
	: m_renderer(renderer),
	  m_hotkeys(hotkeys),
	  m_supervisor(supervisor),
	  m_menu(profiles, catalog),
	  m_frameDelayMs(frameDelayMs)
{
}

bool MenuSession::step()
{
	InputEvent event = {InputEvent::Navigate, 0};
	while (!m_quit && m_renderer.pollInput(&event))
		handleInput(event);
	if (m_quit)
		return false;

	for (const HotkeyEvent& hotkey : m_hotkeys.poll()) {
		if (hotkey.type == HotkeyEvent::ShutdownRequested) {
			m_shutdown = true;
			m_quit = true;
		}
	}
	if (m_quit)
		return false;

	m_renderer.present(m_menu.render());
	m_renderer.delay(m_frameDelayMs);
	return true;
}

void MenuSession::run(const volatile sig_atomic_t* quit)
{
	while (!(quit && *quit) && step()) {
	}
	if (quit && *quit)
		m_quit = true;
}

void MenuSession::handleInput(const InputEvent& event)
{
	switch (event.type) {
	case InputEvent::Navigate:
		m_menu.navigate(event.delta);
		break;
	case InputEvent::Select:
		if (m_menu.select())
			launchSelected();
		break;
	case InputEvent::Back:
		m_menu.back();
		break;
	case InputEvent::Quit:
		m_quit = true;
		break;
	}
}

void MenuSession::launchSelected()
{
	const Game* game = m_menu.currentGame();
	if (!game)
		return;

	// the emulator gets the display to itself
	m_renderer.quit();
	m_supervisor.launch(m_menu.currentProfile(), *game);
	m_launches++;

	// presses made in-game are not menu hotkeys
	m_hotkeys.discardPending();

	if (!m_renderer.init())
		throw std::runtime_error("display could not be reinitialized after emulator exit");
	LOG_info("Standing by...\n");
}

} // namespace Mimiki
