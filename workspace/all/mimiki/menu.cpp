#include "menu.h"

#include <algorithm>
#include <cstdio>
#include <stdexcept>


namespace Mimiki {

PageWindow Menu_pageWindow(int selected, int count, int pageSize)
{
	PageWindow window = {0, 0, 1, 1};
	if (count <= 0)
		return window;
	if (pageSize < 1)
		pageSize = 1;

	selected = std::min(std::max(selected, 0), count - 1);
	int page = selected / pageSize;

	window.start = page * pageSize;
	window.end = std::min(window.start + pageSize, count);
	window.page = page + 1;
	window.pages = (count + pageSize - 1) / pageSize;
	return window;
}

std::string Menu_pageIndicator(const PageWindow& window)
{
	if (window.pages <= 1)
		return "";
	char text[32];
	snprintf(text, sizeof(text), "%d/%d", window.page, window.pages);
	return text;
}

MenuController::MenuController(const std::vector<SystemProfile>& profiles, const Catalog& catalog, int pageSize)
	: m_profiles(profiles), m_catalog(catalog), m_pageSize(pageSize)
{
	if (profiles.empty())
		throw std::invalid_argument("menu needs at least one system");
}

int MenuController::gameCount() const
{
	return (int)m_catalog.count(m_state.system);
}

const SystemProfile& MenuController::currentProfile() const
{
	return m_profiles[m_state.system];
}

const Game* MenuController::currentGame() const
{
	if (m_state.mode != MenuMode::GameList || m_state.game >= gameCount())
		return nullptr;
	return &m_catalog.at(m_state.system, m_state.game);
}

void MenuController::navigate(int delta)
{
	if (m_state.mode == MenuMode::SystemList) {
		int last = (int)m_profiles.size() - 1;
		m_state.system = std::min(std::max(m_state.system + delta, 0), last);
		return;
	}

	int count = gameCount();
	if (count == 0)
		return;
	m_state.game = std::min(std::max(m_state.game + delta, 0), count - 1);
}

bool MenuController::select()
{
	if (gameCount() == 0)
		return false;

	if (m_state.mode == MenuMode::SystemList) {
		m_state.mode = MenuMode::GameList;
		m_state.game = 0;
		return false;
	}

	return true;
}

void MenuController::back()
{
	if (m_state.mode != MenuMode::GameList)
		return;
	m_state.mode = MenuMode::SystemList;
	m_state.game = 0;
}

DrawList MenuController::render() const
{
	DrawList out;
	if (m_state.mode == MenuMode::GameList)
		renderGameList(out);
	else
		renderSystemList(out);
	return out;
}

void MenuController::renderSystemList(DrawList& out) const
{
	out.push_back({SCREEN_WIDTH / 2, 40, "MIMIKI", false, TextAlign::Center});

	int y = 120;
	for (size_t i = 0; i < m_profiles.size(); i++) {
		bool selected = (int)i == m_state.system;
		if (selected)
			out.push_back({120, y, ">", true, TextAlign::Left});
		out.push_back({150, y, m_profiles[i].name, selected, TextAlign::Left});

		char count[32];
		snprintf(count, sizeof(count), "(%zu games)", m_catalog.count(i));
		out.push_back({400, y, count, false, TextAlign::Left});

		y += 50;
	}

	out.push_back({120, 396, "D-PAD: Navigate  A: Select", false, TextAlign::Left});
}

void MenuController::renderGameList(DrawList& out) const
{
	out.push_back({SCREEN_WIDTH / 2, 40, currentProfile().name, false, TextAlign::Center});

	const std::vector<Game>& games = m_catalog.games(m_state.system);
	PageWindow window = Menu_pageWindow(m_state.game, (int)games.size(), m_pageSize);

	int y = 80;
	for (int i = window.start; i < window.end; i++) {
		bool selected = i == m_state.game;
		if (selected)
			out.push_back({80, y, ">", true, TextAlign::Left});
		out.push_back({110, y, games[i].name, selected, TextAlign::Left});
		y += 30;
	}

	out.push_back({120, 396, "D-PAD: Navigate  A: Launch", false, TextAlign::Left});
	// the page label fills the blank start of this line
	out.push_back({120, 420, "                 B:  Back", false, TextAlign::Left});

	std::string indicator = Menu_pageIndicator(window);
	if (!indicator.empty())
		out.push_back({120, 420, "PAGE : " + indicator, false, TextAlign::Left});
}

} // namespace Mimiki
