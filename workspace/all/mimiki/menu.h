#ifndef MENU_H
#define MENU_H

#include <string>
#include <vector>

#include "catalog.h"
#include "defines.h"
#include "profiles.h"
#include "renderer.h"

namespace Mimiki {

// ---- Menu State ----

enum class MenuMode {
	SystemList,
	GameList,
};

struct MenuState {
	int system = 0;
	int game = 0;
	MenuMode mode = MenuMode::SystemList;
};

// ---- Pagination ----

typedef struct {
	int start; // first visible index
	int end;   // one past the last visible index
	int page;  // 1-based
	int pages;
} PageWindow;

// The page containing selected, page = selected / pageSize
PageWindow Menu_pageWindow(int selected, int count, int pageSize);

// "2/3", empty when everything fits on one page
std::string Menu_pageIndicator(const PageWindow& window);

// ---- Controller ----

class MenuController {
public:
	MenuController(const std::vector<SystemProfile>& profiles, const Catalog& catalog, int pageSize = GAMES_PER_PAGE);

	// Moves the selection in the current list, clamped, no wraparound
	void navigate(int delta);

	// Opens the game list, or returns true when the selected game should launch
	bool select();

	void back();

	const MenuState& state() const { return m_state; }
	const SystemProfile& currentProfile() const;
	// nullptr outside the game list
	const Game* currentGame() const;

	DrawList render() const;

private:
	int gameCount() const;
	void renderSystemList(DrawList& out) const;
	void renderGameList(DrawList& out) const;

	const std::vector<SystemProfile>& m_profiles;
	const Catalog& m_catalog;
	int m_pageSize;
	MenuState m_state;
};

} // namespace Mimiki

#endif // MENU_H
