/*
Menu state machine, pagination and draw list tests.
*/
#include "catalog.h"
#include "menu.h"
#include "profiles.h"

#include <stdio.h>
#include <stdlib.h>

#include <stdexcept>

using namespace Mimiki;

#define EXPECT(cond, msg) do { \
    if (!(cond)) { \
        fprintf(stderr, "FAIL: %s\n", msg); \
        return 1; \
    } \
} while (0)

static std::vector<Game> make_games(int count)
{
    std::vector<Game> games;
    for (int i = 0; i < count; i++) {
        char name[32];
        snprintf(name, sizeof(name), "Game %02d", i);
        games.push_back({name, std::string("/roms/") + name + ".iso"});
    }
    return games;
}

static bool has_text(const DrawList& list, const std::string& text)
{
    for (const DrawCommand& command : list) {
        if (command.text == text)
            return true;
    }
    return false;
}

static const DrawCommand* find_text(const DrawList& list, const std::string& text)
{
    for (const DrawCommand& command : list) {
        if (command.text == text)
            return &command;
    }
    return nullptr;
}

static int test_page_window(void)
{
    PageWindow window = Menu_pageWindow(17, 25, 10);
    EXPECT(window.start == 10, "window starts at 10");
    EXPECT(window.end == 20, "window ends after 19");
    EXPECT(window.page == 2 && window.pages == 3, "page 2 of 3");
    EXPECT(Menu_pageIndicator(window) == "2/3", "indicator");

    window = Menu_pageWindow(24, 25, 10);
    EXPECT(window.start == 20 && window.end == 25, "short last page");

    window = Menu_pageWindow(3, 7, 10);
    EXPECT(window.start == 0 && window.end == 7 && window.pages == 1, "single page");
    EXPECT(Menu_pageIndicator(window).empty(), "no indicator for one page");

    window = Menu_pageWindow(0, 0, 10);
    EXPECT(window.start == 0 && window.end == 0, "empty list");

    window = Menu_pageWindow(40, 25, 10);
    EXPECT(window.page == 3, "selection clamped");
    return 0;
}

static int test_system_navigation(void)
{
    std::vector<SystemProfile> profiles = defaultProfiles();
    Catalog catalog(profiles.size());
    MenuController menu(profiles, catalog);

    EXPECT(menu.state().mode == MenuMode::SystemList, "starts in system list");
    EXPECT(menu.state().system == 0, "starts at system 0");

    menu.navigate(-1);
    EXPECT(menu.state().system == 0, "no wrap at the top");
    menu.navigate(+1);
    menu.navigate(+1);
    menu.navigate(+1);
    menu.navigate(+1);
    EXPECT(menu.state().system == 3, "no wrap at the bottom");

    menu.back();
    EXPECT(menu.state().mode == MenuMode::SystemList && menu.state().system == 3, "back is a no-op here");

    EXPECT(!menu.select(), "empty system does not launch");
    EXPECT(menu.state().mode == MenuMode::SystemList, "empty system stays in system list");
    EXPECT(menu.currentGame() == nullptr, "no game outside game list");
    return 0;
}

static int test_random_navigation_bounds(void)
{
    std::vector<SystemProfile> profiles = defaultProfiles();
    Catalog catalog(profiles.size());
    catalog.assign(0, make_games(25));
    catalog.assign(2, make_games(3));
    MenuController menu(profiles, catalog);

    srand(1234);
    for (int i = 0; i < 2000; i++) {
        int action = rand() % 6;
        if (action < 3)
            menu.navigate((rand() % 21) - 10);
        else if (action == 3)
            menu.select();
        else
            menu.back();

        const MenuState& state = menu.state();
        EXPECT(state.system >= 0 && state.system < (int)profiles.size(), "system index in bounds");
        if (state.mode == MenuMode::GameList) {
            EXPECT(state.game >= 0 && state.game < (int)catalog.count(state.system), "game index in bounds");
            EXPECT(menu.currentGame() != nullptr, "current game valid");
        }
        else {
            EXPECT(state.game == 0, "game reset outside game list");
        }
    }
    return 0;
}

static int test_game_list(void)
{
    std::vector<SystemProfile> profiles = defaultProfiles();
    Catalog catalog(profiles.size());
    catalog.assign(1, make_games(25));
    MenuController menu(profiles, catalog);

    menu.navigate(+1);
    EXPECT(!menu.select(), "select on a system opens it");
    EXPECT(menu.state().mode == MenuMode::GameList, "in game list");
    EXPECT(menu.state().game == 0, "first game");
    EXPECT(menu.currentProfile().shortName == "dreamcast", "current profile");

    menu.navigate(17);
    EXPECT(menu.state().game == 17, "moved to 17");
    menu.navigate(100);
    EXPECT(menu.state().game == 24, "clamped at last game");
    menu.navigate(-7);
    EXPECT(menu.state().game == 17, "back to 17");

    EXPECT(menu.select(), "select on a game launches");
    EXPECT(menu.state().mode == MenuMode::GameList && menu.state().game == 17, "stays in game list");
    EXPECT(menu.currentGame() && menu.currentGame()->name == "Game 17", "current game");

    menu.back();
    EXPECT(menu.state().mode == MenuMode::SystemList, "back to system list");
    EXPECT(menu.state().game == 0, "game index reset");
    EXPECT(menu.state().system == 1, "system kept");
    return 0;
}

static int test_render_system_list(void)
{
    std::vector<SystemProfile> profiles = defaultProfiles();
    Catalog catalog(profiles.size());
    catalog.assign(0, make_games(3));
    MenuController menu(profiles, catalog);

    DrawList list = menu.render();
    const DrawCommand* title = find_text(list, "MIMIKI");
    EXPECT(title != nullptr, "title");
    EXPECT(title->align == TextAlign::Center && title->x == 320 && title->y == 40, "title centred at the top");
    EXPECT(has_text(list, "(3 games)"), "game count");
    EXPECT(has_text(list, "(0 games)"), "empty system count");
    EXPECT(has_text(list, "D-PAD: Navigate  A: Select"), "hint");

    const DrawCommand* n64 = find_text(list, "Nintendo 64");
    const DrawCommand* dc = find_text(list, "Dreamcast");
    EXPECT(n64 && n64->selected && n64->y == 120, "first row selected");
    EXPECT(dc && !dc->selected && dc->y == 170, "rows 50 apart");

    int markers = 0;
    for (const DrawCommand& command : list) {
        if (command.text == ">")
            markers++;
    }
    EXPECT(markers == 1, "one marker");
    return 0;
}

static int test_render_game_list(void)
{
    std::vector<SystemProfile> profiles = defaultProfiles();
    Catalog catalog(profiles.size());
    catalog.assign(0, make_games(25));
    MenuController menu(profiles, catalog);
    menu.select();

    DrawList list = menu.render();
    EXPECT(has_text(list, "Nintendo 64"), "system name as title");
    EXPECT(has_text(list, "Game 00") && has_text(list, "Game 09"), "first page");
    EXPECT(!has_text(list, "Game 10"), "second page hidden");
    EXPECT(has_text(list, "PAGE : 1/3"), "page indicator");
    EXPECT(has_text(list, "D-PAD: Navigate  A: Launch"), "launch hint");
    EXPECT(has_text(list, "                 B:  Back"), "back hint");

    menu.navigate(17);
    list = menu.render();
    EXPECT(has_text(list, "PAGE : 2/3"), "page 2 of 3");
    EXPECT(has_text(list, "Game 10") && has_text(list, "Game 19"), "window 10 to 19");
    EXPECT(!has_text(list, "Game 09") && !has_text(list, "Game 20"), "nothing outside the window");

    const DrawCommand* selected = find_text(list, "Game 17");
    EXPECT(selected && selected->selected, "selected row highlighted");
    EXPECT(selected->y == 80 + 7 * 30, "row position within page");

    Catalog small(profiles.size());
    small.assign(0, make_games(4));
    MenuController single(profiles, small);
    single.select();
    list = single.render();
    for (const DrawCommand& command : list)
        EXPECT(command.text.compare(0, 4, "PAGE") != 0, "no indicator on a single page");
    return 0;
}

static int test_requires_profiles(void)
{
    std::vector<SystemProfile> none;
    Catalog catalog;
    bool threw = false;
    try {
        MenuController menu(none, catalog);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    EXPECT(threw, "empty profile list rejected");
    return 0;
}

int main(void)
{
    if (test_page_window() != 0) return 1;
    if (test_system_navigation() != 0) return 1;
    if (test_random_navigation_bounds() != 0) return 1;
    if (test_game_list() != 0) return 1;
    if (test_render_system_list() != 0) return 1;
    if (test_render_game_list() != 0) return 1;
    if (test_requires_profiles() != 0) return 1;
    return 0;
}
