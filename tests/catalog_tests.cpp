/*
Catalog builder tests.
*/
#include "catalog.h"
#include "profiles.h"
#include "test_util.h"

#include <stdio.h>
#include <strings.h>

#include <stdexcept>

using namespace Mimiki;

#define EXPECT(cond, msg) do { \
    if (!(cond)) { \
        fprintf(stderr, "FAIL: %s\n", msg); \
        return 1; \
    } \
} while (0)

static SystemProfile n64(void)
{
    return defaultProfiles()[0];
}

static int test_default_profiles(void)
{
    std::vector<SystemProfile> profiles = defaultProfiles();
    EXPECT(profiles.size() == 4, "four built-in systems");
    EXPECT(profiles[0].shortName == "n64", "n64 first");
    EXPECT(profiles[1].shortName == "dreamcast", "dreamcast second");
    EXPECT(profiles[2].shortName == "ps1", "ps1 third");
    EXPECT(profiles[3].shortName == "psp", "psp fourth");
    EXPECT(profiles[0].policy.cpuGovernor == "performance", "n64 runs at performance");
    EXPECT(profiles[2].policy.gpuGovernor == "simple_ondemand", "ps1 gpu governor");

    std::vector<std::string> argv = profiles[0].commandLine("/mnt/games/n64/Mario.z64");
    EXPECT(argv.size() == 3, "argv0, option, rom");
    EXPECT(argv[0] == "mupen64plus", "argv0 is the short program name");
    EXPECT(argv[1] == "--fullscreen", "option before rom");
    EXPECT(argv[2] == "/mnt/games/n64/Mario.z64", "rom last");

    argv = profiles[1].commandLine("/mnt/games/dreamcast/x.gdi");
    EXPECT(argv.size() == 2 && argv[0] == "flycast", "no options for flycast");
    return 0;
}

static int test_extension_match(void)
{
    SystemProfile profile = n64();
    EXPECT(profile.accepts("Mario.z64"), "lowercase ext");
    EXPECT(profile.accepts("MARIO.Z64"), "uppercase ext");
    EXPECT(profile.accepts("a.b.v64"), "last extension counts");
    EXPECT(!profile.accepts("Mario.z64.txt"), "only the last extension");
    EXPECT(!profile.accepts("z64"), "no extension");
    EXPECT(!profile.accepts("Mario.iso"), "other system");
    return 0;
}

static int test_sort_scenario(void)
{
    TempDir tmp;
    EXPECT(tmp.ok(), "temp dir");
    tmp.mkdir("roms/n64");
    tmp.writeFile("roms/n64/Mario.z64", "");
    tmp.writeFile("roms/n64/Zelda.n64", "");
    tmp.writeFile("roms/n64/banana.v64", "");

    CatalogBuilder builder({tmp.path() + "/roms"}, 256);
    std::vector<Game> games = builder.scan(n64());
    EXPECT(games.size() == 3, "three games");
    EXPECT(games[0].name == "banana", "banana first");
    EXPECT(games[1].name == "Mario", "Mario second");
    EXPECT(games[2].name == "Zelda", "Zelda third");
    EXPECT(games[1].path == tmp.path() + "/roms/n64/Mario.z64", "absolute path kept");
    return 0;
}

static int test_filters(void)
{
    TempDir tmp;
    EXPECT(tmp.ok(), "temp dir");
    tmp.mkdir("roms/n64/folder.z64");
    tmp.writeFile("roms/n64/game.z64", "");
    tmp.writeFile("roms/n64/readme.txt", "");
    tmp.writeFile("roms/n64/noext", "");
    tmp.writeFile("roms/n64/._game.z64", "");
    tmp.writeFile("roms/n64/.hidden.n64", "");

    CatalogBuilder builder({tmp.path() + "/roms"}, 256);
    std::vector<Game> games = builder.scan(n64());
    EXPECT(games.size() == 1, "only the real rom file");
    EXPECT(games[0].name == "game", "display name drops extension");

    SystemProfile profile = n64();
    for (const Game& game : games)
        EXPECT(profile.accepts(game.path), "every entry has an accepted extension");
    return 0;
}

static int test_missing_root(void)
{
    TempDir tmp;
    EXPECT(tmp.ok(), "temp dir");

    CatalogBuilder builder({tmp.path() + "/nope", "/nonexistent/mimiki"}, 256);
    Catalog catalog = builder.build(defaultProfiles());
    EXPECT(catalog.profileCount() == 4, "one list per profile even when empty");
    for (size_t i = 0; i < catalog.profileCount(); i++)
        EXPECT(catalog.count(i) == 0, "no games");
    EXPECT(catalog.count(99) == 0, "out of range count is zero");
    return 0;
}

static int test_merge_roots(void)
{
    TempDir tmp;
    EXPECT(tmp.ok(), "temp dir");
    tmp.mkdir("a/psp");
    tmp.mkdir("b/psp");
    tmp.writeFile("a/psp/Wipeout.iso", "");
    tmp.writeFile("a/psp/daxter.cso", "");
    tmp.writeFile("b/psp/Ape Escape.chd", "");
    tmp.writeFile("b/psp/daxter.iso", "");

    CatalogBuilder builder({tmp.path() + "/a", tmp.path() + "/b"}, 256);
    Catalog catalog = builder.build(defaultProfiles());
    EXPECT(catalog.count(3) == 4, "both roots merged");

    const std::vector<Game>& games = catalog.games(3);
    EXPECT(games[0].name == "Ape Escape", "merged list sorted");
    EXPECT(games[1].name == "daxter" && games[1].path.find("/a/psp/") != std::string::npos,
           "equal names keep root order");
    EXPECT(games[2].name == "daxter" && games[2].path.find("/b/psp/") != std::string::npos,
           "second duplicate from the second root");
    EXPECT(games[3].name == "Wipeout", "last");

    for (size_t i = 1; i < games.size(); i++)
        EXPECT(strcasecmp(games[i - 1].name.c_str(), games[i].name.c_str()) <= 0, "non-decreasing order");
    return 0;
}

static int test_capacity(void)
{
    TempDir tmp;
    EXPECT(tmp.ok(), "temp dir");
    tmp.mkdir("a/ps1");
    tmp.mkdir("b/ps1");
    for (int i = 0; i < 5; i++) {
        char name[32];
        snprintf(name, sizeof(name), "a/ps1/game%d.cue", i);
        tmp.writeFile(name, "");
        snprintf(name, sizeof(name), "b/ps1/other%d.pbp", i);
        tmp.writeFile(name, "");
    }

    CatalogBuilder builder({tmp.path() + "/a", tmp.path() + "/b"}, 3);
    std::vector<Game> games = builder.scan(defaultProfiles()[2]);
    EXPECT(games.size() == 3, "capped at capacity");

    CatalogBuilder roomy({tmp.path() + "/a", tmp.path() + "/b"}, 256);
    EXPECT(roomy.scan(defaultProfiles()[2]).size() == 10, "all games with room");
    return 0;
}

static int test_catalog_access(void)
{
    Catalog catalog(2);
    catalog.assign(1, {{"x", "/x.iso"}});
    EXPECT(catalog.count(0) == 0, "empty list");
    EXPECT(catalog.at(1, 0).name == "x", "at");

    bool threw = false;
    try {
        catalog.games(5);
    } catch (const std::out_of_range&) {
        threw = true;
    }
    EXPECT(threw, "bad profile index throws");
    return 0;
}

int main(void)
{
    if (test_default_profiles() != 0) return 1;
    if (test_extension_match() != 0) return 1;
    if (test_sort_scenario() != 0) return 1;
    if (test_filters() != 0) return 1;
    if (test_missing_root() != 0) return 1;
    if (test_merge_roots() != 0) return 1;
    if (test_capacity() != 0) return 1;
    if (test_catalog_access() != 0) return 1;
    return 0;
}
