#ifndef CATALOG_H
#define CATALOG_H

#include <stddef.h>
#include <string>
#include <vector>

#include "profiles.h"

namespace Mimiki {

///////////////////////////////////////
// Game

struct Game {
	std::string name; // filename without its last extension
	std::string path; // absolute
};

// Case-insensitive name order, used with a stable sort
bool Game_lessByName(const Game& a, const Game& b);

///////////////////////////////////////
// Catalog
// One sorted game list per profile, indexed like the profile list.

class Catalog {
public:
	Catalog() {}
	explicit Catalog(size_t profileCount) : m_games(profileCount) {}

	size_t profileCount() const { return m_games.size(); }
	size_t count(size_t profile) const;
	const std::vector<Game>& games(size_t profile) const;
	const Game& at(size_t profile, size_t index) const;

	void assign(size_t profile, std::vector<Game> games);

private:
	std::vector<std::vector<Game>> m_games;
};

///////////////////////////////////////
// CatalogBuilder

class CatalogBuilder {
public:
	// roots are scanned in order, each as <root>/<profile short name>
	CatalogBuilder(std::vector<std::string> roots, size_t capacity);

	Catalog build(const std::vector<SystemProfile>& profiles) const;

	// Matches for one profile across all roots, sorted, at most capacity entries
	std::vector<Game> scan(const SystemProfile& profile) const;

private:
	// Returns false once the capacity is reached
	bool scanDirectory(const SystemProfile& profile, const std::string& dir, std::vector<Game>& out) const;

	std::vector<std::string> m_roots;
	size_t m_capacity;
};

} // namespace Mimiki

#endif // CATALOG_H
