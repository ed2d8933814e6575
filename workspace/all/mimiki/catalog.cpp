#include "catalog.h"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <dirent.h>
#include <stdexcept>
#include <strings.h>
#include <sys/stat.h>

#include "log.h"

namespace Mimiki {

bool Game_lessByName(const Game& a, const Game& b)
{
	return strcasecmp(a.name.c_str(), b.name.c_str()) < 0;
}

size_t Catalog::count(size_t profile) const
{
	return profile < m_games.size() ? m_games[profile].size() : 0;
}

const std::vector<Game>& Catalog::games(size_t profile) const
{
	if (profile >= m_games.size())
		throw std::out_of_range("catalog profile index out of range");
	return m_games[profile];
}

const Game& Catalog::at(size_t profile, size_t index) const
{
	return games(profile).at(index);
}

void Catalog::assign(size_t profile, std::vector<Game> games)
{
	if (profile >= m_games.size())
		m_games.resize(profile + 1);
	m_games[profile] = std::move(games);
}

CatalogBuilder::CatalogBuilder(std::vector<std::string> roots, size_t capacity)
	: m_roots(std::move(roots)), m_capacity(capacity)
{
}

Catalog CatalogBuilder::build(const std::vector<SystemProfile>& profiles) const
{
	Catalog catalog(profiles.size());
	for (size_t i = 0; i < profiles.size(); i++) {
		catalog.assign(i, scan(profiles[i]));
		LOG_info("Found %zu games for %s\n", catalog.count(i), profiles[i].name.c_str());
	}
	return catalog;
}

std::vector<Game> CatalogBuilder::scan(const SystemProfile& profile) const
{
	std::vector<Game> games;
	for (const std::string& root : m_roots) {
		if (!scanDirectory(profile, root + "/" + profile.shortName, games))
			break;
	}

	// stable so duplicates keep their discovery order
	std::stable_sort(games.begin(), games.end(), Game_lessByName);
	return games;
}

bool CatalogBuilder::scanDirectory(const SystemProfile& profile, const std::string& dir, std::vector<Game>& out) const
{
	DIR* dh = opendir(dir.c_str());
	if (!dh) {
		LOG_warn("Skipping ROM directory %s: %s\n", dir.c_str(), strerror(errno));
		return true;
	}

	bool room = true;
	struct dirent* entry;
	while ((entry = readdir(dh)) != NULL) {
		const char* filename = entry->d_name;

		// covers "." and ".." and dotfiles left behind by other OSes
		if (filename[0] == '.')
			continue;

		std::string path = dir + "/" + filename;

		if (entry->d_type == DT_DIR)
			continue;
		if (entry->d_type == DT_UNKNOWN || entry->d_type == DT_LNK) {
			struct stat st;
			if (stat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode))
				continue;
		}

		if (!profile.accepts(filename))
			continue;

		if (out.size() >= m_capacity) {
			LOG_debug("%s: game limit of %zu reached, ignoring the rest\n", profile.name.c_str(), m_capacity);
			room = false;
			break;
		}

		std::string name = filename;
		size_t dot = name.find_last_of('.');
		if (dot != std::string::npos)
			name.erase(dot);

		out.push_back({name, path});
	}

	closedir(dh);
	return room;
}

} // namespace Mimiki
