/*

         sitescout - find the nearest radio sites from a GPS fix
            Copyright (C) 2026 Thomas A. Early N7TAE

This program is free software; you can redistribute it and/or modify
it under the terms of the GNU General Public License as published by
the Free Software Foundation; either version 2 of the License, or
(at your option) any later version.

This program is distributed in the hope that it will be useful,
but WITHOUT ANY WARRANTY; without even the implied warranty of
MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
GNU General Public License for more details.

You should have received a copy of the GNU General Public License along
with this program; if not, write to the Free Software Foundation, Inc.,
51 Franklin Street, Fifth Floor, Boston, MA 02110-1301 USA.

*/

#pragma once

#include <istream>
#include <string>
#include <vector>

#include "Site.h"

// The list of sites for a session. Load it once, then share it read-only.
class CSiteCatalog
{
public:
	CSiteCatalog() {}
	~CSiteCatalog() {}

	// All loaders return true on failure. A bad record is skipped, logged
	// and added to the warnings, it is not a failure.
	bool LoadCSV(const std::string &path);
	bool LoadCSV(std::istream &is, const std::string &name);
	bool LoadJSON(const std::string &path);
	bool LoadJSON(std::istream &is, const std::string &name);

	const std::vector<SSite> &GetSites() const { return m_sites; }
	const std::vector<std::string> &GetWarnings() const { return m_warnings; }
	std::size_t Size() const { return m_sites.size(); }
	bool IsEmpty() const { return m_sites.empty(); }

	// A trailing 'c' or 'C' marks a control channel and is removed from
	// the text. Returns true if what is left isn't a frequency.
	static bool ClassifyFrequency(const std::string &raw, SFrequency &freq);

	// splits one csv line, double quotes protect commas
	static void SplitCSV(const std::string &line, std::vector<std::string> &fields);

private:
	void clear();
	void skip(const std::string &name, unsigned record, const std::string &why);
	void addFrequency(SSite &site, const std::string &raw);

	std::vector<SSite> m_sites;
	std::vector<std::string> m_warnings;
};
