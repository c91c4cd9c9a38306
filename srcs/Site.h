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

#include <map>
#include <string>
#include <vector>

struct SFrequency
{
	std::string text;	// MHz, without the control marker
	bool isControl;
};

// one transmission site from the catalog
struct SSite
{
	std::string description;
	std::string county;
	double latitude, longitude;
	std::vector<SFrequency> frequencies;
	std::map<std::string, std::string> attributes;	// rfss, site_dec, site_hex, nac, range, ...

	// the attribute, or an empty string
	const std::string &Attribute(const std::string &key) const
	{
		static const std::string empty;
		auto it = attributes.find(key);
		return (attributes.end() == it) ? empty : it->second;
	}

	unsigned ControlCount() const
	{
		unsigned count = 0u;
		for (const auto &f : frequencies)
			if (f.isControl)
				count++;
		return count;
	}
};
