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

#include <vector>

#include "Position.h"
#include "SiteCatalog.h"

struct SRankedSite
{
	const SSite *site;	// owned by the catalog
	double distance;	// in the unit asked for
	double bearing;		// degrees true from the position
};

// Ranking reads the position and catalog and keeps nothing between calls.
// Equal distances stay in catalog order.
class CRanker
{
public:
	static std::vector<SRankedSite> Nearest(const CPosition &position, const CSiteCatalog &catalog, EUnit unit, std::size_t limit);
	// empty when range isn't a finite number
	static std::vector<SRankedSite> WithinRange(const CPosition &position, const CSiteCatalog &catalog, EUnit unit, double range);
	// returns true if the catalog is empty
	static bool Closest(const CPosition &position, const CSiteCatalog &catalog, EUnit unit, SRankedSite &nearest);

private:
	static std::vector<SRankedSite> rankAll(const CPosition &position, const CSiteCatalog &catalog, EUnit unit);
};
