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

#include <algorithm>
#include <cmath>

#include "Ranker.h"

std::vector<SRankedSite> CRanker::rankAll(const CPosition &position, const CSiteCatalog &catalog, EUnit unit)
{
	std::vector<SRankedSite> ranked;
	ranked.reserve(catalog.Size());
	const auto here = position.GetLatLon();
	for (const auto &site : catalog.GetSites())
	{
		const SLatLon there { site.latitude, site.longitude };
		SRankedSite r { &site, 0.0, 0.0 };
		// both ends were validated when they were built
		if (CGeoMath::Distance(here, there, unit, r.distance) or CGeoMath::Bearing(here, there, r.bearing))
			continue;
		ranked.push_back(r);
	}
	std::stable_sort(ranked.begin(), ranked.end(), [](const SRankedSite &a, const SRankedSite &b) { return a.distance < b.distance; });
	return ranked;
}

std::vector<SRankedSite> CRanker::Nearest(const CPosition &position, const CSiteCatalog &catalog, EUnit unit, std::size_t limit)
{
	auto ranked = rankAll(position, catalog, unit);
	if (ranked.size() > limit)
		ranked.resize(limit);
	return ranked;
}

std::vector<SRankedSite> CRanker::WithinRange(const CPosition &position, const CSiteCatalog &catalog, EUnit unit, double range)
{
	if (not std::isfinite(range))
		return std::vector<SRankedSite>();
	auto ranked = rankAll(position, catalog, unit);
	auto end = std::find_if(ranked.begin(), ranked.end(), [range](const SRankedSite &r) { return r.distance > range; });
	ranked.erase(end, ranked.end());
	return ranked;
}

bool CRanker::Closest(const CPosition &position, const CSiteCatalog &catalog, EUnit unit, SRankedSite &nearest)
{
	auto ranked = Nearest(position, catalog, unit, 1);
	if (ranked.empty())
		return true;
	nearest = ranked.front();
	return false;
}
