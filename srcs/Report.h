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

#include <ostream>
#include <vector>

#include "Position.h"
#include "GridConverter.h"
#include "Ranker.h"

// the text the sitescout program prints
class CReport
{
public:
	static void Position(std::ostream &os, const CPosition &position);
	static void Grid(std::ostream &os, const CPosition &position);
	static void SiteDetail(std::ostream &os, const SRankedSite &ranked, EUnit unit);
	static void NearestList(std::ostream &os, const std::vector<SRankedSite> &ranked, EUnit unit);
	// "852.975000 MHz, 853.250000 MHz", empty if there are none
	static std::string ControlChannels(const SSite &site);
};
