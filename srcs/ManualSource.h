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

#include "PositionSource.h"

// coordinates typed in by the user, trusted except for the range check
class CManualSource : public CPositionSource
{
public:
	CManualSource(double lat, double lon) : CPositionSource("manual"), m_lat(lat), m_lon(lon) {}

	EAcquireError Acquire(double timeout, std::unique_ptr<CPosition> &pos) override;

private:
	const double m_lat, m_lon;
};
