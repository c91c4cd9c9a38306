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

#include "ManualSource.h"
#include "Log.h"

EAcquireError CManualSource::Acquire(double /*timeout*/, std::unique_ptr<CPosition> &pos)
{
	pos.reset();
	if (m_cancelled)
		return EAcquireError::sourceUnavailable;
	pos = CPosition::Make(m_lat, m_lon, EFixMode::fix3D);
	if (nullptr == pos)
	{
		LogError("Manual position %f,%f is out of range", m_lat, m_lon);
		return EAcquireError::invalidCoordinate;
	}
	notify(ESourceEvent::resolved, "manual coordinates");
	return EAcquireError::none;
}
