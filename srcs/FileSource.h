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

#include <string>

#include "PositionSource.h"

// A small side file holding the last known position, either
// {"latitude": x, "longitude": y, "altitude": z} (altitude optional,
// "lat" and "lon" also work) or a plain "lat,lon" line.
class CFileSource : public CPositionSource
{
public:
	CFileSource(const std::string &path) : CPositionSource("file"), m_path(path) {}

	EAcquireError Acquire(double timeout, std::unique_ptr<CPosition> &pos) override;

	// the parser behind Acquire(), a missing altitude gives a 2D fix
	static EAcquireError Parse(const std::string &content, std::unique_ptr<CPosition> &pos);
	// writes the JSON form, returns true on failure
	static bool Save(const std::string &path, const CPosition &position);

private:
	const std::string m_path;
};
