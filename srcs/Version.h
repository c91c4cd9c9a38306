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

#include <cstdint>
#include <iostream>
#include <string>

// major.minor.revision
class CVersion
{
public:
	CVersion() = delete;
	CVersion(uint8_t a, uint8_t b, uint16_t c);
	~CVersion() {}

	const char *c_str() const { return vstr.c_str(); }

	friend std::ostream &operator<<(std::ostream &os, const CVersion &v);

private:
	uint8_t maj, min;
	uint16_t rev;
	std::string vstr;
};

extern CVersion g_Version;
