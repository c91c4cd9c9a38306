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

#include "Version.h"

// the one and only global object
CVersion g_Version(1, 0, 0);

CVersion::CVersion(uint8_t a, uint8_t b, uint16_t c) : maj(a), min(b), rev(c)
{
	vstr.assign(std::to_string(maj) + '.' + std::to_string(min) + '.' + std::to_string(rev));
}

std::ostream &operator<<(std::ostream &os, const CVersion &v)
{
	os << v.c_str();
	return os;
}
