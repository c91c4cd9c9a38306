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

#include "PositionSource.h"

const char *ToString(EAcquireError err)
{
	switch (err)
	{
		case EAcquireError::none:              return "no error";
		case EAcquireError::timeout:           return "timed out waiting for a fix";
		case EAcquireError::sourceUnavailable: return "position source unavailable";
		case EAcquireError::notFound:          return "position file not found";
		case EAcquireError::malformed:         return "position file is malformed";
		case EAcquireError::noSourceAvailable: return "no position source available";
		case EAcquireError::invalidCoordinate: return "invalid coordinate";
		default:                               return "unknown error";
	}
}

const char *ToString(ESourceEvent event)
{
	switch (event)
	{
		case ESourceEvent::unrecognized: return "unrecognized";
		case ESourceEvent::degradedFix:  return "degraded fix";
		case ESourceEvent::resolved:     return "resolved";
		case ESourceEvent::timedOut:     return "timed out";
		case ESourceEvent::channelLost:  return "channel lost";
		default:                         return "unknown";
	}
}
