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
#include "LineReader.h"

enum class EParseResult { unrecognized, noFix, fix };

// The acquisition loop shared by the gpsd and NMEA sources:
//   waiting -> waiting   on a line that isn't understood
//   waiting -> waiting   on a report without a usable fix
//   waiting -> resolved  on the first usable fix
//   waiting -> timed out when the clock runs out
//   waiting -> unavailable when the channel closes or is cancelled
// Reports without a fix don't restart the clock. The channel is opened
// fresh for each Acquire() and closed on every way out.
class CStreamSource : public CPositionSource
{
public:
	EAcquireError Acquire(double timeout, std::unique_ptr<CPosition> &pos) override;

protected:
	CStreamSource(const std::string &name) : CPositionSource(name) {}

	// attach a new descriptor to reader, returns true on failure
	virtual bool openChannel(CLineReader &reader, double timeout) = 0;
	virtual EParseResult parseLine(const std::string &line, SFixData &fix) = 0;
	// forget anything remembered from an earlier channel
	virtual void resetParser() {}
};
