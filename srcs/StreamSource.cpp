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

#include "StreamSource.h"
#include "SteadyTimer.h"
#include "Log.h"

EAcquireError CStreamSource::Acquire(double timeout, std::unique_ptr<CPosition> &pos)
{
	pos.reset();
	if (m_cancelled)
		return EAcquireError::sourceUnavailable;
	if (timeout < 0.0)
		timeout = 0.0;

	CSteadyTimer timer;
	CLineReader reader;
	resetParser();
	if (openChannel(reader, timeout))
	{
		notify(ESourceEvent::channelLost, "could not open " + GetName());
		return EAcquireError::sourceUnavailable;
	}

	unsigned degraded = 0u;
	while (true)
	{
		const int ms = timer.remainingMs(timeout);
		if (0 == ms)
		{
			LogDebug("%s timed out after %.1f seconds, %u reports without a fix", GetName().c_str(), timer.time(), degraded);
			notify(ESourceEvent::timedOut, GetName());
			return EAcquireError::timeout;
		}

		std::string line;
		switch (reader.ReadLine(line, ms, m_cancelled))
		{
			case EReadResult::timeout:
				continue;
			case EReadResult::cancelled:
				LogDebug("%s was cancelled", GetName().c_str());
				notify(ESourceEvent::channelLost, "cancelled");
				return EAcquireError::sourceUnavailable;
			case EReadResult::closed:
				LogWarning("%s closed before a fix was received", GetName().c_str());
				notify(ESourceEvent::channelLost, GetName() + " closed");
				return EAcquireError::sourceUnavailable;
			case EReadResult::line:
				break;
		}

		SFixData fix;
		switch (parseLine(line, fix))
		{
			case EParseResult::unrecognized:
				notify(ESourceEvent::unrecognized, line);
				break;
			case EParseResult::noFix:
				degraded++;
				notify(ESourceEvent::degradedFix, line);
				break;
			case EParseResult::fix:
				pos = CPosition::Make(fix);
				if (nullptr == pos)
				{
					LogDebug("%s reported an out of range position", GetName().c_str());
					notify(ESourceEvent::degradedFix, line);
					break;
				}
				LogDebug("%s resolved %s after %.2f seconds", GetName().c_str(), ToString(fix.mode), timer.time());
				notify(ESourceEvent::resolved, line);
				return EAcquireError::none;
		}
	}
}
