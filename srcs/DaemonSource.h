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
#include <string>

#include "StreamSource.h"

// reads TPV reports from gpsd over its JSON socket protocol
class CDaemonSource : public CStreamSource
{
public:
	static constexpr const char *DefaultHost = "127.0.0.1";
	static constexpr uint16_t DefaultPort = 2947;

	CDaemonSource(const std::string &host, uint16_t port) : CStreamSource("gpsd"), m_host(host), m_port(port) {}

	// Decodes one gpsd report. Anything but a TPV is unrecognized, a TPV
	// needs mode 2 or 3 plus lat and lon to be a fix.
	static EParseResult ParseReport(const std::string &line, SFixData &fix);

protected:
	bool openChannel(CLineReader &reader, double timeout) override;
	EParseResult parseLine(const std::string &line, SFixData &fix) override;

private:
	const std::string m_host;
	const uint16_t m_port;
};
