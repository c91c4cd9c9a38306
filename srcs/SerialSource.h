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
#include <termios.h>

#include "StreamSource.h"
#include "NmeaParser.h"

// NMEA sentences from a serial GPS. A tty gets set to raw 8N1 at the
// baud rate, anything else (a fifo, a capture file) is read as it is.
class CSerialSource : public CStreamSource
{
public:
	CSerialSource(const std::string &device, unsigned baud) : CStreamSource("nmea"), m_device(device), m_baud(baud) {}

	static speed_t GetBaud(unsigned baud);

protected:
	bool openChannel(CLineReader &reader, double timeout) override;
	EParseResult parseLine(const std::string &line, SFixData &fix) override;
	void resetParser() override { m_parser.Reset(); }

private:
	bool setInterface(int fd);

	const std::string m_device;
	const unsigned m_baud;
	CNmeaParser m_parser;
};
