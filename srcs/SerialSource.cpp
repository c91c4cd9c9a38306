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

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

#include "SerialSource.h"
#include "Log.h"

speed_t CSerialSource::GetBaud(unsigned baud)
{
	switch (baud)
	{
		case 4800:
			return B4800;
		case 9600:
			return B9600;
		case 19200:
			return B19200;
		case 38400:
			return B38400;
		case 57600:
			return B57600;
		case 115200:
			return B115200;
		case 230400:
			return B230400;
		case 460800:
			return B460800;
		default:
			return B0;
	}
}

// returns true on failure
bool CSerialSource::setInterface(int fd)
{
	struct termios tty;
	if (0 != tcgetattr(fd, &tty))
	{
		LogError("tcgetattr() on %s: %s", m_device.c_str(), strerror(errno));
		return true;
	}

	auto brate = GetBaud(m_baud);
	if (B0 == brate)
	{
		LogError("Baud rate %u is not supported", m_baud);
		return true;
	}
	cfsetospeed(&tty, brate);
	cfsetispeed(&tty, brate);

	tty.c_cflag = (tty.c_cflag & ~CSIZE) | CS8;	// 8-bit chars
	tty.c_iflag &= ~(IGNBRK | IXON | IXOFF | IXANY | ICRNL);
	tty.c_lflag = 0;	// no canonical processing, no echo
	tty.c_oflag = 0;
	tty.c_cc[VMIN]  = 0;	// poll() does the waiting
	tty.c_cc[VTIME] = 0;

	tty.c_cflag |= (CLOCAL | CREAD);	// ignore modem controls
	tty.c_cflag &= ~(PARENB | PARODD | CSTOPB | CRTSCTS);

	if (0 != tcsetattr(fd, TCSANOW, &tty))
	{
		LogError("tcsetattr() on %s: %s", m_device.c_str(), strerror(errno));
		return true;
	}
	tcflush(fd, TCIFLUSH);
	return false;
}

bool CSerialSource::openChannel(CLineReader &reader, double /*timeout*/)
{
	int fd = open(m_device.c_str(), O_RDONLY | O_NOCTTY | O_NONBLOCK);
	if (0 > fd)
	{
		LogError("Could not open %s: %s", m_device.c_str(), strerror(errno));
		return true;
	}
	reader.Attach(fd);

	if (isatty(fd))
	{
		if (setInterface(fd))
			return true;
		LogDebug("Opened %s at %u baud", m_device.c_str(), m_baud);
	}
	else
		LogDebug("Opened %s, not a tty", m_device.c_str());
	return false;
}

EParseResult CSerialSource::parseLine(const std::string &line, SFixData &fix)
{
	return m_parser.Parse(line, fix);
}
