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
#include <poll.h>
#include <unistd.h>

#include "LineReader.h"
#include "SteadyTimer.h"
#include "Log.h"

void CLineReader::Attach(int fd)
{
	Close();
	m_fd = fd;
	m_eof = false;
	m_buffer.clear();
}

void CLineReader::Close()
{
	if (m_fd >= 0)
	{
		LogDebug("Closing descriptor %d", m_fd);
		close(m_fd);
		m_fd = -1;
	}
	m_buffer.clear();
}

bool CLineReader::takeLine(std::string &line)
{
	auto pos = m_buffer.find('\n');
	if (std::string::npos == pos)
		return false;
	line.assign(m_buffer.substr(0, pos));
	m_buffer.erase(0, pos + 1);
	if (not line.empty() and '\r' == line.back())
		line.pop_back();
	return true;
}

EReadResult CLineReader::ReadLine(std::string &line, int ms, const std::atomic<bool> &cancel)
{
	line.clear();
	CSteadyTimer timer;
	const double limit = ms / 1000.0;

	while (true)
	{
		if (takeLine(line))
			return EReadResult::line;

		if (m_eof or m_fd < 0)
		{
			if (m_buffer.empty())
				return EReadResult::closed;
			line.assign(m_buffer);
			m_buffer.clear();
			return EReadResult::line;
		}

		if (cancel)
			return EReadResult::cancelled;

		int slice = timer.remainingMs(limit);
		if (0 == slice)
			return EReadResult::timeout;
		if (slice > PollSliceMs)
			slice = PollSliceMs;

		struct pollfd pfd;
		pfd.fd = m_fd;
		pfd.events = POLLIN;
		pfd.revents = 0;
		auto rval = poll(&pfd, 1, slice);
		if (rval < 0)
		{
			if (EINTR == errno)
				continue;
			LogError("poll() on descriptor %d: %s", m_fd, strerror(errno));
			return EReadResult::closed;
		}
		if (0 == rval)
			continue;
		if (pfd.revents & POLLNVAL)
		{
			LogError("Descriptor %d is not open", m_fd);
			return EReadResult::closed;
		}

		char buf[512];
		auto len = read(m_fd, buf, sizeof(buf));
		if (len > 0)
		{
			m_buffer.append(buf, len);
			if (m_buffer.size() > MaxLineLength and std::string::npos == m_buffer.find('\n'))
			{
				LogDebug("Discarding %u bytes without an end of line", unsigned(m_buffer.size()));
				m_buffer.clear();
			}
		}
		else if (0 == len)
			m_eof = true;
		else if (EAGAIN != errno and EWOULDBLOCK != errno and EINTR != errno)
		{
			LogError("read() on descriptor %d: %s", m_fd, strerror(errno));
			m_eof = true;
		}
	}
}
