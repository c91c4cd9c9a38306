// Copyright (C) 2015,2016,2020 by Jonathan Naylor G4KLX

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

#include <sys/time.h>

#include <cstdio>
#include <cstdarg>
#include <ctime>
#include <cstring>
#include <cerrno>

#include "Log.h"

// the one and only global object
CLog g_Log;

bool CLog::Open(const std::string &filepath, unsigned level)
{
	std::lock_guard<std::mutex> lock(m_mutex);
	if (level > 6U) level = 6U;
	m_level = level;

	if (filepath.empty())
		return false;

	m_fp = ::fopen(filepath.c_str(), "a+t");
	if (nullptr == m_fp)
	{
		fprintf(stderr, "Couldn't open %s: %s\n", filepath.c_str(), strerror(errno));
		return true;
	}
	return false;
}

void CLog::Close()
{
	std::lock_guard<std::mutex> lock(m_mutex);
	if (m_fp != nullptr)
		fclose(m_fp);
	m_fp = nullptr;
}

void CLog::SetObserver(LogObserver observer)
{
	std::lock_guard<std::mutex> lock(m_mutex);
	m_observer = std::move(observer);
}

void CLog::Log(unsigned level, const char *fmt, ...)
{
	if (nullptr == fmt or level >= LEVELS.size())
		return;

	LogObserver observer;
	std::string line;
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		const bool toConsole = m_level and level >= m_level;
		if (not toConsole and nullptr == m_fp and not m_observer)
			return;

		char buffer[601U];
		struct timeval now;
		gettimeofday(&now, nullptr);

		struct tm tm;
		::localtime_r(&now.tv_sec, &tm);

		auto len = snprintf(buffer, sizeof(buffer), "%c: %02d/%02d %02d:%02d:%02d.%03lld ", LEVELS[level], tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec, (long long)now.tv_usec / 1000LL);

		va_list vl;
		va_start(vl, fmt);
		vsnprintf(buffer + len, sizeof(buffer) - len, fmt, vl);
		va_end(vl);

		// the file always gets everything, it's the debug log
		if (m_fp)
		{
			fprintf(m_fp, "%s\n", buffer);
			fflush(m_fp);
		}

		if (toConsole)
		{
			fprintf(stdout, "%s\n", buffer);
			fflush(stdout);
		}

		if (not m_observer)
			return;
		observer = m_observer;
		line.assign(buffer + len);
	}

	// called unlocked, an observer may log or replace itself
	observer(level, line);
}
