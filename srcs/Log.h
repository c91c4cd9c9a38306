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

#pragma once

#include <cstdio>
#include <string>
#include <mutex>
#include <functional>

#define	LogDebug(fmt, ...)   g_Log.Log(1U, fmt, ##__VA_ARGS__)
#define	LogMessage(fmt, ...) g_Log.Log(2U, fmt, ##__VA_ARGS__)
#define	LogInfo(fmt, ...)    g_Log.Log(3U, fmt, ##__VA_ARGS__)
#define	LogWarning(fmt, ...) g_Log.Log(4U, fmt, ##__VA_ARGS__)
#define	LogError(fmt, ...)   g_Log.Log(5U, fmt, ##__VA_ARGS__)

// receives every formatted line, whatever the console level
using LogObserver = std::function<void(unsigned level, const std::string &line)>;

class CLog
{
public:
	CLog() : LEVELS("-DMIWE") {}
	~CLog() { Close(); }

	void Log(unsigned level, const char* fmt, ...) __attribute__((format(printf, 3, 4)));
	// returns true on failure
	bool Open(const std::string &filepath, unsigned level);
	void Close();
	void SetObserver(LogObserver observer);
	unsigned GetLevel() const { return m_level; }

private:
	const std::string LEVELS;
	unsigned m_level = 0U;
	FILE *m_fp = nullptr;
	LogObserver m_observer;
	std::mutex m_mutex;
};

extern CLog g_Log;
