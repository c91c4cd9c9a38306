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
#include <poll.h>
#include <unistd.h>
#include <nlohmann/json.hpp>

#include "DaemonSource.h"
#include "SockAddress.h"
#include "SteadyTimer.h"
#include "Log.h"

static const char *WATCH_REQUEST = "?WATCH={\"enable\":true,\"json\":true}\n";

// returns true on failure
static bool getNumber(const nlohmann::json &report, const char *key, double &value)
{
	if (report.contains(key) and report[key].is_number())
	{
		value = report[key].get<double>();
		return false;
	}
	return true;
}

bool CDaemonSource::openChannel(CLineReader &reader, double timeout)
{
	CSockAddress addr;
	if (addr.Initialize(m_host, m_port))
		return true;

	int fd = socket(addr.GetFamily(), SOCK_STREAM, 0);
	if (0 > fd)
	{
		LogError("socket() for gpsd at %s: %s", addr.GetAddress(), strerror(errno));
		return true;
	}
	// the reader closes it from here on
	reader.Attach(fd);

	if (0 > fcntl(fd, F_SETFL, O_NONBLOCK))
	{
		LogError("Cannot set the gpsd socket to non-blocking: %s", strerror(errno));
		return true;
	}

	if (0 != connect(fd, addr.GetCPointer(), addr.GetSize()))
	{
		if (EINPROGRESS != errno)
		{
			LogDebug("connect() to gpsd at %s:%u: %s", addr.GetAddress(), m_port, strerror(errno));
			return true;
		}

		CSteadyTimer timer;
		while (true)
		{
			if (m_cancelled)
				return true;
			int slice = timer.remainingMs(timeout);
			if (0 == slice)
			{
				LogDebug("Timed out connecting to gpsd at %s:%u", addr.GetAddress(), m_port);
				return true;
			}
			if (slice > CLineReader::PollSliceMs)
				slice = CLineReader::PollSliceMs;

			struct pollfd pfd;
			pfd.fd = fd;
			pfd.events = POLLOUT;
			pfd.revents = 0;
			auto rval = poll(&pfd, 1, slice);
			if (rval < 0 and EINTR != errno)
			{
				LogError("poll() connecting to gpsd: %s", strerror(errno));
				return true;
			}
			if (rval > 0)
				break;
		}

		int soerr = 0;
		socklen_t len = sizeof(soerr);
		if (0 > getsockopt(fd, SOL_SOCKET, SO_ERROR, &soerr, &len) or 0 != soerr)
		{
			LogDebug("Could not connect to gpsd at %s:%u: %s", addr.GetAddress(), m_port, strerror(soerr ? soerr : errno));
			return true;
		}
	}
	LogDebug("Connected to gpsd at %s:%u", addr.GetAddress(), m_port);

	const auto size = strlen(WATCH_REQUEST);
	auto rval = write(fd, WATCH_REQUEST, size);
	if (0 > rval)
	{
		LogError("Could not send the WATCH request to gpsd: %s", strerror(errno));
		return true;
	}
	if (size_t(rval) != size)
	{
		LogError("Short write of the WATCH request, %d of %u", int(rval), unsigned(size));
		return true;
	}
	return false;
}

EParseResult CDaemonSource::parseLine(const std::string &line, SFixData &fix)
{
	return ParseReport(line, fix);
}

EParseResult CDaemonSource::ParseReport(const std::string &line, SFixData &fix)
{
	auto report = nlohmann::json::parse(line, nullptr, false);
	if (report.is_discarded() or not report.is_object())
		return EParseResult::unrecognized;
	if (not report.contains("class") or not report["class"].is_string())
		return EParseResult::unrecognized;

	const auto cls = report["class"].get<std::string>();
	if (0 == cls.compare("VERSION"))
	{
		if (report.contains("release") and report["release"].is_string())
			LogInfo("gpsd release %s", report["release"].get<std::string>().c_str());
		return EParseResult::unrecognized;
	}
	if (0 == cls.compare("DEVICES"))
	{
		if (report.contains("devices") and report["devices"].is_array())
		{
			for (const auto &dev : report["devices"])
			{
				if (dev.is_object() and dev.contains("path") and dev["path"].is_string())
					LogInfo("gpsd device %s", dev["path"].get<std::string>().c_str());
			}
		}
		return EParseResult::unrecognized;
	}
	if (cls.compare("TPV"))
		return EParseResult::unrecognized;

	int mode = 0;
	if (report.contains("mode") and report["mode"].is_number_integer())
		mode = report["mode"].get<int>();
	if (mode < 2)
		return EParseResult::noFix;
	if (getNumber(report, "lat", fix.latitude) or getNumber(report, "lon", fix.longitude))
		return EParseResult::noFix;

	fix.mode = (mode >= 3) ? EFixMode::fix3D : EFixMode::fix2D;
	if (not getNumber(report, "alt", fix.altitude) or not getNumber(report, "altMSL", fix.altitude) or not getNumber(report, "altHAE", fix.altitude))
		fix.hasAltitude = true;
	fix.hasSpeed = not getNumber(report, "speed", fix.speed);
	fix.hasTrack = not getNumber(report, "track", fix.track);
	return EParseResult::fix;
}
