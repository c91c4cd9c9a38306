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

#include <chrono>

// measures elapsed seconds on the monotonic clock
class CSteadyTimer
{
public:
	CSteadyTimer()
	{
		start();
	}

	~CSteadyTimer() {}

	void start()
	{
		starttime = std::chrono::steady_clock::now();
	}

	double time() const
	{
		std::chrono::duration<double> elapsed(std::chrono::steady_clock::now() - starttime);
		return elapsed.count();
	}

	// milliseconds left before limit seconds have passed, never negative
	int remainingMs(double limit) const
	{
		const double left = limit - time();
		return (left > 0.0) ? int(left * 1000.0 + 0.5) : 0;
	}

	bool expired(double limit) const
	{
		return time() >= limit;
	}

private:
	std::chrono::steady_clock::time_point starttime;
};
