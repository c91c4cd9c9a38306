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

#include <thread>
#include <chrono>

#include "GpsWorker.h"
#include "SteadyTimer.h"
#include "Log.h"

bool CGpsWorker::Start(std::unique_ptr<CPositionSource> src, double t, double i)
{
	if (keep_running)
	{
		LogError("The GPS worker is already running");
		return true;
	}
	if (nullptr == src)
	{
		LogError("The GPS worker needs a position source");
		return true;
	}
	source = std::move(src);
	timeout = t;
	interval = i;
	reports.Clear();

	keep_running = true;
	workFuture = std::async(std::launch::async, &CGpsWorker::process, this);
	if (not workFuture.valid())
	{
		LogError("Could not start the GPS worker thread");
		keep_running = false;
		source.reset();
		return true;
	}
	LogDebug("GPS worker started with the %s source", source->GetName().c_str());
	return false;
}

void CGpsWorker::Stop()
{
	keep_running = false;
	if (source)
		source->Cancel();
	if (workFuture.valid())
		workFuture.get();
	if (source)
	{
		LogDebug("GPS worker stopped");
		source.reset();
	}
}

// sleeps in short pieces so Stop() isn't held up
void CGpsWorker::pause(double seconds)
{
	CSteadyTimer timer;
	while (keep_running and not timer.expired(seconds))
		std::this_thread::sleep_for(std::chrono::milliseconds(50));
}

void CGpsWorker::process()
{
	while (keep_running)
	{
		auto report = std::make_unique<SFixReport>();
		report->status = source->Acquire(timeout, report->position);
		if (not keep_running)
			break;

		const auto status = report->status;
		reports.Push(std::move(report), MaxReports);

		switch (status)
		{
			case EAcquireError::none:
				pause(interval);
				break;
			case EAcquireError::timeout:
				// the time has already been spent waiting
				break;
			default:
				LogDebug("%s: %s, backing off", source->GetName().c_str(), ToString(status));
				pause(BackoffSeconds);
				break;
		}
	}
}
