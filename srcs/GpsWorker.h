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

#include <atomic>
#include <cstddef>
#include <future>
#include <memory>

#include "PositionSource.h"
#include "SafeQueue.h"

struct SFixReport
{
	EAcquireError status;
	std::unique_ptr<CPosition> position;	// set when status is none
};

using FixReportQueue = CSafeQueue<std::unique_ptr<SFixReport>>;

// Runs Acquire() over and over on its own task and queues every result.
// Nothing else touches the source while the worker owns it.
class CGpsWorker
{
public:
	static constexpr double BackoffSeconds = 1.0;
	// unread reports beyond this are dropped, oldest first
	static constexpr std::size_t MaxReports = 16;

	CGpsWorker() : keep_running(false) {}
	~CGpsWorker() { Stop(); }

	// returns true on failure; interval is the pause after each fix
	bool Start(std::unique_ptr<CPositionSource> source, double timeout, double interval = BackoffSeconds);
	// cancels the source and waits for the task to finish
	void Stop();
	bool IsRunning() const { return keep_running; }

	// the next result, or nullptr after ms milliseconds
	std::unique_ptr<SFixReport> WaitFor(int ms) { return reports.PopWaitFor(ms); }

private:
	void process();
	void pause(double seconds);

	std::unique_ptr<CPositionSource> source;
	double timeout = 0.0, interval = 0.0;
	std::atomic<bool> keep_running;
	std::future<void> workFuture;
	FixReportQueue reports;
};
