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
#include <memory>
#include <string>
#include <functional>

#include "Position.h"

enum class EAcquireError { none, timeout, sourceUnavailable, notFound, malformed, noSourceAvailable, invalidCoordinate };

// what a source tells its observer while it works
enum class ESourceEvent { unrecognized, degradedFix, resolved, timedOut, channelLost };

using SourceObserver = std::function<void(ESourceEvent event, const std::string &text)>;

// One way of getting a position. Only one thread may call Acquire(),
// any thread may call Cancel().
class CPositionSource
{
public:
	CPositionSource(const std::string &name) : m_name(name) {}
	virtual ~CPositionSource() {}

	// Blocks for no more than timeout seconds (plus a poll slice).
	// On success pos holds the new fix.
	virtual EAcquireError Acquire(double timeout, std::unique_ptr<CPosition> &pos) = 0;

	// Interrupts a pending Acquire(). Once cancelled, a source stays cancelled
	// and every Acquire() returns sourceUnavailable.
	virtual void Cancel() { m_cancelled = true; }
	virtual void SetObserver(SourceObserver observer) { m_observer = std::move(observer); }

	bool IsCancelled() const { return m_cancelled; }
	const std::string &GetName() const { return m_name; }

protected:
	void notify(ESourceEvent event, const std::string &text) const
	{
		if (m_observer)
			m_observer(event, text);
	}

	std::atomic<bool> m_cancelled { false };

private:
	const std::string m_name;
	SourceObserver m_observer;
};

const char *ToString(EAcquireError err);
const char *ToString(ESourceEvent event);
