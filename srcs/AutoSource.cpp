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

#include "AutoSource.h"
#include "SteadyTimer.h"
#include "Log.h"

EAcquireError CAutoSource::Acquire(double timeout, std::unique_ptr<CPosition> &pos)
{
	pos.reset();
	if (m_cancelled)
		return EAcquireError::sourceUnavailable;

	CSteadyTimer timer;
	if (m_primary)
	{
		const double t = (m_primaryTimeout < timeout) ? m_primaryTimeout : timeout;
		auto err = m_primary->Acquire(t, pos);
		if (EAcquireError::none == err)
			return err;
		LogInfo("%s: %s, trying %s", m_primary->GetName().c_str(), ToString(err), m_fallback ? m_fallback->GetName().c_str() : "nothing else");
	}

	if (m_fallback and not m_cancelled)
	{
		double left = timeout - timer.time();
		if (left < 0.0)
			left = 0.0;
		auto err = m_fallback->Acquire(left, pos);
		if (EAcquireError::none == err)
			return err;
		LogInfo("%s: %s", m_fallback->GetName().c_str(), ToString(err));
	}

	if (m_cancelled)
		return EAcquireError::sourceUnavailable;
	return EAcquireError::noSourceAvailable;
}

void CAutoSource::Cancel()
{
	m_cancelled = true;
	if (m_primary)
		m_primary->Cancel();
	if (m_fallback)
		m_fallback->Cancel();
}

void CAutoSource::SetObserver(SourceObserver observer)
{
	if (m_primary)
		m_primary->SetObserver(observer);
	if (m_fallback)
		m_fallback->SetObserver(observer);
	CPositionSource::SetObserver(std::move(observer));
}
