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

#include "PositionSource.h"

// gpsd first with a short timeout, then the position file
class CAutoSource : public CPositionSource
{
public:
	static constexpr double DefaultPrimaryTimeout = 3.0;

	CAutoSource(std::unique_ptr<CPositionSource> primary, std::unique_ptr<CPositionSource> fallback, double primaryTimeout = DefaultPrimaryTimeout)
	: CPositionSource("auto"), m_primary(std::move(primary)), m_fallback(std::move(fallback)), m_primaryTimeout(primaryTimeout) {}

	// noSourceAvailable only when both fail
	EAcquireError Acquire(double timeout, std::unique_ptr<CPosition> &pos) override;
	void Cancel() override;
	void SetObserver(SourceObserver observer) override;

private:
	std::unique_ptr<CPositionSource> m_primary, m_fallback;
	const double m_primaryTimeout;
};
