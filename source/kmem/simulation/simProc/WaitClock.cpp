/*  This file is part of KMem, a cycle-accurate model of a key memory core.
	Copyright (C) 2026 The KMem Authors

	KMem is free software; you can redistribute it and/or
	modify it under the terms of the GNU Lesser General Public
	License as published by the Free Software Foundation; either
	version 3 of the License, or (at your option) any later version.

	KMem is distributed in the hope that it will be useful,
	but WITHOUT ANY WARRANTY; without even the implied warranty of
	MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU
	Lesser General Public License for more details.

	You should have received a copy of the GNU Lesser General Public
	License along with this library; if not, write to the Free Software
	Foundation, Inc., 51 Franklin Street, Fifth Floor, Boston, MA  02110-1301  USA
*/
#include "kmem/pch.h"
#include "WaitClock.h"

#include "../Simulator.h"

namespace kmem::sim {

WaitClock::WaitClock(const Clock &clock, TimingPhase timing) : m_clock(&clock), m_timing(timing)
{
}

void WaitClock::await_suspend(std::coroutine_handle<> handle)
{
	Simulator *simulator = Simulator::current();
	KMEM_DESIGNCHECK_HINT(simulator != nullptr, "Waiting for a clock is only possible from within a running simulation process.");
	simulator->simulationProcessSuspending(handle, *this);
}

}
