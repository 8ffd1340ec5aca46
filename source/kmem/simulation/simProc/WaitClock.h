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
#pragma once


#include <coroutine>

namespace kmem::sim {

class Clock;

/**
 * @brief co_awaiting on a WaitClock continues the simulation until the clock triggers.
 * @details If the clock is already triggering, the simulation continues until it triggers again.
 * This means repeatedly co_awaiting a clock can be used to advance in clock ticks.
 */
class WaitClock {
	public:
		/**
		 * @brief How this event relates to the activities of clocked nodes in the simulation.
		 * @details A simulation process usually drives inputs and checks outputs "between" clock edges.
		 */
		enum TimingPhase {
			BEFORE, /// Resume before the nodes advance. The process sees the old state, inputs it drives are sampled by this edge.
			AFTER,  /// Resume after the nodes advanced. The process sees the new state, inputs it drives are sampled by the next edge.
		};

		WaitClock(const Clock &clock, TimingPhase timing = AFTER);

		bool await_ready() noexcept { return false; } // always force reevaluation
		void await_suspend(std::coroutine_handle<> handle);
		void await_resume() noexcept { }

		const Clock *getClock() const { return m_clock; }
		TimingPhase getTimingPhase() const { return m_timing; }
	protected:
		const Clock *m_clock;
		TimingPhase m_timing;
};

}
