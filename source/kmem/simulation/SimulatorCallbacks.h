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

#include "Clock.h"

#include <string>

namespace kmem::sim {

class SimulationNode;

/**
 * @brief Interface for classes that want to be informed of simulator events.
 */
class SimulatorCallbacks
{
	public:
		virtual ~SimulatorCallbacks() = default;

		/**
		 * @brief Called when the simulation is powered on, after all nodes have been reset but before simulation processes have started.
		 */
		virtual void onPowerOn() { }

		/**
		 * @brief Called once the state of a time step is final.
		 * @details This is where checks can be performed or states can be written to waveform files.
		 */
		virtual void onCommitState() { }

		/**
		 * @brief Called whenever the simulation time advances, but before the new state for this time step has been evaluated.
		 * @param simulationTime The new simulator time.
		 */
		virtual void onNewTick(const ClockRational &simulationTime) { }

		/**
		 * @brief Called after all nodes have advanced on a clock edge.
		 * @param clock The clock which triggered.
		 */
		virtual void onClock(const Clock *clock) { }

		virtual void onDebugMessage(const SimulationNode *src, std::string msg) { }
		virtual void onWarning(const SimulationNode *src, std::string msg) { }
		virtual void onAssert(const SimulationNode *src, std::string msg) { }
};


/**
 * @brief Simple SimulatorCallbacks implementation that writes the most important events to the console.
 */
class SimulatorConsoleOutput : public SimulatorCallbacks
{
	public:
		virtual void onNewTick(const ClockRational &simulationTime) override;
		virtual void onDebugMessage(const SimulationNode *src, std::string msg) override;
		virtual void onWarning(const SimulationNode *src, std::string msg) override;
		virtual void onAssert(const SimulationNode *src, std::string msg) override;
	protected:
		ClockRational m_simTime;

		void printPrefix(const SimulationNode *src) const;
};


}
