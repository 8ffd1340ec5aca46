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

#include "Simulator.h"
#include "SimulatorCallbacks.h"
#include "simProc/SimulationProcess.h"

#include <functional>
#include <list>
#include <optional>
#include <vector>

namespace kmem::sim {

/**
 * @brief Straight forward single clock cycle simulator.
 */
class ReferenceSimulator : public Simulator
{
	public:
		ReferenceSimulator(bool enableConsoleOutput = true);
		virtual ~ReferenceSimulator();

		virtual void addNode(SimulationNode &root, const Clock &clock) override;

		virtual void powerOn() override;
		virtual void advanceTick() override;
		virtual void runTicks(size_t numTicks) override;
		virtual void abort() override { m_abortCalled = true; }
		virtual bool abortCalled() const override { return m_abortCalled; }

		virtual const Clock *getClock() const override { return m_clock; }
		virtual const std::vector<SimulationNode*> &getRootNodes() const override { return m_rootNodes; }

		virtual void addSimulationProcess(std::function<SimulationFunction<void>()> simProc) override;

		virtual void simulationProcessSuspending(std::coroutine_handle<> handle, WaitClock &waitClock) override;
	protected:
		const Clock *m_clock = nullptr;
		std::vector<SimulationNode*> m_rootNodes;
		std::vector<SimulationNode*> m_nodes;

		SimulationCoroutineHandler m_coroutineHandler;
		std::list<std::function<SimulationFunction<>()>> m_simProcs;

		std::vector<std::coroutine_handle<>> m_processesAwaitingBeforeClock;
		std::vector<std::coroutine_handle<>> m_processesAwaitingAfterClock;
		/// Processes that waited for the phase before an edge while no edge was being simulated (at power on or between calls).
		std::vector<std::coroutine_handle<>> m_processesSuspendedBetweenClocks;

		bool m_simulatingClockEdge = false;

		bool m_poweredOn = false;
		bool m_abortCalled = false;

		std::optional<SimulatorConsoleOutput> m_simulatorConsoleOutput;

		virtual void startCoroutine(SimulationFunction<void> coroutine) override;

		void resumeProcesses(std::vector<std::coroutine_handle<>> &processes);
		void runCoroutines();
		void commitState();
		void stopProcesses();
};

}
