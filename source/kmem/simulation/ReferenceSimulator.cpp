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
#include "ReferenceSimulator.h"
#include "SimulationNode.h"

#include "../debug/DebugInterface.h"

namespace kmem::sim {

thread_local Simulator *Simulator::s_current = nullptr;


void Simulator::CallbackDispatcher::onPowerOn()
{
	for (auto *c : m_callbacks) c->onPowerOn();
}

void Simulator::CallbackDispatcher::onCommitState()
{
	for (auto *c : m_callbacks) c->onCommitState();
}

void Simulator::CallbackDispatcher::onNewTick(const ClockRational &simulationTime)
{
	for (auto *c : m_callbacks) c->onNewTick(simulationTime);
}

void Simulator::CallbackDispatcher::onClock(const Clock *clock)
{
	for (auto *c : m_callbacks) c->onClock(clock);
}

void Simulator::CallbackDispatcher::onDebugMessage(const SimulationNode *src, std::string msg)
{
	for (auto *c : m_callbacks) c->onDebugMessage(src, msg);
}

void Simulator::CallbackDispatcher::onWarning(const SimulationNode *src, std::string msg)
{
	dbg::log(dbg::LogMessage() << dbg::LogMessage::LOG_WARNING << dbg::LogMessage::LOG_SIMULATION
		<< (src ? src->getPath() + ": " : std::string()) << msg);

	for (auto *c : m_callbacks) c->onWarning(src, msg);
}

void Simulator::CallbackDispatcher::onAssert(const SimulationNode *src, std::string msg)
{
	dbg::log(dbg::LogMessage() << dbg::LogMessage::LOG_ERROR << dbg::LogMessage::LOG_SIMULATION
		<< (src ? src->getPath() + ": " : std::string()) << msg);

	for (auto *c : m_callbacks) c->onAssert(src, msg);
}


ReferenceSimulator::ReferenceSimulator(bool enableConsoleOutput)
{
	if (enableConsoleOutput) {
		m_simulatorConsoleOutput.emplace();
		addCallbacks(&*m_simulatorConsoleOutput);
	}
}

ReferenceSimulator::~ReferenceSimulator()
{
	stopProcesses();
}

void ReferenceSimulator::addNode(SimulationNode &root, const Clock &clock)
{
	KMEM_DESIGNCHECK_HINT(m_clock == nullptr || m_clock == &clock, "All simulated nodes must be driven by the same clock.");
	KMEM_DESIGNCHECK_HINT(root.getParent() == nullptr, "Only the root of a node hierarchy can be added to the simulator.");
	KMEM_DESIGNCHECK_HINT(!m_poweredOn, "Nodes must be added before powering on the simulation.");
	m_clock = &clock;
	m_rootNodes.push_back(&root);

	auto nodes = collectNodes(root);
	m_nodes.insert(m_nodes.end(), nodes.begin(), nodes.end());
}

void ReferenceSimulator::addSimulationProcess(std::function<SimulationFunction<void>()> simProc)
{
	m_simProcs.push_back(std::move(simProc));

	if (m_poweredOn) {
		startCoroutine(m_simProcs.back()());
	}
}

void ReferenceSimulator::stopProcesses()
{
	m_processesAwaitingBeforeClock.clear();
	m_processesAwaitingAfterClock.clear();
	m_processesSuspendedBetweenClocks.clear();
	m_coroutineHandler.stopAll();
}

void ReferenceSimulator::powerOn()
{
	KMEM_DESIGNCHECK_HINT(m_clock != nullptr, "Nothing to simulate, no nodes have been added to the simulator.");

	stopProcesses();

	m_tick = 0;
	m_simulationTime = 0;
	m_timingPhase = WaitClock::BEFORE;
	m_abortCalled = false;
	m_poweredOn = true;
	m_simulatingClockEdge = false;

	dbg::newTick(m_tick);
	dbg::changeState(dbg::State::SIMULATION);

	m_callbackDispatcher.onNewTick(m_simulationTime);

	for (auto *node : m_nodes)
		node->simulateReset(m_callbackDispatcher);

	m_callbackDispatcher.onPowerOn();

	for (auto &simProc : m_simProcs)
		m_coroutineHandler.start(simProc());
	runCoroutines();

	commitState();
}

void ReferenceSimulator::advanceTick()
{
	KMEM_DESIGNCHECK_HINT(m_poweredOn, "The simulation must be powered on before it can advance.");

	m_tick++;
	m_simulationTime = m_clock->period() * ClockRational(m_tick);
	dbg::newTick(m_tick);
	m_callbackDispatcher.onNewTick(m_simulationTime);

	m_simulatingClockEdge = true;

	// Whatever ran between the edges already was in the phase before this edge, those processes resume before the next one.
	std::vector<std::coroutine_handle<>> suspendedBetweenClocks;
	std::swap(suspendedBetweenClocks, m_processesSuspendedBetweenClocks);

	m_timingPhase = WaitClock::BEFORE;
	resumeProcesses(m_processesAwaitingBeforeClock);
	m_processesAwaitingBeforeClock.insert(m_processesAwaitingBeforeClock.end(), suspendedBetweenClocks.begin(), suspendedBetweenClocks.end());

	for (auto *node : m_nodes)
		node->simulateEvaluate(m_callbackDispatcher);
	for (auto *node : m_nodes)
		node->simulateAdvance(m_callbackDispatcher);

	m_callbackDispatcher.onClock(m_clock);

	m_timingPhase = WaitClock::AFTER;
	resumeProcesses(m_processesAwaitingAfterClock);

	commitState();
	m_simulatingClockEdge = false;
}

void ReferenceSimulator::runTicks(size_t numTicks)
{
	m_abortCalled = false;
	for (size_t i = 0; i < numTicks && !m_abortCalled; i++)
		advanceTick();
}

void ReferenceSimulator::commitState()
{
	m_callbackDispatcher.onCommitState();
}

void ReferenceSimulator::resumeProcesses(std::vector<std::coroutine_handle<>> &processes)
{
	// Processes that wait again while being resumed wait for the next clock edge
	std::vector<std::coroutine_handle<>> resuming;
	std::swap(resuming, processes);

	for (auto handle : resuming)
		m_coroutineHandler.readyToResume(handle);

	runCoroutines();
}

void ReferenceSimulator::runCoroutines()
{
	CurrentScope scope(this);
	m_coroutineHandler.run();
}

void ReferenceSimulator::startCoroutine(SimulationFunction<void> coroutine)
{
	m_abortCalled = false;
	m_coroutineHandler.start(coroutine);
	runCoroutines();
}

void ReferenceSimulator::simulationProcessSuspending(std::coroutine_handle<> handle, WaitClock &waitClock)
{
	KMEM_DESIGNCHECK_HINT(waitClock.getClock() == m_clock, "Simulation processes can only wait on the clock that drives the simulated nodes.");

	switch (waitClock.getTimingPhase()) {
		case WaitClock::BEFORE:
			if (m_simulatingClockEdge)
				m_processesAwaitingBeforeClock.push_back(handle);
			else
				m_processesSuspendedBetweenClocks.push_back(handle);
		break;
		case WaitClock::AFTER:
			m_processesAwaitingAfterClock.push_back(handle);
		break;
	}
}

}
