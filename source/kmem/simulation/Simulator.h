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
#include "SimulatorCallbacks.h"
#include "simProc/SimulationProcess.h"
#include "simProc/WaitClock.h"

#include <coroutine>

#include <functional>
#include <string>
#include <vector>

namespace kmem::sim {

class SimulationNode;

/**
 * @brief Interface for all cycle simulators
 */
class Simulator
{
	public:
		Simulator() = default;
		virtual ~Simulator() = default;

		/// Returns the simulator that is currently running simulation processes on this thread, or nullptr.
		static Simulator *current() { return s_current; }

		/// Adds a simulator callback hook to inform waveform recorders and test fixtures about simulation events.
		void addCallbacks(SimulatorCallbacks *simCallbacks) { m_callbackDispatcher.m_callbacks.push_back(simCallbacks); }

		/**
		 * @brief Adds a node hierarchy that is to be simulated, clocked by the given clock.
		 * @details All nodes of one simulator share a single clock.
		 */
		virtual void addNode(SimulationNode &root, const Clock &clock) = 0;

		/**
			@name Simulator control
			@{
		*/

		/// Resets all nodes into their power on state and starts the simulation processes.
		virtual void powerOn() = 0;

		/**
		 * @brief Advances the simulation by one clock edge.
		 * @details Announces the new time through SimulatorCallbacks::onNewTick, resumes processes waiting before the edge,
		 * evaluates and advances all nodes, announces SimulatorCallbacks::onClock, resumes processes waiting after the edge
		 * and finally declares the state final through SimulatorCallbacks::onCommitState.
		 */
		virtual void advanceTick() = 0;

		/// Advances the simulation by numTicks clock edges or until aborted.
		virtual void runTicks(size_t numTicks) = 0;

		/**
		 * @brief Starts the given coroutine and advances the simulation until it finished.
		 * @details Must be called after powerOn and outside of simulation processes.
		 * @param maxTicks Upper bound of clock edges to simulate before giving up with an error.
		 */
		template<typename ReturnValue>
		ReturnValue executeCoroutine(SimulationFunction<ReturnValue> coroutine, size_t maxTicks = ~0ull);

		/// Aborts a running call to runTicks or executeCoroutine after the current clock edge.
		virtual void abort() = 0;
		/// Returns whether abort() has been called
		virtual bool abortCalled() const = 0;

		/// @}

		/// Returns the number of clock edges since @ref powerOn.
		inline size_t getCurrentTick() const { return m_tick; }
		/// Returns the elapsed simulation time (in seconds) since @ref powerOn.
		inline const ClockRational &getCurrentSimulationTime() const { return m_simulationTime; }
		/// Returns the current timing phase (before or after the nodes advanced on the current clock edge).
		inline WaitClock::TimingPhase getCurrentPhase() const { return m_timingPhase; }

		virtual const Clock *getClock() const = 0;
		virtual const std::vector<SimulationNode*> &getRootNodes() const = 0;

		/// Adds a simulation process to this simulator that gets started on power on.
		virtual void addSimulationProcess(std::function<SimulationFunction<void>()> simProc) = 0;

		virtual void simulationProcessSuspending(std::coroutine_handle<> handle, WaitClock &waitClock) = 0;

		void onDebugMessage(const SimulationNode *src, std::string msg) { m_callbackDispatcher.onDebugMessage(src, std::move(msg)); }
		void onWarning(const SimulationNode *src, std::string msg) { m_callbackDispatcher.onWarning(src, std::move(msg)); }
		void onAssert(const SimulationNode *src, std::string msg) { m_callbackDispatcher.onAssert(src, std::move(msg)); }
	protected:
		class CallbackDispatcher : public SimulatorCallbacks {
			public:
				std::vector<SimulatorCallbacks*> m_callbacks;

				virtual void onPowerOn() override;
				virtual void onCommitState() override;
				virtual void onNewTick(const ClockRational &simulationTime) override;
				virtual void onClock(const Clock *clock) override;
				virtual void onDebugMessage(const SimulationNode *src, std::string msg) override;
				virtual void onWarning(const SimulationNode *src, std::string msg) override;
				virtual void onAssert(const SimulationNode *src, std::string msg) override;
		};

		/// Makes a simulator the current one for the duration of a scope.
		class CurrentScope {
			public:
				CurrentScope(Simulator *simulator) : m_last(s_current) { s_current = simulator; }
				~CurrentScope() { s_current = m_last; }
			protected:
				Simulator *m_last;
		};

		size_t m_tick = 0;
		ClockRational m_simulationTime;
		WaitClock::TimingPhase m_timingPhase = WaitClock::AFTER;
		CallbackDispatcher m_callbackDispatcher;

		virtual void startCoroutine(SimulationFunction<void> coroutine) = 0;

		static thread_local Simulator *s_current;
};


template<typename ReturnValue>
ReturnValue Simulator::executeCoroutine(SimulationFunction<ReturnValue> coroutine, size_t maxTicks)
{
	KMEM_DESIGNCHECK_HINT(s_current == nullptr, "executeCoroutine can not be called from within a simulation process.");

	bool done = false;
	std::optional<std::conditional_t<std::is_void_v<ReturnValue>, bool, ReturnValue>> result;

	auto callbackWrapper = [&result, &done, &coroutine]()mutable->SimulationFunction<void> {
		if constexpr (std::is_void_v<ReturnValue>)
			co_await coroutine;
		else
			result.emplace(co_await coroutine);
		done = true;
	};

	startCoroutine(callbackWrapper());
	for (size_t ticks = 0; !done; ticks++) {
		KMEM_DESIGNCHECK_HINT(ticks < maxTicks, "Simulation coroutine did not finish within the given number of clock ticks.");
		KMEM_DESIGNCHECK_HINT(!abortCalled(), "Simulation was aborted before the coroutine finished.");
		advanceTick();
	}

	if constexpr (!std::is_void_v<ReturnValue>)
		return std::move(*result);
}

}
