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

#include "utils/Exceptions.h"
#include "utils/ConfigTree.h"

#include "debug/DebugInterface.h"

#include "simulation/Clock.h"
#include "simulation/Reg.h"
#include "simulation/SimulationNode.h"
#include "simulation/Simulator.h"
#include "simulation/ReferenceSimulator.h"
#include "simulation/simProc/SimulationProcess.h"
#include "simulation/simProc/WaitClock.h"

#include <concepts>
#include <functional>
#include <type_traits>

namespace kmem {

	using Clock = sim::Clock;
	using ClockConfig = sim::ClockConfig;
	using Seconds = sim::ClockRational;

	template<typename T>
	using SimFunction = sim::SimulationFunction<T>;

	using SimProcess = sim::SimulationFunction<void>;

	/// Awaiter that resumes after the nodes advanced on the next clock edge.
	inline sim::WaitClock AfterClk(const Clock &clk) { return sim::WaitClock(clk, sim::WaitClock::AFTER); }
	/// Awaiter that resumes right before the nodes advance on the next clock edge. Inputs driven afterwards are sampled by that edge.
	inline sim::WaitClock OnClk(const Clock &clk) { return sim::WaitClock(clk, sim::WaitClock::BEFORE); }

	/// Returns the elapsed simulation time of the currently running simulation.
	inline Seconds getCurrentSimulationTime() {
		auto *simulator = sim::Simulator::current();
		KMEM_DESIGNCHECK_HINT(simulator != nullptr, "The simulation time can only be queried from within a simulation process.");
		return simulator->getCurrentSimulationTime();
	}
	inline double nowNs() { return sim::toNanoseconds(getCurrentSimulationTime()); }

	/**
	 * @brief Forks a new simulation process that will run in (quasi-)parallel.
	 * @details Execution resumes in the new simulation process and returns to the calling simulation process
	 * once the forked one suspends or finishes.
	 * @return A handle that other simulation processes can @ref kmem::join on.
	 */
	template<typename ReturnValue>
	auto fork(const sim::SimulationFunction<ReturnValue> &simProc) {
		return sim::forkFunc(simProc);
	}

	/**
	 * @brief Forks a new simulation process from a lambda expression.
	 * @details The lambda is stored alongside the coroutine so that its captures outlive the simulation process.
	 */
	template<std::invocable Functor>
	auto fork(Functor simProcLambda) {
		using SimFunc = std::invoke_result_t<Functor>;
		return sim::forkFunc(std::function<SimFunc()>(std::move(simProcLambda)));
	}

	/// Suspends until a forked simulation function finished and returns its return value.
	template<typename ReturnValue>
	auto join(const sim::SimulationFunction<ReturnValue> &handle) {
		return handle.join();
	}

}
