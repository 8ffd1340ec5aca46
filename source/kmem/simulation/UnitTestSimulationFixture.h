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

#include "SimulatorCallbacks.h"
#include "simProc/SimulationProcess.h"
#include "waveformFormats/VCDSink.h"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace kmem::sim {

	class Simulator;
	class SimulationNode;
	class Clock;

	/**
	 * @brief Owns a simulator for the duration of a unit test and fails the test on any warning or assert reported through the simulator.
	 * @details Passing `--report html` or `--report console` to the test executable enables the respective logging backend,
	 * `--vcd` records the waveform of every test into <test name>.vcd.
	 */
	class UnitTestSimulationFixture : public SimulatorCallbacks
	{
	public:
		UnitTestSimulationFixture();
		~UnitTestSimulationFixture();

		void addNode(SimulationNode &root, const Clock &clock);
		void addSimulationProcess(std::function<SimulationFunction<>()> simProc);

		/// Powers on and runs the simulation for a specified amount of clock ticks.
		void runTicks(size_t numTicks);

		/// Records the waveform of the following simulation run into filename.
		void recordVCD(const std::string &filename);

		/// Stops an ongoing simulation (to be used during runHitsTimeout)
		void stopTest();

		/// Powers on and runs the simulation until the timeout (in clock ticks) is reached or stopTest is called
		/// @return returns true if the timeout was reached.
		bool runHitsTimeout(size_t timeoutTicks);

		virtual void onDebugMessage(const SimulationNode *src, std::string msg) override;
		virtual void onWarning(const SimulationNode *src, std::string msg) override;
		virtual void onAssert(const SimulationNode *src, std::string msg) override;

		Simulator &getSimulator() { return *m_simulator; }
	protected:
		std::unique_ptr<Simulator> m_simulator;
		std::optional<std::string> m_waveformName;
		std::optional<VCDSink> m_vcdSink;

		bool m_stopTestCalled = false;

		std::vector<std::string> m_warnings;
		std::vector<std::string> m_errors;

		void simulate(size_t numTicks);
	};

	/**
	 * @brief Helper class to facilitate writing unit tests
	 */
	class BoostUnitTestSimulationFixture : protected UnitTestSimulationFixture {
		public:
			using UnitTestSimulationFixture::addNode;
			using UnitTestSimulationFixture::addSimulationProcess;
			using UnitTestSimulationFixture::recordVCD;
			using UnitTestSimulationFixture::stopTest;
			using UnitTestSimulationFixture::runTicks;

			Simulator &getSimulator() { return UnitTestSimulationFixture::getSimulator(); }

			/// Runs for exactly the given amount of ticks, calling stopTest is an error.
			void runFixedLengthTest(size_t numTicks);
			/// Runs until stopTest is called, hitting the timeout is an error.
			void runTest(size_t timeoutTicks);
	};

}
