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
#include "UnitTestSimulationFixture.h"

#include "ReferenceSimulator.h"
#include "SimulationNode.h"

#include "../debug/DebugInterface.h"

#include <boost/test/unit_test.hpp>

namespace kmem::sim {

namespace {
	struct TestOptions {
		std::optional<std::string> report;
		bool recordWaveform = false;
	};

	TestOptions parseTestOptions()
	{
		TestOptions options;
		auto &suite = boost::unit_test::framework::master_test_suite();
		for (int i = 1; i < suite.argc; i++) {
			const std::string_view arg = suite.argv[i];
			if (arg == "--vcd") {
				options.recordWaveform = true;
			} else if (arg == "--report") {
				if (++i == suite.argc)
					throw std::runtime_error("--report expects html or console");
				options.report = suite.argv[i];
			}
		}
		return options;
	}

	std::string describe(const SimulationNode *src, const std::string &msg)
	{
		if (src == nullptr)
			return msg;
		return src->getPath() + ": " + msg;
	}
}

UnitTestSimulationFixture::UnitTestSimulationFixture()
{
	const std::string testName = boost::unit_test::framework::current_test_case().p_name;
	const TestOptions options = parseTestOptions();

	// The logging backend has to be in place before any node reports anything.
	if (options.report == "html")
		dbg::logHtml(testName + "_log/");
	else if (options.report == "console")
		dbg::logConsole();
	else if (options.report)
		throw std::runtime_error("unknown report backend " + *options.report);

	m_simulator = std::make_unique<ReferenceSimulator>(false);
	m_simulator->addCallbacks(this);

	if (options.recordWaveform)
		m_waveformName = testName + ".vcd";
}

UnitTestSimulationFixture::~UnitTestSimulationFixture()
{
	m_vcdSink.reset();
	m_simulator.reset();
	dbg::logNothing();
}

void UnitTestSimulationFixture::addNode(SimulationNode &root, const Clock &clock)
{
	m_simulator->addNode(root, clock);
}

void UnitTestSimulationFixture::addSimulationProcess(std::function<SimulationFunction<>()> simProc)
{
	m_simulator->addSimulationProcess(std::move(simProc));
}

void UnitTestSimulationFixture::recordVCD(const std::string &filename)
{
	m_waveformName = filename;
}

void UnitTestSimulationFixture::simulate(size_t numTicks)
{
	if (m_waveformName && !m_vcdSink)
		m_vcdSink.emplace(*m_simulator, m_waveformName->c_str());

	m_stopTestCalled = false;
	m_simulator->powerOn();
	m_simulator->runTicks(numTicks);

	if (!m_errors.empty())
		BOOST_FAIL(m_errors.front());
	for (const auto &warning : m_warnings)
		BOOST_ERROR(warning);
	m_warnings.clear();
}

void UnitTestSimulationFixture::runTicks(size_t numTicks)
{
	simulate(numTicks);
}

void UnitTestSimulationFixture::stopTest()
{
	m_stopTestCalled = true;
	m_simulator->abort();
}

bool UnitTestSimulationFixture::runHitsTimeout(size_t timeoutTicks)
{
	simulate(timeoutTicks);
	return !m_stopTestCalled;
}

void UnitTestSimulationFixture::onDebugMessage(const SimulationNode *src, std::string msg)
{
	BOOST_TEST_MESSAGE(describe(src, msg));
}

void UnitTestSimulationFixture::onWarning(const SimulationNode *src, std::string msg)
{
	m_warnings.push_back(describe(src, msg));
}

void UnitTestSimulationFixture::onAssert(const SimulationNode *src, std::string msg)
{
	m_errors.push_back(describe(src, msg));
}


void BoostUnitTestSimulationFixture::runFixedLengthTest(size_t numTicks)
{
	BOOST_CHECK_MESSAGE(runHitsTimeout(numTicks), "the simulation was stopped before " << numTicks << " ticks");
}

void BoostUnitTestSimulationFixture::runTest(size_t timeoutTicks)
{
	BOOST_CHECK_MESSAGE(!runHitsTimeout(timeoutTicks), "the simulation was not stopped within " << timeoutTicks << " ticks");
}

}
