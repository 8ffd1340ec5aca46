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
#include "frontend/pch.h"
#include "frontend/CounterNode.h"

#include <boost/test/unit_test.hpp>
#include <boost/test/data/dataset.hpp>
#include <boost/test/data/test_case.hpp>
#include <boost/test/data/monomorphic.hpp>

using namespace boost::unit_test;
using namespace kmem;
using sim::BoostUnitTestSimulationFixture;

namespace {
	struct test_exception_t : public std::runtime_error {
		test_exception_t() : std::runtime_error("test exception") { }
	};
}

BOOST_FIXTURE_TEST_CASE(SimProc_Basics, BoostUnitTestSimulationFixture)
{
	Clock clock;
	CounterNode counter;
	addNode(counter, clock);

	addSimulationProcess([&]()->SimProcess{
		BOOST_TEST(*counter.count == 0u);
		BOOST_TEST((*counter.phase == CounterNode::Phase::Stopped));

		counter.enable = true;
		for ([[maybe_unused]] auto i : kmem::utils::Range(5))
			co_await OnClk(clock);
		BOOST_TEST(*counter.count == 5u);
		BOOST_TEST((*counter.phase == CounterNode::Phase::Counting));
		// Power on already was the phase before the first edge.
		BOOST_TEST(getSimulator().getCurrentTick() == 6u);

		counter.enable = false;
		co_await OnClk(clock);
		co_await OnClk(clock);
		BOOST_TEST(*counter.count == 5u);
		BOOST_TEST((*counter.phase == CounterNode::Phase::Stopped));

		stopTest();
	});

	runTest(100);
}

BOOST_FIXTURE_TEST_CASE(SimProc_AfterClkSeesNewState, BoostUnitTestSimulationFixture)
{
	Clock clock;
	CounterNode counter;
	addNode(counter, clock);

	addSimulationProcess([&]()->SimProcess{
		counter.enable = true;
		co_await AfterClk(clock);
		BOOST_TEST(*counter.count == 1u);
		co_await AfterClk(clock);
		BOOST_TEST(*counter.count == 2u);

		// Driven after edge 2, so edge 3 no longer counts.
		counter.enable = false;
		co_await AfterClk(clock);
		BOOST_TEST(*counter.count == 2u);

		stopTest();
	});

	runTest(100);
}

BOOST_FIXTURE_TEST_CASE(SimProc_SimulationTime, BoostUnitTestSimulationFixture)
{
	ClockConfig clockConfig;
	clockConfig.absoluteFrequency = sim::ClockRational(125'000'000);
	Clock clock(clockConfig);
	CounterNode counter;
	addNode(counter, clock);

	addSimulationProcess([&]()->SimProcess{
		BOOST_TEST(nowNs() == 0.0);
		for ([[maybe_unused]] auto i : kmem::utils::Range(3))
			co_await AfterClk(clock);
		BOOST_TEST(nowNs() == 24.0);
		BOOST_TEST(getCurrentSimulationTime() == sim::ClockRational(3, 125'000'000));
		stopTest();
	});

	runTest(10);

	BOOST_CHECK_THROW(getCurrentSimulationTime(), kmem::utils::DesignError);
}

BOOST_FIXTURE_TEST_CASE(SimProc_NestedFunctionReturnValue, BoostUnitTestSimulationFixture)
{
	Clock clock;
	CounterNode counter;
	addNode(counter, clock);

	auto countTo = [&](std::uint32_t target)->SimFunction<size_t> {
		counter.enable = true;
		while (*counter.count < target)
			co_await OnClk(clock);
		counter.enable = false;
		co_return getSimulator().getCurrentTick();
	};

	addSimulationProcess([&]()->SimProcess{
		size_t tick = co_await countTo(3);
		BOOST_TEST(tick == 4u);
		BOOST_TEST(*counter.count == 3u);

		tick = co_await countTo(5);
		BOOST_TEST(tick == 6u);

		co_await OnClk(clock);
		BOOST_TEST(*counter.count == 5u);
		stopTest();
	});

	runTest(100);
}

BOOST_FIXTURE_TEST_CASE(SimProc_ForkJoin, BoostUnitTestSimulationFixture)
{
	Clock clock;
	CounterNode counter;
	addNode(counter, clock);

	addSimulationProcess([&]()->SimProcess{
		auto child = fork([&]()->SimFunction<size_t> {
			counter.enable = true;
			for ([[maybe_unused]] auto i : kmem::utils::Range(3))
				co_await OnClk(clock);
			counter.enable = false;
			co_return getSimulator().getCurrentTick();
		});

		// The child ran until its first suspension before returning here.
		BOOST_TEST(*counter.enable);
		BOOST_TEST(getSimulator().getCurrentTick() == 0u);

		size_t finishedAt = co_await join(child);
		BOOST_TEST(finishedAt == 4u);
		BOOST_TEST(getSimulator().getCurrentTick() == 4u);

		co_await OnClk(clock);
		BOOST_TEST(*counter.count == 3u);
		stopTest();
	});

	runTest(100);
}

BOOST_FIXTURE_TEST_CASE(SimProc_ParallelProcesses, BoostUnitTestSimulationFixture)
{
	Clock clock;
	CounterNode counter;
	addNode(counter, clock);

	// Toggles enable every other edge while the second process observes the count.
	addSimulationProcess([&]()->SimProcess{
		while (true) {
			counter.enable = !*counter.enable;
			co_await OnClk(clock);
		}
	});

	addSimulationProcess([&]()->SimProcess{
		for ([[maybe_unused]] auto i : kmem::utils::Range(10))
			co_await OnClk(clock);
		BOOST_TEST(*counter.count == 5u);
		stopTest();
	});

	runTest(100);
}

BOOST_FIXTURE_TEST_CASE(SimProc_PowerOnResets, BoostUnitTestSimulationFixture)
{
	Clock clock;
	CounterNode counter;
	addNode(counter, clock);

	addSimulationProcess([&]()->SimProcess{
		counter.enable = true;
		while (true)
			co_await OnClk(clock);
	});

	runTicks(5);
	BOOST_TEST(*counter.count == 5u);

	runTicks(3);
	BOOST_TEST(*counter.count == 3u);

	runFixedLengthTest(2);
	BOOST_TEST(*counter.count == 2u);
}

BOOST_FIXTURE_TEST_CASE(SimProc_ExceptionForwarding, BoostUnitTestSimulationFixture)
{
	Clock clock;
	CounterNode counter;
	addNode(counter, clock);

	addSimulationProcess([&]()->SimProcess{
		co_await OnClk(clock);
		co_await OnClk(clock);
		throw test_exception_t{};
	});

	BOOST_CHECK_THROW(runTicks(10), std::runtime_error);
}

BOOST_AUTO_TEST_CASE(SimProc_ExecuteCoroutine)
{
	sim::ReferenceSimulator simulator(false);
	Clock clock;
	CounterNode counter;
	simulator.addNode(counter, clock);
	simulator.powerOn();

	auto countTo = [&](std::uint32_t target)->SimFunction<size_t> {
		counter.enable = true;
		while (*counter.count < target)
			co_await OnClk(clock);
		counter.enable = false;
		co_return simulator.getCurrentTick();
	};

	BOOST_TEST(simulator.executeCoroutine(countTo(4)) == 5u);
	BOOST_TEST(*counter.count == 4u);

	auto forever = [&]()->SimProcess{
		while (true)
			co_await OnClk(clock);
	};
	BOOST_CHECK_THROW(simulator.executeCoroutine(forever(), 10), kmem::utils::DesignError);
}
