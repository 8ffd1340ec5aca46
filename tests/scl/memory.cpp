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
#include "scl/pch.h"

#include <kmem/scl/memory/DualPortMemory.h>

#include <boost/test/unit_test.hpp>
#include <boost/test/data/dataset.hpp>
#include <boost/test/data/test_case.hpp>
#include <boost/test/data/monomorphic.hpp>

using namespace boost::unit_test;
using namespace kmem;
using scl::DualPortMemory;

namespace {
	/// Issues the read and write requests driven on its wires to both ports of a memory.
	class MemoryDriver : public sim::SimulationNode
	{
		public:
			struct PortInputs {
				PortInputs(SimulationNode &owner, const std::string &prefix) :
					read(owner, prefix + "_read", false),
					write(owner, prefix + "_write", false),
					address(owner, prefix + "_address", 0u),
					data(owner, prefix + "_data", 0u) { }

				sim::Wire<bool> read;
				sim::Wire<bool> write;
				sim::Wire<std::uint32_t> address;
				sim::Wire<std::uint32_t> data;
			};

			MemoryDriver(size_t numWords) :
				SimulationNode("driver"),
				memory("memory", this, numWords, 0xdeadbeef),
				a(*this, "a"),
				b(*this, "b") { }

			DualPortMemory memory;
			PortInputs a;
			PortInputs b;

			virtual void simulateEvaluate(sim::SimulatorCallbacks &simCallbacks) override {
				drive(DualPortMemory::Port::A, a);
				drive(DualPortMemory::Port::B, b);
			}
		protected:
			void drive(DualPortMemory::Port port, const PortInputs &inputs) {
				if (*inputs.read)
					memory.requestRead(port, *inputs.address);
				if (*inputs.write)
					memory.requestWrite(port, *inputs.address, *inputs.data);
			}
	};

	void idle(MemoryDriver::PortInputs &port)
	{
		port.read = false;
		port.write = false;
	}

	void write(MemoryDriver::PortInputs &port, std::uint32_t address, std::uint32_t data)
	{
		port.read = false;
		port.write = true;
		port.address = address;
		port.data = data;
	}

	void read(MemoryDriver::PortInputs &port, std::uint32_t address)
	{
		port.read = true;
		port.write = false;
		port.address = address;
	}
}

/// Records collision warnings instead of failing the test on them.
class MemoryCollisionFixture : public sim::BoostUnitTestSimulationFixture
{
	public:
		virtual void onWarning(const sim::SimulationNode *src, std::string msg) override {
			m_collisions.push_back(msg);
		}
	protected:
		std::vector<std::string> m_collisions;
};


BOOST_FIXTURE_TEST_CASE(Memory_PowerOnPattern, sim::BoostUnitTestSimulationFixture)
{
	Clock clock;
	MemoryDriver driver(16);
	addNode(driver, clock);

	runTicks(3);

	for (auto i : kmem::utils::Range(driver.memory.size()))
		BOOST_TEST(driver.memory.peek(i) == 0xdeadbeefu);
	BOOST_TEST(driver.memory.q(DualPortMemory::Port::A) == 0xdeadbeefu);
	BOOST_TEST(driver.memory.q(DualPortMemory::Port::B) == 0xdeadbeefu);

	BOOST_CHECK_THROW(driver.memory.peek(16), kmem::utils::DesignError);
}

BOOST_FIXTURE_TEST_CASE(Memory_ReadLatency, sim::BoostUnitTestSimulationFixture)
{
	Clock clock;
	MemoryDriver driver(16);
	addNode(driver, clock);

	addSimulationProcess([&]()->SimProcess{
		write(driver.a, 3, 0x01234567);
		co_await OnClk(clock);
		idle(driver.a);
		BOOST_TEST(driver.memory.peek(3) == 0x01234567u);

		read(driver.b, 3);
		co_await OnClk(clock);
		idle(driver.b);
		BOOST_TEST(driver.memory.q(DualPortMemory::Port::B) == 0x01234567u);
		BOOST_TEST(driver.memory.q(DualPortMemory::Port::A) == 0xdeadbeefu);

		// The output register holds the word until the next read.
		co_await OnClk(clock);
		BOOST_TEST(driver.memory.q(DualPortMemory::Port::B) == 0x01234567u);

		stopTest();
	});

	runTest(20);
}

BOOST_FIXTURE_TEST_CASE(Memory_ReadFirst, sim::BoostUnitTestSimulationFixture)
{
	Clock clock;
	MemoryDriver driver(16);
	addNode(driver, clock);

	addSimulationProcess([&]()->SimProcess{
		write(driver.a, 5, 1);
		co_await OnClk(clock);

		write(driver.a, 5, 2);
		read(driver.b, 5);
		co_await OnClk(clock);
		idle(driver.a);
		idle(driver.b);

		BOOST_TEST(driver.memory.q(DualPortMemory::Port::B) == 1u);
		BOOST_TEST(driver.memory.peek(5) == 2u);

		// Same for a port reading the word it writes.
		write(driver.b, 5, 3);
		co_await OnClk(clock);
		read(driver.b, 5);
		co_await OnClk(clock);
		idle(driver.b);
		BOOST_TEST(driver.memory.q(DualPortMemory::Port::B) == 3u);

		stopTest();
	});

	runTest(20);
}

BOOST_FIXTURE_TEST_CASE(Memory_WriteCollisionPortBWins, MemoryCollisionFixture)
{
	Clock clock;
	MemoryDriver driver(16);
	addNode(driver, clock);

	addSimulationProcess([&]()->SimProcess{
		write(driver.a, 7, 0xaaaaaaaa);
		write(driver.b, 8, 0xbbbbbbbb);
		co_await OnClk(clock);
		BOOST_TEST(m_collisions.empty());

		write(driver.a, 7, 0x11111111);
		write(driver.b, 7, 0x22222222);
		co_await OnClk(clock);
		idle(driver.a);
		idle(driver.b);

		BOOST_TEST(driver.memory.peek(7) == 0x22222222u);
		BOOST_TEST(driver.memory.peek(8) == 0xbbbbbbbbu);
		BOOST_TEST(m_collisions.size() == 1u);

		stopTest();
	});

	runTest(20);
}
