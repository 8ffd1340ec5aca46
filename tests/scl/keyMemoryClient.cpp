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
#include "scl/KeyMemoryFixture.h"

#include <boost/test/unit_test.hpp>
#include <boost/test/data/dataset.hpp>
#include <boost/test/data/test_case.hpp>
#include <boost/test/data/monomorphic.hpp>

using namespace boost::unit_test;
using namespace kmem;
using namespace kmem::scl;

namespace {
	std::vector<std::uint32_t> keyWords(const SlotContent &content)
	{
		return { content.key.begin(), content.key.end() };
	}
}


BOOST_FIXTURE_TEST_CASE(Client_SeparateDomains, KeyMemoryFixture)
{
	build(16);

	addSimulationProcess([&]()->SimProcess{
		const auto md5Slot = makeSlot(0xc01df337, 0x11000000);
		const auto sha1Slot = makeSlot(0xc01df337, 0x22000000);
		co_await host->writeSlot(0, md5Slot, true, false);
		co_await host->writeSlot(1, sha1Slot, false, true);

		auto result = co_await client->lookup(KeyDomain::MD5, 0xc01df337);
		BOOST_TEST(result.found());
		BOOST_TEST(result.steps == 13u);
		BOOST_TEST(result.words == keyWords(md5Slot), boost::test_tools::per_element());
		BOOST_TEST(dut->peekSlot(0).counter.value() == 1u);
		BOOST_TEST(dut->peekSlot(1).counter.value() == 0u);

		result = co_await client->lookup(KeyDomain::SHA1, 0xc01df337);
		BOOST_TEST(result.found());
		BOOST_TEST(result.words == keyWords(sha1Slot), boost::test_tools::per_element());
		BOOST_TEST(dut->peekSlot(0).counter.value() == 1u);
		BOOST_TEST(dut->peekSlot(1).counter.value() == 1u);

		// Only the counter words are written back.
		BOOST_TEST(dut->peekSlot(0).keyId == 0xc01df337u);
		BOOST_TEST((dut->peekSlot(1).key == sha1Slot.key));

		stopTest();
	});

	runTest(2000);
}

BOOST_FIXTURE_TEST_CASE(Client_HighestSlotWins, KeyMemoryFixture)
{
	build(16);

	addSimulationProcess([&]()->SimProcess{
		const auto lower = makeSlot(0xee000002, 0x44000000);
		const auto upper = makeSlot(0xee000002, 0x99000000);
		co_await host->writeSlot(4, lower, false, true);
		co_await host->writeSlot(9, upper, false, true);

		auto result = co_await client->lookup(KeyDomain::SHA1, 0xee000002);
		BOOST_TEST(result.words == keyWords(upper), boost::test_tools::per_element());
		BOOST_TEST(dut->peekSlot(9).counter.value() == 1u);
		BOOST_TEST(dut->peekSlot(4).counter.value() == 0u);

		// With the upper slot invalidated, the lower one is next.
		co_await host->setValid(9, false, false);
		result = co_await client->lookup(KeyDomain::SHA1, 0xee000002);
		BOOST_TEST(result.words == keyWords(lower), boost::test_tools::per_element());
		BOOST_TEST(dut->peekSlot(4).counter.value() == 1u);

		stopTest();
	});

	runTest(2000);
}

BOOST_FIXTURE_TEST_CASE(Client_NotFound, KeyMemoryFixture)
{
	build(16);

	addSimulationProcess([&]()->SimProcess{
		co_await host->writeSlot(3, makeSlot(0x00000003, 0x33000000, { .msb = 0, .lsb = 41 }), true, true);

		auto result = co_await client->lookup(KeyDomain::MD5, 0x12345678);
		BOOST_TEST(!result.found());
		BOOST_TEST(result.words.empty());
		BOOST_TEST(result.steps == 5u);
		BOOST_TEST(dut->ready());

		for (auto slot : kmem::utils::Range(dut->numSlots()))
			BOOST_TEST(dut->peekSlot(slot).counter.value() == (slot == 3 ? 41u : 0u));

		// The port accepts the next request right away.
		result = co_await client->lookup(KeyDomain::SHA1, 0x00000003);
		BOOST_TEST(result.found());
		BOOST_TEST(dut->peekSlot(3).counter.value() == 42u);

		stopTest();
	});

	runTest(2000);
}

BOOST_FIXTURE_TEST_CASE(Client_ValidityPerDomain, KeyMemoryFixture)
{
	build(16);

	addSimulationProcess([&]()->SimProcess{
		co_await host->writeSlot(2, makeSlot(0x0badcafe, 0x02000000), true, false);

		auto result = co_await client->lookup(KeyDomain::SHA1, 0x0badcafe);
		BOOST_TEST(!result.found());
		BOOST_TEST(result.steps == 5u);

		result = co_await client->lookup(KeyDomain::MD5, 0x0badcafe);
		BOOST_TEST(result.found());

		co_await host->setValid(2, false, false);
		result = co_await client->lookup(KeyDomain::MD5, 0x0badcafe);
		BOOST_TEST(!result.found());

		// A scrubbed slot holds id zero but is never valid.
		result = co_await client->lookup(KeyDomain::MD5, 0);
		BOOST_TEST(!result.found());

		BOOST_TEST(dut->peekSlot(2).counter.value() == 1u);

		stopTest();
	});

	runTest(2000);
}

BOOST_FIXTURE_TEST_CASE(Client_CounterCarry, KeyMemoryFixture)
{
	build(16);

	addSimulationProcess([&]()->SimProcess{
		co_await host->writeSlot(9, makeSlot(0xee000002, 0x90000000, { .msb = 7, .lsb = 0xffffffff }), false, true);

		co_await client->lookup(KeyDomain::SHA1, 0xee000002);
		BOOST_TEST((dut->peekSlot(9).counter == SlotCounter{ .msb = 8, .lsb = 0 }));

		co_await client->lookup(KeyDomain::SHA1, 0xee000002);
		BOOST_TEST((dut->peekSlot(9).counter == SlotCounter{ .msb = 8, .lsb = 1 }));

		// The host sees the written back counter as well.
		auto loaded = co_await host->loadSlot(9);
		BOOST_TEST(loaded.counter.msb == 8u);
		BOOST_TEST(loaded.counter.lsb == 1u);

		stopTest();
	});

	runTest(2000);
}

BOOST_FIXTURE_TEST_CASE(Client_CounterWrapsAround, KeyMemoryFixture)
{
	build(16);

	addSimulationProcess([&]()->SimProcess{
		co_await host->writeSlot(0, makeSlot(0x00000001, 0), true, false);
		co_await host->selectSlot(0);
		co_await host->write(ADDR_COUNTER_MSB, 0xffffffff);
		co_await host->write(ADDR_COUNTER_LSB, 0xffffffff);

		co_await client->lookup(KeyDomain::MD5, 0x00000001);
		BOOST_TEST((dut->peekSlot(0).counter == SlotCounter{ .msb = 0, .lsb = 0 }));

		stopTest();
	});

	runTest(2000);
}

BOOST_FIXTURE_TEST_CASE(Client_StartupGate, KeyMemoryFixture)
{
	build(16);

	addSimulationProcess([&]()->SimProcess{
		auto &request = dut->clientRequest();
		request.getKeyMd5 = true;
		request.keyId = 0;

		while (dut->busy()) {
			BOOST_TEST(!dut->ready());
			BOOST_TEST((dut->clientEngine().state() == ClientEngine::State::StartupWait));
			co_await OnClk(clock);
		}
		request.getKeyMd5 = false;

		co_await OnClk(clock);
		BOOST_TEST(dut->ready());
		co_await OnClk(clock);
		BOOST_TEST(dut->ready());
		BOOST_TEST((dut->clientEngine().state() == ClientEngine::State::Idle));

		stopTest();
	});

	runTest(1000);
}

BOOST_FIXTURE_TEST_CASE(Client_BothSelectorsPreferMD5, KeyMemoryFixture)
{
	build(16);

	addSimulationProcess([&]()->SimProcess{
		const auto md5Slot = makeSlot(0x0000f00d, 0x0d000000);
		co_await host->writeSlot(0, md5Slot, true, false);
		co_await host->writeSlot(1, makeSlot(0x0000f00d, 0x1d000000), false, true);
		co_await client->waitReady();

		auto &request = dut->clientRequest();
		request.getKeyMd5 = true;
		request.getKeySha1 = true;
		request.keyId = 0x0000f00d;
		co_await OnClk(clock);
		request.getKeyMd5 = false;
		request.getKeySha1 = false;

		std::vector<std::uint32_t> words;
		while (!dut->ready()) {
			co_await OnClk(clock);
			if (dut->keyValid())
				words.push_back(dut->keyData());
		}

		BOOST_TEST(words == keyWords(md5Slot), boost::test_tools::per_element());
		BOOST_TEST(dut->peekSlot(0).counter.value() == 1u);
		BOOST_TEST(dut->peekSlot(1).counter.value() == 0u);

		stopTest();
	});

	runTest(2000);
}

BOOST_FIXTURE_TEST_CASE(Client_RequestsIgnoredWhileSearching, KeyMemoryFixture)
{
	build(16);

	addSimulationProcess([&]()->SimProcess{
		const auto first = makeSlot(0x00000a0a, 0x0a000000);
		co_await host->writeSlot(5, first, true, false);
		co_await host->writeSlot(6, makeSlot(0x00000b0b, 0x0b000000), true, false);

		auto lookup = fork(client->lookup(KeyDomain::MD5, 0x00000a0a));

		// Hold a second request while the first one is in flight.
		co_await OnClk(clock);
		auto &request = dut->clientRequest();
		request.getKeyMd5 = true;
		request.keyId = 0x00000b0b;
		co_await OnClk(clock);
		co_await OnClk(clock);
		request.getKeyMd5 = false;

		auto result = co_await join(lookup);
		BOOST_TEST(result.words == keyWords(first), boost::test_tools::per_element());
		BOOST_TEST(dut->peekSlot(5).counter.value() == 1u);
		BOOST_TEST(dut->peekSlot(6).counter.value() == 0u);

		co_await OnClk(clock);
		BOOST_TEST((dut->clientEngine().state() == ClientEngine::State::Idle));

		stopTest();
	});

	runTest(2000);
}

BOOST_FIXTURE_TEST_CASE(Client_HostWritesDuringLookup, KeyMemoryFixture)
{
	build(16);

	addSimulationProcess([&]()->SimProcess{
		const auto served = makeSlot(0x00000c0c, 0x0c000000);
		const auto updated = makeSlot(0x00000d0d, 0x0d000000);
		co_await host->writeSlot(0, served, false, true);

		auto lookup = fork(client->lookup(KeyDomain::SHA1, 0x00000c0c));
		co_await host->writeSlot(7, updated, false, true);

		auto result = co_await join(lookup);
		BOOST_TEST(result.words == keyWords(served), boost::test_tools::per_element());
		BOOST_TEST(dut->peekSlot(0).counter.value() == 1u);
		BOOST_TEST((dut->peekSlot(7).key == updated.key));

		result = co_await client->lookup(KeyDomain::SHA1, 0x00000d0d);
		BOOST_TEST(result.words == keyWords(updated), boost::test_tools::per_element());

		stopTest();
	});

	runTest(2000);
}

BOOST_DATA_TEST_CASE_F(KeyMemoryFixture, Client_SlotCounts, data::make({ 2, 4, 16, 256 }), numSlots)
{
	build(numSlots);

	addSimulationProcess([&]()->SimProcess{
		co_await client->waitReady();
		BOOST_TEST(getSimulator().getCurrentTick() == scrubTicks() + 2);

		const size_t lastSlot = numSlots - 1;
		const auto first = makeSlot(0x5a5a5a5a, 0x01000000);
		const auto last = makeSlot(0x5a5a5a5a, 0x02000000);
		co_await host->writeSlot(0, first, true, false);
		co_await host->writeSlot(lastSlot, last, true, false);

		auto result = co_await client->lookup(KeyDomain::MD5, 0x5a5a5a5a);
		BOOST_TEST(result.steps == 13u);
		BOOST_TEST(result.words == keyWords(last), boost::test_tools::per_element());
		BOOST_TEST(dut->peekSlot(lastSlot).counter.value() == 1u);
		BOOST_TEST(dut->peekSlot(0).counter.value() == 0u);

		result = co_await client->lookup(KeyDomain::SHA1, 0x5a5a5a5a);
		BOOST_TEST(result.steps == 5u);

		stopTest();
	});

	runTest(numSlots * WORDS_PER_SLOT + 1000);
}
