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

#include <kmem/utils/ConfigTree.h>

#include <boost/test/unit_test.hpp>
#include <boost/test/data/dataset.hpp>
#include <boost/test/data/test_case.hpp>
#include <boost/test/data/monomorphic.hpp>

#include <sstream>

using namespace boost::unit_test;
using namespace kmem;
using namespace kmem::scl;


BOOST_AUTO_TEST_CASE(SlotCounterIncrement)
{
	BOOST_TEST((incrementCounter({ .msb = 0, .lsb = 0 }) == SlotCounter{ .msb = 0, .lsb = 1 }));
	BOOST_TEST((incrementCounter({ .msb = 7, .lsb = 0xffffffff }) == SlotCounter{ .msb = 8, .lsb = 0 }));
	BOOST_TEST((incrementCounter({ .msb = 0xffffffff, .lsb = 0xffffffff }) == SlotCounter{ .msb = 0, .lsb = 0 }));

	SlotCounter counter{ .msb = 1, .lsb = 2 };
	BOOST_TEST(counter.value() == 0x100000002ull);
	BOOST_TEST(incrementCounter(counter).value() == counter.value() + 1);
}

BOOST_AUTO_TEST_CASE(RegisterMapSlotWords)
{
	size_t word = ~0ull;
	BOOST_TEST(slotWordOfAddress(ADDR_KEY_ID, word));
	BOOST_TEST(word == size_t(WORD_KEY_ID));
	BOOST_TEST(slotWordOfAddress(ADDR_COUNTER_LSB, word));
	BOOST_TEST(word == size_t(WORD_COUNTER_LSB));
	BOOST_TEST(slotWordOfAddress(ADDR_KEY0, word));
	BOOST_TEST(word == size_t(WORD_KEY0));
	BOOST_TEST(slotWordOfAddress(ADDR_KEY4, word));
	BOOST_TEST(word == WORDS_PER_SLOT - 1);

	BOOST_TEST(!slotWordOfAddress(0x23, word));
	BOOST_TEST(!slotWordOfAddress(0x35, word));
	BOOST_TEST(!slotWordOfAddress(ADDR_VALID, word));
	BOOST_TEST(!slotWordOfAddress(ADDR_CTRL, word));
}

BOOST_AUTO_TEST_CASE(KeyMemoryConfigLoad)
{
	kmem::utils::ConfigTree config;
	config.loadFromString("keymem:\n  slots: 64\n  uninitialized: 0x5a5a5a5a\n");

	KeyMemoryConfig keyMemoryConfig;
	keyMemoryConfig.loadConfig(config["keymem"]);
	BOOST_TEST(keyMemoryConfig.numSlots == 64u);
	BOOST_TEST(keyMemoryConfig.uninitializedPattern == 0x5a5a5a5au);
	BOOST_TEST(keyMemoryConfig.slotSelectWidth() == 6u);

	std::stringstream stream;
	stream << keyMemoryConfig;
	BOOST_TEST(stream.str() == "slots: 64 uninitialized: 0x5a5a5a5a");

	// Missing sections and keys keep the defaults.
	KeyMemoryConfig defaults;
	defaults.loadConfig(config["missing"]);
	BOOST_TEST(defaults.numSlots == 16u);
	BOOST_TEST(defaults.uninitializedPattern == 0xdeadbeefu);
}

BOOST_AUTO_TEST_CASE(KeyMemoryConfigRejectsSlotCounts)
{
	for (auto numSlots : { 0, 1, 3, 12, 100, 512 }) {
		kmem::utils::ConfigTree config;
		config.loadFromString("keymem:\n  slots: " + std::to_string(numSlots) + "\n");

		KeyMemoryConfig keyMemoryConfig;
		BOOST_CHECK_THROW(keyMemoryConfig.loadConfig(config["keymem"]), kmem::utils::DesignError);
	}

	KeyMemoryConfig config;
	config.numSlots = 24;
	BOOST_CHECK_THROW(KeyMemory keyMemory(config), kmem::utils::DesignError);

	config.numSlots = 2;
	BOOST_CHECK_NO_THROW(config.validate());
	BOOST_TEST(config.slotSelectWidth() == 1u);
}

BOOST_AUTO_TEST_CASE(KeyMemoryHierarchy)
{
	KeyMemoryConfig config;
	config.numSlots = 8;
	KeyMemory keyMemory(config, "dut");

	BOOST_TEST(keyMemory.store().size() == 64u);
	BOOST_TEST(keyMemory.shadowIndex().size() == 8u);
	BOOST_TEST(keyMemory.hostLoader().getPath() == "dut/host_loader");
	BOOST_TEST(keyMemory.clientEngine().getPath() == "dut/client_engine");

	std::vector<std::string> children;
	for (auto *child : keyMemory.getChildren())
		children.push_back(child->getName());
	std::vector<std::string> expected = { "store", "shadow_index", "validity", "host_loader", "client_engine" };
	BOOST_TEST(children == expected, boost::test_tools::per_element());

	BOOST_CHECK_THROW(keyMemory.peekSlot(8), kmem::utils::DesignError);
}
