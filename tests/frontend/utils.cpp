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

#include <boost/test/unit_test.hpp>
#include <boost/test/data/dataset.hpp>
#include <boost/test/data/test_case.hpp>
#include <boost/test/data/monomorphic.hpp>

#include <kmem/utils/ConfigTree.h>
#include <kmem/debug/ConsoleInterface.h>

#include <cstdlib>
#include <sstream>

using namespace boost::unit_test;
using namespace kmem;
using namespace kmem::utils;


BOOST_AUTO_TEST_CASE(GlobbingMatchPath)
{
	{
		auto m = globbingMatchPath("keymem", "keymem");
		BOOST_TEST((m && *m == "keymem"));
	}
	{
		auto m = globbingMatchPath("key", "keymem");
		BOOST_TEST((m && *m == "key"));
	}
	{
		auto m = globbingMatchPath("clock", "keymem");
		BOOST_TEST((!m));
	}
	{
		auto m = globbingMatchPath("*", "simulation/vcd");
		BOOST_TEST((m && *m == "simulation"));
	}
	{
		auto m = globbingMatchPath("simulation/*", "simulation/vcd/file");
		BOOST_TEST((m && *m == "simulation/vcd"));
	}
	{
		auto m = globbingMatchPath("sim*/v*d", "simulation/vcd");
		BOOST_TEST((m && *m == "simulation/vcd"));
	}
}

BOOST_AUTO_TEST_CASE(EnvVarReplacement)
{
	BOOST_TEST(replaceEnvVars("keymem") == "keymem");

	BOOST_CHECK_THROW(replaceEnvVars("$(KMEM_TEST_UNDEFINED_VAR)"), std::runtime_error);
	BOOST_CHECK_THROW(replaceEnvVars("out/$(KMEM_TEST_UNDEFINED_VAR)"), std::runtime_error);

	setenv("KMEM_TEST_OUT_DIR", "build/out", 1);
	BOOST_TEST(replaceEnvVars("$(KMEM_TEST_OUT_DIR)/keymem.vcd") == "build/out/keymem.vcd");
}

BOOST_AUTO_TEST_CASE(ConfigTreeEnvVarInNumber)
{
	setenv("KMEM_TEST_SLOTS", "64", 1);

	ConfigTree config;
	config.loadFromString("keymem:\n  slots: $(KMEM_TEST_SLOTS)\n");

	BOOST_TEST(config["keymem"]["slots"].as<size_t>() == 64u);
}

BOOST_AUTO_TEST_CASE(ConfigTreePathSearch)
{
	YAML::Node root;

	root["simulation"]["vcd"]["file"] = "a.vcd";
	root["simulation/vcd"]["depth"] = 3;
	root["simulation/*"]["enabled"] = true;
	root["simulation"]["report"]["dir"] = "report";

	ConfigTree config{ root };

	auto vcd = config["simulation/vcd"];
	BOOST_TEST(vcd["file"].as<std::string>("") == "a.vcd");
	BOOST_TEST(vcd["depth"].as(0) == 3);
	BOOST_TEST(vcd["enabled"].as(false));
	BOOST_TEST(config["simulation/report"]["dir"].as<std::string>("") == "report");
	BOOST_TEST(!config["simulation/waveform"]["file"]);
}

BOOST_AUTO_TEST_CASE(ConfigTreeLayeredDocuments)
{
	ConfigTree config;
	config.loadFromString("clock:\n  period: 10 ns\nkeymem:\n  slots: 16\n");
	config.loadFromString("keymem:\n  slots: 32\n");

	BOOST_TEST(config["keymem"]["slots"].as<size_t>() == 32u);
	BOOST_TEST(config["clock"]["period"].as<std::string>() == "10 ns");

	BOOST_CHECK_THROW(config.loadFromString("- 1\n- 2\n"), std::runtime_error);
}

BOOST_AUTO_TEST_CASE(ConfigTreeLists)
{
	ConfigTree config;
	config.loadFromString("words: [0x11111111, 0x22222222, 0x33333333]\n");

	auto words = config["words"];
	BOOST_TEST(words.isSequence());
	BOOST_TEST(words.size() == 3);
	BOOST_TEST(words[1].as<std::uint32_t>() == 0x22222222u);

	std::uint32_t expected = 0x11111111;
	for (auto word : words) {
		BOOST_TEST(word.as<std::uint32_t>() == expected);
		expected += 0x11111111;
	}
}

BOOST_AUTO_TEST_CASE(ConfigTreeEnumLoad)
{
	YAML::Node root;
	root["a"] = "RISING";
	root["b"] = "falling";
	root["c"] = "sideways";
	root["e"] = "r\xc3\xa9sing";

	ConfigTree config{ root };

	BOOST_TEST((config["a"].as(ClockConfig::TriggerEvent::FALLING) == ClockConfig::TriggerEvent::RISING));
	BOOST_TEST((config["b"].as(ClockConfig::TriggerEvent::RISING) == ClockConfig::TriggerEvent::FALLING));
	BOOST_CHECK_THROW(config["c"].as(ClockConfig::TriggerEvent::RISING), std::runtime_error);
	BOOST_CHECK_THROW(config["e"].as(ClockConfig::TriggerEvent::RISING), std::runtime_error);
	BOOST_TEST((config["d"].as(ClockConfig::TriggerEvent::FALLING) == ClockConfig::TriggerEvent::FALLING));
}

BOOST_AUTO_TEST_CASE(ClockFromString)
{
	BOOST_TEST(sim::clockFromString("10 ns") == sim::ClockRational(100'000'000));
	BOOST_TEST(sim::clockFromString("100 MHz") == sim::ClockRational(100'000'000));
	BOOST_TEST(sim::clockFromString("4 ps") == sim::ClockRational(250'000'000'000ull));
	BOOST_TEST(sim::clockFromString("1 khz") == sim::ClockRational(1'000));

	BOOST_CHECK_THROW(sim::clockFromString("0 ns"), std::runtime_error);
	BOOST_CHECK_THROW(sim::clockFromString("10 parsec"), std::runtime_error);
}

BOOST_AUTO_TEST_CASE(ClockConfigLoad)
{
	ConfigTree config;
	config.loadFromString("clock:\n  name: keyclk\n  period: 8 ns\n  clock_edge: falling\nshort_clock: 50 MHz\n");

	ClockConfig clockConfig;
	clockConfig.loadConfig(config["clock"]);
	Clock clock(clockConfig);

	BOOST_TEST(clock.getName() == "keyclk");
	BOOST_TEST(clock.absoluteFrequency() == sim::ClockRational(125'000'000));
	BOOST_TEST((clock.getTriggerEvent() == ClockConfig::TriggerEvent::FALLING));
	BOOST_TEST(sim::toPicoseconds(clock.period()) == 8'000u);

	ClockConfig shortConfig;
	shortConfig.loadConfig(config["short_clock"]);
	Clock shortClock(shortConfig);
	BOOST_TEST(shortClock.getName() == "clk");
	BOOST_TEST(sim::toNanoseconds(shortClock.period()) == 20.0);
}

BOOST_AUTO_TEST_CASE(BitManipulation)
{
	BOOST_TEST(isPow2(16u));
	BOOST_TEST(!isPow2(24u));
	BOOST_TEST(Log2(256u) == 8u);
	BOOST_TEST(Log2C(17u) == 5u);
	BOOST_TEST(Log2C(16u) == 4u);

	BOOST_TEST(bitfieldExtract(0xc01df337u, 16, 8) == 0x1du);
	BOOST_TEST(bitfieldInsert(0xc01df337u, 0, 8, 0xffu) == 0xc01df3ffu);
}

BOOST_AUTO_TEST_CASE(DesignCheckRecordsStackTrace)
{
	try {
		KMEM_DESIGNCHECK_HINT(1 + 1 == 3, "arithmetic is broken");
		BOOST_FAIL("design check did not throw");
	} catch (const DesignError &e) {
		BOOST_TEST(std::string(e.what()).find("arithmetic is broken") != std::string::npos);

		std::stringstream stream;
		stream << e;
		BOOST_TEST(stream.str().find("Stack trace") != std::string::npos);
		BOOST_TEST(e.getStackTrace().depth() > 0u);
		BOOST_TEST(e.getStackTrace().describeRelevant().size() <= e.getStackTrace().depth());
	}

	BOOST_CHECK_THROW(KMEM_ASSERT(false), InternalError);
}

BOOST_AUTO_TEST_CASE(LogMessageText)
{
	dbg::LogMessage msg;
	msg << dbg::LogMessage::LOG_WARNING << dbg::LogMessage::LOG_HOST_PORT << dbg::LogMessage::Anchor{ 3 }
		<< "write of " << dbg::LogMessage::Word{ 0xc01df337 } << " to " << dbg::LogMessage::Slot{ 3 } << " ignored";

	BOOST_TEST(msg.text() == "write of 0xc01df337 to slot 3 ignored");
	BOOST_TEST(msg.severity() == dbg::LogMessage::LOG_WARNING);
	BOOST_TEST(msg.source() == dbg::LogMessage::LOG_HOST_PORT);
	BOOST_TEST(msg.anchor() == 3u);
}

BOOST_AUTO_TEST_CASE(ConsoleLogging)
{
	std::stringstream stream;
	dbg::ConsoleInterface::create(stream);

	dbg::log(dbg::LogMessage() << dbg::LogMessage::LOG_INFO << dbg::LogMessage::LOG_CONFIG << "key memory with " << size_t(16) << " slots");
	dbg::changeState(dbg::State::SIMULATION);
	dbg::newTick(42);
	dbg::log(dbg::LogMessage() << dbg::LogMessage::LOG_ERROR << dbg::LogMessage::LOG_CLIENT_PORT << dbg::LogMessage::Anchor{ 7 } << "lookup failed");

	dbg::logNothing();

	std::string line;
	std::getline(stream, line);
	BOOST_TEST(line == "[INFO   ] [CONFIG     ] key memory with 16 slots");
	std::getline(stream, line);
	BOOST_TEST(line == "[SIMULATION]");
	std::getline(stream, line);
	BOOST_TEST(line == "[tick     42] [ERROR  ] [CLIENT_PORT] [slot   7] lookup failed");
}
