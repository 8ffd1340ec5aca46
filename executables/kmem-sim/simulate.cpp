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
#include <kmem/frontend.h>
#include <kmem/scl/kvs/KeyMemory.h>
#include <kmem/scl/sim/KeyMemoryHostModel.h>
#include <kmem/scl/sim/KeyMemoryClientModel.h>
#include <kmem/simulation/waveformFormats/VCDSink.h>
#include <kmem/utils/BitManipulation.h>

#include <boost/format.hpp>

#include <iostream>
#include <optional>
#include <set>
#include <vector>

using namespace kmem;

namespace {

	struct SlotSetup
	{
		size_t slot = 0;
		scl::SlotContent content;
		bool md5 = false;
		bool sha1 = false;
	};

	struct LookupSetup
	{
		scl::KeyDomain domain = scl::KeyDomain::MD5;
		std::uint32_t keyId = 0;
	};

	std::vector<SlotSetup> loadSlots(const utils::ConfigTree &config, size_t numSlots)
	{
		std::vector<SlotSetup> slots;
		for (auto entry : config) {
			SlotSetup setup;
			setup.slot = entry["slot"].as<size_t>();
			KMEM_DESIGNCHECK_HINT(setup.slot < numSlots, "Slot index in scenario exceeds the number of key slots.");

			setup.content.keyId = entry["id"].as<std::uint32_t>();

			const std::uint64_t counter = entry["counter"].as<std::uint64_t>(0);
			setup.content.counter.msb = std::uint32_t(utils::bitfieldExtract(counter, 32, 32));
			setup.content.counter.lsb = std::uint32_t(utils::bitfieldExtract(counter, 0, 32));

			auto key = entry["key"];
			KMEM_DESIGNCHECK_HINT(!key || key.size() == scl::KEY_WORDS, "A key must consist of exactly five 32 bit words.");
			for (size_t i = 0; i < key.size(); i++)
				setup.content.key[i] = key[i].as<std::uint32_t>();

			setup.md5 = entry["md5"].as(false);
			setup.sha1 = entry["sha1"].as(false);
			slots.push_back(setup);
		}
		return slots;
	}

	std::vector<LookupSetup> loadLookups(const utils::ConfigTree &config)
	{
		std::vector<LookupSetup> lookups;
		for (auto entry : config) {
			LookupSetup setup;
			setup.domain = entry["domain"].as<scl::KeyDomain>();
			setup.keyId = entry["id"].as<std::uint32_t>();
			lookups.push_back(setup);
		}
		return lookups;
	}

	/// Remembers whether the simulation reported any asserts.
	class AssertCounter : public sim::SimulatorCallbacks
	{
		public:
			virtual void onAssert(const sim::SimulationNode *src, std::string msg) override { m_numAsserts++; }
			size_t numAsserts() const { return m_numAsserts; }
		protected:
			size_t m_numAsserts = 0;
	};

	void printResult(const LookupSetup &lookup, const scl::LookupResult &result)
	{
		std::cout << boost::format("lookup %-4s 0x%08x: ") % magic_enum::enum_name(lookup.domain) % lookup.keyId;
		if (!result.found()) {
			std::cout << "not found (" << result.steps << " clock cycles)" << std::endl;
			return;
		}
		std::cout << "found (" << result.steps << " clock cycles) key";
		for (auto word : result.words)
			std::cout << boost::format(" %08x") % word;
		std::cout << std::endl;
	}

	int simulate(const utils::ConfigTree &config)
	{
		auto simulationConfig = config["simulation"];

		if (auto report = simulationConfig["report"])
			dbg::logHtml(report.as<std::string>());
		else if (simulationConfig["log"].as<std::string>("") == "console")
			dbg::logConsole();

		ClockConfig clockConfig;
		clockConfig.loadConfig(config["clock"]);
		Clock clock(clockConfig);

		scl::KeyMemoryConfig keyMemoryConfig;
		keyMemoryConfig.loadConfig(config["keymem"]);

		const auto slots = loadSlots(config["slots"], keyMemoryConfig.numSlots);
		const auto lookups = loadLookups(config["lookups"]);
		const size_t maxTicks = simulationConfig["max_ticks"].as<size_t>(1'000'000);

		scl::KeyMemory keyMemory(keyMemoryConfig);
		scl::KeyMemoryHostModel host(keyMemory, clock);
		scl::KeyMemoryClientModel client(keyMemory, clock);

		sim::ReferenceSimulator simulator;
		AssertCounter asserts;
		simulator.addCallbacks(&asserts);
		simulator.addNode(keyMemory, clock);
		simulator.addSimulationProcess([&]() { return scl::validateClientPort(keyMemory, clock); });

		std::optional<sim::VCDSink> vcd;
		if (auto vcdFile = simulationConfig["vcd"])
			vcd.emplace(simulator, vcdFile.as<std::string>().c_str());

		simulator.powerOn();

		std::cout << "clock " << clockConfig << ", key memory " << keyMemoryConfig << std::endl;

		auto scenario = [&]() -> SimProcess {
			co_await client.waitReady();
			std::cout << "startup scrub finished after " << simulator.getCurrentTick() << " clock cycles" << std::endl;

			for (const auto &setup : slots)
				co_await host.writeSlot(setup.slot, setup.content, setup.md5, setup.sha1);

			for (const auto &lookup : lookups)
				printResult(lookup, co_await client.lookup(lookup.domain, lookup.keyId));
		};
		simulator.executeCoroutine(scenario(), maxTicks);

		std::set<size_t> writtenSlots;
		for (const auto &setup : slots)
			writtenSlots.insert(setup.slot);

		for (auto slot : writtenSlots) {
			auto content = keyMemory.peekSlot(slot);
			std::cout << boost::format("slot %3d: id 0x%08x counter %d md5 %d sha1 %d")
				% slot % content.keyId % content.counter.value()
				% keyMemory.isValid(slot, scl::KeyDomain::MD5) % keyMemory.isValid(slot, scl::KeyDomain::SHA1) << std::endl;
		}

		if (vcd)
			std::cout << "waveform written to " << vcd->getFilename() << std::endl;
		std::cout << dbg::howToReachLog() << std::endl;

		return asserts.numAsserts() == 0 ? 0 : 1;
	}
}

int main(int argc, char *argv[])
{
	if (argc < 2) {
		std::cerr << "usage: " << argv[0] << " <scenario.yaml> [more.yaml...]" << std::endl;
		return 1;
	}

	try {
		utils::ConfigTree config;
		for (int i = 1; i < argc; i++)
			config.loadFromFile(argv[i]);

		return simulate(config);
	} catch (const utils::DesignError &e) {
		dbg::log(dbg::LogMessage() << dbg::LogMessage::LOG_ERROR << dbg::LogMessage::LOG_CONFIG << e.what() << e.getStackTrace());
		std::cerr << e << std::endl;
	} catch (const utils::InternalError &e) {
		dbg::log(dbg::LogMessage() << dbg::LogMessage::LOG_ERROR << dbg::LogMessage::LOG_SIMULATION << e.what() << e.getStackTrace());
		std::cerr << e << std::endl;
	} catch (const std::exception &e) {
		std::cerr << "error: " << e.what() << std::endl;
	}
	return 1;
}
