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

#include <kmem/frontend.h>
#include <kmem/simulation/UnitTestSimulationFixture.h>
#include <kmem/scl/kvs/KeyMemory.h>
#include <kmem/scl/sim/KeyMemoryHostModel.h>
#include <kmem/scl/sim/KeyMemoryClientModel.h>

#include <cstdint>
#include <memory>

/**
 * @brief Simulates one key memory together with a host and a client bus model.
 * @details Every built key memory also runs the client port protocol checker, so any violation fails the test.
 */
class KeyMemoryFixture : public kmem::sim::BoostUnitTestSimulationFixture
{
	public:
		void build(size_t numSlots = 16) {
			kmem::scl::KeyMemoryConfig config;
			config.numSlots = numSlots;

			dut = std::make_unique<kmem::scl::KeyMemory>(config);
			host = std::make_unique<kmem::scl::KeyMemoryHostModel>(*dut, clock);
			client = std::make_unique<kmem::scl::KeyMemoryClientModel>(*dut, clock);

			addNode(*dut, clock);
			addSimulationProcess([this]() { return kmem::scl::validateClientPort(*dut, clock); });
		}

		/// Clock edges of the startup scrub, one per word of the backing store.
		size_t scrubTicks() const { return dut->numSlots() * kmem::scl::WORDS_PER_SLOT; }

		static kmem::scl::SlotContent makeSlot(std::uint32_t keyId, std::uint32_t keySeed, kmem::scl::SlotCounter counter = {}) {
			kmem::scl::SlotContent content;
			content.keyId = keyId;
			content.counter = counter;
			for (size_t i = 0; i < kmem::scl::KEY_WORDS; i++)
				content.key[i] = keySeed + std::uint32_t(i) * 0x01010101u;
			return content;
		}

		kmem::Clock clock;
		std::unique_ptr<kmem::scl::KeyMemory> dut;
		std::unique_ptr<kmem::scl::KeyMemoryHostModel> host;
		std::unique_ptr<kmem::scl::KeyMemoryClientModel> client;
};
