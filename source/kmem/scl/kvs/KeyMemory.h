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

#include "KeyMemoryConfig.h"
#include "KeyMemoryPorts.h"
#include "KeyMemoryRegisters.h"
#include "SlotCounter.h"
#include "ShadowIndex.h"
#include "ValidityMasks.h"
#include "HostLoader.h"
#include "ClientEngine.h"
#include "../memory/DualPortMemory.h"

#include "../../simulation/SimulationNode.h"

#include <array>
#include <cstdint>

namespace kmem::scl
{
	/// Content of a slot as seen directly in the backing store.
	struct SlotContent
	{
		std::uint32_t keyId = 0;
		SlotCounter counter;
		std::array<std::uint32_t, KEY_WORDS> key = {};
	};

	/**
	 * @brief Slotted key memory with a host management port and a client lookup port.
	 * @details Root of the node hierarchy: a backing store of numSlots * 8 words with one port per state machine, the shadow index
	 * of all key ids, the validity masks of both domains, the host loader and the client search/fetch engine.
	 *
	 * The inputs of both ports are wires driven by simulation processes, the outputs are registers updated on the clock edge
	 * (except for the combinational host read data).
	 */
	class KeyMemory : public sim::SimulationNode
	{
	public:
		KeyMemory(const KeyMemoryConfig &config, std::string name = "keymem");

		const KeyMemoryConfig &config() const { return m_config; }
		size_t numSlots() const { return m_config.numSlots; }

		HostBusInputs &hostBus() { return m_hostBus; }
		ClientRequestInputs &clientRequest() { return m_clientRequest; }

		/// Read data of the host port for the address currently on the bus.
		std::uint32_t readData() const { return m_hostLoader.readRegister(*m_hostBus.address); }
		bool busy() const { return m_hostLoader.busy(); }

		bool ready() const { return m_clientEngine.ready(); }
		bool keyValid() const { return m_clientEngine.keyValid(); }
		std::uint8_t keyWord() const { return m_clientEngine.keyWord(); }
		std::uint32_t keyData() const { return m_clientEngine.keyData(); }

		/// Reads a slot directly from the backing store, bypassing both ports.
		SlotContent peekSlot(size_t slot) const;
		bool isValid(size_t slot, KeyDomain domain) const;

		const DualPortMemory &store() const { return m_store; }
		const ShadowIndex &shadowIndex() const { return m_shadowIndex; }
		const HostLoader &hostLoader() const { return m_hostLoader; }
		const ClientEngine &clientEngine() const { return m_clientEngine; }
	protected:
		KeyMemoryConfig m_config;

		HostBusInputs m_hostBus;
		ClientRequestInputs m_clientRequest;

		DualPortMemory m_store;
		ShadowIndex m_shadowIndex;
		ValidityMasks m_validity;
		HostLoader m_hostLoader;
		ClientEngine m_clientEngine;

		static const KeyMemoryConfig &validated(const KeyMemoryConfig &config);
	};
}
