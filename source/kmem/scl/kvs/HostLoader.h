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

#include "../../simulation/SimulationNode.h"
#include "../../simulation/Reg.h"

#include <cstdint>
#include <memory>
#include <vector>

namespace kmem::scl
{
	class DualPortMemory;
	class ShadowIndex;
	class ValidityMasks;

	/**
	 * @brief State machine behind the host management port.
	 * @details Scrubs the backing store and shadow index after power on, then decodes host writes and copies the active slot into the
	 * mirror registers on request. Uses port A of the backing store.
	 */
	class HostLoader : public sim::SimulationNode
	{
	public:
		enum class State {
			Idle,
			LoadId,
			LoadCounterHigh,
			LoadCounterLow,
			LoadKey0,
			LoadKey1,
			LoadKey2,
			LoadKey3,
			LoadKey4,
			Wait0,
			Wait1,
			Reset,
		};

		HostLoader(SimulationNode *parent, const KeyMemoryConfig &config, const HostBusInputs &bus,
					DualPortMemory &store, ShadowIndex &shadow, ValidityMasks &validity);

		State state() const { return *m_state; }
		bool busy() const { return *m_busy; }
		bool scrubDone() const { return *m_scrubDone; }
		size_t activeSlot() const { return *m_activeSlot; }
		std::uint32_t mirror(SlotWord word) const { return **m_mirror[word]; }

		/// Combinational read data for the given register address.
		std::uint32_t readRegister(std::uint8_t address) const;

		virtual void simulateEvaluate(sim::SimulatorCallbacks &simCallbacks) override;
	protected:
		const KeyMemoryConfig m_config;
		const HostBusInputs &m_bus;
		DualPortMemory &m_store;
		ShadowIndex &m_shadow;
		ValidityMasks &m_validity;

		sim::Reg<State> m_state;
		sim::Reg<bool> m_busy;
		sim::Reg<bool> m_scrubDone;
		sim::Reg<std::uint32_t> m_scrubAddress;
		sim::Reg<std::uint32_t> m_activeSlot;
		/// Second stage of the read pipeline of port A.
		sim::Reg<std::uint32_t> m_readData;
		std::vector<std::unique_ptr<sim::Reg<std::uint32_t>>> m_mirror;

		void scrubStep();
		void decodeWrite();
		void decodeRead() const;
		void loadStep();

		size_t storeAddress(size_t word) const { return *m_activeSlot * WORDS_PER_SLOT + word; }
	};
}
