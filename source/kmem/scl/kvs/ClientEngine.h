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

#include <boost/dynamic_bitset.hpp>

#include <cstdint>

namespace kmem::scl
{
	class DualPortMemory;
	class ShadowIndex;
	class ValidityMasks;
	class HostLoader;

	/**
	 * @brief State machine behind the client lookup port.
	 * @details Searches the shadow index for the requested key id among the slots valid for the requested domain (the highest matching
	 * slot wins), streams the five key words of the winning slot and writes the incremented usage counter back. Uses port B of the backing store.
	 *
	 * A lookup that finds a key keeps ready low for 12 clock edges after the one that accepted the request, a lookup that finds nothing for 4.
	 */
	class ClientEngine : public sim::SimulationNode
	{
	public:
		enum class State {
			StartupWait,
			Idle,
			SearchBuildMatch,
			SearchPick,
			SearchBranch,
			LoadCounterHigh,
			LoadCounterLow,
			LoadKey0,
			LoadKey1,
			LoadKey2,
			LoadKey3,
			LoadKey4,
			WriteCounterHigh,
			WriteCounterLow,
			NotFound,
		};

		ClientEngine(SimulationNode *parent, const KeyMemoryConfig &config, const ClientRequestInputs &request,
					DualPortMemory &store, const ShadowIndex &shadow, const ValidityMasks &validity, const HostLoader &hostLoader);

		State state() const { return *m_state; }

		bool ready() const { return *m_ready; }
		bool keyValid() const { return *m_keyValid; }
		std::uint8_t keyWord() const { return *m_keyWord; }
		std::uint32_t keyData() const { return *m_keyData; }

		virtual void simulateEvaluate(sim::SimulatorCallbacks &simCallbacks) override;
	protected:
		const ClientRequestInputs &m_request;
		DualPortMemory &m_store;
		const ShadowIndex &m_shadow;
		const ValidityMasks &m_validity;
		const HostLoader &m_hostLoader;

		sim::Reg<State> m_state;

		sim::Reg<KeyDomain> m_domain;
		sim::Reg<std::uint32_t> m_keyId;
		sim::Reg<boost::dynamic_bitset<>> m_mask;
		sim::Reg<boost::dynamic_bitset<>> m_match;
		sim::Reg<bool> m_found;
		sim::Reg<std::uint32_t> m_slot;

		/// Second stage of the read pipeline of port B.
		sim::Reg<std::uint32_t> m_readData;
		sim::Reg<std::uint32_t> m_counterMsb;
		sim::Reg<std::uint32_t> m_counterLsb;

		sim::Reg<bool> m_ready;
		sim::Reg<bool> m_keyValid;
		sim::Reg<std::uint8_t> m_keyWord;
		sim::Reg<std::uint32_t> m_keyData;

		void acceptRequest();
		void pickSlot();
		void branch();
		void fetchStep();

		size_t storeAddress(size_t word) const { return *m_slot * WORDS_PER_SLOT + word; }
	};
}
