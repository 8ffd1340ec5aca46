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

#include "../kvs/KeyMemory.h"

#include "../../frontend.h"

#include <cstdint>
#include <vector>

namespace kmem::scl
{
	struct LookupResult
	{
		/// Key words in the order they were delivered.
		std::vector<std::uint32_t> words;
		/// Word index that accompanied each delivered word.
		std::vector<std::uint8_t> wordIndices;
		/// Clock edges from accepting the request until ready was high again (inclusive).
		size_t steps = 0;

		bool found() const { return words.size() == KEY_WORDS; }
	};

	/**
	 * @brief Requester driving the client lookup port of a KeyMemory from simulation processes.
	 * @details Must be called from a point in time right before a clock edge (i.e. after co_awaiting OnClk or at power on).
	 */
	class KeyMemoryClientModel
	{
	public:
		KeyMemoryClientModel(KeyMemory &dut, const Clock &clock);

		/// Waits until the key memory accepts requests.
		SimProcess waitReady();
		/// Issues a lookup and collects the delivered key words, reports protocol violations as simulation asserts.
		SimFunction<LookupResult> lookup(KeyDomain domain, std::uint32_t keyId);
	protected:
		KeyMemory &m_dut;
		const Clock &m_clock;
	};

	/**
	 * @brief Checks on every clock edge that key words are only delivered while a lookup is in progress and with ascending word index.
	 * @details Violations are reported as simulation asserts.
	 */
	SimProcess validateClientPort(const KeyMemory &dut, const Clock &clock);
}
