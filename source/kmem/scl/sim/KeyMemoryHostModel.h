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

namespace kmem::scl
{
	/// Identification registers of the host port.
	struct CoreIdentity
	{
		std::uint32_t name0 = 0;
		std::uint32_t name1 = 0;
		std::uint32_t version = 0;
		std::uint32_t numSlots = 0;

		bool matches() const { return name0 == CORE_NAME0 && name1 == CORE_NAME1 && version == CORE_VERSION; }
	};

	/**
	 * @brief Bus master driving the host management port of a KeyMemory from simulation processes.
	 * @details Every access occupies the bus for one clock edge. All functions must be called from a point in time right before a
	 * clock edge (i.e. after co_awaiting OnClk or at power on) and return at such a point.
	 */
	class KeyMemoryHostModel
	{
	public:
		KeyMemoryHostModel(KeyMemory &dut, const Clock &clock);

		SimProcess write(std::uint8_t address, std::uint32_t data);
		SimFunction<std::uint32_t> read(std::uint8_t address);

		/// Polls the status register until the host loader is no longer busy.
		SimProcess waitWhileBusy();

		SimProcess selectSlot(size_t slot);
		SimProcess setValid(size_t slot, bool md5, bool sha1);
		/// Writes id, counter and key words of a slot, followed by its validity bits.
		SimProcess writeSlot(size_t slot, SlotContent content, bool md5, bool sha1);
		/// Loads a slot into the mirror registers and reads them back.
		SimFunction<SlotContent> loadSlot(size_t slot);
		SimFunction<CoreIdentity> readIdentity();
	protected:
		KeyMemory &m_dut;
		const Clock &m_clock;
	};
}
