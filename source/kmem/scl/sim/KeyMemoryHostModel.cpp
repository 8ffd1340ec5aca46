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
#include "kmem/pch.h"
#include "KeyMemoryHostModel.h"

namespace kmem::scl
{
	KeyMemoryHostModel::KeyMemoryHostModel(KeyMemory &dut, const Clock &clock) :
		m_dut(dut),
		m_clock(clock)
	{
	}

	SimProcess KeyMemoryHostModel::write(std::uint8_t address, std::uint32_t data)
	{
		auto &bus = m_dut.hostBus();
		bus.cs = true;
		bus.we = true;
		bus.address = address;
		bus.writeData = data;

		co_await OnClk(m_clock);

		bus.cs = false;
		bus.we = false;
	}

	SimFunction<std::uint32_t> KeyMemoryHostModel::read(std::uint8_t address)
	{
		auto &bus = m_dut.hostBus();
		bus.cs = true;
		bus.we = false;
		bus.address = address;

		const std::uint32_t value = m_dut.readData();

		co_await OnClk(m_clock);

		bus.cs = false;
		co_return value;
	}

	SimProcess KeyMemoryHostModel::waitWhileBusy()
	{
		while (true) {
			const std::uint32_t status = co_await read(ADDR_STATUS);
			if (!(status & STATUS_BUSY_BIT))
				break;
		}
	}

	SimProcess KeyMemoryHostModel::selectSlot(size_t slot)
	{
		KMEM_DESIGNCHECK_HINT(slot < m_dut.numSlots(), "Slot index out of range.");
		co_await write(ADDR_ACTIVE_SLOT, (std::uint32_t) slot);
	}

	SimProcess KeyMemoryHostModel::setValid(size_t slot, bool md5, bool sha1)
	{
		co_await waitWhileBusy();
		co_await selectSlot(slot);
		co_await write(ADDR_VALID, (md5 ? VALID_MD5_BIT : 0u) | (sha1 ? VALID_SHA1_BIT : 0u));
	}

	SimProcess KeyMemoryHostModel::writeSlot(size_t slot, SlotContent content, bool md5, bool sha1)
	{
		co_await waitWhileBusy();
		co_await selectSlot(slot);

		co_await write(ADDR_KEY_ID, content.keyId);
		co_await write(ADDR_COUNTER_MSB, content.counter.msb);
		co_await write(ADDR_COUNTER_LSB, content.counter.lsb);
		for (size_t i = 0; i < KEY_WORDS; i++)
			co_await write(std::uint8_t(ADDR_KEY0 + i), content.key[i]);

		co_await write(ADDR_VALID, (md5 ? VALID_MD5_BIT : 0u) | (sha1 ? VALID_SHA1_BIT : 0u));
	}

	SimFunction<SlotContent> KeyMemoryHostModel::loadSlot(size_t slot)
	{
		co_await waitWhileBusy();
		co_await selectSlot(slot);
		co_await write(ADDR_CTRL, CTRL_LOAD_BIT);
		co_await waitWhileBusy();

		SlotContent content;
		content.keyId = co_await read(ADDR_KEY_ID);
		content.counter.msb = co_await read(ADDR_COUNTER_MSB);
		content.counter.lsb = co_await read(ADDR_COUNTER_LSB);
		for (size_t i = 0; i < KEY_WORDS; i++)
			content.key[i] = co_await read(std::uint8_t(ADDR_KEY0 + i));

		co_return content;
	}

	SimFunction<CoreIdentity> KeyMemoryHostModel::readIdentity()
	{
		CoreIdentity identity;
		identity.name0 = co_await read(ADDR_NAME0);
		identity.name1 = co_await read(ADDR_NAME1);
		identity.version = co_await read(ADDR_VERSION);
		identity.numSlots = co_await read(ADDR_NUM_SLOTS);
		co_return identity;
	}
}
