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
#include "KeyMemory.h"

#include "../../utils/Exceptions.h"

namespace kmem::scl
{
	const KeyMemoryConfig &KeyMemory::validated(const KeyMemoryConfig &config)
	{
		config.validate();
		return config;
	}

	KeyMemory::KeyMemory(const KeyMemoryConfig &config, std::string name) :
		SimulationNode(std::move(name)),
		m_config(validated(config)),
		m_hostBus(*this),
		m_clientRequest(*this),
		m_store("store", this, m_config.numSlots * WORDS_PER_SLOT, m_config.uninitializedPattern),
		m_shadowIndex(this, m_config.numSlots),
		m_validity(this, m_config.numSlots),
		m_hostLoader(this, m_config, m_hostBus, m_store, m_shadowIndex, m_validity),
		m_clientEngine(this, m_config, m_clientRequest, m_store, m_shadowIndex, m_validity, m_hostLoader)
	{
	}

	SlotContent KeyMemory::peekSlot(size_t slot) const
	{
		KMEM_DESIGNCHECK_HINT(slot < m_config.numSlots, "Slot index out of range.");

		const size_t base = slot * WORDS_PER_SLOT;
		SlotContent content;
		content.keyId = m_store.peek(base + WORD_KEY_ID);
		content.counter.msb = m_store.peek(base + WORD_COUNTER_MSB);
		content.counter.lsb = m_store.peek(base + WORD_COUNTER_LSB);
		for (size_t i = 0; i < KEY_WORDS; i++)
			content.key[i] = m_store.peek(base + WORD_KEY0 + i);
		return content;
	}

	bool KeyMemory::isValid(size_t slot, KeyDomain domain) const
	{
		KMEM_DESIGNCHECK_HINT(slot < m_config.numSlots, "Slot index out of range.");
		return m_validity.isValid(slot, domain);
	}
}
