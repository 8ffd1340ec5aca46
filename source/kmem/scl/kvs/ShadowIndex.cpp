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
#include "ShadowIndex.h"

#include "../../utils/Exceptions.h"

namespace kmem::scl
{
	ShadowIndex::ShadowIndex(SimulationNode *parent, size_t numSlots) :
		SimulationNode("shadow_index", parent)
	{
		m_ids.reserve(numSlots);
		for (size_t i = 0; i < numSlots; i++)
			m_ids.push_back(std::make_unique<sim::Reg<std::uint32_t>>(*this, "id_" + std::to_string(i), 0u));
	}

	std::uint32_t ShadowIndex::idOf(size_t slot) const
	{
		KMEM_ASSERT(slot < m_ids.size());
		return **m_ids[slot];
	}

	void ShadowIndex::write(size_t slot, std::uint32_t id)
	{
		KMEM_ASSERT(slot < m_ids.size());
		*m_ids[slot] = id;
	}

	boost::dynamic_bitset<> ShadowIndex::match(std::uint32_t id) const
	{
		boost::dynamic_bitset<> result(m_ids.size());
		for (size_t i = 0; i < m_ids.size(); i++)
			result[i] = **m_ids[i] == id;
		return result;
	}
}
