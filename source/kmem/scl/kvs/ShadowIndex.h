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

#include "../../simulation/SimulationNode.h"
#include "../../simulation/Reg.h"

#include <boost/dynamic_bitset.hpp>

#include <cstdint>
#include <memory>
#include <vector>

namespace kmem::scl
{
	/**
	 * @brief One register per slot mirroring the key id stored in the backing store.
	 * @details Allows comparing a key id against all slots on a single clock edge.
	 */
	class ShadowIndex : public sim::SimulationNode
	{
	public:
		ShadowIndex(SimulationNode *parent, size_t numSlots);

		size_t size() const { return m_ids.size(); }

		std::uint32_t idOf(size_t slot) const;
		/// Takes effect on the current clock edge.
		void write(size_t slot, std::uint32_t id);

		/// Bit i is set if slot i currently holds the given key id.
		boost::dynamic_bitset<> match(std::uint32_t id) const;
	protected:
		std::vector<std::unique_ptr<sim::Reg<std::uint32_t>>> m_ids;
	};
}
