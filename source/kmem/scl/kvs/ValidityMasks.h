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

#include "KeyMemoryRegisters.h"

#include "../../simulation/SimulationNode.h"
#include "../../simulation/Reg.h"

#include <boost/dynamic_bitset.hpp>

namespace kmem::scl
{
	/// One validity bit per slot and key domain.
	class ValidityMasks : public sim::SimulationNode
	{
	public:
		ValidityMasks(SimulationNode *parent, size_t numSlots);

		const boost::dynamic_bitset<> &mask(KeyDomain domain) const { return domain == KeyDomain::MD5 ? *m_md5 : *m_sha1; }
		bool isValid(size_t slot, KeyDomain domain) const { return mask(domain)[slot]; }

		/// Replaces both bits of a slot, takes effect on the current clock edge.
		void set(size_t slot, bool md5, bool sha1);
	protected:
		sim::Reg<boost::dynamic_bitset<>> m_md5;
		sim::Reg<boost::dynamic_bitset<>> m_sha1;
	};
}
