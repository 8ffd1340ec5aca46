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
#include "ValidityMasks.h"

#include "../../utils/Exceptions.h"

namespace kmem::scl
{
	ValidityMasks::ValidityMasks(SimulationNode *parent, size_t numSlots) :
		SimulationNode("validity", parent),
		m_md5(*this, "valid_md5", boost::dynamic_bitset<>(numSlots)),
		m_sha1(*this, "valid_sha1", boost::dynamic_bitset<>(numSlots))
	{
	}

	void ValidityMasks::set(size_t slot, bool md5, bool sha1)
	{
		KMEM_ASSERT(slot < m_md5->size());
		m_md5.next()[slot] = md5;
		m_sha1.next()[slot] = sha1;
	}
}
