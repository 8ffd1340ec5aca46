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

#include <cstdint>

namespace kmem::scl
{
	/// Usage counter of a slot, stored as two independently addressable halves.
	struct SlotCounter
	{
		std::uint32_t msb = 0;
		std::uint32_t lsb = 0;

		std::uint64_t value() const { return (std::uint64_t(msb) << 32) | lsb; }

		bool operator==(const SlotCounter &) const = default;
	};

	/// Adds one, carrying from the low into the high half.
	inline SlotCounter incrementCounter(SlotCounter counter)
	{
		return {
			.msb = counter.msb + (counter.lsb == 0xFFFF'FFFFu ? 1u : 0u),
			.lsb = counter.lsb + 1,
		};
	}
}
