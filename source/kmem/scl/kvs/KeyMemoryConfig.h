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

#include "../../utils/ConfigTree.h"

#include <cstdint>
#include <ostream>

namespace kmem::scl
{
	struct KeyMemoryConfig
	{
		/// Number of key slots, a power of two between 2 and 256.
		size_t numSlots = 16;
		/// Content of the backing store before the startup scrub.
		std::uint32_t uninitializedPattern = 0xdeadbeef;

		/// Loads the attributes from a `keymem` config subtree (keys `slots` and `uninitialized`).
		void loadConfig(const utils::ConfigTree &config);
		/// Throws a DesignError if the configuration can not be built.
		void validate() const;

		size_t slotSelectWidth() const;
	};

	std::ostream &operator<<(std::ostream &s, const KeyMemoryConfig &cfg);
}
