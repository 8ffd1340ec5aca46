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
#include "KeyMemoryConfig.h"

#include "../../utils/BitManipulation.h"
#include "../../utils/Exceptions.h"
#include "../../debug/DebugInterface.h"

namespace kmem::scl
{
	void KeyMemoryConfig::loadConfig(const utils::ConfigTree &config)
	{
		if (!config)
			return;

		numSlots = config["slots"].as(numSlots);
		uninitializedPattern = config["uninitialized"].as(uninitializedPattern);

		dbg::log(dbg::LogMessage() << dbg::LogMessage::LOG_INFO << dbg::LogMessage::LOG_CONFIG
			<< "key memory with " << numSlots << " slots");

		validate();
	}

	void KeyMemoryConfig::validate() const
	{
		KMEM_DESIGNCHECK_HINT(numSlots >= 2 && numSlots <= 256, "The number of key slots must be between 2 and 256.");
		KMEM_DESIGNCHECK_HINT(utils::isPow2(numSlots), "The number of key slots must be a power of two.");
	}

	size_t KeyMemoryConfig::slotSelectWidth() const
	{
		return utils::Log2C(numSlots);
	}

	std::ostream &operator<<(std::ostream &s, const KeyMemoryConfig &cfg)
	{
		s << "slots: " << cfg.numSlots << " uninitialized: 0x" << std::hex << cfg.uninitializedPattern << std::dec;
		return s;
	}
}
