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

#include <cstddef>
#include <cstdint>

namespace kmem::scl
{
	/// Algorithm domain a key can be valid for.
	enum class KeyDomain
	{
		MD5,
		SHA1
	};

	/// Word offsets inside a slot of the backing store.
	enum SlotWord : size_t
	{
		WORD_KEY_ID = 0,
		WORD_COUNTER_MSB = 1,
		WORD_COUNTER_LSB = 2,
		WORD_KEY0 = 3,
	};

	constexpr size_t WORDS_PER_SLOT = 8;
	constexpr size_t KEY_WORDS = 5;

	/// Addresses of the host management port.
	enum KeyMemoryAddress : std::uint8_t
	{
		ADDR_NAME0 = 0x00,
		ADDR_NAME1 = 0x01,
		ADDR_VERSION = 0x02,

		ADDR_CTRL = 0x08,
		ADDR_STATUS = 0x09,
		ADDR_NUM_SLOTS = 0x0a,

		ADDR_ACTIVE_SLOT = 0x10,
		ADDR_VALID = 0x11,

		ADDR_KEY_ID = 0x20,
		ADDR_COUNTER_MSB = 0x21,
		ADDR_COUNTER_LSB = 0x22,

		ADDR_KEY0 = 0x30,
		ADDR_KEY1 = 0x31,
		ADDR_KEY2 = 0x32,
		ADDR_KEY3 = 0x33,
		ADDR_KEY4 = 0x34,
	};

	constexpr std::uint32_t CORE_NAME0 = 0x6e747061; // "ntpa"
	constexpr std::uint32_t CORE_NAME1 = 0x6b6d656d; // "kmem"
	constexpr std::uint32_t CORE_VERSION = 0x302e3130; // "0.10"

	constexpr std::uint32_t CTRL_LOAD_BIT = 0x1;
	constexpr std::uint32_t STATUS_BUSY_BIT = 0x1;
	constexpr std::uint32_t VALID_MD5_BIT = 0x1;
	constexpr std::uint32_t VALID_SHA1_BIT = 0x2;

	/// Maps the per slot addresses (key id, counter and key words) to the word offset inside the slot, returns false for all other addresses.
	inline bool slotWordOfAddress(std::uint8_t address, size_t &word)
	{
		if (address >= ADDR_KEY_ID && address <= ADDR_COUNTER_LSB) {
			word = WORD_KEY_ID + (address - ADDR_KEY_ID);
			return true;
		}
		if (address >= ADDR_KEY0 && address <= ADDR_KEY4) {
			word = WORD_KEY0 + (address - ADDR_KEY0);
			return true;
		}
		return false;
	}
}
