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

#include "Exceptions.h"

#include <cstdint>
#include <bit>


namespace kmem::utils
{
	using ::std::popcount;

template<typename T>
bool isPow2(T v) { return popcount(v) == 1; }

template<typename T>
T Log2(T v)
{
	KMEM_ASSERT(v > 0);
	T ret = 0;
	while (v >>= 1)
		++ret;
	return ret;
}

template<typename T>
T Log2C(T v)
{
	KMEM_ASSERT(v > 0);
	if (v == 1)
		return 0;

	return Log2(v - 1) + 1;
}

template<typename T>
inline T bitfieldExtract(T value, size_t offset, size_t size) {
	if (size == 0) return T(0);
	if (size >= sizeof(T) * 8)
		return value >> offset;
	return (value >> offset) & ((T(1) << size) - 1);
}

template<typename T>
inline T bitfieldInsert(T value, size_t offset, size_t size, T insert) {
	T mask = (size >= sizeof(T) * 8) ? ~T(0) : ((T(1) << size) - 1);
	return (value & ~(mask << offset)) | ((insert & mask) << offset);
}

}
