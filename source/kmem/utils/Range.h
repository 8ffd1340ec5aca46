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

#include <concepts>
#include <cstddef>
#include <iterator>

namespace kmem::utils {

/// Counts through [first, last), e.g. `for (auto slot : Range(numSlots))`.
template<std::integral Integral = size_t>
class Range
{
	public:
		Range(Integral last) : m_last(last) { }
		Range(Integral first, Integral last) : m_first(first), m_last(last) { }

		struct iterator {
			using iterator_category = std::input_iterator_tag;
			using value_type = Integral;
			using difference_type = std::ptrdiff_t;

			Integral current;

			Integral operator*() const { return current; }
			iterator &operator++() { ++current; return *this; }
			bool operator==(const iterator &) const = default;
		};

		iterator begin() const { return { m_first }; }
		iterator end() const { return { m_last < m_first ? m_first : m_last }; }
		size_t size() const { return m_last < m_first ? 0 : size_t(m_last - m_first); }
	protected:
		Integral m_first = 0;
		Integral m_last;
};

}
