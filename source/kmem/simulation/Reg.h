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

#include "waveformFormats/VCDWriter.h"

#include <boost/dynamic_bitset.hpp>
#include <magic_enum.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>

namespace kmem::sim {

class SimulationNode;

/**
 * @brief Named piece of simulation state owned by a SimulationNode.
 * @details State elements register themselves with their owner on construction, which resets them on power on,
 * commits them on every clock edge and exposes them to waveform recorders.
 */
class StateElement
{
	public:
		StateElement(SimulationNode &owner, std::string name);
		virtual ~StateElement() = default;

		StateElement(const StateElement&) = delete;
		StateElement &operator=(const StateElement&) = delete;

		const std::string &getName() const { return m_name; }
		SimulationNode &getOwner() const { return m_owner; }

		/// Puts the element into its power on state.
		virtual void reset() = 0;
		/// Makes the value computed during evaluation visible. Called once per clock edge.
		virtual void commit() { }

		/// Bit width in waveforms, 0 for elements that are recorded as strings.
		virtual size_t width() const = 0;
		/// Writes the current value if it changed since the last dump (or always if forced). Returns whether anything was written.
		virtual bool dump(VCDWriter &writer, std::string_view code, bool force) = 0;
	protected:
		SimulationNode &m_owner;
		std::string m_name;
};

namespace internal {

	template<typename T>
	size_t defaultWidth(const T &value) {
		if constexpr (std::is_enum_v<T>)
			return 0;
		else if constexpr (std::is_same_v<T, bool>)
			return 1;
		else if constexpr (std::is_integral_v<T>)
			return sizeof(T) * 8;
		else
			return value.size();
	}

	template<typename T>
	void writeValue(VCDWriter &writer, std::string_view code, size_t width, const T &value) {
		if constexpr (std::is_enum_v<T>)
			writer.writeString(code, magic_enum::enum_name(value));
		else if constexpr (std::is_same_v<T, bool>)
			writer.writeBit(code, value);
		else if constexpr (std::is_integral_v<T>)
			writer.writeVector(code, width, (std::uint64_t) value);
		else
			writer.writeVector(code, value);
	}

	template<typename T>
	class DumpedValue
	{
		public:
			bool dump(VCDWriter &writer, std::string_view code, size_t width, const T &value, bool force) {
				if (!force && m_lastDumped && *m_lastDumped == value)
					return false;
				writeValue(writer, code, width, value);
				m_lastDumped = value;
				return true;
			}
			void clear() { m_lastDumped.reset(); }
		protected:
			std::optional<T> m_lastDumped;
	};
}

/**
 * @brief Clocked register.
 * @details Evaluation assigns the next value with operator= (or modifies it in place through next()), reading through
 * operator* always returns the value committed on the last clock edge. A register that is not assigned holds its value.
 */
template<typename T>
class Reg : public StateElement
{
	public:
		Reg(SimulationNode &owner, std::string name, T resetValue) :
			StateElement(owner, std::move(name)), m_resetValue(resetValue), m_value(resetValue), m_next(resetValue) { m_width = internal::defaultWidth(resetValue); }

		Reg(SimulationNode &owner, std::string name, T resetValue, size_t width) :
			StateElement(owner, std::move(name)), m_resetValue(resetValue), m_value(resetValue), m_next(resetValue), m_width(width) { }

		const T &operator*() const { return m_value; }
		const T *operator->() const { return &m_value; }

		Reg<T> &operator=(const T &next) { m_next = next; return *this; }
		T &next() { return m_next; }
		const T &next() const { return m_next; }

		virtual void reset() override { m_value = m_resetValue; m_next = m_resetValue; m_dumped.clear(); }
		virtual void commit() override { m_value = m_next; }
		virtual size_t width() const override { return m_width; }
		virtual bool dump(VCDWriter &writer, std::string_view code, bool force) override { return m_dumped.dump(writer, code, m_width, m_value, force); }
	protected:
		T m_resetValue;
		T m_value;
		T m_next;
		size_t m_width;
		internal::DumpedValue<T> m_dumped;
};

/**
 * @brief Input of a node that is driven by simulation processes.
 * @details Assignments are visible immediately, the value is sampled by whatever clock edge evaluates the node next.
 */
template<typename T>
class Wire : public StateElement
{
	public:
		Wire(SimulationNode &owner, std::string name, T defaultValue, size_t width) :
			StateElement(owner, std::move(name)), m_defaultValue(defaultValue), m_value(defaultValue), m_width(width) { }
		Wire(SimulationNode &owner, std::string name, T defaultValue) :
			Wire(owner, std::move(name), defaultValue, internal::defaultWidth(defaultValue)) { }

		const T &operator*() const { return m_value; }
		Wire<T> &operator=(const T &value) { m_value = value; return *this; }

		virtual void reset() override { m_value = m_defaultValue; m_dumped.clear(); }
		virtual size_t width() const override { return m_width; }
		virtual bool dump(VCDWriter &writer, std::string_view code, bool force) override { return m_dumped.dump(writer, code, m_width, m_value, force); }
	protected:
		T m_defaultValue;
		T m_value;
		size_t m_width;
		internal::DumpedValue<T> m_dumped;
};

}
