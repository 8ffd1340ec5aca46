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

#include "../utils/ConfigTree.h"

#include <boost/rational.hpp>

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>

namespace kmem::sim {

	using ClockRational = boost::rational<std::uint64_t>;

	inline double toNanoseconds(const ClockRational &v) { return v.numerator() * 1e9 / v.denominator(); }
	inline std::uint64_t toPicoseconds(const ClockRational &v) { return v.numerator() * 1'000'000'000'000ull / v.denominator(); }

	/// Parses a clock given either as period ("10 ns") or as frequency ("100 MHz") and returns the frequency.
	ClockRational clockFromString(std::string text);

	/**
	 * @brief Optional clock attributes as they appear in configuration files.
	 * @details Unset fields keep the default of the Clock they are applied to.
	 */
	struct ClockConfig
	{
		enum class TriggerEvent {
			RISING,
			FALLING
		};

		std::optional<std::string> name;
		std::optional<ClockRational> absoluteFrequency;
		std::optional<TriggerEvent> triggerEvent;

		/**
		 * @brief Loads the clock attributes from a config subtree.
		 * @details Either a scalar holding the period/frequency or a map with the keys name, period and clock_edge.
		 */
		void loadConfig(const utils::ConfigTree &config);
		void print(std::ostream &s) const;
	};

	std::ostream &operator<<(std::ostream &s, const ClockConfig &cfg);

	/// The single clock that drives all simulated key memory components.
	class Clock
	{
		public:
			Clock(const ClockConfig &config = {});

			const std::string &getName() const { return m_name; }
			const ClockRational &absoluteFrequency() const { return m_absoluteFrequency; }
			ClockRational period() const { return ClockRational(1) / m_absoluteFrequency; }
			ClockConfig::TriggerEvent getTriggerEvent() const { return m_triggerEvent; }
		protected:
			std::string m_name = "clk";
			ClockRational m_absoluteFrequency = ClockRational(100'000'000);
			ClockConfig::TriggerEvent m_triggerEvent = ClockConfig::TriggerEvent::RISING;
	};

}
