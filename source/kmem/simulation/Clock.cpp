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
#include "Clock.h"

#include "../utils/Exceptions.h"

#include <boost/algorithm/string.hpp>
#include <magic_enum.hpp>

#include <cmath>
#include <sstream>

namespace kmem::sim {

	ClockRational clockFromString(std::string text)
	{
		double number = 0;
		std::string unit;
		std::istringstream{ text } >> number >> unit;

		if (number <= 0)
			throw std::runtime_error{ "invalid clock '" + text + "'. expected a positive number followed by a unit" };

		ClockRational roundedNumber{ std::uint64_t(std::llround(number * 1000)), 1000 };
		ClockRational frequency;

		boost::algorithm::to_lower(unit);
		if (unit == "ps")
			frequency = ClockRational{ 1'000'000'000'000, 1 } / roundedNumber;
		else if (unit == "ns")
			frequency = ClockRational{ 1'000'000'000, 1 } / roundedNumber;
		else if (unit == "us")
			frequency = ClockRational{ 1'000'000, 1 } / roundedNumber;
		else if (unit == "ms")
			frequency = ClockRational{ 1'000, 1 } / roundedNumber;
		else if (unit == "s")
			frequency = ClockRational{ 1, 1 } / roundedNumber;
		else if (unit == "hz")
			frequency = ClockRational{ 1, 1 } * roundedNumber;
		else if (unit == "khz")
			frequency = ClockRational{ 1'000, 1 } * roundedNumber;
		else if (unit == "mhz")
			frequency = ClockRational{ 1'000'000, 1 } * roundedNumber;
		else if (unit == "ghz")
			frequency = ClockRational{ 1'000'000'000, 1 } * roundedNumber;
		else
			throw std::runtime_error{ "unknown clock period unit '" + unit + "'. must be one of (ps, ns, us, ms, s, Hz, KHz, MHz, GHz)" };

		return frequency;
	}

	void ClockConfig::loadConfig(const utils::ConfigTree &config)
	{
		if (config.isScalar())
			absoluteFrequency = clockFromString(config.as<std::string>());
		else
		{
			if (config["name"])
				name = config["name"].as<std::string>();

			if (config["period"])
				absoluteFrequency = clockFromString(config["period"].as<std::string>());

			if (config["clock_edge"])
				triggerEvent = config["clock_edge"].as<TriggerEvent>();
		}
	}

	void ClockConfig::print(std::ostream &s) const
	{
		s << name.value_or("<unnamed>");

		if (absoluteFrequency)
		{
			double frequencyMhz = double(absoluteFrequency->numerator()) / absoluteFrequency->denominator();
			frequencyMhz /= 1'000'000;
			s << ", period: " << frequencyMhz << " MHz";
		}

		if (triggerEvent)
			s << ", clock edge: " << magic_enum::enum_name(*triggerEvent);
	}

	std::ostream &operator<<(std::ostream &s, const ClockConfig &cfg)
	{
		cfg.print(s);
		return s;
	}

	Clock::Clock(const ClockConfig &config)
	{
		if (config.name)
			m_name = *config.name;
		if (config.absoluteFrequency)
			m_absoluteFrequency = *config.absoluteFrequency;
		if (config.triggerEvent)
			m_triggerEvent = *config.triggerEvent;

		KMEM_DESIGNCHECK_HINT(m_absoluteFrequency.numerator() != 0, "clock frequency must not be zero");
	}

}
