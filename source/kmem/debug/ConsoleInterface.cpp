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
#include "ConsoleInterface.h"

#include <boost/format.hpp>
#include <magic_enum.hpp>

namespace kmem::dbg {

	void ConsoleInterface::create(std::ostream &stream)
	{
		instance.reset(nullptr);
		instance.reset(new ConsoleInterface(stream));
	}

	ConsoleInterface::ConsoleInterface(std::ostream &stream) : m_stream(stream)
	{
	}

	void ConsoleInterface::log(LogMessage msg)
	{
		std::string_view severity = magic_enum::enum_name(msg.severity());
		std::string_view source = magic_enum::enum_name(msg.source());
		severity.remove_prefix(4);
		source.remove_prefix(4);

		if (m_state == State::SIMULATION)
			m_stream << boost::format("[tick %6d] ") % m_tick;
		m_stream << boost::format("[%-7s] [%-11s] ") % severity % source;
		if (msg.anchor() != ~0ull)
			m_stream << boost::format("[slot %3d] ") % msg.anchor();
		m_stream << msg.text() << '\n';
	}

	void ConsoleInterface::changeState(State state)
	{
		if (state != m_state)
			m_stream << "[" << magic_enum::enum_name(state) << "]\n";
		DebugInterface::changeState(state);
	}

	std::string ConsoleInterface::howToReachLog()
	{
		return "Log messages are written to the console.";
	}

}
