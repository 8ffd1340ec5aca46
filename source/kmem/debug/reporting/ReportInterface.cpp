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
#include "ReportInterface.h"
#include "../helpers/JsonSerialization.h"

#include <magic_enum.hpp>

using namespace std::literals;

namespace kmem::dbg {

	void ReportInterface::create(const std::filesystem::path &outputDir)
	{
		instance.reset(nullptr); // Close previous first
		instance.reset(new ReportInterface(outputDir));
	}

	ReportInterface::ReportInterface(const std::filesystem::path &outputDir) : m_outputDir(outputDir)
	{
		auto dataFolder = outputDir / "data";
		if (!std::filesystem::exists(dataFolder))
			std::filesystem::create_directories(dataFolder);

		m_logMessages.open(dataFolder / "report.js", "logMessages"sv);
		m_stateChanges.open(dataFolder / "states.js", "stateChanges"sv);
	}

	std::string ReportInterface::howToReachLog()
	{
		return std::string("Log messages are written to ") + std::filesystem::absolute(m_logMessages.filename()).string();
	}

	void ReportInterface::log(LogMessage msg)
	{
		json::serializeLogMessage(m_logMessages.append(), msg, m_tick);
	}

	void ReportInterface::changeState(State state)
	{
		m_stateChanges.append()
			<< "{ \"state\": \"" << magic_enum::enum_name(state) << "\", \"tick\": " << m_tick
			<< ", \"message_index\": " << m_logMessages.numEntries() << " }";

		DebugInterface::changeState(state);
	}

}
