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
#include "DebugInterface.h"
#include "ConsoleInterface.h"
#include "reporting/ReportInterface.h"

#include <boost/format.hpp>

namespace kmem::dbg {

LogMessage::LogMessage()
{
}

LogMessage::LogMessage(const char *c)
{
	(*this) << c;
}

std::string LogMessage::text() const
{
	std::string ret;
	for (const auto &part : m_messageParts) {
		if (std::holds_alternative<const char*>(part))
			ret += std::get<const char*>(part);
		else if (std::holds_alternative<std::string>(part))
			ret += std::get<std::string>(part);
		else if (std::holds_alternative<Slot>(part))
			ret += (boost::format("slot %d") % std::get<Slot>(part).index).str();
		else if (std::holds_alternative<Word>(part))
			ret += (boost::format("0x%08x") % std::get<Word>(part).value).str();
	}
	return ret;
}


thread_local std::unique_ptr<DebugInterface> DebugInterface::instance = std::make_unique<DebugInterface>();

void changeState(State state)
{
	DebugInterface::instance->changeState(state);
}

void newTick(size_t tick)
{
	DebugInterface::instance->newTick(tick);
}

void log(const LogMessage &msg)
{
	DebugInterface::instance->log(msg);
}

void logConsole()
{
	ConsoleInterface::create();
}

void logHtml(const std::filesystem::path &outputDir)
{
	ReportInterface::create(outputDir);
}

void logNothing()
{
	DebugInterface::instance.reset(nullptr);
	DebugInterface::instance = std::make_unique<DebugInterface>();
}

std::string howToReachLog()
{
	return DebugInterface::instance->howToReachLog();
}


}
