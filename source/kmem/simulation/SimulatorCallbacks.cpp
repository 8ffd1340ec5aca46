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
#include "SimulatorCallbacks.h"
#include "SimulationNode.h"

#include <boost/format.hpp>

#include <iostream>

namespace kmem::sim {

void SimulatorConsoleOutput::onNewTick(const ClockRational &simulationTime)
{
	m_simTime = simulationTime;
}

void SimulatorConsoleOutput::printPrefix(const SimulationNode *src) const
{
	std::cout << boost::format("[%10.1f ns] ") % toNanoseconds(m_simTime);
	if (src)
		std::cout << src->getPath() << ": ";
}

void SimulatorConsoleOutput::onDebugMessage(const SimulationNode *src, std::string msg)
{
	printPrefix(src);
	std::cout << msg << std::endl;
}

void SimulatorConsoleOutput::onWarning(const SimulationNode *src, std::string msg)
{
	printPrefix(src);
	std::cout << "WARNING: " << msg << std::endl;
}

void SimulatorConsoleOutput::onAssert(const SimulationNode *src, std::string msg)
{
	printPrefix(src);
	std::cout << "ASSERT: " << msg << std::endl;
}

}
