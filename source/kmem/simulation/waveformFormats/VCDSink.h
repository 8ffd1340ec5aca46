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

#include "../SimulatorCallbacks.h"
#include "VCDWriter.h"

#include <map>
#include <string>
#include <utility>
#include <vector>

namespace kmem::sim {

class Simulator;
class StateElement;
class VCDIdentifierGenerator;

/**
 * @brief Records all state elements of all simulated nodes, the clock and all simulator messages into a VCD file.
 * @details Registers holding enums (e.g. states of state machines) are written as strings.
 */
class VCDSink : public SimulatorCallbacks
{
	public:
		VCDSink(Simulator &simulator, const char *filename);

		virtual void onPowerOn() override;
		virtual void onCommitState() override;
		virtual void onDebugMessage(const SimulationNode *src, std::string msg) override;
		virtual void onWarning(const SimulationNode *src, std::string msg) override;
		virtual void onAssert(const SimulationNode *src, std::string msg) override;

		const std::string &getFilename() const { return m_VCD.filename(); }
	protected:
		Simulator &m_simulator;
		VCDWriter m_VCD;

		bool m_initialized = false;
		bool m_firstCommit = true;

		std::vector<std::pair<StateElement*, std::string>> m_stateElements;
		std::string m_clockCode;
		std::string m_debugMessageCode;
		std::string m_warningsCode;
		std::string m_assertsCode;

		std::vector<std::pair<std::string, std::string>> m_pendingMessages;

		void declareNode(const SimulationNode &node, VCDIdentifierGenerator &identifiers);
};

}
