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
#include "VCDSink.h"

#include "../Simulator.h"
#include "../SimulationNode.h"
#include "../Reg.h"

namespace kmem::sim
{
	namespace {
		const char *syntheticModuleName = "synthetic";
		const char *debugMessagesLabel = "Debug_Messages";
		const char *warningsLabel = "Warnings";
		const char *assertsLabel = "Asserts";
	}

	class VCDIdentifierGenerator {
	public:
		enum {
			IDENT_BEG = 33,
			IDENT_END = 127
		};

		std::string getIdentifer()
		{
			std::string res;
			size_t id = m_nextId++;
			do {
				res.push_back(char(IDENT_BEG + id % (IDENT_END - IDENT_BEG)));
				id /= (IDENT_END - IDENT_BEG);
			} while (id != 0);
			return res;
		}
	protected:
		size_t m_nextId = 0;
	};

	VCDSink::VCDSink(Simulator &simulator, const char *filename) :
		m_simulator(simulator),
		m_VCD(filename)
	{
		m_simulator.addCallbacks(this);
	}

	void VCDSink::declareNode(const SimulationNode &node, VCDIdentifierGenerator &identifiers)
	{
		auto scope = m_VCD.openModule(node.getName());

		for (auto *element : node.getStateElements()) {
			auto code = identifiers.getIdentifer();
			if (element->width() == 0)
				m_VCD.declareString(code, element->getName());
			else
				m_VCD.declareVector(element->width(), code, element->getName());
			m_stateElements.emplace_back(element, code);
		}

		for (auto *child : node.getChildren())
			declareNode(*child, identifiers);
	}

	void VCDSink::onPowerOn()
	{
		KMEM_DESIGNCHECK_HINT(!m_initialized, "A VCD file can only record a single power on of the simulation.");
		m_initialized = true;

		VCDIdentifierGenerator identifiers;

		m_clockCode = identifiers.getIdentifer();
		m_VCD.declareVector(1, m_clockCode, m_simulator.getClock()->getName());

		for (auto *root : m_simulator.getRootNodes())
			declareNode(*root, identifiers);

		{
			auto scope = m_VCD.openModule(syntheticModuleName);
			m_debugMessageCode = identifiers.getIdentifer();
			m_VCD.declareString(m_debugMessageCode, debugMessagesLabel);
			m_warningsCode = identifiers.getIdentifer();
			m_VCD.declareString(m_warningsCode, warningsLabel);
			m_assertsCode = identifiers.getIdentifer();
			m_VCD.declareString(m_assertsCode, assertsLabel);
		}
	}

	void VCDSink::onDebugMessage(const SimulationNode *src, std::string msg)
	{
		m_pendingMessages.emplace_back(m_debugMessageCode, std::move(msg));
	}

	void VCDSink::onWarning(const SimulationNode *src, std::string msg)
	{
		m_pendingMessages.emplace_back(m_warningsCode, std::move(msg));
	}

	void VCDSink::onAssert(const SimulationNode *src, std::string msg)
	{
		m_pendingMessages.emplace_back(m_assertsCode, std::move(msg));
	}

	void VCDSink::onCommitState()
	{
		if (!m_initialized)
			return;

		bool activeLevel = m_simulator.getClock()->getTriggerEvent() == ClockConfig::TriggerEvent::RISING;
		auto time = m_simulator.getCurrentSimulationTime();

		if (m_firstCommit) {
			m_firstCommit = false;

			// initial values at time zero
			auto scope = m_VCD.openInitialValues();
			m_VCD.writeBit(m_clockCode, !activeLevel);
			for (auto &e : m_stateElements)
				e.first->dump(m_VCD, e.second, true);
			m_VCD.writeString(m_debugMessageCode, "");
			m_VCD.writeString(m_warningsCode, "");
			m_VCD.writeString(m_assertsCode, "");
		} else {
			m_VCD.writeTime(toPicoseconds(time));
			m_VCD.writeBit(m_clockCode, activeLevel);
			for (auto &e : m_stateElements)
				e.first->dump(m_VCD, e.second, false);
		}

		for (auto &msg : m_pendingMessages)
			m_VCD.writeString(msg.first, msg.second);
		m_pendingMessages.clear();

		if (m_simulator.getCurrentTick() > 0) {
			m_VCD.writeTime(toPicoseconds(time + m_simulator.getClock()->period() / ClockRational(2)));
			m_VCD.writeBit(m_clockCode, !activeLevel);
		}
		m_VCD.flush();
	}
}
