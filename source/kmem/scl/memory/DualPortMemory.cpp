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
#include "DualPortMemory.h"

#include "../../simulation/SimulatorCallbacks.h"
#include "../../utils/Exceptions.h"

#include <boost/format.hpp>

namespace kmem::scl
{
	DualPortMemory::DualPortMemory(std::string name, SimulationNode *parent, size_t numWords, std::uint32_t uninitializedPattern) :
		SimulationNode(std::move(name), parent),
		m_data(numWords, uninitializedPattern),
		m_uninitializedPattern(uninitializedPattern),
		m_qA(*this, "port_a_q", uninitializedPattern),
		m_qB(*this, "port_b_q", uninitializedPattern)
	{
		KMEM_DESIGNCHECK(numWords > 0);
	}

	void DualPortMemory::requestRead(Port port, size_t address)
	{
		KMEM_ASSERT_HINT(address < m_data.size(), "Memory read out of range.");
		if (port == Port::A)
			m_qA = m_data[address];
		else
			m_qB = m_data[address];
	}

	void DualPortMemory::requestWrite(Port port, size_t address, std::uint32_t data)
	{
		KMEM_ASSERT_HINT(address < m_data.size(), "Memory write out of range.");
		auto &write = pendingWrite(port);
		KMEM_ASSERT_HINT(!write, "A memory port can only write one word per clock edge.");
		write = PendingWrite{ address, data };
	}

	std::uint32_t DualPortMemory::peek(size_t address) const
	{
		KMEM_DESIGNCHECK_HINT(address < m_data.size(), "Memory address out of range.");
		return m_data[address];
	}

	void DualPortMemory::simulateReset(sim::SimulatorCallbacks &simCallbacks)
	{
		SimulationNode::simulateReset(simCallbacks);
		std::fill(m_data.begin(), m_data.end(), m_uninitializedPattern);
		m_writeA.reset();
		m_writeB.reset();
	}

	void DualPortMemory::simulateAdvance(sim::SimulatorCallbacks &simCallbacks)
	{
		if (m_writeA && m_writeB && m_writeA->address == m_writeB->address)
			simCallbacks.onWarning(this, (boost::format("Both ports write address 0x%x on the same clock edge, port B wins.") % m_writeA->address).str());

		if (m_writeA)
			m_data[m_writeA->address] = m_writeA->data;
		if (m_writeB)
			m_data[m_writeB->address] = m_writeB->data;

		m_writeA.reset();
		m_writeB.reset();

		SimulationNode::simulateAdvance(simCallbacks);
	}
}
