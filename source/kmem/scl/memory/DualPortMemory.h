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

#include "../../simulation/SimulationNode.h"
#include "../../simulation/Reg.h"

#include <cstdint>
#include <optional>
#include <vector>

namespace kmem::scl
{
	/**
	 * @brief Word addressed memory with two independent read/write ports.
	 * @details Requests are issued by the owners of the ports while they evaluate. A read registers the addressed word in the port's
	 * output register on the clock edge (read-first: a write to the same word on the same edge is not yet visible). Writes become visible
	 * to both ports after the clock edge. If both ports write the same word on the same edge, port B wins and a warning is issued.
	 */
	class DualPortMemory : public sim::SimulationNode
	{
	public:
		enum class Port {
			A,
			B
		};

		DualPortMemory(std::string name, SimulationNode *parent, size_t numWords, std::uint32_t uninitializedPattern);

		size_t size() const { return m_data.size(); }

		void requestRead(Port port, size_t address);
		void requestWrite(Port port, size_t address, std::uint32_t data);

		/// Output register of a port, holds the word of the last read request.
		std::uint32_t q(Port port) const { return port == Port::A ? *m_qA : *m_qB; }

		/// Direct access to the committed content, bypassing the ports.
		std::uint32_t peek(size_t address) const;

		virtual void simulateReset(sim::SimulatorCallbacks &simCallbacks) override;
		virtual void simulateAdvance(sim::SimulatorCallbacks &simCallbacks) override;
	protected:
		struct PendingWrite {
			size_t address;
			std::uint32_t data;
		};

		std::vector<std::uint32_t> m_data;
		std::uint32_t m_uninitializedPattern;

		sim::Reg<std::uint32_t> m_qA;
		sim::Reg<std::uint32_t> m_qB;

		std::optional<PendingWrite> m_writeA;
		std::optional<PendingWrite> m_writeB;

		std::optional<PendingWrite> &pendingWrite(Port port) { return port == Port::A ? m_writeA : m_writeB; }
	};
}
