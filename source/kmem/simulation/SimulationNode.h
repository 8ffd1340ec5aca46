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

#include <string>
#include <vector>

namespace kmem::sim {

class SimulatorCallbacks;
class StateElement;

/**
 * @brief Clocked component of the simulated hardware.
 * @details All nodes of a simulation share one clock. On every clock edge the simulator first calls simulateEvaluate on all nodes,
 * which compute their next state purely from committed state and inputs, and then simulateAdvance on all nodes, which commits it.
 * The order in which nodes are evaluated therefore does not matter.
 *
 * Nodes form a hierarchy (children register with their parent on construction) which is mirrored in waveforms.
 */
class SimulationNode
{
	public:
		SimulationNode(std::string name, SimulationNode *parent = nullptr);
		virtual ~SimulationNode() = default;

		SimulationNode(const SimulationNode&) = delete;
		SimulationNode &operator=(const SimulationNode&) = delete;

		const std::string &getName() const { return m_name; }
		std::string getPath() const;
		SimulationNode *getParent() const { return m_parent; }
		const std::vector<SimulationNode*> &getChildren() const { return m_children; }
		const std::vector<StateElement*> &getStateElements() const { return m_stateElements; }

		/// Puts all state elements into their power on state.
		virtual void simulateReset(SimulatorCallbacks &simCallbacks);
		/// Computes the next state from the committed state and inputs.
		virtual void simulateEvaluate(SimulatorCallbacks &simCallbacks) { }
		/// Commits the next state of all registers.
		virtual void simulateAdvance(SimulatorCallbacks &simCallbacks);

	protected:
		std::string m_name;
		SimulationNode *m_parent;
		std::vector<SimulationNode*> m_children;
		std::vector<StateElement*> m_stateElements;

		friend class StateElement;
};

/// Flattens a node hierarchy in pre-order.
std::vector<SimulationNode*> collectNodes(SimulationNode &root);

}
