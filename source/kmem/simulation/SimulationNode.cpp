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
#include "SimulationNode.h"
#include "Reg.h"

namespace kmem::sim {

StateElement::StateElement(SimulationNode &owner, std::string name) : m_owner(owner), m_name(std::move(name))
{
	m_owner.m_stateElements.push_back(this);
}


SimulationNode::SimulationNode(std::string name, SimulationNode *parent) : m_name(std::move(name)), m_parent(parent)
{
	if (m_parent)
		m_parent->m_children.push_back(this);
}

std::string SimulationNode::getPath() const
{
	if (m_parent == nullptr)
		return m_name;
	return m_parent->getPath() + '/' + m_name;
}

void SimulationNode::simulateReset(SimulatorCallbacks &simCallbacks)
{
	for (auto *e : m_stateElements)
		e->reset();
}

void SimulationNode::simulateAdvance(SimulatorCallbacks &simCallbacks)
{
	for (auto *e : m_stateElements)
		e->commit();
}

std::vector<SimulationNode*> collectNodes(SimulationNode &root)
{
	std::vector<SimulationNode*> nodes;
	std::vector<SimulationNode*> stack = { &root };
	while (!stack.empty()) {
		auto *n = stack.back();
		stack.pop_back();
		nodes.push_back(n);
		for (auto it = n->getChildren().rbegin(); it != n->getChildren().rend(); ++it)
			stack.push_back(*it);
	}
	return nodes;
}

}
