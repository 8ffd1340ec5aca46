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

#include <kmem/simulation/SimulationNode.h>
#include <kmem/simulation/Reg.h>

#include <cstdint>

/// Counts the clock edges on which enable was high.
class CounterNode : public kmem::sim::SimulationNode
{
	public:
		enum class Phase {
			Stopped,
			Counting,
		};

		CounterNode(SimulationNode *parent = nullptr) :
			SimulationNode("counter", parent),
			enable(*this, "enable", false),
			count(*this, "count", 0u),
			phase(*this, "phase", Phase::Stopped) { }

		kmem::sim::Wire<bool> enable;
		kmem::sim::Reg<std::uint32_t> count;
		kmem::sim::Reg<Phase> phase;

		virtual void simulateEvaluate(kmem::sim::SimulatorCallbacks &simCallbacks) override {
			if (*enable)
				count = *count + 1;
			phase = *enable ? Phase::Counting : Phase::Stopped;
		}
};
