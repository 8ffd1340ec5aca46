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
#include "SimulationProcess.h"

namespace kmem::sim {

thread_local SimulationCoroutineHandler *SimulationCoroutineHandler::activeHandler = nullptr;

namespace {
	struct ActiveHandlerScope {
		ActiveHandlerScope(SimulationCoroutineHandler *handler) : m_last(SimulationCoroutineHandler::activeHandler) { SimulationCoroutineHandler::activeHandler = handler; }
		~ActiveHandlerScope() { SimulationCoroutineHandler::activeHandler = m_last; }
		SimulationCoroutineHandler *m_last;
	};
}

SimulationCoroutineHandler::~SimulationCoroutineHandler()
{
	stopAll();
}

void SimulationCoroutineHandler::stopAll()
{
	ActiveHandlerScope scope(this);
	while (!m_coroutinesReadyToResume.empty())
		m_coroutinesReadyToResume.pop();
	m_simulationCoroutines.clear();
}

void SimulationCoroutineHandler::run()
{
	ActiveHandlerScope scope(this);
	while (!m_coroutinesReadyToResume.empty()) {
		auto handle = m_coroutinesReadyToResume.front();
		m_coroutinesReadyToResume.pop();
		handle.resume();
	}
}

void SimulationCoroutineHandler::coroutineFinalSuspending(std::coroutine_handle<> handle)
{
	auto it = m_simulationCoroutines.find(handle.address());
	if (it != m_simulationCoroutines.end())
		m_simulationCoroutines.erase(it);
}


template class SimulationFunction<void>;
template class SimulationFunction<bool>;
template class SimulationFunction<size_t>;
template class SimulationFunction<std::uint32_t>;

}
