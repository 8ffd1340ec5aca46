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
#include "KeyMemoryClientModel.h"

#include <boost/format.hpp>

namespace kmem::scl
{
	namespace {
		void reportAssert(const KeyMemory &dut, std::string msg)
		{
			auto *simulator = sim::Simulator::current();
			KMEM_ASSERT(simulator != nullptr);
			simulator->onAssert(&dut, std::move(msg));
		}
	}

	KeyMemoryClientModel::KeyMemoryClientModel(KeyMemory &dut, const Clock &clock) :
		m_dut(dut),
		m_clock(clock)
	{
	}

	SimProcess KeyMemoryClientModel::waitReady()
	{
		while (!m_dut.ready())
			co_await OnClk(m_clock);
	}

	SimFunction<LookupResult> KeyMemoryClientModel::lookup(KeyDomain domain, std::uint32_t keyId)
	{
		co_await waitReady();

		auto &request = m_dut.clientRequest();
		request.getKeyMd5 = domain == KeyDomain::MD5;
		request.getKeySha1 = domain == KeyDomain::SHA1;
		request.keyId = keyId;

		co_await OnClk(m_clock);

		request.getKeyMd5 = false;
		request.getKeySha1 = false;

		LookupResult result;
		result.steps = 1;

		if (m_dut.ready())
			reportAssert(m_dut, "Lookup request was not accepted.");

		while (true) {
			if (m_dut.keyValid()) {
				result.words.push_back(m_dut.keyData());
				result.wordIndices.push_back(m_dut.keyWord());
			}
			if (m_dut.ready())
				break;
			co_await OnClk(m_clock);
			result.steps++;
		}

		if (!result.words.empty() && !result.found())
			reportAssert(m_dut, (boost::format("Lookup of key id 0x%08x delivered %d key words instead of %d.") % keyId % result.words.size() % KEY_WORDS).str());

		for (size_t i = 0; i < result.wordIndices.size(); i++)
			if (size_t(result.wordIndices[i]) != i)
				reportAssert(m_dut, (boost::format("Key word %d was delivered with word index %d.") % i % unsigned(result.wordIndices[i])).str());

		co_return result;
	}

	SimProcess validateClientPort(const KeyMemory &dut, const Clock &clock)
	{
		size_t expectedWord = 0;
		while (true) {
			if (dut.keyValid()) {
				if (dut.keyWord() != expectedWord)
					reportAssert(dut, (boost::format("Key word index %d delivered, expected %d.") % unsigned(dut.keyWord()) % expectedWord).str());
				// The last key word is delivered together with ready going high.
				if (dut.ready() && size_t(dut.keyWord()) + 1 != KEY_WORDS)
					reportAssert(dut, "Key word delivered while the client port is ready.");
				expectedWord = size_t(dut.keyWord()) + 1;
			}
			if (dut.ready())
				expectedWord = 0;

			co_await OnClk(clock);
		}
	}
}
