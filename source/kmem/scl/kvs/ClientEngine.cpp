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
#include "ClientEngine.h"

#include "HostLoader.h"
#include "ShadowIndex.h"
#include "SlotCounter.h"
#include "ValidityMasks.h"
#include "../memory/DualPortMemory.h"

#include "../../debug/DebugInterface.h"

#include <magic_enum.hpp>

namespace kmem::scl
{
	using dbg::LogMessage;

	ClientEngine::ClientEngine(SimulationNode *parent, const KeyMemoryConfig &config, const ClientRequestInputs &request,
								DualPortMemory &store, const ShadowIndex &shadow, const ValidityMasks &validity, const HostLoader &hostLoader) :
		SimulationNode("client_engine", parent),
		m_request(request),
		m_store(store),
		m_shadow(shadow),
		m_validity(validity),
		m_hostLoader(hostLoader),
		m_state(*this, "state", State::StartupWait),
		m_domain(*this, "domain", KeyDomain::MD5),
		m_keyId(*this, "key_id", 0u),
		m_mask(*this, "mask", boost::dynamic_bitset<>(config.numSlots)),
		m_match(*this, "match", boost::dynamic_bitset<>(config.numSlots)),
		m_found(*this, "found", false),
		m_slot(*this, "slot", 0u, config.slotSelectWidth()),
		m_readData(*this, "read_data", 0u),
		m_counterMsb(*this, "counter_msb", 0u),
		m_counterLsb(*this, "counter_lsb", 0u),
		m_ready(*this, "ready", false),
		m_keyValid(*this, "key_valid", false),
		m_keyWord(*this, "key_word", std::uint8_t(0), 3),
		m_keyData(*this, "key_data", 0u)
	{
	}

	void ClientEngine::simulateEvaluate(sim::SimulatorCallbacks &simCallbacks)
	{
		m_readData = m_store.q(DualPortMemory::Port::B);
		m_keyValid = false;

		switch (*m_state) {
			case State::StartupWait:
				if (m_hostLoader.scrubDone()) {
					m_state = State::Idle;
					m_ready = true;
				}
			break;
			case State::Idle:
				if (m_request.requested())
					acceptRequest();
			break;
			case State::SearchBuildMatch:
				m_match = m_shadow.match(*m_keyId) & *m_mask;
				m_state = State::SearchPick;
			break;
			case State::SearchPick:
				pickSlot();
				m_state = State::SearchBranch;
			break;
			case State::SearchBranch:
				branch();
			break;
			case State::LoadCounterHigh:
			case State::LoadCounterLow:
			case State::LoadKey0:
			case State::LoadKey1:
			case State::LoadKey2:
			case State::LoadKey3:
			case State::LoadKey4:
			case State::WriteCounterHigh:
			case State::WriteCounterLow:
				fetchStep();
			break;
			case State::NotFound:
				m_ready = true;
				m_state = State::Idle;
			break;
			default:
				m_ready = true;
				m_state = State::Idle;
		}
	}

	void ClientEngine::acceptRequest()
	{
		// Both selectors asserted is not a valid request, md5 takes precedence.
		const KeyDomain domain = *m_request.getKeyMd5 ? KeyDomain::MD5 : KeyDomain::SHA1;

		m_domain = domain;
		m_keyId = *m_request.keyId;
		m_mask = m_validity.mask(domain);
		m_ready = false;
		m_state = State::SearchBuildMatch;

		dbg::log(LogMessage() << LogMessage::LOG_INFO << LogMessage::LOG_CLIENT_PORT
			<< "lookup of key id " << LogMessage::Word{ *m_request.keyId } << " for " << magic_enum::enum_name(domain));
	}

	void ClientEngine::pickSlot()
	{
		bool found = false;
		std::uint32_t slot = 0;
		for (size_t i = 0; i < m_match->size(); i++)
			if ((*m_match)[i]) {
				found = true;
				slot = (std::uint32_t) i;
			}

		m_found = found;
		m_slot = slot;
	}

	void ClientEngine::branch()
	{
		if (*m_found) {
			m_state = State::LoadCounterHigh;
			dbg::log(LogMessage() << LogMessage::LOG_INFO << LogMessage::LOG_CLIENT_PORT << LogMessage::Anchor{ *m_slot }
				<< "key id " << LogMessage::Word{ *m_keyId } << " found in " << LogMessage::Slot{ *m_slot });
		} else {
			m_state = State::NotFound;
			dbg::log(LogMessage() << LogMessage::LOG_INFO << LogMessage::LOG_CLIENT_PORT
				<< "key id " << LogMessage::Word{ *m_keyId } << " not found for " << magic_enum::enum_name(*m_domain));
		}
	}

	void ClientEngine::fetchStep()
	{
		const size_t step = (size_t) *m_state - (size_t) State::LoadCounterHigh;

		// Addresses of counter high, counter low and the key words, the data arrives two states later.
		if (step < WORDS_PER_SLOT - 1)
			m_store.requestRead(DualPortMemory::Port::B, storeAddress(WORD_COUNTER_MSB + step));

		if (step == 2)
			m_counterMsb = *m_readData;
		if (step == 3)
			m_counterLsb = *m_readData;

		if (step >= 4) {
			m_keyValid = true;
			m_keyWord = std::uint8_t(step - 4);
			m_keyData = *m_readData;
		}

		const SlotCounter incremented = incrementCounter({ .msb = *m_counterMsb, .lsb = *m_counterLsb });

		switch (*m_state) {
			case State::WriteCounterHigh:
				m_store.requestWrite(DualPortMemory::Port::B, storeAddress(WORD_COUNTER_MSB), incremented.msb);
				m_state = State::WriteCounterLow;
			break;
			case State::WriteCounterLow:
				m_store.requestWrite(DualPortMemory::Port::B, storeAddress(WORD_COUNTER_LSB), incremented.lsb);
				m_ready = true;
				m_state = State::Idle;
				dbg::log(LogMessage() << LogMessage::LOG_INFO << LogMessage::LOG_CLIENT_PORT << LogMessage::Anchor{ *m_slot }
					<< LogMessage::Slot{ *m_slot } << " delivered, counter now " << LogMessage::Word{ incremented.msb } << ":" << LogMessage::Word{ incremented.lsb });
			break;
			default:
				m_state = State((size_t) *m_state + 1);
		}
	}
}
