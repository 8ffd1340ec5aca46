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
#include "HostLoader.h"

#include "ShadowIndex.h"
#include "../../utils/BitManipulation.h"
#include "ValidityMasks.h"
#include "../memory/DualPortMemory.h"

#include "../../debug/DebugInterface.h"
#include "../../utils/Exceptions.h"

#include <magic_enum.hpp>

namespace kmem::scl
{
	using dbg::LogMessage;

	HostLoader::HostLoader(SimulationNode *parent, const KeyMemoryConfig &config, const HostBusInputs &bus,
							DualPortMemory &store, ShadowIndex &shadow, ValidityMasks &validity) :
		SimulationNode("host_loader", parent),
		m_config(config),
		m_bus(bus),
		m_store(store),
		m_shadow(shadow),
		m_validity(validity),
		m_state(*this, "state", State::Reset),
		m_busy(*this, "busy", true),
		m_scrubDone(*this, "scrub_done", false),
		m_scrubAddress(*this, "scrub_address", 0u, utils::Log2C(config.numSlots * WORDS_PER_SLOT)),
		m_activeSlot(*this, "active_slot", 0u, config.slotSelectWidth()),
		m_readData(*this, "read_data", 0u)
	{
		static const char *mirrorNames[WORDS_PER_SLOT] = { "key_id", "counter_msb", "counter_lsb", "key0", "key1", "key2", "key3", "key4" };
		for (auto name : mirrorNames)
			m_mirror.push_back(std::make_unique<sim::Reg<std::uint32_t>>(*this, name, 0u));
	}

	std::uint32_t HostLoader::readRegister(std::uint8_t address) const
	{
		switch (address) {
			case ADDR_NAME0: return CORE_NAME0;
			case ADDR_NAME1: return CORE_NAME1;
			case ADDR_VERSION: return CORE_VERSION;
			case ADDR_STATUS: return *m_busy ? STATUS_BUSY_BIT : 0u;
			case ADDR_NUM_SLOTS: return (std::uint32_t) m_config.numSlots;
			case ADDR_ACTIVE_SLOT: return *m_activeSlot;
			case ADDR_VALID:
				return (m_validity.isValid(*m_activeSlot, KeyDomain::MD5) ? VALID_MD5_BIT : 0u) |
						(m_validity.isValid(*m_activeSlot, KeyDomain::SHA1) ? VALID_SHA1_BIT : 0u);
			default: {
				size_t word;
				if (slotWordOfAddress(address, word))
					return **m_mirror[word];
				return 0;
			}
		}
	}

	void HostLoader::simulateEvaluate(sim::SimulatorCallbacks &simCallbacks)
	{
		m_readData = m_store.q(DualPortMemory::Port::A);

		if (*m_bus.cs) {
			if (*m_bus.we)
				decodeWrite();
			else
				decodeRead();
		}

		switch (*m_state) {
			case State::Idle:
			break;
			case State::Reset:
				scrubStep();
			break;
			case State::LoadId:
			case State::LoadCounterHigh:
			case State::LoadCounterLow:
			case State::LoadKey0:
			case State::LoadKey1:
			case State::LoadKey2:
			case State::LoadKey3:
			case State::LoadKey4:
			case State::Wait0:
			case State::Wait1:
				loadStep();
			break;
			default:
				m_state = State::Idle;
				m_busy = false;
		}
	}

	void HostLoader::scrubStep()
	{
		const std::uint32_t address = *m_scrubAddress;
		m_store.requestWrite(DualPortMemory::Port::A, address, 0);
		if (address % WORDS_PER_SLOT == WORD_KEY_ID)
			m_shadow.write(address / WORDS_PER_SLOT, 0);

		if (address + 1 == m_store.size()) {
			m_state = State::Idle;
			m_busy = false;
			m_scrubDone = true;
			dbg::log(LogMessage() << LogMessage::LOG_INFO << LogMessage::LOG_HOST_PORT
				<< "scrub of " << m_store.size() << " words finished");
		} else {
			m_scrubAddress = address + 1;
		}
	}

	void HostLoader::loadStep()
	{
		const size_t step = (size_t) *m_state - (size_t) State::LoadId;

		// The eight load states present the word addresses, the read data arrives two states later.
		if (step < WORDS_PER_SLOT)
			m_store.requestRead(DualPortMemory::Port::A, storeAddress(step));
		if (step >= 2)
			*m_mirror[step - 2] = *m_readData;

		if (*m_state == State::Wait1) {
			m_state = State::Idle;
			m_busy = false;
			dbg::log(LogMessage() << LogMessage::LOG_INFO << LogMessage::LOG_HOST_PORT << LogMessage::Anchor{ *m_activeSlot }
				<< "finished loading " << LogMessage::Slot{ *m_activeSlot });
		} else {
			m_state = State((size_t) *m_state + 1);
		}
	}

	void HostLoader::decodeWrite()
	{
		const std::uint8_t address = *m_bus.address;
		const std::uint32_t data = *m_bus.writeData;

		if (*m_state != State::Idle) {
			dbg::log(LogMessage() << LogMessage::LOG_WARNING << LogMessage::LOG_HOST_PORT << LogMessage::Anchor{ *m_activeSlot }
				<< "write of " << LogMessage::Word{ data } << " to address " << LogMessage::Word{ address }
				<< " ignored while busy (" << std::string(magic_enum::enum_name(*m_state)) << ")");
			return;
		}

		size_t word;
		if (slotWordOfAddress(address, word)) {
			m_store.requestWrite(DualPortMemory::Port::A, storeAddress(word), data);
			if (word == WORD_KEY_ID)
				m_shadow.write(*m_activeSlot, data);
			return;
		}

		switch (address) {
			case ADDR_ACTIVE_SLOT:
				m_activeSlot = data & std::uint32_t(m_config.numSlots - 1);
			break;
			case ADDR_VALID:
				m_validity.set(*m_activeSlot, data & VALID_MD5_BIT, data & VALID_SHA1_BIT);
				dbg::log(LogMessage() << LogMessage::LOG_INFO << LogMessage::LOG_HOST_PORT << LogMessage::Anchor{ *m_activeSlot }
					<< LogMessage::Slot{ *m_activeSlot } << " valid md5: " << ((data & VALID_MD5_BIT) ? "yes" : "no")
					<< " sha1: " << ((data & VALID_SHA1_BIT) ? "yes" : "no"));
			break;
			case ADDR_CTRL:
				if (data & CTRL_LOAD_BIT) {
					m_state = State::LoadId;
					m_busy = true;
					dbg::log(LogMessage() << LogMessage::LOG_INFO << LogMessage::LOG_HOST_PORT << LogMessage::Anchor{ *m_activeSlot }
						<< "loading " << LogMessage::Slot{ *m_activeSlot });
				}
			break;
			default:
				dbg::log(LogMessage() << LogMessage::LOG_WARNING << LogMessage::LOG_HOST_PORT
					<< "write of " << LogMessage::Word{ data } << " to read only or unmapped address " << LogMessage::Word{ address } << " ignored");
		}
	}

	void HostLoader::decodeRead() const
	{
		const std::uint8_t address = *m_bus.address;

		size_t word;
		if (slotWordOfAddress(address, word))
			return;

		switch (address) {
			case ADDR_NAME0:
			case ADDR_NAME1:
			case ADDR_VERSION:
			case ADDR_STATUS:
			case ADDR_NUM_SLOTS:
			case ADDR_ACTIVE_SLOT:
			case ADDR_VALID:
			break;
			case ADDR_CTRL:
				dbg::log(LogMessage() << LogMessage::LOG_WARNING << LogMessage::LOG_HOST_PORT
					<< "read of write only address " << LogMessage::Word{ address });
			break;
			default:
				dbg::log(LogMessage() << LogMessage::LOG_WARNING << LogMessage::LOG_HOST_PORT
					<< "read of unmapped address " << LogMessage::Word{ address });
		}
	}
}
