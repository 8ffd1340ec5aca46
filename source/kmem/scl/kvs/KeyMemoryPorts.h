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

#include "../../simulation/Reg.h"

#include <cstdint>

namespace kmem::scl
{
	/// Inputs of the host management port. Writes are captured on the clock edge, read data is combinational.
	struct HostBusInputs
	{
		HostBusInputs(sim::SimulationNode &owner) :
			cs(owner, "host_cs", false),
			we(owner, "host_we", false),
			address(owner, "host_address", std::uint8_t(0)),
			writeData(owner, "host_write_data", 0u) { }

		sim::Wire<bool> cs;
		sim::Wire<bool> we;
		sim::Wire<std::uint8_t> address;
		sim::Wire<std::uint32_t> writeData;
	};

	/// Inputs of the client lookup port. A request is taken while the ready output is high.
	struct ClientRequestInputs
	{
		ClientRequestInputs(sim::SimulationNode &owner) :
			getKeyMd5(owner, "client_get_key_md5", false),
			getKeySha1(owner, "client_get_key_sha1", false),
			keyId(owner, "client_key_id", 0u) { }

		sim::Wire<bool> getKeyMd5;
		sim::Wire<bool> getKeySha1;
		sim::Wire<std::uint32_t> keyId;

		bool requested() const { return *getKeyMd5 || *getKeySha1; }
	};
}
