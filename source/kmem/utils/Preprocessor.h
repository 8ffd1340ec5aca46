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

#define KMEM_ASSERT(x) { if (!(x)) { throw kmem::utils::InternalError(__FILE__, __LINE__, std::string("Assertion failed: ") + #x); }}
#define KMEM_ASSERT_HINT(x, message) { if (!(x)) { throw kmem::utils::InternalError(__FILE__, __LINE__, std::string("Assertion failed: ") + #x + " Hint: " + message); }}


#define KMEM_DESIGNCHECK(x) { if (!(x)) { throw kmem::utils::DesignError(__FILE__, __LINE__, std::string("Design failed: ") + #x); }}
#define KMEM_DESIGNCHECK_HINT(x, message) { if (!(x)) { throw kmem::utils::DesignError(__FILE__, __LINE__, std::string("Design failed: ") + #x + " Hint: " + message); }}
