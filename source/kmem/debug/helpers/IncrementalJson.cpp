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

#include "IncrementalJson.h"

namespace kmem::dbg::json {

IncrementalArray::Appender::Appender(IncrementalArray &file) : m_file(file)
{
	// drop the closing "\n]" and separate from the previous element
	m_file.m_stream.seekp(-2, std::ios_base::cur);
	if (m_file.m_numEntries != 0)
		m_file.m_stream << ',';
	m_file.m_stream << '\n';
	m_file.m_numEntries++;
}

IncrementalArray::Appender::~Appender()
{
	m_file.m_stream << "\n]" << std::flush;
}


IncrementalArray::IncrementalArray(const std::filesystem::path &filename, std::string_view arrayName)
{
	open(filename, arrayName);
}

void IncrementalArray::open(const std::filesystem::path &filename, std::string_view arrayName)
{
	m_filename = filename;
	m_numEntries = 0;
	m_stream.exceptions(std::fstream::badbit | std::fstream::failbit);
	m_stream.open(m_filename.string(), std::ios::binary | std::fstream::out | std::fstream::trunc);

	m_stream << "var " << arrayName << " = [\n]" << std::flush;
}

}
