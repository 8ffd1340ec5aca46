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
#include "VCDWriter.h"
#include "../../utils/Exceptions.h"

#include <chrono>
#include <ctime>
#include <filesystem>
#include <iomanip>

namespace kmem::sim
{
	VCDWriter::VCDWriter(std::string filename) : m_filename(std::move(filename))
	{
		const auto directory = std::filesystem::path(m_filename).parent_path();
		if (!directory.empty())
			std::filesystem::create_directories(directory);

		m_file.open(m_filename, std::ofstream::binary);
		if (!m_file)
			throw std::runtime_error("Could not open vcd file for writing: " + m_filename);

		const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
		std::tm localNow;
		localtime_r(&now, &localNow);

		m_file << "$date\n" << std::put_time(&localNow, "%Y-%m-%d %X") << "\n$end\n";
		m_file << "$version\nKMem simulation output\n$end\n";
		m_file << "$timescale\n1ps\n$end\n";
	}

	VCDWriter::Section VCDWriter::openModule(std::string_view name)
	{
		KMEM_ASSERT_HINT(!m_declarationsDone, "modules must be declared before the initial values");
		KMEM_ASSERT(!name.empty());
		m_file << "$scope module " << name << " $end\n";
		return Section(m_file, "$upscope $end\n");
	}

	void VCDWriter::declareVector(size_t width, std::string_view code, std::string_view label)
	{
		KMEM_ASSERT(!m_declarationsDone);
		m_file << "$var wire " << width << ' ' << code << ' ' << label << " $end\n";
	}

	void VCDWriter::declareString(std::string_view code, std::string_view label)
	{
		KMEM_ASSERT(!m_declarationsDone);
		m_file << "$var string 0 " << code << ' ' << label << " $end\n";
	}

	VCDWriter::Section VCDWriter::openInitialValues()
	{
		KMEM_ASSERT(!m_declarationsDone);
		m_declarationsDone = true;
		m_file << "$enddefinitions $end\n$dumpvars\n";
		return Section(m_file, "$end\n");
	}

	void VCDWriter::writeTime(std::uint64_t picoseconds)
	{
		KMEM_ASSERT(m_declarationsDone);
		m_file << '#' << picoseconds << '\n';
	}

	void VCDWriter::writeBit(std::string_view code, bool value)
	{
		KMEM_ASSERT(m_declarationsDone);
		m_file << (value ? '1' : '0') << code << '\n';
	}

	void VCDWriter::writeVector(std::string_view code, size_t width, std::uint64_t value)
	{
		KMEM_ASSERT(m_declarationsDone);
		KMEM_ASSERT_HINT(width <= 64, "wider vectors are written from a dynamic_bitset");

		m_file << 'b';
		for (size_t bit = width; bit > 0; --bit)
			m_file << (((value >> (bit - 1)) & 1) ? '1' : '0');
		m_file << ' ' << code << '\n';
	}

	void VCDWriter::writeVector(std::string_view code, const boost::dynamic_bitset<> &value)
	{
		KMEM_ASSERT(m_declarationsDone);

		std::string bits;
		boost::to_string(value, bits);
		m_file << 'b' << bits << ' ' << code << '\n';
	}

	void VCDWriter::writeString(std::string_view code, std::string_view text)
	{
		KMEM_ASSERT(m_declarationsDone);

		// Spaces separate the value from the identifier, an empty string is written as a single escaped space.
		m_file << 's';
		if (text.empty())
			m_file << "\\x20";
		for (char c : text) {
			if (c == ' ')
				m_file << "\\x20";
			else
				m_file << c;
		}
		m_file << ' ' << code << '\n';
	}
}
