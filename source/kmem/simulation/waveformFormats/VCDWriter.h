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

#include <boost/dynamic_bitset.hpp>

#include <cstdint>
#include <fstream>
#include <string>
#include <string_view>

namespace kmem::sim
{
	/**
	 * @brief Streams a value change dump file.
	 * @details All declarations (modules and variables) have to be made before the initial values are opened.
	 * Values are always fully defined, the key memory has no undefined or high impedance states.
	 */
	class VCDWriter
	{
	public:
		/// Emits the closing keyword of a module or of the initial value block when leaving the C++ scope.
		class Section
		{
		public:
			Section(std::ofstream &file, const char *closing) : m_file(file), m_closing(closing) { }
			Section(const Section &) = delete;
			Section &operator=(const Section &) = delete;
			~Section() { m_file << m_closing; }
		private:
			std::ofstream &m_file;
			const char *m_closing;
		};

		VCDWriter(std::string filename);

		const std::string &filename() const { return m_filename; }

		[[nodiscard]] Section openModule(std::string_view name);
		void declareVector(size_t width, std::string_view code, std::string_view label);
		void declareString(std::string_view code, std::string_view label);

		[[nodiscard]] Section openInitialValues();
		void writeTime(std::uint64_t picoseconds);
		void writeBit(std::string_view code, bool value);
		void writeVector(std::string_view code, size_t width, std::uint64_t value);
		void writeVector(std::string_view code, const boost::dynamic_bitset<> &value);
		void writeString(std::string_view code, std::string_view text);
		void flush() { m_file.flush(); }

	protected:
		std::ofstream m_file;
		std::string m_filename;
		bool m_declarationsDone = false;
	};
}
