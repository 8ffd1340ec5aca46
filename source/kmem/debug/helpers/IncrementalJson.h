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

#include <filesystem>
#include <fstream>
#include <string_view>

/**
 * @addtogroup kmem_logging
 * @{
 */

namespace kmem::dbg::json {

/**
 * @brief A json (java script) file holding one array that is kept well formed after every append.
 * @details The file reads `var name = [ ... ]`, so it can be loaded by a static html page while the simulation is still running.
 */
class IncrementalArray {
	public:
		IncrementalArray() = default;
		IncrementalArray(const std::filesystem::path &filename, std::string_view arrayName);
		void open(const std::filesystem::path &filename, std::string_view arrayName);
		bool isOpen() const { return m_stream.is_open(); }

		/// Scoped writer for one new array element, closes the array again on destruction.
		class Appender {
			public:
				Appender(IncrementalArray &file);
				~Appender();

				Appender(const Appender&) = delete;
				Appender &operator=(const Appender&) = delete;

				operator std::ostream&() { return m_file.m_stream; }
				template<typename T>
				Appender &operator<<(const T &v) { m_file.m_stream << v; return *this; }
			protected:
				IncrementalArray &m_file;
		};

		Appender append() { return Appender(*this); }
		size_t numEntries() const { return m_numEntries; }
		const std::filesystem::path &filename() const { return m_filename; }
	protected:
		std::ofstream m_stream;
		std::filesystem::path m_filename;
		size_t m_numEntries = 0;
};

}

/**@}*/
