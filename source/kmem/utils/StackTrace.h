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

#include <boost/stacktrace.hpp>

#include <ostream>
#include <string>
#include <vector>


namespace kmem::utils {

	/// Call stack captured at the point an error was raised.
	class StackTrace
	{
	public:
		/// Captures at most maxDepth frames, omitting the innermost skipFrames.
		void capture(size_t maxDepth, size_t skipFrames);

		size_t depth() const { return m_frames.size(); }
		/// One "function at file:line" line per frame, innermost first.
		std::vector<std::string> describe() const;
		/// Like describe() but only with the frames of the key memory components and the user code up to main.
		std::vector<std::string> describeRelevant() const;
	protected:
		std::vector<boost::stacktrace::frame> m_frames;
	};

	std::ostream &operator<<(std::ostream &stream, const StackTrace &trace);
}
