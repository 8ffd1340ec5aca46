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
#include "StackTrace.h"

#include <boost/format.hpp>

#include <algorithm>
#include <iterator>

namespace kmem::utils
{
	namespace {
		std::string describeFrame(const boost::stacktrace::frame &frame)
		{
			return (boost::format("%s at %s:%d") % frame.name() % frame.source_file() % frame.source_line()).str();
		}

		bool isPlumbing(const std::string &description)
		{
			if (description.starts_with("boost::") || description.starts_with("std::"))
				return true;
			return description.starts_with("kmem::") && !description.starts_with("kmem::scl::");
		}
	}

	void StackTrace::capture(size_t maxDepth, size_t skipFrames)
	{
		const boost::stacktrace::stacktrace trace(skipFrames, maxDepth);
		m_frames.assign(trace.begin(), trace.end());
	}

	std::vector<std::string> StackTrace::describe() const
	{
		std::vector<std::string> lines;
		lines.reserve(m_frames.size());
		std::transform(m_frames.begin(), m_frames.end(), std::back_inserter(lines), describeFrame);
		return lines;
	}

	std::vector<std::string> StackTrace::describeRelevant() const
	{
		std::vector<std::string> lines = describe();
		std::erase_if(lines, isPlumbing);

		auto mainFrame = std::find_if(lines.begin(), lines.end(), [](const std::string &line) { return line.starts_with("main "); });
		if (mainFrame != lines.end())
			lines.erase(std::next(mainFrame), lines.end());

		return lines;
	}

	std::ostream &operator<<(std::ostream &stream, const StackTrace &trace)
	{
		size_t index = 0;
		for (const auto &line : trace.describe())
			stream << '\t' << index++ << ": " << line << '\n';
		return stream;
	}
}
