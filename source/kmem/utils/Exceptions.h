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

#include "StackTrace.h"
#include "Preprocessor.h"

#include <boost/lexical_cast.hpp>

#include <stdexcept>
#include <iostream>


namespace kmem::utils {

std::string composeKMemErrorString(const char *file, size_t line, const std::string &what);


/**
 * @brief Base for all errors raised by the model, records where it was thrown and the call stack leading there.
 */
template<class BaseError>
class KMemError : public BaseError
{
	public:
		KMemError(const char *file, size_t line, const std::string &what) :
				BaseError(composeKMemErrorString(file, line, what)) {

			m_trace.capture(20, 1);
		}
		inline const StackTrace &getStackTrace() const { return m_trace; }
	protected:
		StackTrace m_trace;
};

extern template class KMemError<std::logic_error>;
extern template class KMemError<std::runtime_error>;


/// Broken invariant inside the model itself.
class InternalError : public KMemError<std::logic_error>
{
	public:
		InternalError(const char *file, size_t line, const std::string &what);
		~InternalError();
};


/// Invalid configuration or invalid use of the model by its user.
class DesignError : public KMemError<std::runtime_error>
{
	public:
		DesignError(const char *file, size_t line, const std::string &what);
		~DesignError();
};


template<class BaseError>
std::ostream &operator<<(std::ostream &stream, const KMemError<BaseError> &exception) {
	stream
		<< exception.what() << std::endl
		<< "Stack trace: " << std::endl
		<< exception.getStackTrace();

	return stream;
}

}
