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

#include "JsonSerialization.h"
#include "../DebugInterface.h"
#include "../../utils/StackTrace.h"

#include <boost/format.hpp>
#include <magic_enum.hpp>

#include <sstream>

namespace kmem::dbg::json {

void serializeString(std::ostream &json, std::string_view str)
{
	json << '"';
	for (char c : str) {
		switch (c) {
			case '"': json << "\\\""; break;
			case '\\': json << "\\\\"; break;
			case '\n': json << "\\n"; break;
			case '\r': json << "\\r"; break;
			case '\t': json << "\\t"; break;
			default:
				if ((unsigned char) c < 0x20)
					json << boost::format("\\u%04x") % (unsigned) c;
				else
					json << c;
		}
	}
	json << '"';
}

void serializeStackTrace(std::ostream &json, const utils::StackTrace &trace)
{
	json << '[';
	bool first = true;
	for (const auto &frame : trace.describeRelevant()) {
		if (!first) json << ", ";
		first = false;
		serializeString(json, frame);
	}
	json << ']';
}

void serializeLogMessage(std::ostream &json, const LogMessage &msg, size_t tick)
{
	json
		<< "{ \"severity\": \"" << magic_enum::enum_name(msg.severity()) << "\",\n"
		<< "\"source\": \"" << magic_enum::enum_name(msg.source()) << "\",\n"
		<< "\"tick\": " << tick << ",\n";
	if (msg.anchor() != ~0ull)
		json << "\"anchor\": " << msg.anchor() << ",\n";
	if (msg.stackTrace()) {
		json << "\"stack_trace\": ";
		serializeStackTrace(json, *msg.stackTrace());
		json << ",\n";
	}
	json << "\"message_parts\": [\n";

	bool firstPart = true;
	for (const auto &part : msg.parts()) {
		if (!firstPart) json << ",\n";
		firstPart = false;

		if (std::holds_alternative<const char*>(part)) {
			json << "{\"type\": \"string\", \"data\": ";
			serializeString(json, std::get<const char*>(part));
			json << "}";
		} else if (std::holds_alternative<std::string>(part)) {
			json << "{\"type\": \"string\", \"data\": ";
			serializeString(json, std::get<std::string>(part));
			json << "}";
		} else if (std::holds_alternative<LogMessage::Slot>(part))
			json << "{\"type\": \"slot\", \"id\": " << std::get<LogMessage::Slot>(part).index << "}";
		else if (std::holds_alternative<LogMessage::Word>(part))
			json << "{\"type\": \"word\", \"data\": " << std::get<LogMessage::Word>(part).value << "}";
	}

	json << "]}";
}

std::string serializeLogMessage(const LogMessage &msg, size_t tick)
{
	std::stringstream json;
	serializeLogMessage(json, msg, tick);
	return json.str();
}

}
