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

#include "../utils/StackTrace.h"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace kmem {

/**
 * @addtogroup kmem_logging
 * @{
 */

namespace dbg {

/**
 * @brief Helper class for composing logging messages.
 * @details Similarly to std::ostream, it uses the << operator to concatenate message parts.
 * Message parts can refer to slots of the key memory or carry 32 bit words, such that the logging backend
 * can render these in whatever way is suitable.
 *
 * A common use case is `log(LogMessage() << LogMessage::LOG_WARNING << LogMessage::LOG_HOST_PORT << LogMessage::Anchor{ slot } << "write ignored while busy: " << LogMessage::Word{ data });`
 */
class LogMessage
{
	public:
		enum Severity {
			LOG_INFO,
			LOG_WARNING,
			LOG_ERROR
		};

		enum Source {
			LOG_HOST_PORT,
			LOG_CLIENT_PORT,
			LOG_SIMULATION,
			LOG_CONFIG
		};

		/// Slot the message is about, allows backends to filter messages by slot.
		struct Anchor {
			size_t slot;
		};

		/// Reference to a slot as part of the message text.
		struct Slot {
			size_t index;
		};

		/// 32 bit word, rendered in hex.
		struct Word {
			std::uint32_t value;
		};

		/// Creates an empty log message
		LogMessage();
		/// Same as `LogMessage() << c`
		LogMessage(const char *c);

		/// Sets the severity of the log message
		LogMessage &operator<<(Severity s) { m_severity = s; return *this; }
		/// Sets the origin of the log message
		LogMessage &operator<<(Source s) { m_source = s; return *this; }
		/// Sets a slot as the anchor or context of this log message.
		LogMessage &operator<<(Anchor a) { m_anchor = a.slot; return *this; }

		/// Adds a string message part
		LogMessage &operator<<(const char *c) { m_messageParts.push_back(c); return *this; }
		/// Adds a string message part
		LogMessage &operator<<(std::string s) { m_messageParts.push_back(std::move(s)); return *this; }
		/// Adds a string message part
		LogMessage &operator<<(std::string_view s) { m_messageParts.push_back(std::string(s)); return *this; }
		/// Adds a reference to a slot
		LogMessage &operator<<(Slot s) { m_messageParts.push_back(s); return *this; }
		/// Adds a data word
		LogMessage &operator<<(Word w) { m_messageParts.push_back(w); return *this; }

		/// Attaches the call stack that lead to the logged event, usually the one recorded by an exception.
		LogMessage &operator<<(const utils::StackTrace &trace) { m_stackTrace = trace; return *this; }

		/// Adds an integer number to the message
		LogMessage &operator<<(std::size_t v) { m_messageParts.push_back(std::to_string(v)); return *this; }

		Severity severity() const { return m_severity; }
		Source source() const { return m_source; }

		/// @brief Returns the parts of which this message is composed.
		/// @details Each part is a std::variant that aside from strings can refer to slots or data words.
		const auto &parts() const { return m_messageParts; }
		/// Returns the anchoring slot or ~0ull if the message is not about a particular slot.
		size_t anchor() const { return m_anchor; }
		const std::optional<utils::StackTrace> &stackTrace() const { return m_stackTrace; }

		/// Concatenates all parts into plain text.
		std::string text() const;
	protected:
		Severity m_severity = LOG_INFO;
		Source m_source = LOG_SIMULATION;
		size_t m_anchor = ~0ull;
		std::optional<utils::StackTrace> m_stackTrace;

		std::vector<std::variant<const char*, std::string, Slot, Word>> m_messageParts;
};

enum class State {
	SETUP,
	SIMULATION
};

/**
 * @brief Common interface that all logging backends must implement.
 * @details Also serves as the default implementation that silently ignores all log messages.
 */
class DebugInterface
{
	public:
		virtual ~DebugInterface() = default;

		inline State getState() const { return m_state; }

		thread_local static std::unique_ptr<DebugInterface> instance;

		virtual void log(LogMessage msg) { }
		virtual void changeState(State state) { m_state = state; }
		virtual void newTick(size_t tick) { m_tick = tick; }
		virtual std::string howToReachLog() { return "Logging disabled! Rerun with a call to e.g. kmem::dbg::logConsole or kmem::dbg::logHtml."; }

	protected:
		State m_state = State::SETUP;
		size_t m_tick = 0;
};

/// Initialize logging to write all messages to std::clog
void logConsole();
/// Initialize logging to write to a file based static log (data/report.js in outputDir)
void logHtml(const std::filesystem::path &outputDir);
/// Reset logging to the default backend which discards all messages
void logNothing();

void changeState(State state);
/// Informs the backend of the simulation time, log messages are stamped with it.
void newTick(size_t tick);

/// Log a message to whatever backend has been initialized.
void log(const LogMessage &msg);
/// Print a short, human readable description of how the log can be accessed.
std::string howToReachLog();

}

/**@}*/

}
