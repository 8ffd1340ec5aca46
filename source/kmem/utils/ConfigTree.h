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

#include <boost/lexical_cast.hpp>
#include <magic_enum.hpp>
#include <yaml-cpp/yaml.h>

#include <cctype>
#include <filesystem>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace kmem::utils
{
	/// Matches the leading path components of str against a pattern that may contain '*' wildcards (which do not cross '/').
	std::optional<std::string_view> globbingMatchPath(std::string_view pattern, std::string_view str);
	/// Substitutes all $(NAME) with the content of the environment variable NAME, throws if it is not set.
	std::string replaceEnvVars(const std::string& src);

	/**
	 * @brief Read only view into a stack of yaml documents, e.g. a scenario file and overrides loaded after it.
	 * @details Documents loaded later take precedence over earlier ones. Paths are separated by '/' and map keys of the documents
	 * may contain '*' wildcards. Scalars starting with '$' have environment variables of the form $(NAME) substituted.
	 */
	class ConfigTree
	{
	public:
		/// Iterates the elements of a sequence.
		struct iterator {
			YAML::Node::const_iterator it;

			void operator++() { ++it; }
			ConfigTree operator*() { return ConfigTree(*it); }
			bool operator==(const iterator& rhs) const { return it == rhs.it; }
			bool operator!=(const iterator& rhs) const { return it != rhs.it; }
		};

		ConfigTree() = default;
		ConfigTree(YAML::Node node);

		explicit operator bool() const { return isDefined(); }
		bool isDefined() const;
		bool isScalar() const;
		bool isSequence() const;

		iterator begin() const;
		iterator end() const;
		size_t size() const;
		ConfigTree operator[](size_t index) const;

		ConfigTree operator[](std::string_view path) const;
		template<typename T> T as(const T& def) const;
		template<typename T> T as() const;

		/// Pushes a document on top of the stack, it must hold a map.
		void loadFromFile(const std::filesystem::path &filename);
		void loadFromString(const std::string &document);

	protected:
		std::vector<YAML::Node> m_nodes;

		void pushDocument(YAML::Node document, std::string_view origin);
		const YAML::Node *single() const { return m_nodes.size() == 1 ? &m_nodes.front() : nullptr; }
	};

	template<typename T>
	inline T ConfigTree::as(const T& def) const
	{
		if (!single())
			return def;

		return as<T>();
	}

	template<typename T>
	inline T ConfigTree::as() const
	{
		const YAML::Node *node = single();
		if (!node)
			throw std::runtime_error{ "non optional config value not found" };

		try {
			return node->as<T>();
		} catch (const YAML::BadConversion&) {
			auto str = node->as<std::string>();
			if (str.empty() || str[0] != '$')
				throw;
			str = replaceEnvVars(str);
			if constexpr (std::is_same_v<T, bool>) {
				if (str == "true" || str == "yes" || str == "1")
					return true;
				if (str == "false" || str == "no" || str == "0")
					return false;
				throw;
			} else if constexpr (std::is_integral_v<T> || std::is_floating_point_v<T>) {
				return boost::lexical_cast<T>(str);
			} else
				throw;
		}
	}

	template<>
	inline std::string ConfigTree::as() const
	{
		const YAML::Node *node = single();
		if (!node)
			throw std::runtime_error{ "non optional config value not found" };

		return replaceEnvVars(node->as<std::string>());
	}

	template<>
	inline std::string ConfigTree::as(const std::string& def) const
	{
		if (!single())
			return def;
		return as<std::string>();
	}
}

namespace YAML
{
	/// Enums are stored by name, decoding ignores the case.
	template<typename T>
	struct convert
	{
		static auto encode(T value) -> std::enable_if_t<std::is_enum_v<T>, Node>
		{
			return Node{ std::string{ magic_enum::enum_name(value) } };
		}

		static auto decode(const Node& node, T& out) -> std::enable_if_t<std::is_enum_v<T>, bool>
		{
			const std::string value = node.as<std::string>();
			const std::optional<T> eval = magic_enum::enum_cast<T>(value,
				[](char a, char b) { return std::tolower((unsigned char) a) == std::tolower((unsigned char) b); });

			if (eval) {
				out = *eval;
				return true;
			}

			std::ostringstream err;
			err << "'" << value << "' is not a valid " << magic_enum::enum_type_name<T>() << ", expected one of:";
			for (auto name : magic_enum::enum_names<T>())
				err << ' ' << name;

			throw std::runtime_error{ err.str() };
		}
	};
}
