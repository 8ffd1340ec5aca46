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

#include "ConfigTree.h"
#include "Exceptions.h"

#include <boost/spirit/home/x3.hpp>
#include <cstdlib>


namespace kmem::utils
{
	std::optional<std::string_view> globbingMatchPath(std::string_view pattern, std::string_view str)
	{
		size_t common = 0;
		for (; common < pattern.size() && common < str.size(); ++common)
			if (pattern[common] != str[common])
				break;

		if (common == pattern.size())
			return str.substr(0, common);
		if (pattern[common] != '*')
			return std::nullopt;

		// Try every extent of the wildcard within the current path component and keep the longest.
		std::string_view remainingPattern = pattern.substr(common + 1);
		std::optional<std::string_view> longest;
		for (size_t wildcardEnd = common; wildcardEnd <= str.size(); ++wildcardEnd) {
			std::string_view rest = str.substr(wildcardEnd);
			if (auto tail = globbingMatchPath(remainingPattern, rest))
				longest = str.substr(0, wildcardEnd + tail->size());
			if (!rest.empty() && rest.front() == '/')
				break;
		}
		return longest;
	}

	std::string replaceEnvVars(const std::string& src)
	{
		namespace x3 = boost::spirit::x3;

		auto lookup = [](auto& ctx) {
			const std::string &name = x3::_attr(ctx);
			const char *value = std::getenv(name.c_str());
			if (value == nullptr)
				throw std::runtime_error("environment variable '" + name + "' not found.");
			x3::_attr(ctx) = value;
		};

		const auto variable = x3::lit("$(") >> (*(x3::char_ - ')'))[lookup] >> ')';

		std::string result;
		result.reserve(src.size());
		const bool parsed = x3::parse(src.begin(), src.end(), *(variable | x3::char_), result);
		KMEM_ASSERT_HINT(parsed, "unparsable environment variable reference in " + src);
		return result;
	}

	namespace {
		// Collects the maps below node whose (globbed) key path matches path.
		void collectMatchingMaps(const YAML::Node &node, std::string_view path, std::vector<YAML::Node> &matches)
		{
			if (!node.IsMap())
				return;

			for (const auto &entry : node) {
				if (!entry.second.IsMap())
					continue;

				const auto key = entry.first.as<std::string>();
				const auto matched = globbingMatchPath(key, path);
				if (!matched)
					continue;

				if (matched->size() == path.size())
					matches.push_back(entry.second);
				else if (path[matched->size()] == '/')
					collectMatchingMaps(entry.second, path.substr(matched->size() + 1), matches);
			}
		}
	}

	ConfigTree::ConfigTree(YAML::Node node) : m_nodes{ node }
	{
	}

	ConfigTree ConfigTree::operator[](std::string_view path) const
	{
		ConfigTree result;

		// A plain value of the most recent document shadows everything else.
		const std::string key{ path };
		for (auto doc = m_nodes.rbegin(); doc != m_nodes.rend(); ++doc) {
			if (!doc->IsMap())
				continue;
			const YAML::Node value = (*doc)[key];
			if (value && !value.IsMap()) {
				result.m_nodes.push_back(value);
				return result;
			}
		}

		for (const auto &doc : m_nodes)
			collectMatchingMaps(doc, path, result.m_nodes);
		return result;
	}

	bool ConfigTree::isDefined() const
	{
		return !m_nodes.empty() && m_nodes.front().IsDefined();
	}

	bool ConfigTree::isScalar() const
	{
		const YAML::Node *node = single();
		return node && node->IsScalar();
	}

	bool ConfigTree::isSequence() const
	{
		const YAML::Node *node = single();
		return node && node->IsSequence();
	}

	ConfigTree::iterator ConfigTree::begin() const
	{
		return isSequence() ? iterator{ m_nodes.front().begin() } : iterator{};
	}

	ConfigTree::iterator ConfigTree::end() const
	{
		return isSequence() ? iterator{ m_nodes.front().end() } : iterator{};
	}

	size_t ConfigTree::size() const
	{
		return isSequence() ? m_nodes.front().size() : 0;
	}

	ConfigTree ConfigTree::operator[](size_t index) const
	{
		if (!isSequence())
			return {};
		return ConfigTree{ m_nodes.front()[index] };
	}

	void ConfigTree::pushDocument(YAML::Node document, std::string_view origin)
	{
		if (!document.IsMap())
			throw std::runtime_error(std::string{ origin } + " is not a yaml map");
		m_nodes.push_back(std::move(document));
	}

	void ConfigTree::loadFromFile(const std::filesystem::path &filename)
	{
		pushDocument(YAML::LoadFile(filename.string()), filename.string());
	}

	void ConfigTree::loadFromString(const std::string &document)
	{
		pushDocument(YAML::Load(document), "config document");
	}
}
