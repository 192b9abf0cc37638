//------------------------------------------------------------------------------
/*
    This file is part of shylock, a private loan ledger engine.
    Copyright (c) 2025 The Shylock Authors.

    Permission to use, copy, modify, and/or distribute this software for any
    purpose  with  or without fee is hereby granted, provided that the above
    copyright notice and this permission notice appear in all copies.

    THE  SOFTWARE IS PROVIDED "AS IS" AND THE AUTHOR DISCLAIMS ALL WARRANTIES
    WITH  REGARD  TO  THIS  SOFTWARE  INCLUDING  ALL  IMPLIED  WARRANTIES  OF
    MERCHANTABILITY  AND  FITNESS. IN NO EVENT SHALL THE AUTHOR BE LIABLE FOR
    ANY  SPECIAL ,  DIRECT, INDIRECT, OR CONSEQUENTIAL DAMAGES OR ANY DAMAGES
    WHATSOEVER  RESULTING  FROM  LOSS  OF USE, DATA OR PROFITS, WHETHER IN AN
    ACTION  OF  CONTRACT, NEGLIGENCE OR OTHER TORTIOUS ACTION, ARISING OUT OF
    OR IN CONNECTION WITH THE USE OR PERFORMANCE OF THIS SOFTWARE.
*/
//==============================================================================

#include <shylock/basics/BasicConfig.h>

#include <boost/algorithm/string/trim.hpp>
#include <boost/regex.hpp>

#include <sstream>

namespace shylock {

namespace {

// Cuts a line at its first unescaped '#' and unescapes the rest
std::string
stripComment(std::string const& line)
{
    std::string result;
    result.reserve(line.size());

    for (std::size_t i = 0; i < line.size(); ++i)
    {
        if (line[i] == '\\' && i + 1 < line.size() && line[i + 1] == '#')
        {
            result += '#';
            ++i;
        }
        else if (line[i] == '#')
        {
            break;
        }
        else
        {
            result += line[i];
        }
    }

    boost::algorithm::trim(result);
    return result;
}

}  // namespace

IniFileSections
parseIniFile(std::string const& data, bool trim)
{
    IniFileSections sections;
    std::string current;
    sections[current];

    std::istringstream input(data);
    std::string line;
    while (std::getline(input, line))
    {
        if (!line.empty() && line.back() == '\r')
            line.pop_back();

        if (trim)
            boost::algorithm::trim(line);

        if (line.empty() || line.front() == '#')
            continue;

        if (line.front() == '[' && line.back() == ']')
        {
            current = boost::algorithm::trim_copy(
                line.substr(1, line.size() - 2));
            sections[current];
        }
        else
        {
            sections[current].push_back(line);
        }
    }

    return sections;
}

//------------------------------------------------------------------------------

Section::Section(std::string name) : name_(std::move(name))
{
}

void
Section::set(std::string const& key, std::string const& value)
{
    pairs_[key] = value;
}

void
Section::append(std::vector<std::string> const& lines)
{
    // key = value, the key starting with a letter
    static boost::regex const keyValue(
        "\\s*([a-zA-Z][_a-zA-Z0-9]*)\\s*=\\s*(.*\\S)\\s*",
        boost::regex_constants::optimize);

    for (auto const& raw : lines)
    {
        auto const line = stripComment(raw);
        if (line.empty())
            continue;

        boost::smatch match;
        if (boost::regex_match(line, match, keyValue))
            set(match.str(1), match.str(2));
        else
            values_.push_back(line);
    }
}

bool
Section::exists(std::string const& key) const
{
    return pairs_.count(key) != 0;
}

std::optional<std::string>
Section::get(std::string const& key) const
{
    auto const iter = pairs_.find(key);
    if (iter == pairs_.end())
        return std::nullopt;
    return iter->second;
}

std::string
get(Section const& section,
    std::string const& key,
    std::string const& defaultValue)
{
    return section.get(key).value_or(defaultValue);
}

//------------------------------------------------------------------------------

bool
BasicConfig::exists(std::string const& name) const
{
    return sections_.count(name) != 0;
}

Section&
BasicConfig::section(std::string const& name)
{
    return sections_.try_emplace(name, name).first->second;
}

Section const&
BasicConfig::section(std::string const& name) const
{
    static Section const none;
    auto const iter = sections_.find(name);
    return iter == sections_.end() ? none : iter->second;
}

void
BasicConfig::overwrite(
    std::string const& section,
    std::string const& key,
    std::string const& value)
{
    this->section(section).set(key, value);
}

void
BasicConfig::loadFromString(std::string const& data)
{
    for (auto const& [name, lines] : parseIniFile(data, true))
        section(name).append(lines);
}

}  // namespace shylock
