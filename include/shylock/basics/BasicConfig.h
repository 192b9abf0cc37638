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

#ifndef SHYLOCK_BASICS_BASICCONFIG_H_INCLUDED
#define SHYLOCK_BASICS_BASICCONFIG_H_INCLUDED

#include <boost/algorithm/string/predicate.hpp>

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace shylock {

/** Case-insensitive ordering for section and key names. */
struct iless
{
    bool
    operator()(std::string const& lhs, std::string const& rhs) const
    {
        return boost::algorithm::ilexicographical_compare(lhs, rhs);
    }
};

using IniFileSections =
    std::map<std::string, std::vector<std::string>, iless>;

/** Split the text of an ini-style file into its sections.

    Blank lines and lines starting with `#` are dropped. Lines that appear
    before the first `[section]` header are gathered under the empty name.

    @param trim Remove leading and trailing whitespace from each line.
*/
IniFileSections
parseIniFile(std::string const& data, bool trim);

//------------------------------------------------------------------------------

/** The `key = value` pairs under one `[section]` header.

    A `#` starts a comment unless it is written `\#`. Lines that are not
    key/value pairs are kept, in order, as free-form values.
*/
class Section
{
    std::string name_;
    std::map<std::string, std::string, iless> pairs_;
    std::vector<std::string> values_;

public:
    explicit Section(std::string name = {});

    std::string const&
    name() const
    {
        return name_;
    }

    /** Lines of the section that are not key/value pairs. */
    std::vector<std::string> const&
    values() const
    {
        return values_;
    }

    /** Number of distinct keys. */
    std::size_t
    size() const
    {
        return pairs_.size();
    }

    /** Set `key`, replacing any earlier value. */
    void
    set(std::string const& key, std::string const& value);

    void
    append(std::vector<std::string> const& lines);

    bool
    exists(std::string const& key) const;

    std::optional<std::string>
    get(std::string const& key) const;
};

/** Returns the value of `key`, or `defaultValue` when it is not set. */
std::string
get(Section const& section,
    std::string const& key,
    std::string const& defaultValue);

//------------------------------------------------------------------------------

/** The sections of a loan file, looked up by case-insensitive name. */
class BasicConfig
{
    std::map<std::string, Section, iless> sections_;

public:
    bool
    exists(std::string const& name) const;

    /** Returns the named section, creating it if needed. */
    Section&
    section(std::string const& name);

    /** Returns the named section, or an empty one if there is none. */
    Section const&
    section(std::string const& name) const;

    Section&
    operator[](std::string const& name)
    {
        return section(name);
    }

    Section const&
    operator[](std::string const& name) const
    {
        return section(name);
    }

    /** Set a value from the command line over whatever the file had. */
    void
    overwrite(
        std::string const& section,
        std::string const& key,
        std::string const& value);

    /** Parse ini-style text and merge its sections into this config. */
    void
    loadFromString(std::string const& data);
};

}  // namespace shylock

#endif
