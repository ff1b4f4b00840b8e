// SPDX-FileCopyrightText: 2002-2024 PCSX2 Dev Team
// SPDX-License-Identifier: LGPL-3.0+

#pragma once

#include "docpatch/Value.h"

#include <ostream>

// Readable gtest failure output for values.
inline void PrintTo(const Value& value, std::ostream* os)
{
	*os << value.ToString();
}

/// Shorthand for building nested test objects.
inline Value::Object MakeObject(std::initializer_list<std::pair<const std::string, Value>> members)
{
	Value::Object ret;
	for (const auto& [key, value] : members)
		ret.emplace(key, value);
	return ret;
}
