// SPDX-FileCopyrightText: 2002-2024 PCSX2 Dev Team
// SPDX-License-Identifier: LGPL-3.0+

#pragma once

#include "common/DocPatchDefs.h"
#include "common/HeterogeneousContainers.h"

#include <cstddef>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

/// Format-neutral parse result shared by every document type at the Get() boundary.
/// Objects iterate in key order.
class Value
{
public:
	enum class Type : u8
	{
		Null,
		Bool,
		Int,
		Float,
		String,
		Array,
		Object,
	};

	using Array = std::vector<Value>;
	// Value is incomplete here. The standard only guarantees that for vector, list and forward_list,
	// but libstdc++, libc++ and MSVC all accept std::map with an incomplete mapped type.
	using Object = StringMap<Value>;

	Value();
	Value(std::nullptr_t);
	Value(bool value);
	Value(double value);
	Value(const char* value);
	Value(std::string_view value);
	Value(std::string value);
	Value(Array value);
	Value(Object value);

	template <typename T, std::enable_if_t<std::is_integral<T>::value && !std::is_same<T, bool>::value, bool> = true>
	Value(T value)
		: m_value(static_cast<s64>(value))
	{
	}

	Value(const Value& v);
	Value(Value&& v) noexcept;
	~Value();

	Value& operator=(const Value& v);
	Value& operator=(Value&& v) noexcept;

	__fi Type GetType() const { return static_cast<Type>(m_value.index()); }
	__fi bool IsNull() const { return (GetType() == Type::Null); }
	__fi bool IsBool() const { return (GetType() == Type::Bool); }
	__fi bool IsInt() const { return (GetType() == Type::Int); }
	__fi bool IsFloat() const { return (GetType() == Type::Float); }
	__fi bool IsNumber() const { return (IsInt() || IsFloat()); }
	__fi bool IsString() const { return (GetType() == Type::String); }
	__fi bool IsArray() const { return (GetType() == Type::Array); }
	__fi bool IsObject() const { return (GetType() == Type::Object); }

	bool GetBool() const;
	s64 GetInt() const;

	/// Integers are widened.
	double GetFloat() const;

	const std::string& GetString() const;
	const Array& GetArray() const;
	Array& GetArray();
	const Object& GetObject() const;
	Object& GetObject();

	/// Member lookup, null if this is not an object or the key is missing.
	const Value* Find(std::string_view key) const;
	Value* Find(std::string_view key);

	/// True if this value, or anything nested in it, is null.
	bool ContainsNull() const;

	/// Compact JSON-like rendering, used for diagnostics.
	std::string ToString() const;

	static const char* GetTypeName(Type type);
	__fi const char* GetTypeName() const { return GetTypeName(GetType()); }

	/// Integers and floats compare by numeric value, everything else structurally.
	bool operator==(const Value& v) const;
	bool operator!=(const Value& v) const;

private:
	// Order must match Type.
	std::variant<std::nullptr_t, bool, s64, double, std::string, Array, Object> m_value;
};
