// SPDX-FileCopyrightText: 2002-2024 PCSX2 Dev Team
// SPDX-License-Identifier: LGPL-3.0+

#pragma once

#include "DocPatchDefs.h"

#include "fmt/core.h"

#include <string>
#include <string_view>

class Error
{
public:
	Error();
	Error(const Error& e);
	Error(Error&& e);
	~Error();

	enum class Type
	{
		None = 0,
		User = 1,
		Parse = 2,
		PathNotFound = 3,
		InvalidPath = 4,
		TypeMismatch = 5,
		UnsupportedStructure = 6,
	};

	__fi Type GetType() const { return m_type; }
	__fi bool IsValid() const { return (m_type != Type::None); }
	__fi const std::string& GetDescription() const { return m_description; }

	/// The path the error refers to, if the error came from addressing a value.
	__fi const std::string& GetPath() const { return m_path; }

	void Clear();

	/// Sets a free-form message.
	void SetString(std::string description);

	/// Source bytes could not be decoded by the format's parser.
	void SetParse(std::string_view format_name, std::string_view message);

	/// Lookup miss on an explicit-path read.
	void SetPathNotFound(std::string_view path);

	/// Malformed pointer, bad array index, or root addressed where a leaf is required.
	void SetInvalidPath(std::string_view path, std::string_view reason);

	/// Navigation met a container kind incompatible with the remaining path.
	void SetTypeMismatch(std::string_view path, std::string_view expected, std::string_view actual);

	/// Value cannot be represented in the target format. An empty path omits the location.
	void SetUnsupportedStructure(std::string_view path, std::string_view reason);

	// helpers for setting
	static void SetString(Error* errptr, std::string description);
	static void SetParse(Error* errptr, std::string_view format_name, std::string_view message);
	static void SetPathNotFound(Error* errptr, std::string_view path);
	static void SetInvalidPath(Error* errptr, std::string_view path, std::string_view reason);
	static void SetTypeMismatch(Error* errptr, std::string_view path, std::string_view expected, std::string_view actual);
	static void SetUnsupportedStructure(Error* errptr, std::string_view path, std::string_view reason);

	/// Sets a formatted message.
	template <typename... T>
	static void SetStringFmt(Error* errptr, fmt::format_string<T...> fmt, T&&... args)
	{
		if (errptr)
			Error::SetString(errptr, fmt::vformat(fmt, fmt::make_format_args(args...)));
	}

	Error& operator=(const Error& e);
	Error& operator=(Error&& e);

private:
	Type m_type = Type::None;
	std::string m_description;
	std::string m_path;
};
