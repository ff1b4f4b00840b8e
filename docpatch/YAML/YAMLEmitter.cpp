// SPDX-FileCopyrightText: 2002-2024 PCSX2 Dev Team
// SPDX-License-Identifier: LGPL-3.0+

#include "docpatch/YAML/YAMLNodeTree.h"

#include "common/StringUtil.h"

#include "fmt/format.h"

#include <iterator>

namespace
{
	class YAMLEmitter
	{
	public:
		explicit YAMLEmitter(const YAMLNodeTree& tree);

		std::string Emit();

	private:
		static constexpr u32 INDENT_WIDTH = 2;

		void WriteIndent(u32 indent);
		void WriteCommentLines(const std::vector<std::string>& lines, u32 indent);
		void WriteLineComment(std::string_view comment);

		void WriteBlock(YAMLNodeID id, u32 indent, bool inline_first);
		void WriteMapping(YAMLNodeID id, u32 indent, bool inline_first);
		void WriteSequence(YAMLNodeID id, u32 indent, bool inline_first);

		/// Writes everything after "key:" or "-" up to and including the newline.
		void WriteEntryValue(YAMLNodeID id, u32 child_indent, std::string_view comment, bool in_sequence);
		void WriteLiteral(const YAMLNode& node, u32 indent, std::string_view comment);
		void WriteFlow(YAMLNodeID id, u32 depth);
		void WriteKey(YAMLNodeID id);

		/// Anchor and tag prefix, e.g. "&base !!str".
		std::string GetProperties(YAMLNodeID id);

		/// Returns the node to write in place of an alias whose anchor has not been written yet.
		YAMLNodeID GetWriteTarget(YAMLNodeID id) const;

		std::string_view FindFlowLineComment(YAMLNodeID id, u32 depth) const;

		static bool IsBlockContainer(const YAMLNode& node);
		static bool CanUseLiteral(const YAMLNode& node);
		static std::string FormatScalar(const YAMLNode& node, bool flow);

		const YAMLNodeTree& m_tree;
		std::vector<bool> m_anchor_written;
		std::string m_out;
	};
} // namespace

static bool IsPlainSafe(std::string_view text, bool flow)
{
	if (text.empty() || text.front() == ' ' || text.back() == ' ' || text.front() == '\t' || text.back() == '\t')
		return false;

	static constexpr std::string_view s_indicators = ",[]{}#&*!|>'\"%@`";
	const char first = text.front();
	if (s_indicators.find(first) != std::string_view::npos)
		return false;

	// "-x", "?x" and ":x" are fine, a lone indicator or one followed by a space is not.
	if ((first == '-' || first == '?' || first == ':') && (text.size() == 1 || text[1] == ' '))
		return false;

	if (StringUtil::StartsWith(text, "---") || StringUtil::StartsWith(text, "..."))
		return false;

	if (text.back() == ':' || text.find(": ") != std::string_view::npos || text.find(" #") != std::string_view::npos)
		return false;

	for (const char ch : text)
	{
		const unsigned char uch = static_cast<unsigned char>(ch);
		if (uch < 0x20 || uch == 0x7f)
			return false;
		if (flow && (ch == ',' || ch == '[' || ch == ']' || ch == '{' || ch == '}'))
			return false;
	}

	return true;
}

static std::string DoubleQuote(std::string_view text)
{
	std::string ret;
	ret.reserve(text.size() + 2);
	ret.push_back('"');
	for (const char ch : text)
	{
		switch (ch)
		{
			case '"':
				ret.append("\\\"");
				break;
			case '\\':
				ret.append("\\\\");
				break;
			case '\n':
				ret.append("\\n");
				break;
			case '\t':
				ret.append("\\t");
				break;
			case '\r':
				ret.append("\\r");
				break;
			default:
			{
				const unsigned char uch = static_cast<unsigned char>(ch);
				if (uch < 0x20 || uch == 0x7f)
					fmt::format_to(std::back_inserter(ret), "\\x{:02X}", uch);
				else
					ret.push_back(ch);
			}
			break;
		}
	}
	ret.push_back('"');
	return ret;
}

static bool CanSingleQuote(std::string_view text)
{
	for (const char ch : text)
	{
		const unsigned char uch = static_cast<unsigned char>(ch);
		if (uch < 0x20 || uch == 0x7f)
			return false;
	}

	return true;
}

YAMLEmitter::YAMLEmitter(const YAMLNodeTree& tree)
	: m_tree(tree)
	, m_anchor_written(tree.GetNodeCount(), false)
{
}

bool YAMLEmitter::IsBlockContainer(const YAMLNode& node)
{
	return ((node.kind == YAMLNodeKind::Mapping || node.kind == YAMLNodeKind::Sequence) && !node.flow &&
			!node.children.empty());
}

bool YAMLEmitter::CanUseLiteral(const YAMLNode& node)
{
	if (node.kind != YAMLNodeKind::Scalar ||
		(node.style != YAMLScalarStyle::Literal && node.style != YAMLScalarStyle::Folded) ||
		node.value.find('\n') == std::string::npos)
	{
		return false;
	}

	// Whitespace-only content and trailing spaces don't survive a block scalar.
	if (node.value.find_first_not_of('\n') == std::string::npos)
		return false;

	for (size_t i = 0; i < node.value.size(); i++)
	{
		const unsigned char uch = static_cast<unsigned char>(node.value[i]);
		if ((uch < 0x20 && uch != '\n') || uch == 0x7f)
			return false;
		if (uch == ' ' && (i + 1 == node.value.size() || node.value[i + 1] == '\n'))
			return false;
	}

	return true;
}

std::string YAMLEmitter::FormatScalar(const YAMLNode& node, bool flow)
{
	const std::string& text = node.value;
	switch (node.style)
	{
		case YAMLScalarStyle::DoubleQuoted:
			return DoubleQuote(text);

		case YAMLScalarStyle::SingleQuoted:
		{
			if (!CanSingleQuote(text))
				return DoubleQuote(text);

			return fmt::format("'{}'", StringUtil::ReplaceAll(text, "'", "''"));
		}

		default:
			break;
	}

	const bool is_string = (node.tag == YAMLTag::Str || (node.tag == YAMLTag::None && node.style != YAMLScalarStyle::Plain));
	if (is_string)
	{
		// An explicit tag already forces the type, otherwise the text must read back as a string.
		const bool needs_type_check = !node.explicit_tag;
		if (!IsPlainSafe(text, flow) || (needs_type_check && !YAMLNodeTree::InferPlainScalar(text).IsString()))
			return DoubleQuote(text);

		return text;
	}

	if (text.empty())
		return flow ? std::string("null") : std::string();

	if (node.tag == YAMLTag::Custom && !IsPlainSafe(text, flow))
		return DoubleQuote(text);

	return text;
}

void YAMLEmitter::WriteIndent(u32 indent)
{
	m_out.append(indent, ' ');
}

void YAMLEmitter::WriteCommentLines(const std::vector<std::string>& lines, u32 indent)
{
	for (const std::string& line : lines)
	{
		if (!line.empty())
		{
			WriteIndent(indent);
			m_out.append(line);
		}
		m_out.push_back('\n');
	}
}

void YAMLEmitter::WriteLineComment(std::string_view comment)
{
	if (comment.empty())
		return;

	m_out.push_back(' ');
	m_out.append(comment);
}

std::string YAMLEmitter::GetProperties(YAMLNodeID id)
{
	const YAMLNode& node = m_tree.GetNode(id);

	std::string ret;
	if (!node.anchor.empty())
	{
		ret.push_back('&');
		ret.append(node.anchor);
		m_anchor_written[id] = true;
	}

	if (node.explicit_tag && !node.custom_tag.empty())
	{
		if (!ret.empty())
			ret.push_back(' ');
		ret.append(node.custom_tag);
	}

	return ret;
}

YAMLNodeID YAMLEmitter::GetWriteTarget(YAMLNodeID id) const
{
	if (m_tree.GetNode(id).kind != YAMLNodeKind::Alias)
		return id;

	const YAMLNodeID target = m_tree.Resolve(id);
	if (target == INVALID_YAML_NODE || m_anchor_written[target])
		return id;

	// The anchored node was removed or now comes later, write its content here instead.
	return target;
}

std::string_view YAMLEmitter::FindFlowLineComment(YAMLNodeID id, u32 depth) const
{
	const YAMLNode& node = m_tree.GetNode(id);
	if (!node.line_comment.empty() || depth > 64)
		return node.line_comment;

	for (const YAMLNodeID child : node.children)
	{
		const std::string_view comment = FindFlowLineComment(child, depth + 1);
		if (!comment.empty())
			return comment;
	}

	return {};
}

void YAMLEmitter::WriteKey(YAMLNodeID id)
{
	const YAMLNode& node = m_tree.GetNode(id);
	if (node.kind == YAMLNodeKind::Alias)
	{
		const YAMLNodeID target = m_tree.Resolve(id);
		if (target != INVALID_YAML_NODE && m_anchor_written[target])
		{
			m_out.push_back('*');
			m_out.append(m_tree.GetNode(target).anchor);
			m_out.push_back(' ');
		}
		else if (target != INVALID_YAML_NODE)
		{
			m_out.append(FormatScalar(m_tree.GetNode(target), false));
		}
		else
		{
			m_out.append("null");
		}

		return;
	}

	const std::string properties = GetProperties(id);
	if (!properties.empty())
	{
		m_out.append(properties);
		m_out.push_back(' ');
	}

	// Keys are always strings.
	if (node.kind == YAMLNodeKind::Scalar && node.style == YAMLScalarStyle::Plain && node.tag == YAMLTag::None &&
		!node.value.empty())
	{
		m_out.append(node.value);
	}
	else if (node.kind == YAMLNodeKind::Scalar)
	{
		YAMLNode key = node;
		if (key.style == YAMLScalarStyle::Literal || key.style == YAMLScalarStyle::Folded)
			key.style = YAMLScalarStyle::DoubleQuoted;
		m_out.append(FormatScalar(key, false));
	}
	else
	{
		WriteFlow(id, 0);
	}
}

void YAMLEmitter::WriteFlow(YAMLNodeID id, u32 depth)
{
	const YAMLNodeID target = GetWriteTarget(id);
	const YAMLNode& node = m_tree.GetNode(target);
	if (node.kind == YAMLNodeKind::Alias)
	{
		const YAMLNodeID resolved = m_tree.Resolve(target);
		if (resolved == INVALID_YAML_NODE)
		{
			m_out.append("null");
			return;
		}

		m_out.push_back('*');
		m_out.append(m_tree.GetNode(resolved).anchor);
		return;
	}

	const std::string properties = GetProperties(target);
	if (!properties.empty())
	{
		m_out.append(properties);
		m_out.push_back(' ');
	}

	if (depth > 512)
	{
		m_out.append("null");
		return;
	}

	if (node.kind == YAMLNodeKind::Sequence)
	{
		m_out.push_back('[');
		for (size_t i = 0; i < node.children.size(); i++)
		{
			if (i > 0)
				m_out.append(", ");
			WriteFlow(node.children[i], depth + 1);
		}
		m_out.push_back(']');
	}
	else if (node.kind == YAMLNodeKind::Mapping)
	{
		m_out.push_back('{');
		for (size_t i = 0; i + 1 < node.children.size(); i += 2)
		{
			if (i > 0)
				m_out.append(", ");
			WriteKey(node.children[i]);
			m_out.append(": ");
			WriteFlow(node.children[i + 1], depth + 1);
		}
		m_out.push_back('}');
	}
	else
	{
		YAMLNode scalar = node;
		if (scalar.style == YAMLScalarStyle::Literal || scalar.style == YAMLScalarStyle::Folded)
			scalar.style = YAMLScalarStyle::DoubleQuoted;
		m_out.append(FormatScalar(scalar, true));
	}
}

void YAMLEmitter::WriteLiteral(const YAMLNode& node, u32 indent, std::string_view comment)
{
	const std::string& value = node.value;

	size_t trailing_newlines = 0;
	while (trailing_newlines < value.size() && value[value.size() - trailing_newlines - 1] == '\n')
		trailing_newlines++;

	m_out.append(" |");
	if (value.front() == ' ' || value.front() == '\n')
		m_out.push_back('2');
	if (trailing_newlines == 0)
		m_out.push_back('-');
	else if (trailing_newlines > 1)
		m_out.push_back('+');

	WriteLineComment(comment);
	m_out.push_back('\n');

	std::string_view body = value;
	if (!body.empty() && body.back() == '\n')
		body.remove_suffix(1);

	for (;;)
	{
		const size_t pos = body.find('\n');
		const std::string_view line = body.substr(0, pos);
		if (!line.empty())
		{
			WriteIndent(indent);
			m_out.append(line);
		}
		m_out.push_back('\n');

		if (pos == std::string_view::npos)
			break;

		body.remove_prefix(pos + 1);
	}
}

void YAMLEmitter::WriteEntryValue(YAMLNodeID id, u32 child_indent, std::string_view comment, bool in_sequence)
{
	const YAMLNodeID target = GetWriteTarget(id);
	const YAMLNode& node = m_tree.GetNode(target);
	if (comment.empty())
		comment = node.line_comment;

	if (node.kind == YAMLNodeKind::Alias)
	{
		m_out.push_back(' ');
		WriteFlow(target, 0);
		WriteLineComment(comment);
		m_out.push_back('\n');
		return;
	}

	const std::string properties = GetProperties(target);
	if (!properties.empty())
	{
		m_out.push_back(' ');
		m_out.append(properties);
	}

	if (IsBlockContainer(node))
	{
		if (in_sequence && properties.empty() && comment.empty())
		{
			// "- key: value", the first entry shares the dash line.
			m_out.push_back(' ');
			WriteBlock(target, child_indent, true);
			return;
		}

		WriteLineComment(comment);
		m_out.push_back('\n');
		WriteCommentLines(node.head_comment, child_indent);
		WriteBlock(target, child_indent, false);
		return;
	}

	if (node.kind == YAMLNodeKind::Mapping || node.kind == YAMLNodeKind::Sequence)
	{
		m_out.push_back(' ');
		WriteFlow(target, 0);
		WriteLineComment(comment.empty() ? FindFlowLineComment(target, 0) : comment);
		m_out.push_back('\n');
		return;
	}

	if (CanUseLiteral(node))
	{
		WriteLiteral(node, child_indent, comment);
		return;
	}

	YAMLNode scalar = node;
	if (scalar.style == YAMLScalarStyle::Literal || scalar.style == YAMLScalarStyle::Folded)
		scalar.style = (node.value.find('\n') != std::string::npos) ? YAMLScalarStyle::DoubleQuoted : YAMLScalarStyle::Plain;

	const std::string text = FormatScalar(scalar, false);
	if (!text.empty())
	{
		m_out.push_back(' ');
		m_out.append(text);
	}

	WriteLineComment(comment);
	m_out.push_back('\n');
}

void YAMLEmitter::WriteBlock(YAMLNodeID id, u32 indent, bool inline_first)
{
	if (m_tree.GetNode(id).kind == YAMLNodeKind::Mapping)
		WriteMapping(id, indent, inline_first);
	else
		WriteSequence(id, indent, inline_first);
}

void YAMLEmitter::WriteMapping(YAMLNodeID id, u32 indent, bool inline_first)
{
	const std::vector<YAMLNodeID>& children = m_tree.GetNode(id).children;
	for (size_t i = 0; i + 1 < children.size(); i += 2)
	{
		const YAMLNode& key = m_tree.GetNode(children[i]);
		if (i > 0 || !inline_first)
		{
			WriteCommentLines(key.head_comment, indent);
			WriteIndent(indent);
		}

		WriteKey(children[i]);
		m_out.push_back(':');
		WriteEntryValue(children[i + 1], indent + INDENT_WIDTH, key.line_comment, false);
		WriteCommentLines(key.foot_comment, indent);
	}
}

void YAMLEmitter::WriteSequence(YAMLNodeID id, u32 indent, bool inline_first)
{
	const std::vector<YAMLNodeID>& children = m_tree.GetNode(id).children;
	for (size_t i = 0; i < children.size(); i++)
	{
		const YAMLNode& item = m_tree.GetNode(children[i]);
		if (i > 0 || !inline_first)
		{
			WriteCommentLines(item.head_comment, indent);
			WriteIndent(indent);
		}

		m_out.push_back('-');
		WriteEntryValue(children[i], indent + INDENT_WIDTH, {}, true);
		WriteCommentLines(item.foot_comment, indent);
	}
}

std::string YAMLEmitter::Emit()
{
	const YAMLNodeID root = m_tree.GetRoot();
	const YAMLNode& node = m_tree.GetNode(root);

	WriteCommentLines(node.head_comment, 0);
	if (IsBlockContainer(node))
	{
		const std::string properties = GetProperties(root);
		if (!properties.empty())
		{
			m_out.append(properties);
			m_out.push_back('\n');
		}

		WriteBlock(root, 0, false);
	}
	else if (node.kind == YAMLNodeKind::Mapping || node.kind == YAMLNodeKind::Sequence)
	{
		WriteFlow(root, 0);
		WriteLineComment(FindFlowLineComment(root, 0));
		m_out.push_back('\n');
	}
	else
	{
		const std::string properties = GetProperties(root);
		if (!properties.empty())
		{
			m_out.append(properties);
			m_out.push_back(' ');
		}

		m_out.append(FormatScalar(node, false));
		WriteLineComment(node.line_comment);
		m_out.push_back('\n');
	}

	for (const std::string& line : m_tree.GetFootComment())
	{
		m_out.append(line);
		m_out.push_back('\n');
	}

	return std::move(m_out);
}

std::string YAMLNodeTree::Emit() const
{
	YAMLEmitter emitter(*this);
	return emitter.Emit();
}
