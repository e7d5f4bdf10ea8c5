#ifndef COMBITOY_DEDUP
#define COMBITOY_DEDUP // abbrev.cpp has the combitoy.hpp tail already
#endif
#include "markup.hpp"

#include <algorithm>
#include <new>

namespace Combitoy::Markup {

using Abbrev::Node;

//---------------------------------------------------------------------------
std::string escape(std::string_view text)
{
	std::string result;
	result.reserve(text.length());
	for (char c : text) {
		switch (c) {
		case '&': result += "&amp;"; break;
		case '"': result += "&quot;"; break;
		case '<': result += "&lt;"; break;
		case '>': result += "&gt;"; break;
		default:  result += c;
		}
	}
	return result;
}

//---------------------------------------------------------------------------
// Appends the element (repeated) to out, which must not grow beyond room chars.
void Serializer::_build(const Node& node, std::string_view content, std::string& out, size_t room) const
{
	if (node.repeat_count == 0) return;

	std::string element = "<" + node.label;
	if (!node.class_name.empty()) element += fmt::format(" class=\"{}\"", escape(node.class_name));
	if (node.id)                  element += fmt::format(" id=\"{}\"", escape(*node.id));
	element += '>';

	if (node.children.empty()) {
		element += content;
	} else {
		for (const auto& child : node.children) {
			_build(child, content, element, room);
		}
	}
	element += "</" + node.label + ">";

	// element.size() is never 0 here
	if (out.size() > room || node.repeat_count > (room - out.size()) / element.size()) {
		throw Error(ErrorKind::CapacityExceeded, fmt::format(
			"{} x <{}> ({} chars each) wouldn't fit into the capacity of {}!",
			node.repeat_count, node.label, element.size(), _capacity));
	}

	out.reserve(out.size() + node.repeat_count * element.size());
	for (unsigned i = 0; i < node.repeat_count; ++i) {
		out += element;
	}
}

//---------------------------------------------------------------------------
void Serializer::write(const Node& node, std::string_view content, std::string& dest) const
{
	if (node.repeat_count == 0) return; // Suppressed: not even the capacity matters then.

	auto limit = std::min(_capacity, dest.max_size());
	if (dest.size() > limit) {
		throw Error(ErrorKind::CapacityExceeded, fmt::format(
			"Destination is already longer ({}) than the capacity of {}!", dest.size(), _capacity));
	}

	try {
		std::string fragment;
		_build(node, content, fragment, limit - dest.size());
DBG("Markup: <{}> x{} -> {} chars: \"{}\"", node.label, node.repeat_count, fragment.size(), DBG_TRIM(fragment));
		dest += fragment; //! Either all of it, or nothing: std::string appends with the strong guarantee.
	} catch (const std::bad_alloc&) {
		throw Error(ErrorKind::AllocationFailure, fmt::format(
			"Out of memory while writing the markup of <{}>!", node.label));
	}
}

std::string Serializer::operator()(const Node& node, std::string_view content) const
{
	std::string result;
	write(node, content, result);
	return result;
}

//---------------------------------------------------------------------------
std::string serialize(const Node& node, std::string_view content)
{
	return Serializer()(node, content);
}

} // namespace Combitoy::Markup
