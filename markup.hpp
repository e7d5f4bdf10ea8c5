#ifndef _COMBITOY_MARKUP_HPP_
#define _COMBITOY_MARKUP_HPP_
/*****************************************************************************
  Abbrev::Node tree -> markup fragment

    <label class="..." id="...">inner</label>  (times repeat_count)

  - "inner" is the children's markup, if the node has any children at all,
    or else the content text supplied by the caller (for every leaf).
  - Nothing at all is written for a node with repeat_count == 0 (children
    included).
  - Attribute values are escaped; labels and content text are not.
 *****************************************************************************/

#include "abbrev.hpp"

#include <cstddef>
#include <string>
#include <string_view>

namespace Combitoy::Markup {

	constexpr size_t UNLIMITED = size_t(-1);

	// & " < > -> entities
	std::string escape(std::string_view text);

	class Serializer
	{
	public:
		// capacity: the max. total length of the destination string after a write
		explicit Serializer(size_t capacity = UNLIMITED) : _capacity(capacity) {}

		// Appends the markup of node to dest, or throws Error (CapacityExceeded
		// or AllocationFailure), leaving dest unchanged.
		void write(const Abbrev::Node& node, std::string_view content, std::string& dest) const;

		std::string operator()(const Abbrev::Node& node, std::string_view content = {}) const;

		size_t capacity() const { return _capacity; }

	private:
		size_t _capacity;

		void _build(const Abbrev::Node& node, std::string_view content, std::string& out, size_t room) const;
	};

	// With no capacity limit
	std::string serialize(const Abbrev::Node& node, std::string_view content = {});

} // namespace Combitoy::Markup

#endif // _COMBITOY_MARKUP_HPP_
