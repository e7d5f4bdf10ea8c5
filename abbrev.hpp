#ifndef _COMBITOY_ABBREV_HPP_
#define _COMBITOY_ABBREV_HPP_
/*****************************************************************************
  Abbreviation notation -> node tree

    label[.class|#id]...[*count][>child...]

  e.g. "ul.menu>li.item*3>li#last" is a <ul> with two sorts of <li> children.
  The children form a flat sibling list under the root node; there's no
  deeper nesting (a > after a child adds another child to the root).

  The whole grammar is assembled from the combitoy operators only, and is
  built once, on first use (see grammar()).
 *****************************************************************************/

#include "combitoy.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace Combitoy::Abbrev {

	struct Node
	{
		std::string label;
		std::string class_name; // "" if none (several classes are space-separated)
		std::optional<std::string> id;
		unsigned repeat_count = 1; // 0 means suppressed, with all its children
		std::vector<Node> children;

		bool operator==(const Node&) const = default;
	};

	// One .class or #id suffix of a node
	struct Attribute
	{
		enum Kind { Class, Id } kind;
		std::string name;

		bool operator==(const Attribute&) const = default;
	};

	//-------------------------------------------------------------------
	// Atomic matchers
	bool is_letter(char c); // [A-Za-z] only, regardless of the locale
	bool is_digit(char c);  // [0-9]
	bool is_space(char c);  // ' ' or '\t'

	op::Satisfy<char> letter();
	op::Satisfy<char> digit();
	op::Satisfy<char> space();
	op::Satisfy<char> mark(char c); // exactly that one symbol, e.g. '>'

	//-------------------------------------------------------------------
	// The grammar rules (in dependency order; see abbrev.cpp for the
	// actual composition)
	struct Grammar
	{
		Rule<std::string> label;      // letter+
		Rule<unsigned>    number;     // digit+, fails on overflow
		Rule<std::string> class_name; // '.' label
		Rule<std::string> id;         // '#' label
		Rule<unsigned>    count;      // '*' number
		Rule<Attribute>   attribute;  // class_name | id
		Rule<Node>        node;       // label attribute* count?
		Rule<Node>        child;      // '>' node
		Rule<Node>        expression; // node child*
		Rule<Node>        document;   // expression, then end of input

		Grammar();
	};

	// The shared, immutable instance
	const Grammar& grammar();

	// Parse a complete abbreviation (trailing junk is a failure)
	Outcome<Node> parse(std::string_view text);

} // namespace Combitoy::Abbrev

#endif // _COMBITOY_ABBREV_HPP_
