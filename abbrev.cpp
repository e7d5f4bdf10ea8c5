// The first (and only) TU to expand the non-template tail of combitoy.hpp!
#include "abbrev.hpp"

#include <limits>
#include <utility>

namespace Combitoy::Abbrev {

//---------------------------------------------------------------------------
// Atomic matchers
//---------------------------------------------------------------------------
bool is_letter(char c) { return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z'); }
bool is_digit(char c)  { return c >= '0' && c <= '9'; }
bool is_space(char c)  { return c == ' ' || c == '\t'; }

op::Satisfy<char> letter() { return Satisfy("letter", is_letter); }
op::Satisfy<char> digit()  { return Satisfy("digit", is_digit); }
op::Satisfy<char> space()  { return Satisfy("space", is_space); }

op::Satisfy<char> mark(char c)
{
	return Satisfy(fmt::format("'{}'", c), [c](char sym) { return sym == c; });
}


//---------------------------------------------------------------------------
// Reductions
//---------------------------------------------------------------------------
namespace {

	using NodeParts = Pair<std::string, Pair<std::vector<Attribute>, std::optional<unsigned>>>;

	// Left-to-right positional accumulation; nullopt if it doesn't fit
	std::optional<unsigned> to_number(const std::vector<char>& digits)
	{
		constexpr auto MAX = std::numeric_limits<unsigned>::max();
		unsigned n = 0;
		for (char d : digits) {
			auto v = unsigned(d - '0');
			if (n > (MAX - v) / 10) return std::nullopt;
			n = n * 10 + v;
		}
		return n;
	}

	Node make_node(NodeParts&& parts)
	{
		Node node;
		node.label = std::move(parts.first);
		for (auto& attr : parts.second.first) {
			if (attr.kind == Attribute::Class) {
				if (!node.class_name.empty()) node.class_name += ' ';
				node.class_name += attr.name;
			} else {
				node.id = std::move(attr.name); // The last #id wins.
			}
		}
		node.repeat_count = parts.second.second.value_or(1);
		return node;
	}

	Node adopt_children(Pair<Node, std::vector<Node>>&& parts)
	{
		parts.first.children = std::move(parts.second);
		return std::move(parts.first);
	}

} // namespace


//---------------------------------------------------------------------------
Grammar::Grammar() :
	// Sync with the member order in Grammar! (Later rules copy the earlier ones.)
	label("label", Map(ManyOne(letter()), [](std::vector<char>&& chars) {
		return std::string(chars.begin(), chars.end());
	})),
	number("number", TryMap(ManyOne(digit()), to_number, ErrorKind::NumericOverflow,
		fmt::format("number up to {}", std::numeric_limits<unsigned>::max()))),

	class_name("class name", RightOnly(mark('.'), label)),
	id        ("id",         RightOnly(mark('#'), label)),
	count     ("count",      RightOnly(mark('*'), number)),

	attribute("attribute", OrElse(
		Map(class_name, [](std::string&& name) { return Attribute{Attribute::Class, std::move(name)}; }),
		Map(id,         [](std::string&& name) { return Attribute{Attribute::Id,    std::move(name)}; }))),

	node("node", Map(And(label, And(Many(attribute), Optional(count))), make_node)),
	child("child", RightOnly(mark('>'), node)),
	expression("expression", Map(And(node, Many(child)), adopt_children)),
	document("document", LeftOnly(expression, Eof()))
{
}

const Grammar& grammar()
{
	static const Grammar instance; // Built on first use, read-only ever after
	return instance;
}

Outcome<Node> parse(std::string_view text)
{
	auto result = grammar().document.parse(text, 0);
DBG("Abbrev::parse(\"{}\"): {}", text, result ? "OK"s : describe(result.failure(), text));
	return result;
}

} // namespace Combitoy::Abbrev
