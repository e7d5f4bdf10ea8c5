#ifndef _COMBITOY_HPP_
#define _COMBITOY_HPP_
/*****************************************************************************
  Typed parser combinators for small tasks

    A handful of composable building blocks (a predicate matcher, sequencing,
    ordered choice, repetition, optionality and result mapping) to assemble
    recursive descent parsers by plugging them together, instead of writing
    the control flow by hand every time.

    Unlike an interpreted rule table, every parser here is a plain
    value of its own type, and the type of a composed parser's result is
    worked out by the compiler from the types of its operands. So a grammar
    that doesn't fit together won't even compile, long before any text gets
    near it.

  NOTE:

  - Nothing is copied from the input: parsers get a string_view and a
    position, and return where the next one should continue. The input must
    outlive the call, but not the parser. Parsers themselves are immutable
    after construction, so any of them can be reused (or shared across
    threads) freely.

  - A failed parse is a normal result (a Failure inside the Outcome), not an
    exception. Exceptions (Combitoy::Error) are only for broken grammars and
    blown limits.

  - If you need to #include this in more than one translation unit, then
    #define COMBITOY_DEDUP for all but the first one. (The combitoy library
    target exports that define to its users, so normally only abbrev.cpp
    sees the full thing.)

 *****************************************************************************/

//=============================================================================
//---------------------------------------------------------------------------
// My ad-hoc "ground-levelling" base language layer...
//---------------------------------------------------------------------------
#include <cassert>
#include <exception>
#include <stdexcept>
#include <fmt/format.h> //! std::format is still missing from the stock GCC-12 lib here; {fmt} is the same API.
#include <string>
	using std::string;
	using namespace std::literals::string_literals;
#ifndef NDEBUG
#include <iostream>
	using std::cerr, std::cout, std::endl;
#endif

//!!
//!! My plain, undecorated toy macros conflict with the Windows headers (included by DocTest), and who knows what else...
//!! (They are #undef'd at the end of this header!)
//!!
#define CONST constexpr static auto
#define OUT

//! For variadic macros, e.g. for calling format(...):
//!
//! The old MSVC preproc. suppresses the extra ',' when no more args... But, it
//! doesn't understand __VA_OPT__, so the __VA_OPT__(,) __VA_ARGS__ approach
//! can't be unified. (GCC is OK with that, as is the new MCVC preproc,
//! activated by /Zc:preprocessor)
#if defined(__GNUC__) \
	|| defined(_MSC_VER) && (!defined(_MSVC_TRADITIONAL) || !_MSVC_TRADITIONAL)
#  define _Sz_CONFORMANT_PREPROCESSOR 1
#else
#  error Unsupported compiler toolset, or the old MSVC preprocessor! (Use /Zc:preprocessor.)
#endif

#ifndef NDEBUG
#  define DBG(msg, ...) std::cerr << fmt::format("DBG> {}", fmt::format(msg __VA_OPT__(,) __VA_ARGS__)) << std::endl
   // Same as DBG(), but with no trailing \n (for continuation lines)
#  define DBG_(msg, ...) std::cerr << fmt::format("DBG> {}", fmt::format(msg __VA_OPT__(,) __VA_ARGS__))
   // Continuation lines -- same as DBG(), but without the DBG prefix
#  define _DBG(msg, ...) std::cerr << fmt::format(msg __VA_OPT__(,) __VA_ARGS__) << std::endl
   // Line fragment -- neither DBG prefix, no trailing \n
#  define _DBG_(msg, ...) std::cerr << fmt::format(msg __VA_OPT__(,) __VA_ARGS__)

#  define DBG_DEFAULT_TRIM_LEN 30
   // Trim length is ignored as yet, just using the default:
#  define DBG_TRIM(str, ...) (std::string_view(str).length() > DBG_DEFAULT_TRIM_LEN - 3 ? \
		(std::string(std::string_view(str).substr(0, DBG_DEFAULT_TRIM_LEN - 3))) + "..." : \
		std::string(str))
#else
#  define DBG(msg, ...)
#  define DBG_(msg, ...)
#  define _DBG(msg, ...)
#  define _DBG_(msg, ...)
#  define DBG_TRIM(str, ...) std::string(str)
#endif

// Note: ERROR() below is _not_ a debug feature!
// The first arg. is an ErrorKind enumerator name, e.g. ERROR(NoProgress, "...")
#define ERROR(kind, msg, ...) throw ::Combitoy::Error(::Combitoy::ErrorKind::kind, fmt::format(msg __VA_OPT__(,) __VA_ARGS__))
//---------------------------------------------------------------------------
//=============================================================================


//---------------------------------------------------------------------------
#include <string_view>
	using std::string_view;
#include <concepts>
#include <functional> // function, invoke_result_t
#include <new>        // bad_alloc
#include <optional>
#include <type_traits>
#include <utility>    // move
#include <variant>
#include <vector>


//---------------------------------------------------------------------------
namespace Combitoy {

	//-------------------------------------------------------------------
	// Failures...

	enum class ErrorKind {
		EndOfInput,        // predicate attempted past the end of the input
		Unsatisfied,       // predicate evaluated false at a valid position
		SequenceFailure,   // a later (non-optional) part of a sequence failed
		AllocationFailure, // couldn't grow the collection of a repetition
		CapacityExceeded,  // output wouldn't fit into the configured capacity
		NumericOverflow,   // number too large for its target type
		NoProgress,        // repetition of a parser that consumes nothing
		InvalidArgument,   // nonsensical combinator arguments (e.g. min > max)
	};

	const char* to_cstr(ErrorKind kind);

	// For broken grammars and blown limits; never for an ordinary failed parse!
	class Error : public std::runtime_error
	{
	public:
		const ErrorKind kind;

		Error(ErrorKind kind, const string& msg)
			: std::runtime_error(fmt::format("- ERROR: {}", msg)), kind(kind) {}
	};

	struct Failure
	{
		ErrorKind kind;
		size_t    pos;      // where the failing construct was attempted
		string    expected; // name of what was expected there (e.g. "letter")
		ErrorKind cause;    // the atomic kind behind a SequenceFailure (== kind otherwise)

		Failure(ErrorKind kind, size_t pos, string expected)
			: kind(kind), pos(pos), expected(std::move(expected)), cause(kind) {}

		// Same failure, reported from the 2nd (or later) part of a sequence
		Failure in_sequence() const {
			Failure f = *this;
			f.kind = ErrorKind::SequenceFailure;
			return f;
		}

		// Not a mismatch, but a resource or range problem: nothing should absorb
		// it, not even when it's already wrapped into a SequenceFailure
		bool is_fatal() const {
			return cause == ErrorKind::AllocationFailure || cause == ErrorKind::NumericOverflow;
		}
	};

	// Human-readable version of a failure, for the end user
	string describe(const Failure& f, string_view input);

	// The one that got further into the input (b on a tie)
	inline std::optional<Failure> further(const std::optional<Failure>& a, const std::optional<Failure>& b)
	{
		if (!a) return b;
		if (!b) return a;
		return a->pos > b->pos ? a : b;
	}

	// f, unless a failure absorbed earlier on the way got strictly further
	// (then that one is the real culprit; f is just where matching backed off)
	inline Failure deepest(Failure f, const std::optional<Failure>& backoff)
	{
		if (f.is_fatal() || !backoff || backoff->pos <= f.pos) return f;
		return backoff->in_sequence();
	}


	//-------------------------------------------------------------------
	// Results...

	template <typename T>
	struct Success
	{
		size_t next; // where to continue from
		T      value;
		std::optional<Failure> backoff = {}; // furthest failure absorbed by Optional/Many/OrElse on the way
	};

	template <typename T>
	class Outcome
	{
	public:
		using value_type = T;

		Outcome(Success<T> s) : _result(std::move(s)) {}
		Outcome(Failure f)    : _result(std::move(f)) {}

		bool ok() const { return std::holds_alternative<Success<T>>(_result); }
		explicit operator bool() const { return ok(); }

		//! These throw std::bad_variant_access if asked for the wrong side!
		size_t next() const { return std::get<Success<T>>(_result).next; }
		const T& value() const & { return std::get<Success<T>>(_result).value; }
		      T& value()       & { return std::get<Success<T>>(_result).value; }
		      T  value()      && { return std::move(std::get<Success<T>>(_result).value); }
		const Failure& failure() const { return std::get<Failure>(_result); }
		const std::optional<Failure>& backoff() const { return std::get<Success<T>>(_result).backoff; }

	private:
		std::variant<Success<T>, Failure> _result;
	};


	//-------------------------------------------------------------------
	// The parser contract...

	template <typename Sym>
	using Input = std::basic_string_view<Sym>;

	template <typename P>
	concept Parser = requires(const P& p, Input<typename P::symbol_type> in, size_t pos) {
		typename P::output_type;
		{ p.parse(in, pos) } -> std::same_as<Outcome<typename P::output_type>>;
	};

	template <Parser P> using Output = typename P::output_type;
	template <Parser P> using Symbol = typename P::symbol_type;

	// Named record for the result of And (instead of positional tuple fields)
	template <typename A, typename B>
	struct Pair
	{
		A first;
		B second;

		bool operator==(const Pair&) const = default;
	};


//---------------------------------------------------------------------------
// Operators (the parser types themselves)...
//
// Use the factory functions (Satisfy(), And(), Many() etc.) further below to
// create them, instead of spelling out these types!
//---------------------------------------------------------------------------
namespace op {

	CONST UNBOUNDED = size_t(-1);

	//-------------------------------------------------------------------
	// Method chaining, as a shorthand for the factories:
	// p.and_then(q) == AndThen(p, q), p.and_with(q) == And(p, q),
	// p.or_else(q) == OrElse(p, q), p.map(f) == Map(p, f)
	// (Defined after the operators, at the end of this namespace.)
	template <typename Self>
	class Fluent
	{
	public:
		template <Parser Q>   auto and_then(Q q) const;
		template <Parser Q>   auto and_with(Q q) const;
		template <Parser Q>   auto or_else(Q q) const;
		template <typename F> auto map(F f) const;

	private:
		const Self& _self() const { return static_cast<const Self&>(*this); }
	};

	//-------------------------------------------------------------------
	template <typename Sym = char>
	class Satisfy : public Fluent<Satisfy<Sym>>
	{
	public:
		using symbol_type = Sym;
		using output_type = Sym;
		using Predicate = std::function<bool(Sym)>;

		Satisfy(string name, Predicate pred) : _name(std::move(name)), _pred(std::move(pred)) {}

		Outcome<Sym> parse(Input<Sym> in, size_t pos) const
		{
			if (pos >= in.length()) return Failure(ErrorKind::EndOfInput, pos, _name);
			if (!_pred(in[pos]))     return Failure(ErrorKind::Unsatisfied, pos, _name);
			return Success<Sym>{pos + 1, in[pos]};
		}

		const string& name() const { return _name; }

	private:
		string    _name; // what it's called in diagnostics, e.g. "digit"
		Predicate _pred;
	};

	//-------------------------------------------------------------------
	template <typename Sym = char>
	class Eof : public Fluent<Eof<Sym>>
	{
	public:
		using symbol_type = Sym;
		using output_type = std::monostate;

		Outcome<output_type> parse(Input<Sym> in, size_t pos) const
		{
			if (pos >= in.length()) return Success<output_type>{pos, {}};
			return Failure(ErrorKind::Unsatisfied, pos, "end of input");
		}
	};

	//-------------------------------------------------------------------
	// Common part of the two-operand operators
	template <Parser P, Parser Q>
	class Binary
	{
		static_assert(std::is_same_v<Symbol<P>, Symbol<Q>>,
			"Can't combine parsers of different input types!");
	public:
		using symbol_type = Symbol<P>;

		Binary(P p, Q q) : _p(std::move(p)), _q(std::move(q)) {}

	protected:
		P _p;
		Q _q;

		// Run p, then q from where p stopped. A failure of q is reported
		// as a SequenceFailure at q's position (or at a failure p absorbed
		// further on, if any); p's consumption is NOT undone!
		template <typename F>
		auto _sequence(Input<symbol_type> in, size_t pos, F&& combine) const
			-> Outcome<std::invoke_result_t<F, Output<P>&&, Output<Q>&&>>
		{
			auto r1 = _p.parse(in, pos);
			if (!r1) return r1.failure();
			auto r2 = _q.parse(in, r1.next());
			if (!r2) return deepest(r2.failure().in_sequence(), r1.backoff());
			auto next = r2.next();
			auto backoff = further(r1.backoff(), r2.backoff());
			return Success<std::invoke_result_t<F, Output<P>&&, Output<Q>&&>>{
				next, combine(std::move(r1).value(), std::move(r2).value()), std::move(backoff)};
		}
	};

	//-------------------------------------------------------------------
	template <Parser P, Parser Q>
	class And : public Binary<P, Q>, public Fluent<And<P, Q>>
	{
	public:
		using output_type = Pair<Output<P>, Output<Q>>;
		using Binary<P, Q>::Binary;

		Outcome<output_type> parse(Input<Symbol<P>> in, size_t pos) const
		{
			return this->_sequence(in, pos, [](Output<P>&& a, Output<Q>&& b) {
				return output_type{std::move(a), std::move(b)};
			});
		}
	};

	//-------------------------------------------------------------------
	// Right-biased sequence: only q's output is kept (e.g. separator-then-payload)
	template <Parser P, Parser Q>
	class AndThen : public Binary<P, Q>, public Fluent<AndThen<P, Q>>
	{
	public:
		using output_type = Output<Q>;
		using Binary<P, Q>::Binary;

		Outcome<output_type> parse(Input<Symbol<P>> in, size_t pos) const
		{
			return this->_sequence(in, pos, [](Output<P>&&, Output<Q>&& b) { return std::move(b); });
		}
	};

	//-------------------------------------------------------------------
	// Left-biased sequence: only p's output is kept (e.g. payload-then-terminator)
	template <Parser P, Parser Q>
	class LeftOnly : public Binary<P, Q>, public Fluent<LeftOnly<P, Q>>
	{
	public:
		using output_type = Output<P>;
		using Binary<P, Q>::Binary;

		Outcome<output_type> parse(Input<Symbol<P>> in, size_t pos) const
		{
			return this->_sequence(in, pos, [](Output<P>&& a, Output<Q>&&) { return std::move(a); });
		}
	};

	//-------------------------------------------------------------------
	// Ordered choice, with real backtracking: q always starts from the
	// original position, so p's partial consumption never leaks into q.
	// (Only the diagnostics remember p's attempt.)
	template <Parser P, Parser Q>
	class OrElse : public Binary<P, Q>, public Fluent<OrElse<P, Q>>
	{
		static_assert(std::is_same_v<Output<P>, Output<Q>>,
			"OrElse: the alternatives must have the same output type!");
	public:
		using output_type = Output<P>;
		using Binary<P, Q>::Binary;

		Outcome<output_type> parse(Input<Symbol<P>> in, size_t pos) const
		{
			auto r1 = this->_p.parse(in, pos);
			if (r1 || r1.failure().is_fatal()) return r1;
//DBG("OrElse: 1st choice failed at {} (expected {}), retrying from {}", r1.failure().pos, r1.failure().expected, pos);
			auto r2 = this->_q.parse(in, pos);
			if (r2) {
				auto next = r2.next();
				auto backoff = further(r1.failure(), r2.backoff());
				return Success<output_type>{next, std::move(r2).value(), std::move(backoff)};
			}
			// Both failed: blame the one that got further (q on a tie)
			if (r2.failure().is_fatal() || r1.failure().pos <= r2.failure().pos) return r2;
			return r1;
		}
	};

	//-------------------------------------------------------------------
	// Bounded/unbounded repetition: Many, ManyOne and Times are all this.
	template <Parser P>
	class Repeat : public Fluent<Repeat<P>>
	{
	public:
		using symbol_type = Symbol<P>;
		using output_type = std::vector<Output<P>>;

		Repeat(P p, size_t min, size_t max = UNBOUNDED) : _p(std::move(p)), _min(min), _max(max)
		{
			if (min > max) {
				ERROR(InvalidArgument, "Repetition with min ({}) > max ({})!", min, max);
			}
		}

		Outcome<output_type> parse(Input<symbol_type> in, size_t pos) const
		{
			output_type items; //! Local to this call: nothing survives to the next one.
			auto at = pos;
			std::optional<Failure> backoff;

			while (items.size() < _max)
			{
				auto r = _p.parse(in, at);
				if (!r) {
					if (r.failure().is_fatal()) return r.failure();
					if (items.size() >= _min) {
						backoff = further(backoff, r.failure());
						break;
					}
					// Not enough matches:
					if (items.empty()) return r.failure();
					return deepest(r.failure().in_sequence(), backoff);
				}

				auto next = r.next();
				if (next == at && _max == UNBOUNDED) { // We're stuck forever if not progressing!
					ERROR(NoProgress, "Infinite loop in repetition: no input consumed at position {}!", at);
				}

				backoff = further(backoff, r.backoff());
				try {
					items.push_back(std::move(r).value());
				} catch (const std::bad_alloc&) {
					return Failure(ErrorKind::AllocationFailure, at, "storage for repeated items");
				}
				at = next;
			}
			return Success<output_type>{at, std::move(items), std::move(backoff)};
		}

		size_t min() const { return _min; }
		size_t max() const { return _max; }

	private:
		P      _p;
		size_t _min;
		size_t _max;
	};

	//-------------------------------------------------------------------
	// Never fails; on p's failure it's "absent", and the position stays put.
	template <Parser P>
	class Optional : public Fluent<Optional<P>>
	{
	public:
		using symbol_type = Symbol<P>;
		using output_type = std::optional<Output<P>>;

		explicit Optional(P p) : _p(std::move(p)) {}

		Outcome<output_type> parse(Input<symbol_type> in, size_t pos) const
		{
			auto r = _p.parse(in, pos);
			if (!r) {
				if (r.failure().is_fatal()) return r.failure();
				return Success<output_type>{pos, std::nullopt, r.failure()};
			}
			auto next = r.next();
			auto backoff = r.backoff();
			return Success<output_type>{next, std::move(r).value(), std::move(backoff)};
		}

	private:
		P _p;
	};

	//-------------------------------------------------------------------
	// f must be total: it can't make the parse fail (see TryMap for that)
	template <Parser P, typename F>
	class Map : public Fluent<Map<P, F>>
	{
	public:
		using symbol_type = Symbol<P>;
		using output_type = std::decay_t<std::invoke_result_t<const F&, Output<P>&&>>;

		Map(P p, F f) : _p(std::move(p)), _f(std::move(f)) {}

		Outcome<output_type> parse(Input<symbol_type> in, size_t pos) const
		{
			auto r = _p.parse(in, pos);
			if (!r) return r.failure();
			auto next = r.next();
			auto backoff = r.backoff();
			return Success<output_type>{next, std::invoke(_f, std::move(r).value()), std::move(backoff)};
		}

	private:
		P _p;
		F _f;
	};

	//-------------------------------------------------------------------
	// Partial transformation: f returns an optional; nullopt rejects the
	// match, reported at the *start* position (so nothing is consumed).
	template <Parser P, typename F>
	class TryMap : public Fluent<TryMap<P, F>>
	{
		using Result = std::decay_t<std::invoke_result_t<const F&, Output<P>&&>>;
	public:
		using symbol_type = Symbol<P>;
		using output_type = typename Result::value_type;

		TryMap(P p, F f, ErrorKind kind, string expected)
			: _p(std::move(p)), _f(std::move(f)), _kind(kind), _expected(std::move(expected)) {}

		Outcome<output_type> parse(Input<symbol_type> in, size_t pos) const
		{
			auto r = _p.parse(in, pos);
			if (!r) return r.failure();
			auto next = r.next();
			auto backoff = r.backoff();
			Result mapped = std::invoke(_f, std::move(r).value());
			if (!mapped) return Failure(_kind, pos, _expected);
			return Success<output_type>{next, std::move(*mapped), std::move(backoff)};
		}

	private:
		P         _p;
		F         _f;
		ErrorKind _kind;
		string    _expected;
	};

	//-------------------------------------------------------------------
	template <typename Self> template <Parser Q>
	auto Fluent<Self>::and_then(Q q) const { return AndThen<Self, Q>(_self(), std::move(q)); }

	template <typename Self> template <Parser Q>
	auto Fluent<Self>::and_with(Q q) const { return And<Self, Q>(_self(), std::move(q)); }

	template <typename Self> template <Parser Q>
	auto Fluent<Self>::or_else(Q q) const { return OrElse<Self, Q>(_self(), std::move(q)); }

	template <typename Self> template <typename F>
	auto Fluent<Self>::map(F f) const { return Map<Self, F>(_self(), std::move(f)); }

} // namespace op


//---------------------------------------------------------------------------
// Type-erased parser handle
//
// Any parser with output T (over Sym) can be stored in a Rule<T, Sym>, so
// grammar pieces can be declared in headers and built in .cpp files, without
// having to spell out (or even know) their exact combinator types.
//---------------------------------------------------------------------------
template <typename T, typename Sym = char>
class Rule : public op::Fluent<Rule<T, Sym>>
{
public:
	using symbol_type = Sym;
	using output_type = T;

	template <Parser P>
	Rule(string name, P p) : _name(std::move(name))
	{
		static_assert(std::is_same_v<Output<P>, T>, "Rule: wrong output type!");
		static_assert(std::is_same_v<Symbol<P>, Sym>, "Rule: wrong input type!");
		_parse = [p = std::move(p)](Input<Sym> in, size_t pos) { return p.parse(in, pos); };
	}

	Outcome<T> parse(Input<Sym> in, size_t pos) const
	{
		assert(_parse);
		return _parse(in, pos);
	}

	const string& name() const { return _name; }

private:
	string _name; // for diagnostics only
	std::function<Outcome<T>(Input<Sym>, size_t)> _parse;
};


//---------------------------------------------------------------------------
// Factories...
//---------------------------------------------------------------------------

	template <typename Sym = char>
	auto Satisfy(string name, typename op::Satisfy<Sym>::Predicate pred) {
		return op::Satisfy<Sym>(std::move(name), std::move(pred));
	}

	template <typename Sym = char>
	auto Eof() { return op::Eof<Sym>(); }

	template <Parser P, Parser Q> auto And(P p, Q q)       { return op::And<P, Q>(std::move(p), std::move(q)); }
	template <Parser P, Parser Q> auto AndThen(P p, Q q)   { return op::AndThen<P, Q>(std::move(p), std::move(q)); }
	template <Parser P, Parser Q> auto RightOnly(P p, Q q) { return op::AndThen<P, Q>(std::move(p), std::move(q)); } // marker, then payload
	template <Parser P, Parser Q> auto LeftOnly(P p, Q q)  { return op::LeftOnly<P, Q>(std::move(p), std::move(q)); }
	template <Parser P, Parser Q> auto OrElse(P p, Q q)    { return op::OrElse<P, Q>(std::move(p), std::move(q)); }
	template <Parser P, Parser Q> auto Or(P p, Q q)        { return OrElse(std::move(p), std::move(q)); }

	// Chained alternatives: Or(a, b, c, ...) == OrElse(a, OrElse(b, OrElse(c, ...)))
	template <Parser P, Parser Q, Parser... Rest>
		requires (sizeof...(Rest) > 0)
	auto Or(P p, Q q, Rest... rest) {
		return OrElse(std::move(p), Or(std::move(q), std::move(rest)...));
	}

	template <Parser P> auto Many(P p)     { return op::Repeat<P>(std::move(p), 0); }
	template <Parser P> auto ManyOne(P p)  { return op::Repeat<P>(std::move(p), 1); }
	template <Parser P> auto Times(P p, size_t min, size_t max) { return op::Repeat<P>(std::move(p), min, max); }
	template <Parser P> auto Optional(P p) { return op::Optional<P>(std::move(p)); }

	template <Parser P, typename F>
		requires std::invocable<const F&, Output<P>&&>
	auto Map(P p, F f) { return op::Map<P, F>(std::move(p), std::move(f)); }

	template <Parser P, typename F>
		requires std::invocable<const F&, Output<P>&&>
	auto TryMap(P p, F f, ErrorKind kind, string expected) {
		return op::TryMap<P, F>(std::move(p), std::move(f), kind, std::move(expected));
	}

	// Convenience front-end: parse from the start of the text
	template <Parser P>
	auto parse(const P& p, Input<Symbol<P>> text) { return p.parse(text, 0); }

} // namespace Combitoy


//
//--------------------------------------------<< C U T  H E R E ! >>--------------------------------------------
//


#ifndef COMBITOY_DEDUP
//===========================================================================
namespace Combitoy {

const char* to_cstr(ErrorKind kind)
{
	switch (kind) {
	case ErrorKind::EndOfInput:        return "EndOfInput";
	case ErrorKind::Unsatisfied:       return "Unsatisfied";
	case ErrorKind::SequenceFailure:   return "SequenceFailure";
	case ErrorKind::AllocationFailure: return "AllocationFailure";
	case ErrorKind::CapacityExceeded:  return "CapacityExceeded";
	case ErrorKind::NumericOverflow:   return "NumericOverflow";
	case ErrorKind::NoProgress:        return "NoProgress";
	case ErrorKind::InvalidArgument:   return "InvalidArgument";
	}
	return "!!BUG: MISSING NAME FOR ErrorKind!!";
}

string describe(const Failure& f, string_view input)
{
	string found = f.pos < input.length()
		? fmt::format("'{}'", input[f.pos])
		: "end of input"s;

	if (f.kind == ErrorKind::NumericOverflow) {
		return fmt::format("{} at position {}: expected {}", to_cstr(f.kind), f.pos, f.expected);
	}
	if (f.kind == ErrorKind::SequenceFailure) {
		return fmt::format("{} ({}) at position {}: expected {}, found {}",
			to_cstr(f.kind), to_cstr(f.cause), f.pos, f.expected, found);
	}
	return fmt::format("{} at position {}: expected {}, found {}",
		to_cstr(f.kind), f.pos, f.expected, found);
}

} // namespace Combitoy

#endif // COMBITOY_DEDUP

//!! My cute little macros conflict with e.g. the Windows headers (included by DocTest)!
#undef CONST
#undef OUT
#undef ERROR
#endif // _COMBITOY_HPP_
