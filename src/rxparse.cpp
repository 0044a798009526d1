/*
 * Regular expressions
 * Lexical scanner and parser, producing a syntax tree
 *
 * (c) Copyright Clifford Heath 2022. See LICENSE file for usage rights.
 */
#include	<rxengine.h>
#include	<string.h>

class RxToken
{
public:
	RxOp		op;		// The token type
	CharNum		offset;		// Where the token starts in the pattern
	UCS4		character;	// RxoChar, and the letter of an RxoCharProperty
	int		number;		// RxoCaptureGroup, RxoBackReference (0 for a named reference)
	RxRepetitionRange repetition;	// How many repetitions?
	RxRangeSet	ranges;		// RxoCharClass, RxoNegCharClass
	std::string	name;		// Named RxoCaptureGroup or RxoBackReference

	RxToken(RxOp _op, CharNum _offset)
	: op(_op), offset(_offset), character(0), number(0)
	{ repetition.min = repetition.max = 0; repetition.lazy = false; }
};

RxNode::RxNode(RxOp _op, CharNum _offset)
: op(_op)
, offset(_offset)
, character(0)
, number(0)
{
	repetition.min = repetition.max = 0;
	repetition.lazy = false;
}

RxAst::RxAst()
: root(-1)
, group_count(0)
{
}

void
RxAst::clear()
{
	nodes.clear();
	names.clear();
	root = -1;
	group_count = 0;
}

int
RxAst::add(const RxNode& node)
{
	nodes.push_back(node);
	return (int)nodes.size()-1;
}

RxCompiler::RxCompiler(const std::string& _re, RxOptions _options, RxFeature features, RxFeature reject_features)
: re(_re)
, options(_options)
, features_enabled((RxFeature)((int32_t)features & ~(int32_t)reject_features))
, features_rejected(reject_features)
, error_message(0)
, error_offset(0)
, error_code(0)
, total_groups(0)
{
}

RxCompiler::~RxCompiler()
{
}

bool RxCompiler::supported(RxFeature feat)
{
	if (((int32_t)features_rejected & (int32_t)feat) != 0)
	{
		// It would be nice to know the feature here, but we don't have format() yet
		error_code = RXERR_REJECTED;
		error_message = "Rejected feature";
		return false;
	}
	return enabled(feat);
}

bool RxCompiler::enabled(RxFeature feat) const
{
	return ((int32_t)features_enabled & (int32_t)feat) != 0;
}

// Record the first error only. Always returns false.
bool RxCompiler::fail(int code, const char* message, CharNum offset)
{
	if (!error_message)
	{
		error_code = code;
		error_message = message;
		error_offset = offset;
	}
	return false;
}

/*
 * Count the capturing groups, so we know whether \NN is a backreference
 * before we reach the groups it might refer to.
 */
int RxCompiler::countGroups() const
{
	int		count = 0;
	bool		in_class = false;

	if (!enabled(RxFeature::Group))
		return 0;
	for (CharNum i = 0; i < re.length(); i++)
	{
		switch (re[i])
		{
		case '\\':
			i++;
			break;
		case '[':
			in_class = true;
			break;
		case ']':
			in_class = false;
			break;
		case '(':
			if (in_class)
				break;
			if (re[i+1] != '?')
				count++;
			else if (re[i+2] == '<' && re[i+3] != '=' && re[i+3] != '!')
				count++;
			break;
		}
	}
	return count;
}

// Read exactly this many hex digits starting at i, leaving i on the last one
bool RxCompiler::scanHex(CharNum& i, int digits, UCS4& value) const
{
	value = 0;
	for (int d = 0; d < digits; d++)
	{
		int	digit = UCS4HexDigit(re[i+d]);
		if (digit < 0)
			return false;
		value = value*16 + digit;
	}
	i += digits-1;
	return true;
}

/*
 * Scan an escape that stands for a single character. i is at the backslash,
 * and is left on the last character of the escape.
 * Returns 1 for a character, 0 for an alphanumeric escape the caller must
 * interpret (ch is that letter or digit), or -1 after an error.
 */
int RxCompiler::scanCharEscape(CharNum& i, UCS4& ch)
{
	CharNum		start = i;
	UCS4		value;

	switch (ch = re[++i])
	{
	case UCS4_NONE:
		i = start;
		fail(RXERR_BAD_ESCAPE, "\\ at end of pattern", start);
		return -1;

	case 'f': if (!enabled(RxFeature::CEscapes)) goto identity; ch = '\f'; return 1;
	case 'n': if (!enabled(RxFeature::CEscapes)) goto identity; ch = '\n'; return 1;
	case 'r': if (!enabled(RxFeature::CEscapes)) goto identity; ch = '\r'; return 1;
	case 't': if (!enabled(RxFeature::CEscapes)) goto identity; ch = '\t'; return 1;
	case 'v': if (!enabled(RxFeature::CEscapes)) goto identity; ch = '\v'; return 1;

	case '0':
		if (!enabled(RxFeature::CEscapes))
			goto identity;
		if (UCS4Digit(re[i+1]) >= 0)
		{
			fail(RXERR_BAD_ESCAPE, "Invalid octal escape", start);
			return -1;
		}
		ch = 0;
		return 1;

	case 'c':			// Control character \cA to \cZ
		if (!supported(RxFeature::ControlChar))
			goto identity;
		value = re[i+1];
		if (!((value >= 'a' && value <= 'z') || (value >= 'A' && value <= 'Z')))
		{
			fail(RXERR_BAD_ESCAPE, "Invalid control character escape", start);
			return -1;
		}
		i++;
		ch = value % 32;
		return 1;

	case 'x':			// Hex byte (exactly 2 hex digits follow)
		if (!supported(RxFeature::HexChar))
			goto identity;
		if (!scanHex(++i, 2, ch))
		{
			fail(RXERR_BAD_ESCAPE, "Invalid hexadecimal escape", start);
			return -1;
		}
		return 1;

	case 'u':			// Unicode, \uHHHH
		if (!supported(RxFeature::UnicodeChar))
			goto identity;
		if (re[i+1] == '{')
			goto identity;	// A literal u, and the brace may start a quantifier
		if (!scanHex(++i, 4, ch))
		{
			fail(RXERR_BAD_ESCAPE, "Invalid Unicode escape", start);
			return -1;
		}

		// A surrogate pair written as two escapes is one character
		if (ch >= 0xD800 && ch <= 0xDBFF && re[i+1] == '\\' && re[i+2] == 'u')
		{
			CharNum	low_end = i+3;
			if (scanHex(low_end, 4, value) && value >= 0xDC00 && value <= 0xDFFF)
			{
				ch = 0x10000 + ((ch - 0xD800) << 10) + (value - 0xDC00);
				i = low_end;
			}
		}
		return 1;

	default:
		if ((ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || UCS4Digit(ch) >= 0)
			return 0;
	identity:
		ch = re[i];
		return 1;
	}
}

static void
addProperty(RxRangeSet& ranges, UCS4 property)
{
	static const RxRange	digit[] = { {'0', '9'} };
	static const RxRange	word[] = { {'0', '9'}, {'A', 'Z'}, {'_', '_'}, {'a', 'z'} };
	static const RxRange	white[] = {
		{0x09, 0x0D}, {0x20, 0x20}, {0xA0, 0xA0}, {0x1680, 0x1680},
		{0x2000, 0x200A}, {0x2028, 0x2029}, {0x202F, 0x202F}, {0x205F, 0x205F},
		{0x3000, 0x3000}, {0xFEFF, 0xFEFF}
	};
	const RxRange*	set;
	int		count;

	switch (property | 0x20)	// Lower case
	{
	case 'd':	set = digit; count = sizeof(digit)/sizeof(digit[0]); break;
	case 'w':	set = word; count = sizeof(word)/sizeof(word[0]); break;
	default:	set = white; count = sizeof(white)/sizeof(white[0]); break;
	}

	if (property >= 'a')
	{
		ranges.insert(ranges.end(), set, set+count);
		return;
	}

	// Upper case letters are the complement, which includes the illegal-byte characters
	UCS4	next = 0;
	for (int i = 0; i < count; i++)
	{
		if (set[i].first > next)
			ranges.push_back({next, set[i].first-1});
		next = set[i].last+1;
	}
	ranges.push_back({next, UCS4_NONE-1});
}

/*
 * Scan a character class. i is at the [, and is left on the closing ].
 * The result is a list of (inclusive) ranges of characters.
 */
bool RxCompiler::scanClass(CharNum& i, RxRangeSet& ranges, bool& negated)
{
	CharNum		start = i;
	CharNum		atom_start;
	UCS4		first, last;
	UCS4		first_property, last_property;

	auto	atom =
		[&](UCS4& ch, UCS4& property) -> bool
		{
			CharNum	escape = i;
			property = 0;
			if ((ch = re[i]) != '\\')
				return true;
			int	kind = scanCharEscape(i, ch);
			if (kind != 0)
				return kind > 0;
			switch (ch)
			{
			case 'b':		// Backspace inside a class
				ch = '\b';
				return true;

			case 'd': case 'D': case 'w': case 'W': case 's': case 'S':
				if (!supported(RxFeature::Shorthand))
					return !error_message;	// Just the letter
				property = ch;
				return true;

			default:
				return fail(RXERR_BAD_ESCAPE, "Invalid escape", escape);
			}
		};

	auto	add =
		[&](UCS4 ch, UCS4 property)
		{
			if (property)
				addProperty(ranges, property);
			else
				ranges.push_back({ch, ch});
		};

	ranges.clear();
	negated = re[i+1] == '^';
	if (negated)
		i++;
	for (i++; ; i++)
	{
		if (re[i] == UCS4_NONE)
			return fail(RXERR_BAD_CLASS, "Unterminated character class", start);
		if (re[i] == ']')
			return true;

		atom_start = i;
		if (!atom(first, first_property))
			return false;
		if (re[i+1] != '-' || re[i+2] == ']' || re[i+2] == UCS4_NONE)
		{
			add(first, first_property);
			continue;
		}

		i += 2;		// Character range
		if (!atom(last, last_property))
			return false;
		if (first_property || last_property)
		{		// A shorthand can't bound a range, so the - is literal
			add(first, first_property);
			add('-', 0);
			add(last, last_property);
			continue;
		}
		if (last < first)
			return fail(RXERR_CLASS_ORDER, "Range out of order in character class", atom_start);
		ranges.push_back({first, last});
	}
}

/*
 * Scan a group name up to the terminator. i is at the first character, and is left on the terminator.
 */
bool RxCompiler::scanGroupName(CharNum& i, UCS4 terminator, std::string& name)
{
	UTF8		buf[4];
	UTF8*		bp;

	name.clear();
	for (;; i++)
	{
		UCS4	ch = re[i];
		if (ch == terminator && !name.empty())
			return true;
		if (!((ch >= 'a' && ch <= 'z')
		   || (ch >= 'A' && ch <= 'Z')
		   || ch == '_' || ch == '$'
		   || (!name.empty() && UCS4Digit(ch) >= 0)
		   || (!UCS4IsASCII(ch) && UCS4IsUnicode(ch) && !UCS4IsWhite(ch))))
			return false;
		bp = buf;
		UTF8Put(bp, ch);
		name.append(buf, bp-buf);
	}
}

/*
 * Scan {n}, {n,} or {n,m}. i is at the {.
 * If this is not a well-formed quantifier, the { is an ordinary character.
 * Otherwise i is left on the }.
 */
bool RxCompiler::scanQuantifier(CharNum& i, RxRepetitionRange& repetition, bool& is_quantifier)
{
	CharNum		j = i+1;
	long		min = 0;
	long		max;
	int		digits;

	is_quantifier = false;
	for (digits = 0; UCS4Digit(re[j]) >= 0; digits++, j++)
		if (min <= RxMaxRepetition)
			min = min*10 + UCS4Digit(re[j]);
	if (digits == 0)
		return true;
	max = min;
	if (re[j] == ',')
	{
		max = 0;
		for (j++, digits = 0; UCS4Digit(re[j]) >= 0; digits++, j++)
			if (max <= RxMaxRepetition)
				max = max*10 + UCS4Digit(re[j]);
		if (digits == 0)
			max = RxUnbounded;
	}
	if (re[j] != '}')
		return true;

	is_quantifier = true;
	if (min > RxMaxRepetition || max > RxMaxRepetition)
		return fail(RXERR_REPETITION_LIMIT, "Repetition count is too large", i);
	if (max != RxUnbounded && max < min)
		return fail(RXERR_REPETITION_ORDER, "Numbers out of order in {} quantifier", i);
	repetition.min = (int)min;
	repetition.max = (int)max;
	repetition.lazy = false;
	i = j;
	return true;
}

/*
 * Ok ima apologise right now for the nested switch statements and especially the gotos.
 * Each escape or special character that is disabled must fall back to being ordinary,
 * and the gotos are the least complicated way to share that.
 */
bool RxCompiler::scanRegex(const std::function<bool(const RxToken& instr)> func)
{
	CharNum		i = 0;		// Regex character offset
	CharNum		start = 0;	// Offset of the current token
	UCS4		ch;		// A single character to match
	int		kind;		// Kind of escape
	int		group_number = 0;
	bool		ok = true;
	bool		is_quantifier;
	bool		negated;
	RxRepetitionRange repetition;
	RxRangeSet	ranges;
	std::string	name;

	error_message = 0;
	error_offset = -1;
	error_code = 0;
	total_groups = countGroups();

	ok = func(RxToken(RxOp::RxoStart, 0));
	for (; ok && !error_message && i < re.length(); i++)
	{
		start = i;
		switch (ch = re[i])
		{
		case '^':
			if (!supported(RxFeature::BOL))
				goto simple_char;
			ok = func(RxToken(RxOp::RxoBOL, start));
			break;

		case '$':
			if (!supported(RxFeature::EOL))
				goto simple_char;
			ok = func(RxToken(RxOp::RxoEOL, start));
			break;

		case '.':
			ok = func(RxToken(RxOp::RxoAny, start));
			break;

		case '?':
			if (!supported(RxFeature::ZeroOrOneQuest))
				goto simple_char;
			repetition.min = 0;
			repetition.max = 1;
			goto quantifier;

		case '*':
			if (!supported(RxFeature::ZeroOrMore))
				goto simple_char;
			repetition.min = 0;
			repetition.max = RxUnbounded;
			goto quantifier;

		case '+':
			if (!supported(RxFeature::OneOrMore))
				goto simple_char;
			repetition.min = 1;
			repetition.max = RxUnbounded;
			goto quantifier;

		case '{':
			if (!supported(RxFeature::CountRepetition))
				goto simple_char;
			if (!scanQuantifier(i, repetition, is_quantifier))
				break;
			if (!is_quantifier)
				goto simple_char;	// A { that doesn't start a quantifier is literal
		quantifier:
			repetition.lazy = false;
			if (re[i+1] == '?' && supported(RxFeature::Lazy))
			{
				repetition.lazy = true;
				i++;
			}
			{
				RxToken	token(RxOp::RxoRepetition, start);
				token.repetition = repetition;
				ok = func(token);
			}
			break;

		case '\\':		// Escape sequence
			if ((kind = scanCharEscape(i, ch)) < 0)
				break;
			if (kind > 0)
				goto char_token;
			switch (ch)
			{
			case 'b':
			case 'B':
				if (!supported(RxFeature::WordBoundary))
					goto char_token;
				ok = func(RxToken(ch == 'b' ? RxOp::RxoWordBoundary : RxOp::RxoNonWordBoundary, start));
				break;

			case 'd': case 'D':		// Digit
			case 'w': case 'W':		// Word character
			case 's': case 'S':		// Whitespace
				if (!supported(RxFeature::Shorthand))
					goto char_token;
				{
					RxToken	token(RxOp::RxoCharProperty, start);
					token.character = ch;
					ok = func(token);
				}
				break;

			case 'k':			// Named backreference
				if (!supported(RxFeature::Backreference))
					goto char_token;
				if (re[i+1] != '<')
				{
					fail(RXERR_BAD_BACKREFERENCE, "Invalid named backreference", start);
					break;
				}
				i += 2;
				if (!scanGroupName(i, '>', name))
				{
					fail(RXERR_BAD_GROUP_NAME, "Invalid group name", start);
					break;
				}
				{
					RxToken	token(RxOp::RxoBackReference, start);
					token.name = name;
					ok = func(token);
				}
				break;

			case '1': case '2': case '3': case '4': case '5':
			case '6': case '7': case '8': case '9':
				if (!supported(RxFeature::Backreference))
					goto char_token;
				{
					// Use the longest run of digits that names a group
					long	number = UCS4Digit(ch);
					CharNum	last = i;
					while (UCS4Digit(re[last+1]) >= 0 && number <= total_groups)
						number = number*10 + UCS4Digit(re[++last]);
					while (number > total_groups && last > i)
					{
						number /= 10;
						last--;
					}
					if (number > total_groups)
					{
						fail(RXERR_BAD_BACKREFERENCE, "Backreference to a nonexistent group", start);
						break;
					}
					i = last;

					RxToken	token(RxOp::RxoBackReference, start);
					token.number = (int)number;
					ok = func(token);
				}
				break;

			default:
				fail(RXERR_BAD_ESCAPE, "Invalid escape", start);
				break;
			}
			break;

		case '[':		// Character class
			if (!supported(RxFeature::CharClasses))
				goto simple_char;
			if (!scanClass(i, ranges, negated))
				break;
			{
				RxToken	token(negated ? RxOp::RxoNegCharClass : RxOp::RxoCharClass, start);
				token.ranges = ranges;
				ok = func(token);
			}
			break;

		case '|':
			if (!supported(RxFeature::Alternates))
				goto simple_char;
			ok = func(RxToken(RxOp::RxoAlternate, start));
			break;

		case '(':
			if (!supported(RxFeature::Group))
				goto simple_char;
			if (re[i+1] != '?')
			{		// Numbered capture
				RxToken	token(RxOp::RxoCaptureGroup, start);
				token.number = ++group_number;
				ok = func(token);
				break;
			}

			i += 2;	// Skip the '(?'
			switch (re[i])
			{
			case ':':	// Noncapturing group
				if (!supported(RxFeature::NonCapture))
					goto bad_group;
				ok = func(RxToken(RxOp::RxoNonCapturingGroup, start));
				break;

			case '=':	// Lookahead
				if (!supported(RxFeature::Lookahead))
					goto bad_group;
				ok = func(RxToken(RxOp::RxoLookahead, start));
				break;

			case '!':	// Negative Lookahead
				if (!supported(RxFeature::NegLookahead))
					goto bad_group;
				ok = func(RxToken(RxOp::RxoNegLookahead, start));
				break;

			case '<':
				if (re[i+1] == '=' || re[i+1] == '!')
				{
					fail(RXERR_BAD_GROUP, "Lookbehind is not supported", start);
					break;
				}
				if (!supported(RxFeature::Capture))
					goto bad_group;
				i++;
				if (!scanGroupName(i, '>', name))
				{
					fail(RXERR_BAD_GROUP_NAME, "Invalid group name", start);
					break;
				}
				{
					RxToken	token(RxOp::RxoCaptureGroup, start);
					token.number = ++group_number;
					token.name = name;
					ok = func(token);
				}
				break;

			default:
			bad_group:
				fail(RXERR_BAD_GROUP, "Invalid group", start);
				break;
			}
			break;

		case ')':
			if (!enabled(RxFeature::Group))
				goto simple_char;
			ok = func(RxToken(RxOp::RxoEndGroup, start));
			break;

		default:
		simple_char:
			ch = re[i];
		char_token:
			{
				RxToken	token(RxOp::RxoChar, start);
				token.character = ch;
				ok = func(token);
			}
			break;
		}
	}
	if (ok && !error_message)
		ok = func(RxToken(RxOp::RxoAccept, re.length()));
	if (!ok || error_message)
	{
		if (!error_message)
			fail(RXERR_BAD_GROUP, "Regular expression scan failed", start);
		if (error_offset < 0)
			error_offset = start;	// A rejected feature
		return false;
	}
	return true;
}

/*
 * Build a syntax tree from the tokens. Each open group has a stack frame
 * that collects the alternates of the group. An alternate is a sequence node.
 */
bool RxCompiler::parse(RxAst& ast)
{
	struct Frame {
		int		group;		// Node of the group, or -1 for the whole expression
		CharNum		offset;		// Where the group started
		std::vector<int> alternates;	// Sequence nodes of the finished alternates
		int		sequence;	// Sequence node being built
	};
	std::vector<Frame>	stack;

	auto	open =
		[&](int group, CharNum offset)
		{
			Frame	frame;
			frame.group = group;
			frame.offset = offset;
			frame.sequence = ast.add(RxNode(RxOp::RxoSequence, offset));
			stack.push_back(frame);
		};

	auto	append =
		[&](int n)
		{
			ast.node(stack.back().sequence).children.push_back(n);
		};

	// A sequence of one item is just that item
	auto	collapse =
		[&](int sequence) -> int
		{
			const RxNode&	node = ast.node(sequence);
			return node.children.size() == 1 ? node.children[0] : sequence;
		};

	// Finish the top frame, returning the node for its contents
	auto	close =
		[&]() -> int
		{
			Frame&	frame = stack.back();
			frame.alternates.push_back(frame.sequence);
			if (frame.alternates.size() == 1)
				return collapse(frame.alternates[0]);

			RxNode	alternate(RxOp::RxoAlternate, frame.offset);
			for (size_t a = 0; a < frame.alternates.size(); a++)
				alternate.children.push_back(collapse(frame.alternates[a]));
			return ast.add(alternate);
		};

	auto	builder =
		[&](const RxToken& token) -> bool
		{
			RxNode	node(token.op, token.offset);
			int	n;

			switch (token.op)
			{
			case RxOp::RxoStart:
				open(-1, 0);
				return true;

			case RxOp::RxoChar:
			case RxOp::RxoCharProperty:
				node.character = token.character;
				append(ast.add(node));
				return true;

			case RxOp::RxoCharClass:
			case RxOp::RxoNegCharClass:
				node.ranges = token.ranges;
				append(ast.add(node));
				return true;

			case RxOp::RxoBackReference:
				node.number = token.number;
				node.name = token.name;
				append(ast.add(node));
				return true;

			case RxOp::RxoAny:
			case RxOp::RxoBOL:
			case RxOp::RxoEOL:
			case RxOp::RxoWordBoundary:
			case RxOp::RxoNonWordBoundary:
				append(ast.add(node));
				return true;

			case RxOp::RxoCaptureGroup:
				for (size_t g = 0; !token.name.empty() && g < ast.names.size(); g++)
					if (ast.names[g] == token.name)
						return fail(RXERR_DUPLICATE_NAME, "Duplicate group name", token.offset);
				ast.names.push_back(token.name);
				ast.group_count = token.number;
				node.number = token.number;
				node.name = token.name;
				// Fall through
			case RxOp::RxoNonCapturingGroup:
			case RxOp::RxoLookahead:
			case RxOp::RxoNegLookahead:
				if (stack.size() > RxMaxNesting)
					return fail(RXERR_NESTING, "Nesting too deep", token.offset);
				open(ast.add(node), token.offset);
				return true;

			case RxOp::RxoAlternate:
				stack.back().alternates.push_back(stack.back().sequence);
				stack.back().sequence = ast.add(RxNode(RxOp::RxoSequence, token.offset));
				return true;

			case RxOp::RxoEndGroup:
				if (stack.size() <= 1)
					return fail(RXERR_UNMATCHED_PAREN, "Unmatched ')'", token.offset);
				n = close();
				ast.node(stack.back().group).children.push_back(n);
				n = stack.back().group;
				stack.pop_back();
				append(n);
				return true;

			case RxOp::RxoRepetition:
			{
				int	repeated;
				{
					const std::vector<int>&	items = ast.node(stack.back().sequence).children;
					if (items.empty())
						return fail(RXERR_NOTHING_TO_REPEAT, "Nothing to repeat", token.offset);
					repeated = items.back();
				}
				switch (ast.node(repeated).op)
				{
				case RxOp::RxoBOL:
				case RxOp::RxoEOL:
				case RxOp::RxoWordBoundary:
				case RxOp::RxoNonWordBoundary:
				case RxOp::RxoRepetition:
					return fail(RXERR_NOTHING_TO_REPEAT, "Nothing to repeat", token.offset);
				default:
					break;
				}
				node.repetition = token.repetition;
				node.children.push_back(repeated);
				n = ast.add(node);
				ast.node(stack.back().sequence).children.back() = n;
				return true;
			}

			case RxOp::RxoAccept:
				if (stack.size() > 1)
					return fail(RXERR_UNTERMINATED_GROUP, "Unterminated group", stack.back().offset);
				ast.root = close();
				stack.pop_back();
				return true;

			default:
				return false;
			}
		};

	ast.clear();
	if (!scanRegex(builder))
		return false;

	// Named backreferences may refer to groups later in the pattern
	for (int n = 0; n < ast.size(); n++)
	{
		RxNode&	node = ast.node(n);
		if (node.op != RxOp::RxoBackReference)
			continue;
		if (!node.name.empty())
		{
			for (size_t g = 0; g < ast.names.size(); g++)
				if (ast.names[g] == node.name)
					node.number = (int)g+1;
			if (node.number == 0)
				return fail(RXERR_BAD_BACKREFERENCE, "Backreference to an unknown group name", node.offset);
		}
		else if (node.number > ast.group_count)
			return fail(RXERR_BAD_BACKREFERENCE, "Backreference to a nonexistent group", node.offset);
	}
	return true;
}
