#if !defined(RXENGINE_H)
#define RXENGINE_H
/*
 * Regular expression configuration, parser, compiler, matcher and results
 *
 * The pattern language is the common subset of JavaScript regular expressions.
 * A pattern is scanned into tokens, parsed into a syntax tree (RxAst), and
 * compiled into an RxProgram for a backtracking matcher.
 *
 * WARNING: The matcher backtracks. Nested quantifiers over ambiguous alternatives,
 * such as /(a|a)*b/ or /(a*)*b/, can take time exponential in the length of the
 * input before failing. Nothing here bounds that. A caller that matches untrusted
 * patterns against long inputs must impose its own limits.
 *
 * (c) Copyright Clifford Heath 2022. See LICENSE file for usage rights.
 */
#include	<functional>
#include	<string>
#include	<vector>

#include	<error.h>
#include	<refcount.h>
#include	<rxtext.h>

/*
 * Error numbers in the regular expression message set
 */
#define	RXERR_SET		2	// Message set number for regular expressions
#define	RXERR_UNTERMINATED_GROUP 1	// A group has no closing parenthesis
#define	RXERR_UNMATCHED_PAREN	2	// A closing parenthesis has no group to close
#define	RXERR_REPETITION_ORDER	3	// {max,min}
#define	RXERR_NOTHING_TO_REPEAT	4	// A quantifier that follows nothing, or another quantifier
#define	RXERR_BAD_ESCAPE	5	// Unknown or malformed escape sequence
#define	RXERR_BAD_BACKREFERENCE	6	// Backreference to a group that doesn't exist
#define	RXERR_BAD_CLASS		7	// Character class has no closing ]
#define	RXERR_CLASS_ORDER	8	// Character class range like [z-a]
#define	RXERR_BAD_GROUP_NAME	9	// Group name is not an identifier
#define	RXERR_DUPLICATE_NAME	10	// Two groups have the same name
#define	RXERR_BAD_GROUP		11	// (?...) of an unsupported kind, including lookbehind
#define	RXERR_NESTING		12	// Groups nested more deeply than RxMaxNesting
#define	RXERR_REPETITION_LIMIT	13	// A repetition count larger than RxMaxRepetition
#define	RXERR_REJECTED		14	// The pattern uses a rejected feature

#define	RxMaxNesting		250	// Maximum nesting depth for groups
#define	RxMaxRepetition		65535	// Largest number allowed in a {n,m} quantifier
#define	RxUnbounded		(-1)	// RxRepetitionRange.max for * + and {n,}

/*
 * Options that affect how a compiled pattern matches.
 */
struct RxOptions
{
	bool		case_insensitive;	// i: compare characters after case folding
	bool		multiline;		// m: ^ and $ match at line terminators
	bool		dot_all;		// s: . also matches line terminators

	RxOptions(bool i = false, bool m = false, bool s = false)
	: case_insensitive(i), multiline(m), dot_all(s) {}
};

/*
 * Configurable features. Normal things are default, but you can either
 * disable, or detect and reject specific features in the compiler.
 * A disabled feature is read as literal characters.
 */
enum class RxFeature
{
	NoFeature	= 0x0000000,
	// Kinds of characters or classes:
	CEscapes	= 0x0000001,	// \0 \f \n \r \t \v
	Shorthand	= 0x0000002,	// \d \D \w \W \s \S
	ControlChar	= 0x0000004,	// \cX
	HexChar		= 0x0000008,	// \xHH
	UnicodeChar	= 0x0000010,	// \uHHHH
	CharClasses	= 0x0000040,	// [...], [^...]
	// Kinds of multiplicity:
	ZeroOrOneQuest	= 0x0000100,	// ?, zero or one
	ZeroOrMore	= 0x0000200,	// *, zero or more
	OneOrMore	= 0x0000400,	// +, one or more
	CountRepetition	= 0x0000800,	// {n,m}
	Lazy		= 0x0001000,	// *? +? ?? {n,m}?
	// Groups of regular expressions:
	Alternates	= 0x0002000,	// re1|re2
	Group		= 0x0004000,	// (re)
	Capture		= 0x0008000,	// (?<group_name>re)
	NonCapture	= 0x0010000,	// (?:re)
	Lookahead	= 0x0020000,	// (?=re)
	NegLookahead	= 0x0040000,	// (?!re)
	Backreference	= 0x0080000,	// \1, \k<group_name>
	// Assertions
	BOL		= 0x0100000,	// ^ beginning of line
	EOL		= 0x0200000,	// $ end of line
	WordBoundary	= 0x0400000,	// \b \B
	AllFeatures	= 0x07FFFFF,
};

// Regular expression tokens, syntax tree nodes, and instruction opcodes
enum class RxOp: char
{
	// These are lexical tokens or syntax tree nodes only
	RxoNull = 0,		// Nothing
	RxoSequence = 1,	// Concatenation of the children (tree only)
	RxoNonCapturingGroup = 2,	// (?:...)
	RxoCaptureGroup = 3,	// (...) or (?<name>...)
	RxoAlternate = 4,	// |
	RxoEndGroup = 5,	// End of a group (token only)
	RxoRepetition = 6,	// * + ? {n,m}, greedy or lazy
	RxoStart = 'S',		// Start of the token stream

	// The following are tokens, tree nodes and instructions. Use ASCII to make it a bit readable
	RxoChar = 'C',		// A single literal character
	RxoCharClass = 'L',	// Character class
	RxoNegCharClass = 'N',	// Negated Character class
	RxoCharProperty = 'P',	// \d \D \w \W \s \S
	RxoAny = '.',		// Any single char
	RxoBOL = '^',		// Beginning of Line
	RxoEOL = '$',		// End of Line
	RxoWordBoundary = 'b',	// \b
	RxoNonWordBoundary = 'B', // \B
	RxoBackReference = 'K',	// \1, \k<name>
	RxoLookahead = '=',	// (?=...)
	RxoNegLookahead = '!',	// (?!...)
	RxoAccept = '#',	// Termination condition

	// These opcodes are instructions, not lexical tokens
	RxoJump = 'J',		// Continue from a different instruction
	RxoSplit = 'A',		// Continue with the next instruction, or backtrack to the alternate
	RxoLazySplit = 'a',	// Continue with the alternate, or backtrack to the next instruction
	RxoZero = 'Z',		// Zero a repetition counter
	RxoCount = 'R',		// Compare a counter with min and max, and decide whether to iterate
	RxoIterate = 'I',	// Start an iteration: note the offset and reset contained captures
	RxoIterateEnd = 'E',	// End an iteration: reject an empty one, count it and loop
	RxoCaptureStart = '(',	// Save start
	RxoCaptureEnd = ')',	// Save end
};

struct RxRepetitionRange
{
	int		min;
	int		max;		// RxUnbounded means no maximum
	bool		lazy;		// Prefer fewer repetitions
};

struct RxRange			// Inclusive range of characters in a class
{
	UCS4		first;
	UCS4		last;
};
typedef	std::vector<RxRange>	RxRangeSet;

class	RxToken;	// Passes information between the lexer and the parser

/*
 * A node in the syntax tree. The tree is stored flat, and children are node numbers.
 */
struct RxNode
{
	RxOp		op;
	CharNum		offset;		// Where in the pattern this came from
	UCS4		character;	// RxoChar, and the letter of an RxoCharProperty
	int		number;		// Group number: RxoCaptureGroup and RxoBackReference
	RxRepetitionRange repetition;	// RxoRepetition
	RxRangeSet	ranges;		// RxoCharClass, RxoNegCharClass
	std::string	name;		// Named RxoCaptureGroup, or unresolved named RxoBackReference
	std::vector<int> children;	// RxoSequence, RxoAlternate, groups and repetitions

	RxNode(RxOp _op = RxOp::RxoNull, CharNum _offset = 0);
};

class RxAst
{
public:
	RxAst();
	void		clear();

	int		add(const RxNode& node);	// Returns the new node number
	RxNode&		node(int n) { return nodes[n]; }
	const RxNode&	node(int n) const { return nodes[n]; }
	int		size() const { return (int)nodes.size(); }

	int		root;		// Node number of the whole expression
	int		group_count;	// Number of capturing groups
	std::vector<std::string> names;	// Name of each capturing group, "" if unnamed

	std::string	describe() const;	// Printable tree, for diagnostics and tests
	std::string	describe(int n) const;

private:
	std::vector<RxNode> nodes;
};

class	RxProgram;

/*
 * RxCompiler compiles a regular expression for the matcher to execute.
 * The same RxCompiler can be used multiple times.
 */
class RxCompiler
{
public:
	~RxCompiler();
	RxCompiler(const std::string& re, RxOptions options = RxOptions(), RxFeature features = RxFeature::AllFeatures, RxFeature reject_features = RxFeature::NoFeature);

	// Lexical scanner and parser for a regular expression. Each returns false if error_message gets set.
	bool		scanRegex(const std::function<bool(const RxToken& instr)> func);
	bool		parse(RxAst& ast);

	// Compile the tree to a new program. Parse and compile in one step with the second form.
	bool		compile(const RxAst& ast, RxProgram*& program);
	bool		compile(RxProgram*& program);

	const char*	errorMessage() const { return error_message; }
	int		errorOffset() const { return error_offset; }
	int		errorCode() const { return error_code; }

protected:
	RxText		re;
	RxOptions	options;
	RxFeature	features_enabled;	// Features that are not enabled are normally ignored
	RxFeature	features_rejected;	// but these features cause an error if used
	const char*	error_message;		// An error from compiling
	int		error_offset;
	int		error_code;
	int		total_groups;		// Capturing groups in the whole pattern, needed for \NN

	bool		supported(RxFeature);	// Set error message and return false on rejected feature use
	bool		enabled(RxFeature) const; // Return true if the specified feature is enabled
	bool		fail(int code, const char* message, CharNum offset);
	int		countGroups() const;
	bool		scanHex(CharNum& i, int digits, UCS4& value) const;
	int		scanCharEscape(CharNum& i, UCS4& ch);
	bool		scanClass(CharNum& i, RxRangeSet& ranges, bool& negated);
	bool		scanGroupName(CharNum& i, UCS4 terminator, std::string& name);
	bool		scanQuantifier(CharNum& i, RxRepetitionRange& repetition, bool& is_quantifier);
};

/*
 * A decoded instruction for the matcher
 */
struct RxInstruction
{
	RxOp		op;
	UCS4		character;	// RxoChar (folded if case-insensitive), letter of RxoCharProperty
	int		alternate;	// RxoJump, RxoSplit, RxoLazySplit, lookahead continuation, RxoCount exit
	int		number;		// Capture group, backreference group, or counter
	RxRepetitionRange repetition;	// RxoCount
	int		first_group;	// RxoIterate: the captures inside the repeated item
	int		last_group;	//   are first_group..last_group (none if last < first)
	RxRangeSet	ranges;		// RxoCharClass, RxoNegCharClass
	RxRangeSet	folds;		// Case-insensitive classes: the folds of the cased members of ranges

	RxInstruction(RxOp _op = RxOp::RxoNull);
};

class		RxResult;	// The result of a regex match

/*
 * RxProgram wraps a compiled Regular Expression, and starts matchers.
 * Does not get modified after construction, so can run matches in multiple threads simultaneously.
 */
class RxProgram
: public RefCounted
{
public:
	~RxProgram();
	RxProgram(const std::string& source, const RxOptions& options);

	const RxResult	matchAfter(const RxText& target, CharNum offset = 0) const;
	const RxResult	matchAt(const RxText& target, CharNum offset = 0) const;

	int		size() const { return (int)code.size(); }
	const RxInstruction& instruction(int pc) const { return code[pc]; }
	int		maxCounter() const { return max_counter; }
	int		maxCapture() const { return max_capture; }	// Captures including 0, the whole match

	const std::string& source() const { return pattern; }
	const RxOptions& options() const { return opts; }
	const std::string& groupName(int group_number) const;
	int		groupNumber(const std::string& name) const;	// -1 if no such group

	void		dump() const;		// Disassemble to stdout
	std::string	disassemble() const;
	static std::string disassemble(const RxInstruction& instr);

private:
	friend class	RxCompiler;
	std::string	pattern;
	RxOptions	opts;
	std::vector<RxInstruction> code;
	int		max_counter;
	int		max_capture;
	std::vector<std::string> names;	// Name of each capture group 1..max_capture-1

	int		emit(const RxInstruction& instr)
			{ code.push_back(instr); return (int)code.size()-1; }
};

/*
 * The result from regex matching: the span of the match and the captures.
 * Even numbers are the capture start, odd numbers are the end. Capture 0 is the whole match.
 */
class RxResult
{
public:
	RxResult();				// Construct a non-Result (failure)
	RxResult(int capture_max);
	void		clear();

	bool		succeeded() const;
	operator	bool() const { return succeeded(); }

	CharNum		offset() const { return succeeded() ? captures[0] : 0; }
	CharNum		length() const { return succeeded() ? captures[1]-captures[0] : 0; }
	CharNum		end() const { return succeeded() ? captures[1] : 0; }

	// Capture access outside the 0..index range is ignored. -1 is an unset capture.
	int		captureMax() const { return (int)captures.size()/2; }
	CharNum		capture(int index) const;
	bool		captured(int group) const;	// Did this group participate in the match?
	RxResult&	captureSet(int index, CharNum val);

private:
	std::vector<CharNum>	captures;
};

/*
 * A matcher executes a program against one text. It owns the scratch state of
 * each attempt, so a program can be shared between any number of matchers.
 * The backtrack stack is on the heap, so long inputs don't use up the C++ stack.
 */
class RxMatcher
{
public:
	RxMatcher(const RxProgram& program, const RxText& target);

	const RxResult	matchAt(CharNum offset);	// Anchored at offset
	const RxResult	matchAfter(CharNum offset);	// The first match at or after offset

private:
	struct Backtrack {
		enum Kind : char { Choice, Capture, Open, Counter, Start } kind;
		int		index;		// Instruction to resume (Choice) or slot to restore
		CharNum		value;		// Offset to resume (Choice) or value to restore
	};

	const RxProgram& program;		// The instructions to execute
	const RxText&	target;			// The text we are searching
	std::vector<CharNum> captures;		// Current captures, two per group
	std::vector<CharNum> opens;		// Start offset of each group that is being matched
	std::vector<CharNum> counters;		// Completed iterations of each counted repetition
	std::vector<CharNum> starts;		// Offset where each repetition's current iteration began
	std::vector<Backtrack> stack;		// Choice points and undo records

	bool		run(int pc, CharNum offset, CharNum& end);
	void		push(Backtrack::Kind kind, int index, CharNum value);
	void		setCapture(int index, CharNum value);
	void		setOpen(int group, CharNum value);
	void		setCounter(int index, CharNum value);
	void		setStart(int index, CharNum value);
	void		unwind(size_t height);		// Undo changes, and drop choices, above this height

	bool		isWordAt(CharNum offset) const;
	bool		charMatches(const RxInstruction& instr, UCS4 ch) const;
	bool		classMatches(const RxInstruction& instr, UCS4 ch) const;
	bool		propertyMatches(UCS4 property, UCS4 ch) const;
	bool		backReferenceMatches(int group, CharNum& offset) const;
};

#endif	// RXENGINE_H
