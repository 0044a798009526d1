#if !defined(RXPP_H)
#define RXPP_H
/*
 * Regular expression patterns for UTF-8 strings.
 *
 * An RxPattern is compiled once and shared by all its copies. It can be used
 * for matching from any number of threads at once. Indices in an RxMatch are
 * character (code point) numbers, not byte offsets.
 *
 * (c) Copyright Clifford Heath 2022. See LICENSE file for usage rights.
 */
#include	<functional>
#include	<string>
#include	<vector>

#include	<error.h>
#include	<refcount.h>
#include	<rxtext.h>
#include	<rxengine.h>

/*
 * How many matches a scan may produce
 */
class RxCount
{
public:
	static RxCount	All() { return RxCount(-1); }
	static RxCount	AtMost(int n) { return RxCount(n < 0 ? 0 : n); }

	bool		unlimited() const { return limit < 0; }
	int		maximum() const { return limit; }
	bool		allows(int produced) const { return limit < 0 || produced < limit; }

private:
	explicit RxCount(int n) : limit(n) {}
	int		limit;		// -1 for no limit
};

struct RxSubmatch
{
	bool		matched;	// Did the group participate in the match?
	std::string	text;		// Empty if not matched

	RxSubmatch() : matched(false) {}
	RxSubmatch(const std::string& t) : matched(true), text(t) {}
};

/*
 * One match, as presented to callers
 */
struct RxMatch
{
	std::string	text;		// The matched text
	CharNum		index;		// Character offset of the match in the input
	int		number;		// 1 for the first match of a scan, 2 for the next...
	std::vector<RxSubmatch>	submatches;	// One for each capturing group, in order

	RxMatch() : index(0), number(0) {}
};

/*
 * Scan a text for successive matches of a program. Each attempt starts where the
 * previous match ended, or one character later if that match was empty.
 */
class RxScanner
{
public:
	RxScanner(const RxProgram& program, const RxText& target, RxCount count = RxCount::All());

	bool		next();				// Find the next match, false if no more
	const RxResult&	result() const { return current; }
	RxMatch		match() const;			// The current match, projected
	int		matchCount() const { return produced; }

	// Call func with each match in order, stopping early if it returns false
	void		scan(const std::function<bool(const RxMatch&)>& func);

	// Turn a successful result into an RxMatch
	static RxMatch	project(const RxText& target, const RxResult& result, int number);

private:
	const RxText&	target;
	RxCount		count;
	RxMatcher	matcher;
	CharNum		cursor;		// Where the next attempt will start
	int		produced;	// Matches found so far
	RxResult	current;
};

/*
 * A compiled pattern. A null pattern (default constructed, or from a pattern
 * with an error) never matches, so every operation on it is still defined.
 */
class RxPattern
{
public:
	RxPattern() {}
	RxPattern(RxProgram* program) : compiled(program) {}

	static RxPattern fromStringWith(
				const RxOptions& options,
				const std::string& pattern,
				Error* err_return = 0,
				RxFeature reject_features = RxFeature::NoFeature
			);
	static RxPattern fromString(const std::string& pattern, Error* err_return = 0)
			{ return fromStringWith(RxOptions(), pattern, err_return); }

	operator	bool() const { return (RxProgram*)compiled != 0; }
	const RxProgram* program() const { return compiled; }

	// Does the pattern match anywhere in the input?
	bool		contains(const std::string& input) const;

	// The pieces of input between matches, with at most count+1 pieces
	std::vector<std::string> split(RxCount count, const std::string& input) const;

	// The matches in order
	std::vector<RxMatch> find(RxCount count, const std::string& input) const;

	// Replace each match by what the function returns for it
	std::string	replace(
				RxCount count,
				const std::function<std::string(const RxMatch&)>& replacement,
				const std::string& input
			) const;

	// Replace each match by the expansion of a template containing $& $1 $<name> etc
	std::string	replaceWith(RxCount count, const std::string& templ, const std::string& input) const;
	std::string	expand(const RxMatch& match, const std::string& templ, const std::string& input) const;

	void		scan(
				RxCount count,
				const std::string& input,
				const std::function<bool(const RxMatch&)>& func
			) const;

	// A single attempt anchored at offset, or the first match at or after offset
	bool		matchAt(const std::string& input, CharNum offset, RxMatch& match) const;
	bool		matchAfter(const std::string& input, CharNum offset, RxMatch& match) const;

	int		groupCount() const;
	std::string	groupName(int group_number) const;
	int		groupNumber(const std::string& name) const;	// -1 if there's no such group
	std::string	source() const;
	RxOptions	options() const;

private:
	Ref<RxProgram>	compiled;
};

#endif	// RXPP_H
