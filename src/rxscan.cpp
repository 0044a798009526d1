/*
 * Regular expressions
 * Scanning for successive matches, and projecting results to RxMatch
 *
 * (c) Copyright Clifford Heath 2022. See LICENSE file for usage rights.
 */
#include	<rxpp.h>
#include	<stdio.h>

#ifdef	TRACK_RESULTS
#define	TRACK(arglist)	printf arglist
#else
#define	TRACK(arglist)
#endif

RxScanner::RxScanner(const RxProgram& program, const RxText& _target, RxCount _count)
: target(_target)
, count(_count)
, matcher(program, _target)
, cursor(0)
, produced(0)
{
}

bool
RxScanner::next()
{
	current = RxResult();
	if (!count.allows(produced) || cursor > target.length())
		return false;

	current = matcher.matchAfter(cursor);
	if (!current.succeeded())
	{
		cursor = target.length()+1;	// Nothing more to find
		return false;
	}

	produced++;
	TRACK(("match %d at [%d, %d)\n", produced, current.offset(), current.end()));

	// An empty match would be found again at the same place
	cursor = current.length() > 0 ? current.end() : current.offset()+1;
	return true;
}

RxMatch
RxScanner::match() const
{
	return project(target, current, produced);
}

void
RxScanner::scan(const std::function<bool(const RxMatch&)>& func)
{
	while (next())
		if (!func(match()))
			break;
}

RxMatch
RxScanner::project(const RxText& target, const RxResult& result, int number)
{
	RxMatch		match;

	if (!result.succeeded())
		return match;
	match.text = target.slice(result.offset(), result.end());
	match.index = result.offset();
	match.number = number;
	for (int group = 1; group < result.captureMax(); group++)
	{
		if (result.captured(group))
			match.submatches.push_back(RxSubmatch(target.slice(result.capture(group*2), result.capture(group*2+1))));
		else
			match.submatches.push_back(RxSubmatch());
	}
	return match;
}
