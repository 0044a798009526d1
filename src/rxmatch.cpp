/*
 * Regular expressions
 * The backtracking matcher, and match results
 *
 * (c) Copyright Clifford Heath 2022. See LICENSE file for usage rights.
 */
#include	<rxengine.h>
#include	<stdio.h>

#ifdef	TRACK_RESULTS
#define	TRACK(arglist)	printf arglist
#else
#define	TRACK(arglist)
#endif

RxResult::RxResult()
{
}

RxResult::RxResult(int capture_max)
: captures(capture_max*2, -1)
{
}

void
RxResult::clear()
{
	for (size_t i = 0; i < captures.size(); i++)
		captures[i] = -1;
}

bool
RxResult::succeeded() const
{
	return captures.size() >= 2 && captures[0] >= 0 && captures[1] >= 0;
}

CharNum
RxResult::capture(int index) const
{
	if (index < 0 || index >= (int)captures.size())
		return -1;
	return captures[index];
}

bool
RxResult::captured(int group) const
{
	return capture(group*2) >= 0 && capture(group*2+1) >= 0;
}

RxResult&
RxResult::captureSet(int index, CharNum val)
{
	if (index >= 0 && index < (int)captures.size())
		captures[index] = val;
	return *this;
}

const RxResult
RxProgram::matchAt(const RxText& target, CharNum offset) const
{
	RxMatcher	matcher(*this, target);
	return matcher.matchAt(offset);
}

const RxResult
RxProgram::matchAfter(const RxText& target, CharNum offset) const
{
	RxMatcher	matcher(*this, target);
	return matcher.matchAfter(offset);
}

RxMatcher::RxMatcher(const RxProgram& _program, const RxText& _target)
: program(_program)
, target(_target)
{
}

const RxResult
RxMatcher::matchAt(CharNum offset)
{
	CharNum		end;

	if (offset < 0 || offset > target.length())
		return RxResult();

	captures.assign(program.maxCapture()*2, -1);
	opens.assign(program.maxCapture(), -1);
	counters.assign(program.maxCounter(), 0);
	starts.assign(program.maxCounter(), -1);
	stack.clear();

	TRACK(("match attempt at %d\n", offset));
	if (!run(0, offset, end))
		return RxResult();

	RxResult	result(program.maxCapture());
	for (int i = 2; i < (int)captures.size(); i++)
		result.captureSet(i, captures[i]);
	result.captureSet(0, offset);
	result.captureSet(1, end);
	stack.clear();
	return result;
}

const RxResult
RxMatcher::matchAfter(CharNum offset)
{
	if (offset < 0)
		offset = 0;
	for (; offset <= target.length(); offset++)
	{
		RxResult	result = matchAt(offset);
		if (result.succeeded())
			return result;
	}
	return RxResult();
}

void
RxMatcher::push(Backtrack::Kind kind, int index, CharNum value)
{
	Backtrack	entry;
	entry.kind = kind;
	entry.index = index;
	entry.value = value;
	stack.push_back(entry);
}

void
RxMatcher::setCapture(int index, CharNum value)
{
	if (captures[index] == value)
		return;
	push(Backtrack::Capture, index, captures[index]);
	captures[index] = value;
}

void
RxMatcher::setOpen(int group, CharNum value)
{
	if (opens[group] == value)
		return;
	push(Backtrack::Open, group, opens[group]);
	opens[group] = value;
}

void
RxMatcher::setCounter(int index, CharNum value)
{
	if (counters[index] == value)
		return;
	push(Backtrack::Counter, index, counters[index]);
	counters[index] = value;
}

void
RxMatcher::setStart(int index, CharNum value)
{
	if (starts[index] == value)
		return;
	push(Backtrack::Start, index, starts[index]);
	starts[index] = value;
}

void
RxMatcher::unwind(size_t height)
{
	while (stack.size() > height)
	{
		const Backtrack&	entry = stack.back();
		switch (entry.kind)
		{
		case Backtrack::Choice:		break;
		case Backtrack::Capture:	captures[entry.index] = entry.value; break;
		case Backtrack::Open:		opens[entry.index] = entry.value; break;
		case Backtrack::Counter:	counters[entry.index] = entry.value; break;
		case Backtrack::Start:		starts[entry.index] = entry.value; break;
		}
		stack.pop_back();
	}
}

bool
RxMatcher::isWordAt(CharNum offset) const
{
	return offset >= 0 && offset < target.length() && UCS4IsWord(target[offset]);
}

bool
RxMatcher::charMatches(const RxInstruction& instr, UCS4 ch) const
{
	if (ch == UCS4_NONE)
		return false;
	if (program.options().case_insensitive)
		return UCS4Fold(ch) == instr.character;
	return ch == instr.character;
}

bool
RxMatcher::classMatches(const RxInstruction& instr, UCS4 ch) const
{
	if (ch == UCS4_NONE)
		return false;

	auto	in_ranges =
		[](const RxRangeSet& ranges, UCS4 c) -> bool
		{
			for (size_t r = 0; r < ranges.size(); r++)
				if (c >= ranges[r].first && c <= ranges[r].last)
					return true;
			return false;
		};

	bool	found = in_ranges(instr.ranges, ch)
		|| (program.options().case_insensitive && in_ranges(instr.folds, UCS4Fold(ch)));
	return found != (instr.op == RxOp::RxoNegCharClass);
}

bool
RxMatcher::propertyMatches(UCS4 property, UCS4 ch) const
{
	bool	is;

	if (ch == UCS4_NONE)
		return false;
	switch (property | 0x20)
	{
	case 'd':	is = UCS4Digit(ch) >= 0; break;
	case 'w':	is = UCS4IsWord(ch); break;
	default:	is = UCS4IsWhite(ch); break;
	}
	return property >= 'a' ? is : !is;
}

// An unset group matches empty. Advances offset over the matched text.
bool
RxMatcher::backReferenceMatches(int group, CharNum& offset) const
{
	CharNum		start = captures[group*2];
	CharNum		end = captures[group*2+1];
	bool		fold = program.options().case_insensitive;

	if (start < 0 || end < 0)
		return true;
	if (offset+(end-start) > target.length())
		return false;
	for (CharNum i = 0; i < end-start; i++)
	{
		UCS4	a = target[start+i];
		UCS4	b = target[offset+i];
		if (a != b && (!fold || UCS4Fold(a) != UCS4Fold(b)))
			return false;
	}
	offset += end-start;
	return true;
}

/*
 * Run the program from pc at offset until it reaches an Accept, returning the end offset.
 * Choices are pushed on the backtrack stack, along with the previous value of everything
 * that changes. On failure, everything above the stack height on entry is undone.
 */
bool
RxMatcher::run(int pc, CharNum offset, CharNum& end)
{
	size_t		base = stack.size();
	CharNum		count;

	for (;;)
	{
		const RxInstruction&	instr = program.instruction(pc);
		bool		ok = true;

		TRACK(("\tpc %d op %c at %d\n", pc, (char)instr.op, offset));
		switch (instr.op)
		{
		case RxOp::RxoChar:
			if ((ok = charMatches(instr, target[offset])))
				offset++;
			pc++;
			break;

		case RxOp::RxoCharClass:
		case RxOp::RxoNegCharClass:
			if ((ok = classMatches(instr, target[offset])))
				offset++;
			pc++;
			break;

		case RxOp::RxoCharProperty:
			if ((ok = propertyMatches(instr.character, target[offset])))
				offset++;
			pc++;
			break;

		case RxOp::RxoAny:
			ok = target[offset] != UCS4_NONE
				&& (program.options().dot_all || !UCS4IsLineTerminator(target[offset]));
			offset++;
			pc++;
			break;

		case RxOp::RxoBOL:
			ok = offset == 0
				|| (program.options().multiline && UCS4IsLineTerminator(target[offset-1]));
			pc++;
			break;

		case RxOp::RxoEOL:
			ok = offset == target.length()
				|| (program.options().multiline && UCS4IsLineTerminator(target[offset]));
			pc++;
			break;

		case RxOp::RxoWordBoundary:
			ok = isWordAt(offset-1) != isWordAt(offset);
			pc++;
			break;

		case RxOp::RxoNonWordBoundary:
			ok = isWordAt(offset-1) == isWordAt(offset);
			pc++;
			break;

		case RxOp::RxoBackReference:
			ok = backReferenceMatches(instr.number, offset);
			pc++;
			break;

		case RxOp::RxoJump:
			pc = instr.alternate;
			break;

		case RxOp::RxoSplit:
			push(Backtrack::Choice, instr.alternate, offset);
			pc++;
			break;

		case RxOp::RxoLazySplit:
			push(Backtrack::Choice, pc+1, offset);
			pc = instr.alternate;
			break;

		case RxOp::RxoCaptureStart:
			setOpen(instr.number, offset);
			pc++;
			break;

		case RxOp::RxoCaptureEnd:
			setCapture(instr.number*2, opens[instr.number]);
			setCapture(instr.number*2+1, offset);
			pc++;
			break;

		case RxOp::RxoZero:
			setCounter(instr.number, 0);
			setStart(instr.number, -1);
			pc++;
			break;

		case RxOp::RxoCount:
			count = counters[instr.number];
			if (count < instr.repetition.min)
				pc++;			// Must iterate
			else if (instr.repetition.max != RxUnbounded && count >= instr.repetition.max)
				pc = instr.alternate;	// Must exit
			else if (!instr.repetition.lazy)
			{
				push(Backtrack::Choice, instr.alternate, offset);
				pc++;
			}
			else
			{
				push(Backtrack::Choice, pc+1, offset);
				pc = instr.alternate;
			}
			break;

		case RxOp::RxoIterate:
			setStart(instr.number, offset);
			for (int group = instr.first_group; group <= instr.last_group; group++)
			{
				setCapture(group*2, -1);
				setCapture(group*2+1, -1);
			}
			pc++;
			break;

		case RxOp::RxoIterateEnd:
			count = counters[instr.number];
			if (offset == starts[instr.number] && count >= instr.repetition.min)
			{
				TRACK(("\t\tempty iteration %d of counter %d rejected\n", count, instr.number));
				ok = false;	// An empty iteration can't help, once the minimum is met
				break;
			}
			setCounter(instr.number, count+1);
			pc = instr.alternate;
			break;

		case RxOp::RxoLookahead:
		{
			size_t			height = stack.size();
			std::vector<CharNum>	saved(captures);
			CharNum			ahead;

			if (!run(pc+1, offset, ahead))
			{
				ok = false;
				break;
			}
			// Discard the choices inside the lookahead, but keep its captures undoable
			stack.resize(height);
			for (size_t i = 0; i < captures.size(); i++)
				if (captures[i] != saved[i])
					push(Backtrack::Capture, (int)i, saved[i]);
			pc = instr.alternate;
			break;
		}

		case RxOp::RxoNegLookahead:
		{
			size_t		height = stack.size();
			CharNum		ahead;

			if (run(pc+1, offset, ahead))
			{
				TRACK(("\t\tnegative lookahead at %d matched\n", offset));
				unwind(height);
				ok = false;
				break;
			}
			pc = instr.alternate;
			break;
		}

		case RxOp::RxoAccept:
			end = offset;
			return true;

		default:
			ok = false;
			break;
		}
		if (ok)
			continue;

		// Backtrack to the most recent choice, undoing everything since
		for (;;)
		{
			if (stack.size() <= base)
				return false;
			Backtrack	entry = stack.back();
			stack.pop_back();
			if (entry.kind == Backtrack::Choice)
			{
				TRACK(("\t\tbacktrack to pc %d at %d\n", entry.index, entry.value));
				pc = entry.index;
				offset = entry.value;
				break;
			}
			switch (entry.kind)
			{
			case Backtrack::Capture:	captures[entry.index] = entry.value; break;
			case Backtrack::Open:		opens[entry.index] = entry.value; break;
			case Backtrack::Counter:	counters[entry.index] = entry.value; break;
			case Backtrack::Start:		starts[entry.index] = entry.value; break;
			default:			break;
			}
		}
	}
}
