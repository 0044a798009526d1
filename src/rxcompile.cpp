/*
 * Regular expressions
 * Compiler from the syntax tree to a program for the backtracking matcher
 *
 * (c) Copyright Clifford Heath 2022. See LICENSE file for usage rights.
 */
#include	<rxengine.h>
#include	<assert.h>
#include	<algorithm>

/*
 * Structure of the virtual machine:
 *
 * A program is a vector of decoded Instructions. Each Instruction is either
 * a Station or a Shunt. Stations consume text or test the position, and fail
 * the current path if they don't match. Shunts only redirect control or
 * record state, and never fail (except IterateEnd).
 *
 * Stations:
 * - Char(UCS4), folded to the canonical case if case-insensitive
 * - Character Class/Negated class(ranges)
 * - Character Property(letter of \d \D \w \W \s \S)
 * - Any
 * - BOL/EOL (Line assertions), WordBoundary/NonWordBoundary
 * - BackReference(group#)
 * - Lookahead/NegLookahead(continuation): match the following code up to its
 *   Accept as a separate attempt, then go on at the continuation
 * Shunts:
 * - Accept
 * - Capture Start(group#), Capture End(group#)
 * - Jump(target)
 * - Split(alternate): take the next instruction, leaving a choice to take the alternate
 * - LazySplit(alternate): take the alternate, leaving a choice to take the next instruction
 * - Zero(counter#)
 * - Count(counter#, min, max, lazy, exit): decide whether to start another iteration
 * - Iterate(counter#, groups): start an iteration
 * - IterateEnd(counter#, min, head): finish an iteration and loop back to the Count
 *
 * A counted repetition compiles to:
 *	Z k
 * H:	R k {min,max} -> X
 *	I k
 *	...body...
 *	E k -> H
 * X:
 * A repetition whose body can never match empty and contains no captures
 * uses only Split and Jump, which needs no counter.
 */

RxInstruction::RxInstruction(RxOp _op)
: op(_op)
, character(0)
, alternate(0)
, number(0)
, first_group(1)
, last_group(0)
{
	repetition.min = repetition.max = 0;
	repetition.lazy = false;
}

RxProgram::RxProgram(const std::string& source, const RxOptions& options)
: pattern(source)
, opts(options)
, max_counter(0)
, max_capture(1)
{
}

RxProgram::~RxProgram()
{
}

const std::string&
RxProgram::groupName(int group_number) const
{
	static const std::string	unnamed;

	if (group_number < 1 || group_number > (int)names.size())
		return unnamed;
	return names[group_number-1];
}

int
RxProgram::groupNumber(const std::string& name) const
{
	if (name.empty())
		return -1;
	for (size_t g = 0; g < names.size(); g++)
		if (names[g] == name)
			return (int)g+1;
	return -1;
}

/*
 * A character matches a case-insensitive class if its fold is the fold of a member.
 * Collect the folds of the members that have another case, as sorted ranges.
 */
static RxRangeSet
foldRanges(const RxRangeSet& ranges)
{
	std::vector<UCS4>	folds;
	RxRangeSet		folded;

	for (size_t r = 0; r < ranges.size(); r++)
		UCS4FoldRange(ranges[r].first, ranges[r].last, folds);
	std::sort(folds.begin(), folds.end());
	for (size_t f = 0; f < folds.size(); f++)
	{
		if (!folded.empty() && folds[f] <= folded.back().last+1)
		{
			if (folds[f] > folded.back().last)
				folded.back().last = folds[f];
			continue;
		}
		folded.push_back({folds[f], folds[f]});
	}
	return folded;
}

bool RxCompiler::compile(RxProgram*& program)
{
	RxAst		ast;

	program = 0;
	if (!parse(ast))
		return false;
	return compile(ast, program);
}

bool RxCompiler::compile(const RxAst& ast, RxProgram*& program)
{
	RxProgram*	prog;
	int		counters = 0;

	program = 0;
	if (ast.root < 0)
		return fail(RXERR_BAD_GROUP, "Regular expression has not been parsed", 0);

	// Can this subtree succeed without consuming any text?
	std::function<bool(int)>	can_be_empty =
		[&](int n) -> bool
		{
			const RxNode&	node = ast.node(n);
			switch (node.op)
			{
			case RxOp::RxoChar:
			case RxOp::RxoCharClass:
			case RxOp::RxoNegCharClass:
			case RxOp::RxoCharProperty:
			case RxOp::RxoAny:
				return false;

			case RxOp::RxoSequence:
				for (size_t c = 0; c < node.children.size(); c++)
					if (!can_be_empty(node.children[c]))
						return false;
				return true;

			case RxOp::RxoAlternate:
				for (size_t c = 0; c < node.children.size(); c++)
					if (can_be_empty(node.children[c]))
						return true;
				return false;

			case RxOp::RxoNonCapturingGroup:
			case RxOp::RxoCaptureGroup:
				return can_be_empty(node.children[0]);

			case RxOp::RxoRepetition:
				return node.repetition.min == 0 || can_be_empty(node.children[0]);

			default:		// Assertions, lookaheads and backreferences
				return true;
			}
		};

	// Find the lowest and highest capture group numbers in this subtree
	std::function<void(int, int&, int&)>	group_range =
		[&](int n, int& first, int& last)
		{
			const RxNode&	node = ast.node(n);
			if (node.op == RxOp::RxoCaptureGroup)
			{
				if (node.number < first)
					first = node.number;
				if (node.number > last)
					last = node.number;
			}
			for (size_t c = 0; c < node.children.size(); c++)
				group_range(node.children[c], first, last);
		};

	std::function<void(int)>	lower =
		[&](int n)
		{
			const RxNode&	node = ast.node(n);
			RxInstruction	instr(node.op);
			int		pc;

			switch (node.op)
			{
			case RxOp::RxoChar:
				instr.character = options.case_insensitive ? UCS4Fold(node.character) : node.character;
				prog->emit(instr);
				break;

			case RxOp::RxoCharClass:
			case RxOp::RxoNegCharClass:
				instr.ranges = node.ranges;
				if (options.case_insensitive)
					instr.folds = foldRanges(node.ranges);
				prog->emit(instr);
				break;

			case RxOp::RxoCharProperty:
				instr.character = node.character;
				prog->emit(instr);
				break;

			case RxOp::RxoAny:
			case RxOp::RxoBOL:
			case RxOp::RxoEOL:
			case RxOp::RxoWordBoundary:
			case RxOp::RxoNonWordBoundary:
				prog->emit(instr);
				break;

			case RxOp::RxoBackReference:
				instr.number = node.number;
				prog->emit(instr);
				break;

			case RxOp::RxoSequence:
				for (size_t c = 0; c < node.children.size(); c++)
					lower(node.children[c]);
				break;

			case RxOp::RxoNonCapturingGroup:
				assert(node.children.size() == 1);
				lower(node.children[0]);
				break;

			case RxOp::RxoCaptureGroup:
				instr.op = RxOp::RxoCaptureStart;
				instr.number = node.number;
				prog->emit(instr);
				lower(node.children[0]);
				instr.op = RxOp::RxoCaptureEnd;
				prog->emit(instr);
				break;

			case RxOp::RxoLookahead:
			case RxOp::RxoNegLookahead:
				pc = prog->emit(instr);
				lower(node.children[0]);
				prog->emit(RxInstruction(RxOp::RxoAccept));
				prog->code[pc].alternate = prog->size();
				break;

			case RxOp::RxoAlternate:
			{
				std::vector<int>	jumps;
				for (size_t c = 0; c < node.children.size(); c++)
				{
					if (c+1 == node.children.size())
					{		// The last alternate needs no Split or Jump
						lower(node.children[c]);
						break;
					}
					pc = prog->emit(RxInstruction(RxOp::RxoSplit));
					lower(node.children[c]);
					jumps.push_back(prog->emit(RxInstruction(RxOp::RxoJump)));
					prog->code[pc].alternate = prog->size();
				}
				for (size_t j = 0; j < jumps.size(); j++)
					prog->code[jumps[j]].alternate = prog->size();
				break;
			}

			case RxOp::RxoRepetition:
			{
				const RxRepetitionRange&	rep = node.repetition;
				assert(node.children.size() == 1);
				int	body = node.children[0];
				int	first_group = ast.group_count+1;
				int	last_group = 0;

				if (rep.max == 0)
					break;		// x{0} matches empty, and x is never tried

				group_range(body, first_group, last_group);
				bool	simple = !can_be_empty(body) && last_group < first_group;

				if (simple && rep.min == 0 && rep.max == 1)
				{		// ?
					pc = prog->emit(RxInstruction(rep.lazy ? RxOp::RxoLazySplit : RxOp::RxoSplit));
					lower(body);
					prog->code[pc].alternate = prog->size();
					break;
				}
				if (simple && rep.min == 0 && rep.max == RxUnbounded)
				{		// *
					int	head = prog->emit(RxInstruction(rep.lazy ? RxOp::RxoLazySplit : RxOp::RxoSplit));
					lower(body);
					instr.op = RxOp::RxoJump;
					instr.alternate = head;
					prog->emit(instr);
					prog->code[head].alternate = prog->size();
					break;
				}
				if (simple && rep.min == 1 && rep.max == RxUnbounded)
				{		// +
					int	head = prog->size();
					lower(body);
					instr.op = rep.lazy ? RxOp::RxoSplit : RxOp::RxoLazySplit;
					instr.alternate = head;
					prog->emit(instr);
					break;
				}

				// Everything else uses a counter
				int	counter = counters++;
				instr.op = RxOp::RxoZero;
				instr.number = counter;
				prog->emit(instr);

				instr.op = RxOp::RxoCount;
				instr.repetition = rep;
				int	head = prog->emit(instr);

				instr.op = RxOp::RxoIterate;
				instr.first_group = first_group;
				instr.last_group = last_group;
				prog->emit(instr);

				lower(body);

				assert(prog->code[head].op == RxOp::RxoCount);
				instr.op = RxOp::RxoIterateEnd;
				instr.alternate = head;
				prog->emit(instr);
				prog->code[head].alternate = prog->size();
				break;
			}

			default:
				break;
			}
		};

	prog = new RxProgram(re.source(), options);
	lower(ast.root);
	prog->emit(RxInstruction(RxOp::RxoAccept));
	prog->max_counter = counters;
	prog->max_capture = ast.group_count+1;
	prog->names = ast.names;
	program = prog;
	return true;
}
