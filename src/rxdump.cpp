/*
 * Regular expressions
 * Diagnostic descriptions of syntax trees and programs
 *
 * (c) Copyright Clifford Heath 2022. See LICENSE file for usage rights.
 */
#include	<rxengine.h>
#include	<stdio.h>

static std::string
describeChar(UCS4 ch, bool in_class)
{
	char	buf[20];

	if (ch >= 0x20 && ch < 0x7F
	 && !(in_class && (ch == ']' || ch == '\\' || ch == '-' || ch == '^')))
	{
		buf[0] = (char)ch;
		buf[1] = '\0';
	}
	else
		snprintf(buf, sizeof(buf), "\\u{%04X}", (unsigned)ch);
	return buf;
}

static std::string
describeClass(const RxRangeSet& ranges, bool negated)
{
	std::string	str = negated ? "[^" : "[";

	for (size_t r = 0; r < ranges.size(); r++)
	{
		str += describeChar(ranges[r].first, true);
		if (ranges[r].last != ranges[r].first)
		{
			str += "-";
			str += describeChar(ranges[r].last, true);
		}
	}
	return str + "]";
}

static std::string
describeRepetition(const RxRepetitionRange& rep)
{
	char	buf[40];

	if (rep.min == 0 && rep.max == RxUnbounded)
		snprintf(buf, sizeof(buf), "*");
	else if (rep.min == 1 && rep.max == RxUnbounded)
		snprintf(buf, sizeof(buf), "+");
	else if (rep.min == 0 && rep.max == 1)
		snprintf(buf, sizeof(buf), "?");
	else if (rep.max == RxUnbounded)
		snprintf(buf, sizeof(buf), "{%d,}", rep.min);
	else if (rep.min == rep.max)
		snprintf(buf, sizeof(buf), "{%d}", rep.min);
	else
		snprintf(buf, sizeof(buf), "{%d,%d}", rep.min, rep.max);
	return std::string(buf) + (rep.lazy ? "?" : "");
}

std::string
RxAst::describe() const
{
	if (root < 0)
		return "";
	return describe(root);
}

/*
 * Describe a subtree as an S-expression, for example
 *	a(b|c)*	=> (seq 'a' (* (cap 1 (alt 'b' 'c'))))
 */
std::string
RxAst::describe(int n) const
{
	const RxNode&	node = nodes[n];
	std::string	str;
	char		buf[20];

	auto	children =
		[&](std::string head) -> std::string
		{
			for (size_t c = 0; c < node.children.size(); c++)
				head += " " + describe(node.children[c]);
			return head + ")";
		};

	switch (node.op)
	{
	case RxOp::RxoChar:
		return "'" + describeChar(node.character, false) + "'";

	case RxOp::RxoCharClass:
	case RxOp::RxoNegCharClass:
		return describeClass(node.ranges, node.op == RxOp::RxoNegCharClass);

	case RxOp::RxoCharProperty:
		return std::string("\\") + (char)node.character;

	case RxOp::RxoAny:		return ".";
	case RxOp::RxoBOL:		return "^";
	case RxOp::RxoEOL:		return "$";
	case RxOp::RxoWordBoundary:	return "\\b";
	case RxOp::RxoNonWordBoundary:	return "\\B";

	case RxOp::RxoBackReference:
		snprintf(buf, sizeof(buf), "\\%d", node.number);
		return buf;

	case RxOp::RxoSequence:		return children("(seq");
	case RxOp::RxoAlternate:	return children("(alt");
	case RxOp::RxoNonCapturingGroup: return children("(group");
	case RxOp::RxoLookahead:	return children("(?=");
	case RxOp::RxoNegLookahead:	return children("(?!");

	case RxOp::RxoCaptureGroup:
		snprintf(buf, sizeof(buf), "(cap %d", node.number);
		str = buf;
		if (!node.name.empty())
			str += " <" + node.name + ">";
		return children(str);

	case RxOp::RxoRepetition:
		return children("(" + describeRepetition(node.repetition));

	default:
		snprintf(buf, sizeof(buf), "(? op %d)", (int)node.op);
		return buf;
	}
}

std::string
RxProgram::disassemble(const RxInstruction& instr)
{
	char		buf[80];
	std::string	str(1, (char)instr.op);

	switch (instr.op)
	{
	case RxOp::RxoChar:
		return str + " '" + describeChar(instr.character, false) + "'";

	case RxOp::RxoCharClass:
	case RxOp::RxoNegCharClass:
		return str + " " + describeClass(instr.ranges, instr.op == RxOp::RxoNegCharClass);

	case RxOp::RxoCharProperty:
		return str + " \\" + (char)instr.character;

	case RxOp::RxoBackReference:
	case RxOp::RxoCaptureStart:
	case RxOp::RxoCaptureEnd:
	case RxOp::RxoZero:
		snprintf(buf, sizeof(buf), " %d", instr.number);
		return str + buf;

	case RxOp::RxoJump:
	case RxOp::RxoSplit:
	case RxOp::RxoLazySplit:
	case RxOp::RxoLookahead:
	case RxOp::RxoNegLookahead:
		snprintf(buf, sizeof(buf), " ->%d", instr.alternate);
		return str + buf;

	case RxOp::RxoCount:
		snprintf(buf, sizeof(buf), " %d ", instr.number);
		str += buf;
		str += describeRepetition(instr.repetition);
		snprintf(buf, sizeof(buf), " ->%d", instr.alternate);
		return str + buf;

	case RxOp::RxoIterate:
		snprintf(buf, sizeof(buf), " %d", instr.number);
		str += buf;
		if (instr.first_group <= instr.last_group)
		{
			snprintf(buf, sizeof(buf), " reset %d-%d", instr.first_group, instr.last_group);
			str += buf;
		}
		return str;

	case RxOp::RxoIterateEnd:
		snprintf(buf, sizeof(buf), " %d min %d ->%d", instr.number, instr.repetition.min, instr.alternate);
		return str + buf;

	default:			// No operands
		return str;
	}
}

std::string
RxProgram::disassemble() const
{
	std::string	str;
	char		buf[20];

	for (int pc = 0; pc < size(); pc++)
	{
		snprintf(buf, sizeof(buf), "%d: ", pc);
		str += buf + disassemble(code[pc]) + "\n";
	}
	return str;
}

void
RxProgram::dump() const		// Disassemble to stdout
{
	printf("Program for /%s/, %d counters, %d captures\n", pattern.c_str(), max_counter, max_capture);
	printf("%s", disassemble().c_str());
}
