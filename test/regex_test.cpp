/*
 * Regular expressions
 * Unit test driver for the parser and compiler
 *
 * With no arguments, runs the automated tests.
 * Otherwise, each argument is parsed and compiled, and the tree and program are shown.
 *
 * (c) Copyright Clifford Heath 2022. See LICENSE file for usage rights.
 */
#include	<stdio.h>
#include	<string.h>

#include	<rxengine.h>

#include	"memory_monitor.h"

bool	verbose = false;
int	automated_tests();

int
main(int argc, char** argv)
{
	while (argc > 1 && *argv[1] == '-')
	{
		if (0 == strcmp("-v", argv[1]))
			verbose = true;
		argc--; argv++;
	}

	if (argc == 1)
		return automated_tests();

	for (--argc, ++argv; argc > 0; argc--, argv++)
	{
		RxCompiler	rx(*argv);
		RxAst		ast;
		RxProgram*	program = 0;

		printf("Compiling '%s'\n", *argv);
		if (!rx.parse(ast) || !rx.compile(ast, program))
		{
			printf("Regex scan failed at %d: %s\n", rx.errorOffset(), rx.errorMessage());
			continue;
		}
		printf("%s\n", ast.describe().c_str());
		program->dump();
		delete program;
	}
	return 0;
}

struct	parser_test {
	const char*	regex;			// the regex to parse
	const char*	expected_tree;		// The tree which is expected from the parser
	const char*	expected_message;	// If non-zero, the test should fail with this message
	int		expected_offset;	// and at this offset in the regex
};
parser_test	parser_tests[] =
{
 { 0,	"--- Literals and sequences ---", 0, 0 },
	{ "",					"(seq)", 0, 0 },
	{ "a",					"'a'", 0, 0 },
	{ "abc",				"(seq 'a' 'b' 'c')", 0, 0 },
	{ "a b",				"(seq 'a' ' ' 'b')", 0, 0 },
	{ "}",					"'}'", 0, 0 },
	{ "]",					"']'", 0, 0 },

 { 0,	"--- Escapes ---", 0, 0 },
	{ "\\.",				"'.'", 0, 0 },
	{ "\\\\",				"'\\'", 0, 0 },
	{ "\\/",				"'/'", 0, 0 },
	{ "\\n",				"'\\u{000A}'", 0, 0 },
	{ "\\t\\r\\f\\v",			"(seq '\\u{0009}' '\\u{000D}' '\\u{000C}' '\\u{000B}')", 0, 0 },
	{ "\\0",				"'\\u{0000}'", 0, 0 },
	{ "\\cJ",				"'\\u{000A}'", 0, 0 },
	{ "\\ca",				"'\\u{0001}'", 0, 0 },
	{ "\\x41",				"'A'", 0, 0 },
	{ "\\u0042",				"'B'", 0, 0 },
	{ "\\u{1F600}",				"(seq 'u' '{' '1' 'F' '6' '0' '0' '}')", 0, 0 },
	{ "\\u{2}",				"({2} 'u')", 0, 0 },
	{ "[\\u{]",				"[u{]", 0, 0 },
	{ "\\ud83d\\ude00",			"'\\u{1F600}'", 0, 0 },
	{ "\\u00e9",				"'\\u{00E9}'", 0, 0 },
	{ "\xC3\xA9",				"'\\u{00E9}'", 0, 0 },
	{ "\\d\\D\\w\\W\\s\\S",			"(seq \\d \\D \\w \\W \\s \\S)", 0, 0 },
	{ "\\q",				0, "Invalid escape", 0 },
	{ "\\p{L}",				0, "Invalid escape", 0 },
	{ "ab\\",				0, "\\ at end of pattern", 2 },
	{ "\\x4",				0, "Invalid hexadecimal escape", 0 },
	{ "a\\xZZ",				0, "Invalid hexadecimal escape", 1 },
	{ "\\u12",				0, "Invalid Unicode escape", 0 },
	{ "\\u{110000}",			0, "Repetition count is too large", 2 },
	{ "\\u{}",				"(seq 'u' '{' '}')", 0, 0 },
	{ "\\c1",				0, "Invalid control character escape", 0 },
	{ "\\01",				0, "Invalid octal escape", 0 },

 { 0,	"--- Assertions and any ---", 0, 0 },
	{ "^a$",				"(seq ^ 'a' $)", 0, 0 },
	{ "\\bx\\B",				"(seq \\b 'x' \\B)", 0, 0 },
	{ "a.b",				"(seq 'a' . 'b')", 0, 0 },

 { 0,	"--- Character classes ---", 0, 0 },
	{ "[a-z]",				"[a-z]", 0, 0 },
	{ "[^0-9_]",				"[^0-9_]", 0, 0 },
	{ "[]",					"[]", 0, 0 },
	{ "[^]",				"[^]", 0, 0 },
	{ "[\\d]",				"[0-9]", 0, 0 },
	{ "[\\b]",				"[\\u{0008}]", 0, 0 },
	{ "[-a]",				"[\\u{002D}a]", 0, 0 },
	{ "[a-]",				"[a\\u{002D}]", 0, 0 },
	{ "[a\\-z]",				"[a\\u{002D}z]", 0, 0 },
	{ "[\\w-]",				"[0-9A-Z_a-z\\u{002D}]", 0, 0 },
	{ "[\\d-z]",				"[0-9\\u{002D}z]", 0, 0 },
	{ "[\\]]",				"[\\u{005D}]", 0, 0 },
	{ "[.*+?(){}|$]",			"[.*+?(){}|$]", 0, 0 },
	{ "[\\x41-\\x43]",			"[A-C]", 0, 0 },
	{ "[abc",				0, "Unterminated character class", 0 },
	{ "a[b\\",				0, "\\ at end of pattern", 3 },
	{ "x[z-a]",				0, "Range out of order in character class", 2 },
	{ "[\\q]",				0, "Invalid escape", 1 },

 { 0,	"--- Quantifiers ---", 0, 0 },
	{ "a*",					"(* 'a')", 0, 0 },
	{ "a+",					"(+ 'a')", 0, 0 },
	{ "a?",					"(? 'a')", 0, 0 },
	{ "a*?",				"(*? 'a')", 0, 0 },
	{ "a+?",				"(+? 'a')", 0, 0 },
	{ "a??",				"(?? 'a')", 0, 0 },
	{ "a{2,3}",				"({2,3} 'a')", 0, 0 },
	{ "a{2,}",				"({2,} 'a')", 0, 0 },
	{ "a{2}",				"({2} 'a')", 0, 0 },
	{ "a{2}?",				"({2}? 'a')", 0, 0 },
	{ "a{0}",				"({0} 'a')", 0, 0 },
	{ "ab*",				"(seq 'a' (* 'b'))", 0, 0 },
	{ "a{",					"(seq 'a' '{')", 0, 0 },
	{ "a{1",				"(seq 'a' '{' '1')", 0, 0 },
	{ "x{,3}",				"(seq 'x' '{' ',' '3' '}')", 0, 0 },
	{ "(?=a)*",				"(* (?= 'a'))", 0, 0 },
	{ "a{3,1}",				0, "Numbers out of order in {} quantifier", 1 },
	{ "a{70000}",				0, "Repetition count is too large", 1 },
	{ "*a",					0, "Nothing to repeat", 0 },
	{ "a**",				0, "Nothing to repeat", 2 },
	{ "^*",					0, "Nothing to repeat", 1 },
	{ "\\b+",				0, "Nothing to repeat", 2 },
	{ "(*)",				0, "Nothing to repeat", 1 },
	{ "a|*",				0, "Nothing to repeat", 2 },
	{ "{2}",				0, "Nothing to repeat", 0 },

 { 0,	"--- Alternates ---", 0, 0 },
	{ "a|b",				"(alt 'a' 'b')", 0, 0 },
	{ "ab|cd|e",				"(alt (seq 'a' 'b') (seq 'c' 'd') 'e')", 0, 0 },
	{ "|",					"(alt (seq) (seq))", 0, 0 },
	{ "a|",					"(alt 'a' (seq))", 0, 0 },

 { 0,	"--- Groups ---", 0, 0 },
	{ "(a)",				"(cap 1 'a')", 0, 0 },
	{ "()",					"(cap 1 (seq))", 0, 0 },
	{ "(a)(b)",				"(seq (cap 1 'a') (cap 2 'b'))", 0, 0 },
	{ "((a)b)",				"(cap 1 (seq (cap 2 'a') 'b'))", 0, 0 },
	{ "(?<x>ab)",				"(cap 1 <x> (seq 'a' 'b'))", 0, 0 },
	{ "(?:a|b)c",				"(seq (group (alt 'a' 'b')) 'c')", 0, 0 },
	{ "(?=a)",				"(?= 'a')", 0, 0 },
	{ "(?!a)b",				"(seq (?! 'a') 'b')", 0, 0 },
	{ "(a|b)*",				"(* (cap 1 (alt 'a' 'b')))", 0, 0 },
	{ "(a",					0, "Unterminated group", 0 },
	{ "a(b(c)",				0, "Unterminated group", 1 },
	{ "a)",					0, "Unmatched ')'", 1 },
	{ "(a))",				0, "Unmatched ')'", 3 },
	{ "(?<=a)b",				0, "Lookbehind is not supported", 0 },
	{ "(?<!a)b",				0, "Lookbehind is not supported", 0 },
	{ "(?x)",				0, "Invalid group", 0 },
	{ "(?<1a>x)",				0, "Invalid group name", 0 },
	{ "(?<>x)",				0, "Invalid group name", 0 },
	{ "(?<a>x)(?<a>y)",			0, "Duplicate group name", 7 },

 { 0,	"--- Backreferences ---", 0, 0 },
	{ "(a)\\1",				"(seq (cap 1 'a') \\1)", 0, 0 },
	{ "\\1(a)",				"(seq \\1 (cap 1 'a'))", 0, 0 },
	{ "(?<n>a)\\k<n>",			"(seq (cap 1 <n> 'a') \\1)", 0, 0 },
	{ "\\k<n>(?<n>a)",			"(seq \\1 (cap 1 <n> 'a'))", 0, 0 },
	{ "(a)(b)(c)(d)(e)(f)(g)(h)(i)(j)\\10",	"(seq (cap 1 'a') (cap 2 'b') (cap 3 'c') (cap 4 'd') (cap 5 'e') (cap 6 'f') (cap 7 'g') (cap 8 'h') (cap 9 'i') (cap 10 'j') \\10)", 0, 0 },
	{ "(a)(b)(c)(d)(e)(f)(g)(h)(i)(j)\\11",	"(seq (cap 1 'a') (cap 2 'b') (cap 3 'c') (cap 4 'd') (cap 5 'e') (cap 6 'f') (cap 7 'g') (cap 8 'h') (cap 9 'i') (cap 10 'j') \\1 '1')", 0, 0 },
	{ "(a)\\2",				0, "Backreference to a nonexistent group", 3 },
	{ "\\k<x>",				0, "Backreference to an unknown group name", 0 },
	{ "(?<x>a)\\k<y>",			0, "Backreference to an unknown group name", 7 },
	{ "\\k",				0, "Invalid named backreference", 0 },
	{ "\\k<1>",				0, "Invalid group name", 0 },
};

struct	program_test {
	const char*	regex;			// the regex to compile
	bool		case_insensitive;
	const char*	expected_program;	// The disassembled program
};
program_test	program_tests[] =
{
	{ "ab",		false,	"0: C 'a'\n1: C 'b'\n2: #\n" },
	{ "A",		true,	"0: C 'a'\n1: #\n" },
	{ "a|b",	false,	"0: A ->3\n1: C 'a'\n2: J ->4\n3: C 'b'\n4: #\n" },
	{ "a*",		false,	"0: A ->3\n1: C 'a'\n2: J ->0\n3: #\n" },
	{ "a*?",	false,	"0: a ->3\n1: C 'a'\n2: J ->0\n3: #\n" },
	{ "a+",		false,	"0: C 'a'\n1: a ->0\n2: #\n" },
	{ "a+?",	false,	"0: C 'a'\n1: A ->0\n2: #\n" },
	{ "a??",	false,	"0: a ->2\n1: C 'a'\n2: #\n" },
	{ "a{0}",	false,	"0: #\n" },
	{ "(a)",	false,	"0: ( 1\n1: C 'a'\n2: ) 1\n3: #\n" },
	{ "a{2,3}",	false,	"0: Z 0\n1: R 0 {2,3} ->5\n2: I 0\n3: C 'a'\n4: E 0 min 2 ->1\n5: #\n" },
	{ "(a)*",	false,	"0: Z 0\n1: R 0 * ->7\n2: I 0 reset 1-1\n3: ( 1\n4: C 'a'\n5: ) 1\n6: E 0 min 0 ->1\n7: #\n" },
	{ "(?:a*)+?",	false,	"0: Z 0\n1: R 0 +? ->7\n2: I 0\n3: A ->6\n4: C 'a'\n5: J ->3\n6: E 0 min 1 ->1\n7: #\n" },
	{ "(?!a)",	false,	"0: ! ->3\n1: C 'a'\n2: #\n3: #\n" },
	{ "[^\\d]\\1?",	false,	0 },	// Nonexistent group
	{ "\\s\\W",	false,	"0: P \\s\n1: P \\W\n2: #\n" },
	{ "^.$",	false,	"0: ^\n1: .\n2: $\n3: #\n" },
	{ "(a)\\1",	false,	"0: ( 1\n1: C 'a'\n2: ) 1\n3: K 1\n4: #\n" },
};

int parser_tests_run()
{
	auto 	wrapper = [&](parser_test* pt) -> bool
	{
		if (!pt->regex)
		{
			if (verbose)
				printf("%s\n", pt->expected_tree);
			return true;
		}

		RxCompiler	rx(pt->regex);
		RxAst		ast;
		bool		parsed_ok;

		parsed_ok = rx.parse(ast);

		// Check expectations
		bool	return_code_pass = (pt->expected_message == 0) == parsed_ok;
		bool	tree_pass = !pt->expected_tree || (parsed_ok && ast.describe() == pt->expected_tree);
		bool	error_message_pass = !pt->expected_message
				|| (rx.errorMessage() != 0 && 0 == strcmp(pt->expected_message, rx.errorMessage()));
		bool	offset_pass = !pt->expected_message || pt->expected_offset == rx.errorOffset();
		bool	test_pass = return_code_pass && tree_pass && error_message_pass && offset_pass;

		if (test_pass && !pt->expected_message)
			printf("Pass: %s\n", pt->regex);
		else if (test_pass)
			printf("Pass (with expected error): %s\n", pt->regex);
		else
			printf(
				"Fail (%s at %d), (returned %s): %s\n",
				rx.errorMessage() ? rx.errorMessage() : "<no message returned>",
				rx.errorOffset(),
				parsed_ok ? "ok" : "fail",
				pt->regex
			);

		if (parsed_ok && (!tree_pass || verbose))
			printf("\tgot %s\n\twanted %s\n", ast.describe().c_str(), pt->expected_tree ? pt->expected_tree : "an error");
		return test_pass;
	};

	size_t		num_tests = sizeof(parser_tests)/sizeof(parser_tests[0]);
	int		failures = 0;
	for (parser_test* pt = parser_tests; pt < parser_tests+num_tests; pt++)
		if (!wrapper(pt))
			failures++;
	printf("\n%d parser tests run with %d failures\n\n", (int)num_tests, failures);
	return failures;
}

int program_tests_run()
{
	size_t		num_tests = sizeof(program_tests)/sizeof(program_tests[0]);
	int		failures = 0;

	for (program_test* pt = program_tests; pt < program_tests+num_tests; pt++)
	{
		RxCompiler	rx(pt->regex, RxOptions(pt->case_insensitive));
		RxProgram*	program = 0;
		bool		compiled_ok;
		bool		test_pass;

		start_recording_allocations();
		compiled_ok = rx.compile(program);
		if (!pt->expected_program)
			test_pass = !compiled_ok && program == 0;
		else
			test_pass = compiled_ok && program->disassemble() == pt->expected_program;

		printf("%s: /%s/%s\n", test_pass ? "Pass" : "Fail", pt->regex, pt->case_insensitive ? "i" : "");
		if (program && (!test_pass || verbose))
			program->dump();
		if (!test_pass)
			failures++;

		delete program;
		if (allocation_growth_count() > 0)
		{
			printf("Unfreed allocations after compiling \"%s\":\n", pt->regex);
			report_allocation_growth();
			failures++;
		}
	}
	printf("\n%d program tests run with %d failures\n\n", (int)num_tests, failures);
	return failures;
}

int feature_tests_run()
{
	int	failures = 0;

	auto	check =
		[&](const char* label, bool ok)
		{
			printf("%s: %s\n", ok ? "Pass" : "Fail", label);
			if (!ok)
				failures++;
		};

	{	// A disabled feature is literal
		RxCompiler	rx("a|b", RxOptions(), (RxFeature)((int32_t)RxFeature::AllFeatures & ~(int32_t)RxFeature::Alternates));
		RxAst		ast;
		check("disabled alternates are literal", rx.parse(ast) && ast.describe() == "(seq 'a' '|' 'b')");
	}
	{
		RxCompiler	rx("a+", RxOptions(), (RxFeature)((int32_t)RxFeature::AllFeatures & ~(int32_t)RxFeature::OneOrMore));
		RxAst		ast;
		check("disabled + is literal", rx.parse(ast) && ast.describe() == "(seq 'a' '+')");
	}
	{	// A rejected feature is an error
		RxCompiler	rx("x(?=a)", RxOptions(), RxFeature::AllFeatures, RxFeature::Lookahead);
		RxAst		ast;
		check("rejected lookahead fails", !rx.parse(ast));
		check("rejected lookahead message", rx.errorMessage() && 0 == strcmp(rx.errorMessage(), "Rejected feature"));
		check("rejected lookahead code", rx.errorCode() == RXERR_REJECTED);
		check("rejected lookahead offset", rx.errorOffset() == 1);
	}
	{
		RxCompiler	rx("ab{2}", RxOptions(), RxFeature::AllFeatures, RxFeature::CountRepetition);
		RxAst		ast;
		check("rejected counted repetition fails", !rx.parse(ast) && rx.errorOffset() == 2);
	}
	{	// Nesting limit
		std::string	deep = std::string(RxMaxNesting, '(') + "a" + std::string(RxMaxNesting, ')');
		RxCompiler	rx(deep);
		RxAst		ast;
		check("maximum nesting is allowed", rx.parse(ast) && ast.group_count == RxMaxNesting);

		std::string	too_deep = std::string(RxMaxNesting+1, '(') + "a" + std::string(RxMaxNesting+1, ')');
		RxCompiler	rx2(too_deep);
		check("excessive nesting fails", !rx2.parse(ast) && rx2.errorCode() == RXERR_NESTING && rx2.errorOffset() == RxMaxNesting);
	}
	{	// Group names
		RxCompiler	rx("(?<year>\\d{4})-(?<month>\\d\\d)|(x)");
		RxProgram*	program = 0;
		bool		ok = rx.compile(program);
		check("named groups compile", ok);
		if (ok)
		{
			check("group count", program->maxCapture() == 4);
			check("first group name", program->groupName(1) == "year");
			check("unnamed group", program->groupName(3) == "");
			check("group number from name", program->groupNumber("month") == 2);
			check("unknown group name", program->groupNumber("day") == -1);
		}
		delete program;
	}
	{	// Error codes
		RxCompiler	rx("a{3,1}");
		RxAst		ast;
		rx.parse(ast);
		check("repetition order code", rx.errorCode() == RXERR_REPETITION_ORDER);
	}
	printf("\n%d feature test failures\n\n", failures);
	return failures;
}

int automated_tests()
{
	int	failures = 0;

	failures += parser_tests_run();
	failures += program_tests_run();
	failures += feature_tests_run();
	printf("%d failures in total\n", failures);
	return failures > 0 ? 1 : 0;
}
