/*
 * Test program for the character encodings and classifications.
 *
 * (c) Copyright Clifford Heath 2022. See LICENSE file for usage rights.
 */
#include	<cstdio>
#include	<cstring>
#include	<char_encoding.h>

bool		show_passes = false;
int		test_count;
int		failure_count;
const char*	new_group;

void		utf8_char_sizes();
void		utf8_get();
void		utf8_invalid();
void		utf8_put();
void		ucs4_classify();
void		ucs4_case_conversions();

int
main(int argc, const char** argv)
{
	if (argc > 1 && 0 == strcmp("-p", argv[1]))
		show_passes = true;

	utf8_char_sizes();	// Test the different encoded character lengths
	utf8_get();		// Test decoding and advancing
	utf8_invalid();		// Test illegal, overlong and truncated sequences
	utf8_put();		// Test encoding, including illegal bytes
	ucs4_classify();
	ucs4_case_conversions();

	printf("Completed %d tests with %d failures\n", test_count, failure_count);
	return failure_count == 0 ? 0 : 1;
}

void
test_group(const char* group)
{
	new_group = group;
}

void
expect(const char* when, uint32_t result, uint32_t wanted = 1)
{
	test_count++;
	if (result != wanted)
	{
		if (new_group)
			printf("%s:\n", new_group);
		if (wanted != 1)
			printf("%d:\t%s: FAIL (wanted %d=0x%X got %d=0x%X)\n", test_count, when, wanted, wanted, result, result);
		else
			printf("%d:\t%s: FAIL\n", test_count, when);
		failure_count++;
		new_group = 0;
	}
	else if (show_passes)
	{
		if (new_group)
			printf("%s:\n", new_group);
		printf("%d:\t%s: PASS\n", test_count, when);
		new_group = 0;
	}
}

// Decode one character from a string literal, and check how far it advanced
void
expect_get(const char* when, const UTF8* bytes, int len, UCS4 wanted, int advance)
{
	const UTF8*	cp = bytes;
	char		buf[100];

	snprintf(buf, sizeof(buf), "%s get", when);
	expect(buf, UTF8Get(cp, bytes+len), wanted);
	snprintf(buf, sizeof(buf), "%s advance", when);
	expect(buf, (uint32_t)(cp-bytes), advance);
}

void
utf8_char_sizes()
{
	test_group("encoded size for UCS4 chars");

	expect("max length 1", UTF8Len(0x7F), 1);
	expect("min length 2", UTF8Len(0x80), 2);
	expect("max length 2", UTF8Len(0x7FF), 2);
	expect("min length 3", UTF8Len(0x800), 3);
	expect("max length 3", UTF8Len(0xFFFF), 3);
	expect("min length 4", UTF8Len(0x10000), 4);
	expect("max length 4", UTF8Len(0x10FFFF), 4);

	// An illegal byte is re-encoded as itself:
	expect("min illegal", UTF8Len(0x80000000), 1);
	expect("max illegal", UTF8Len(0x800000FF), 1);

	test_group("lead bytes");
	expect("ASCII is 1st", UTF8Is1st('A'));
	expect("continuation is not 1st", !UTF8Is1st('\x80'));
	expect("lead of two", UTF8CorrectLen('\xDF'), 2);
	expect("overlong lead of two", UTF8CorrectLen('\xC1'), 0);
	expect("lead of three", UTF8CorrectLen('\xE0'), 3);
	expect("lead of four", UTF8CorrectLen('\xF4'), 4);
	expect("beyond Unicode lead", UTF8CorrectLen('\xF5'), 0);
}

void
utf8_get()
{
	test_group("decoding UTF8 to UCS4 and advancing");

	expect_get("NUL", "\0", 1, 0, 1);
	expect_get("ASCII", "A", 1, 'A', 1);
	expect_get("max one", "\x7F", 1, 0x7F, 1);
	expect_get("min two", "\xC2\x80", 2, 0x80, 2);
	expect_get("max two", "\xDF\xBF", 2, 0x7FF, 2);
	expect_get("min three", "\xE0\xA0\x80", 3, 0x800, 3);
	expect_get("euro", "\xE2\x82\xAC", 3, 0x20AC, 3);
	expect_get("max three", "\xEF\xBF\xBF", 3, 0xFFFF, 3);
	expect_get("min four", "\xF0\x90\x80\x80", 4, 0x10000, 4);
	expect_get("max four", "\xF4\x8F\xBF\xBF", 4, 0x10FFFF, 4);
}

void
utf8_invalid()
{
	test_group("Invalid UTF8 encoding");

	// Each bad sequence yields its first byte as one character
	expect_get("overlong two", "\xC0\x80", 2, UTF8EncodeIllegal('\xC0'), 1);
	expect_get("overlong three", "\xE0\x80\x80", 3, UTF8EncodeIllegal('\xE0'), 1);
	expect_get("overlong four", "\xF0\x80\x80\x80", 4, UTF8EncodeIllegal('\xF0'), 1);
	expect_get("surrogate", "\xED\xA0\x80", 3, UTF8EncodeIllegal('\xED'), 1);
	expect_get("beyond Unicode", "\xF4\x90\x80\x80", 4, UTF8EncodeIllegal('\xF4'), 1);
	expect_get("bad lead", "\xF8\x88\x80\x80\x80", 5, UTF8EncodeIllegal('\xF8'), 1);
	expect_get("stray trailing byte", "\x80", 1, UTF8EncodeIllegal('\x80'), 1);
	expect_get("bad second byte", "\xC3\x41", 2, UTF8EncodeIllegal('\xC3'), 1);
	expect_get("truncated by end", "\xE2\x82\xAC", 2, UTF8EncodeIllegal('\xE2'), 1);

	expect("illegal is illegal", UCS4IsIllegal(UTF8EncodeIllegal('\xFF')));
	expect("NONE is illegal", UCS4IsIllegal(UCS4_NONE));
	expect("max Unicode is legal", !UCS4IsIllegal(0x10FFFF));
}

void
utf8_put()
{
	test_group("encoding UCS4 to UTF8");

	UTF8		buf[8];
	UTF8*		cp;

	cp = buf;
	UTF8Put(cp, 'z');
	expect("ASCII length", (uint32_t)(cp-buf), 1);
	expect("ASCII byte", buf[0] == 'z');

	cp = buf;
	UTF8Put(cp, 0x20AC);
	expect("euro length", (uint32_t)(cp-buf), 3);
	expect("euro bytes", 0 == memcmp(buf, "\xE2\x82\xAC", 3));

	cp = buf;
	UTF8Put(cp, 0x1F600);
	expect("emoji length", (uint32_t)(cp-buf), 4);
	expect("emoji bytes", 0 == memcmp(buf, "\xF0\x9F\x98\x80", 4));

	cp = buf;
	UTF8Put(cp, UTF8EncodeIllegal('\xC0'));
	expect("illegal byte restored", (uint32_t)(cp-buf), 1);
	expect("illegal byte value", (buf[0]&0xFF) == 0xC0);

	cp = buf;
	UTF8Put(cp, 0x110000);
	expect("beyond Unicode is replaced", 0 == memcmp(buf, "\xEF\xBF\xBD", 3));

	cp = buf;
	UTF8Put(cp, UCS4_NONE);
	expect("NONE writes nothing", cp == buf);
}

void
ucs4_classify()
{
	test_group("UCS4 classification");

	expect("space is white", UCS4IsWhite(' '));
	expect("tab is white", UCS4IsWhite('\t'));
	expect("vertical tab is white", UCS4IsWhite('\v'));
	expect("NBSP is white", UCS4IsWhite(0xA0));
	expect("BOM is white", UCS4IsWhite(0xFEFF));
	expect("line separator is white", UCS4IsWhite(0x2028));
	expect("NEL is not white", !UCS4IsWhite(0x85));
	expect("zero width space is not white", !UCS4IsWhite(0x200B));
	expect("letter is not white", !UCS4IsWhite('x'));

	expect("newline terminates", UCS4IsLineTerminator('\n'));
	expect("return terminates", UCS4IsLineTerminator('\r'));
	expect("U+2029 terminates", UCS4IsLineTerminator(0x2029));
	expect("vertical tab doesn't terminate", !UCS4IsLineTerminator('\v'));

	expect("a is word", UCS4IsWord('a'));
	expect("Z is word", UCS4IsWord('Z'));
	expect("0 is word", UCS4IsWord('0'));
	expect("_ is word", UCS4IsWord('_'));
	expect("- is not word", !UCS4IsWord('-'));
	expect("e-acute is not word", !UCS4IsWord(0xE9));

	expect("UCS4Digit('0'-1) == -1", UCS4Digit('0'-1), (uint32_t)-1);
	expect("UCS4Digit('0') == 0", UCS4Digit('0'), 0);
	expect("UCS4Digit('9') == 9", UCS4Digit('9'), 9);
	expect("UCS4Digit('9'+1) == -1", UCS4Digit('9'+1), (uint32_t)-1);
	expect("Arabic-Indic zero is not a digit", UCS4Digit(0x0660), (uint32_t)-1);
	expect("UCS4HexDigit('f') == 15", UCS4HexDigit('f'), 15);
	expect("UCS4HexDigit('A') == 10", UCS4HexDigit('A'), 10);
	expect("UCS4HexDigit('G') == -1", UCS4HexDigit('G'), (uint32_t)-1);
}

void
ucs4_case_conversions()
{
	test_group("UCS4 case conversions");

	expect("ToUpper('a')", UCS4ToUpper('a'), 'A');
	expect("ToUpper('A')", UCS4ToUpper('A'), 'A');
	expect("ToLower('Z')", UCS4ToLower('Z'), 'z');
	expect("ToLower('1')", UCS4ToLower('1'), '1');
	expect("ToLower(A-grave)", UCS4ToLower(0xC0), 0xE0);
	expect("ToUpper(y-diaeresis)", UCS4ToUpper(0xFF), 0x178);
	expect("ToLower(Y-diaeresis)", UCS4ToLower(0x178), 0xFF);
	expect("ToLower(A-macron)", UCS4ToLower(0x100), 0x101);
	expect("ToLower(a-macron)", UCS4ToLower(0x101), 0x101);
	expect("ToUpper(a-macron)", UCS4ToUpper(0x101), 0x100);
	expect("ToLower(Sigma)", UCS4ToLower(0x3A3), 0x3C3);
	expect("ToUpper(final sigma)", UCS4ToUpper(0x3C2), 0x3A3);
	expect("ToLower(Cyrillic Ie)", UCS4ToLower(0x415), 0x435);
	expect("ToLower(Deseret Long I)", UCS4ToLower(0x10400), 0x10428);

	expect("Fold('K')", UCS4Fold('K'), 'k');
	expect("Fold(final sigma) == Fold(Sigma)", UCS4Fold(0x3C2) == UCS4Fold(0x3A3));
	expect("Fold(Kelvin sign) is not ASCII", UCS4Fold(0x212A), 0x212A);
	expect("Fold(illegal byte)", UCS4Fold(UTF8EncodeIllegal('\xC1')), UTF8EncodeIllegal('\xC1'));

	std::vector<UCS4>	folds;
	UCS4FoldRange(0x3C2, 0x3C2, folds);
	expect("final sigma folds with sigma", folds.size() == 1 && folds[0] == 0x3C3);
	folds.clear();
	UCS4FoldRange('0', '9', folds);
	expect("digits have no folds", folds.empty());
	folds.clear();
	UCS4FoldRange('X', 'b', folds);
	expect("folds of X-b", folds.size() == 5 && folds[0] == 'a' && folds[1] == 'b' && folds[2] == 'x' && folds[4] == 'z');
	folds.clear();
	UCS4FoldRange(0x212A, 0x212A, folds);
	expect("Kelvin sign has no fold", folds.empty());
}
