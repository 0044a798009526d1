/*
 * Encode/decode characters between UTF-8 and UCS4.
 *
 * UCS4 classification and simple case conversion for regular expressions.
 *
 * (c) Copyright Clifford Heath 2022. See LICENSE file for usage rights.
 */
#include	<assert.h>

#include	<atomic>
#include	<char_encoding.h>

// Digit value 0-9, -1 if not digit. Regular expression \d is ASCII only.
int
UCS4Digit(UCS4 ch)
{
	if (ch >= '0' && ch <= '9')
		return ch-'0';
	return -1;
}

int
UCS4HexDigit(UCS4 ch)		// Digit value 0-9, a-f/A-F or -1 if not digit
{
	int digit = UCS4Digit(ch);
	if (digit >= 0)
		return digit;
	if (ch >= 'A' && ch <= 'F')
		return ch-'A'+10;
	if (ch >= 'a' && ch <= 'f')
		return ch-'a'+10;
	return -1;
}

bool
UCS4IsWhite(UCS4 ch)
{
	if (ch < 0x80)
		return ch == ' ' || (ch >= '\t' && ch <= '\r');	// \t \n \v \f \r
	return ch == 0x00A0
		|| ch == 0x1680
		|| (ch >= 0x2000 && ch <= 0x200A)
		|| ch == 0x2028 || ch == 0x2029
		|| ch == 0x202F || ch == 0x205F
		|| ch == 0x3000
		|| ch == 0xFEFF;
}

/*
 * Simple (one-to-one) case mappings. Each entry maps a range of upper-case
 * characters to lower-case by adding delta. Where upper and lower case
 * alternate (as in Latin Extended-A), only every second character starting
 * at upper_first is upper-case, and the lower-case one follows it.
 *
 * This covers the alphabetic scripts with case in the Basic Multilingual Plane
 * that are commonly encountered. It is not the full Unicode case table.
 */
static const struct case_range
{
	UCS4		upper_first;
	UCS4		upper_last;
	int32_t		delta;
	bool		alternating;
} UCS4_CaseRanges[] =
{				// must keep sorted by upper_first:
	{ 0x0041, 0x005A,  32, false },	// Basic Latin
	{ 0x00C0, 0x00D6,  32, false },	// Latin-1 Supplement
	{ 0x00D8, 0x00DE,  32, false },
	{ 0x0100, 0x012E,   1, true },	// Latin Extended-A
	{ 0x0132, 0x0136,   1, true },
	{ 0x0139, 0x0147,   1, true },
	{ 0x014A, 0x0176,   1, true },
	{ 0x0178, 0x0178, -121, false },	// Y with diaeresis
	{ 0x0179, 0x017D,   1, true },
	{ 0x0386, 0x0386,  38, false },	// Greek
	{ 0x0388, 0x038A,  37, false },
	{ 0x038C, 0x038C,  64, false },
	{ 0x038E, 0x038F,  63, false },
	{ 0x0391, 0x03A1,  32, false },
	{ 0x03A3, 0x03AB,  32, false },
	{ 0x03D8, 0x03EE,   1, true },
	{ 0x0400, 0x040F,  80, false },	// Cyrillic
	{ 0x0410, 0x042F,  32, false },
	{ 0x0460, 0x0480,   1, true },
	{ 0x048A, 0x04BE,   1, true },
	{ 0x04C1, 0x04CD,   1, true },
	{ 0x04D0, 0x052E,   1, true },
	{ 0x0531, 0x0556,  48, false },	// Armenian
	{ 0x10A0, 0x10C5, 7264, false },	// Georgian
	{ 0x1E00, 0x1E94,   1, true },	// Latin Extended Additional
	{ 0x1EA0, 0x1EFE,   1, true },
	{ 0x1F08, 0x1F0F,  -8, false },	// Greek Extended
	{ 0x1F18, 0x1F1D,  -8, false },
	{ 0x1F28, 0x1F2F,  -8, false },
	{ 0x1F38, 0x1F3F,  -8, false },
	{ 0x1F48, 0x1F4D,  -8, false },
	{ 0x1F68, 0x1F6F,  -8, false },
	{ 0x2160, 0x216F,  16, false },	// Roman numerals
	{ 0x24B6, 0x24CF,  26, false },	// Circled Latin letters
	{ 0x2C00, 0x2C2E,  48, false },	// Glagolitic
	{ 0xFF21, 0xFF3A,  32, false },	// Fullwidth Latin
	{ 0x10400, 0x10427, 40, false }	// Deseret
};
#define	UCS4NumCaseRanges	(sizeof(UCS4_CaseRanges)/sizeof(struct case_range))

static bool
upperInRange(const case_range& r, UCS4 ch)
{
	return ch >= r.upper_first
		&& ch <= r.upper_last
		&& (!r.alternating || ((ch - r.upper_first) & 1) == 0);
}

static bool
lowerInRange(const case_range& r, UCS4 ch)
{
	return ch >= r.upper_first + r.delta
		&& ch <= r.upper_last + r.delta
		&& (!r.alternating || ((ch - r.delta - r.upper_first) & 1) == 0);
}

/*
 * Convert to lower case
 */
UCS4
UCS4ToLower(UCS4 ch)
{
	if (ch < 0x80)
		return ch >= 'A' && ch <= 'Z' ? ch+32 : ch;

	// Adjacent characters will often be from the same set. Memoize that set.
	// This memo is thread- and SMP-safe as long as we read it only once:
	static	std::atomic<int> last_memo(0);
	int	last = last_memo;
	if (upperInRange(UCS4_CaseRanges[last], ch))
		return ch + UCS4_CaseRanges[last].delta;

	int	hi, lo, mid;
	lo = 0;
	hi = UCS4NumCaseRanges-1;
	while (hi >= lo)
	{
		mid = (lo+hi)/2;
		if (ch < UCS4_CaseRanges[mid].upper_first)
			hi = mid-1;
		else if (ch > UCS4_CaseRanges[mid].upper_last)
			lo = mid+1;
		else
		{
			if (!upperInRange(UCS4_CaseRanges[mid], ch))
				return ch;
			last_memo = mid;
			return ch + UCS4_CaseRanges[mid].delta;
		}
	}
	return ch;
}

/*
 * Convert to upper case. The lower-case ranges are not sorted, so search them all.
 */
UCS4
UCS4ToUpper(UCS4 ch)
{
	if (ch < 0x80)
		return ch >= 'a' && ch <= 'z' ? ch-32 : ch;
	if (ch == 0x03C2)
		return 0x03A3;		// Final sigma has no upper-case of its own

	static	std::atomic<int> last_memo(0);
	int	last = last_memo;
	if (lowerInRange(UCS4_CaseRanges[last], ch))
		return ch - UCS4_CaseRanges[last].delta;

	for (unsigned i = 0; i < UCS4NumCaseRanges; i++)
		if (lowerInRange(UCS4_CaseRanges[i], ch))
		{
			last_memo = i;
			return ch - UCS4_CaseRanges[i].delta;
		}
	return ch;
}

/*
 * All members of a case-equivalence class fold to the same character.
 * A non-ASCII character never folds to ASCII, as in JavaScript's Canonicalize.
 */
UCS4
UCS4Fold(UCS4 ch)
{
	if (UCS4IsIllegal(ch))
		return ch;
	UCS4	folded = UCS4ToLower(UCS4ToUpper(ch));
	if (!UCS4IsASCII(ch) && UCS4IsASCII(folded))
		return ch;
	return folded;
}

void
UCS4FoldRange(UCS4 first, UCS4 last, std::vector<UCS4>& folds)
{
	auto	add =
		[&](UCS4 upper, UCS4 lower)
		{
			if ((upper >= first && upper <= last) || (lower >= first && lower <= last))
				folds.push_back(UCS4Fold(upper));
		};

	for (unsigned i = 0; i < UCS4NumCaseRanges; i++)
	{
		const case_range&	r = UCS4_CaseRanges[i];
		UCS4			lowest = r.delta < 0 ? r.upper_first + r.delta : r.upper_first;
		UCS4			highest = r.delta < 0 ? r.upper_last : r.upper_last + r.delta;
		if (highest < first || lowest > last)
			continue;
		for (UCS4 upper = r.upper_first; upper <= r.upper_last; upper += r.alternating ? 2 : 1)
			add(upper, upper + r.delta);
	}
	add(0x03A3, 0x03C2);		// Final sigma
}
