#if !defined(CHAR_ENCODING_H)
#define CHAR_ENCODING_H
/*
 * Encode/decode characters between UTF-8 and UCS4, and classify them
 * the way JavaScript regular expressions need.
 *
 * UCS4 (AKA UTF-32, Rune) is the ISO/IEC 10646 32-bit character encoding.
 *
 * A UTF8 character is represented as 1-4 bytes. A first byte with a most
 * significant bit of zero is a single ASCII byte. The bytes after the first
 * always have most significant two bits == "10", which never occurs in the
 * first byte.
 *
 * Illegal UTF-8 handing:
 * A byte which does not start a legal UTF-8 character is returned as a 32-bit
 * value with the high order bit set, as in, 0x800000yy. Such a value is one
 * character as far as indexing is concerned, and UTF8Put writes the original
 * byte back, so illegal input survives slicing unchanged.
 *
 * (c) Copyright Clifford Heath 2022. See LICENSE file for usage rights.
 */
#include	<assert.h>
#include	<cstdint>
#include	<vector>

typedef char		UTF8;		// We don't assume un/signed
typedef	char32_t	UCS4;		// A UCS4 character, aka UTF-32, aka Rune

#define	UCS4_NONE	0xFFFFFFFF	// Marker indicating no UCS4 character (end of text)
#define	UCS4_REPLACEMENT ((UCS4)0x0000FFFD)	// substitute for an unknown char

/*
 * UCS4 classification and conversion
 */
int		UCS4Digit(UCS4 ch);		// ASCII digit value 0-9 or -1 if not digit
int		UCS4HexDigit(UCS4 ch);		// Digit value 0-9, a-f/A-F or -1 if not hex
UCS4		UCS4ToUpper(UCS4 ch);		// To upper case (simple, one-to-one mappings only)
UCS4		UCS4ToLower(UCS4 ch);		// To lower case (simple, one-to-one mappings only)
UCS4		UCS4Fold(UCS4 ch);		// Canonical case for case-independent comparison

// Append the fold of every character in first..last that has another case
void		UCS4FoldRange(UCS4 first, UCS4 last, std::vector<UCS4>& folds);

// JavaScript WhiteSpace and LineTerminator, as matched by \s
bool		UCS4IsWhite(UCS4 ch);

// JavaScript LineTerminator: not matched by . and recognised by multiline ^ and $
inline bool	UCS4IsLineTerminator(UCS4 ch)
		{
			return ch == '\n' || ch == '\r' || ch == 0x2028 || ch == 0x2029;
		}

// A character matched by \w, and used to find \b word boundaries
inline bool	UCS4IsWord(UCS4 ch)
		{
			return (ch >= 'a' && ch <= 'z')
				|| (ch >= 'A' && ch <= 'Z')
				|| (ch >= '0' && ch <= '9')
				|| ch == '_';
		}

inline bool	UCS4IsASCII(UCS4 ch) { return ch < 0x00000080; }
inline bool	UCS4IsUnicode(UCS4 ch) { return ch < 0x00110000; }

inline bool
UCS4IsIllegal(UCS4 ucs4)	// Does this UCS4 character encode an illegal utf-8 byte?
{
	return (ucs4 & 0xFFFFFF00) == 0x80000000 || ucs4 == UCS4_NONE;
}

inline UCS4
UTF8EncodeIllegal(UTF8 illegal)	// Encode an illegal UTF8 byte as a UCS4 replacement
{
	return 0x80000000 | (illegal&0xFF);
}

inline bool
UTF8Is1st(UTF8 ch)
{
	return (ch & 0xC0) != 0x80;	// A non-1st byte is always 0b10xx_xxxx
}

// Get length of UTF8 from UCS4
inline int
UTF8Len(UCS4 ch)
{
	if (UCS4IsIllegal(ch))
		return 1;	// The original byte
	if (ch < (1<<7))
		return 1;	// ASCII
	if (ch < (1<<11))
		return 2;
	if (ch < (1<<16))
		return 3;
	return 4;		// Beyond Unicode is clamped by UTF8Put
}

// From a candidate UTF8 first byte, return the correct length of the UTF8 sequence it introduces:
inline int
UTF8CorrectLen(UTF8 c)
{
	if ((unsigned char)c < 0x80) return 1;		// 0b0xxx_xxxx
	if ((unsigned char)c < 0xC2) return 0;		// continuation byte, or overlong 2-byte lead
	if ((unsigned char)c < 0xE0) return 2;		// 0b110x_xxxx
	if ((unsigned char)c < 0xF0) return 3;		// 0b1110_xxxx
	if ((unsigned char)c < 0xF5) return 4;		// 0b1111_0xxx up to U+10FFFF
	return 0;
}

/*
 * Decode one character and advance cp. ep guards the end of the data, so a
 * sequence truncated by the end is illegal rather than an overrun.
 */
inline UCS4
UTF8Get(const UTF8*& cp, const UTF8* ep)
{
	const	UTF8*	sp = cp;
	static	const unsigned char	masks[] = { 0xFF, 0x7F, 0x1F, 0x0F, 0x07 };

	int		len = UTF8CorrectLen(*cp);
	UCS4		ch = (unsigned char)*cp & masks[len];

	if (len == 0 || sp+len > ep)
		goto illegal;
	for (int i = 1; i < len; i++)
	{
		if (UTF8Is1st(sp[i]))
			goto illegal;
		ch = (ch << 6) | (sp[i]&0x3F);
	}
	// Reject overlong forms, surrogates and values beyond Unicode
	if ((len == 3 && ch < 0x800)
	 || (len == 4 && ch < 0x10000)
	 || (ch >= 0xD800 && ch <= 0xDFFF)
	 || !UCS4IsUnicode(ch))
		goto illegal;
	cp = sp+len;
	return ch;

illegal:
	cp = sp+1;
	return UTF8EncodeIllegal(*sp);
}

// Store UTF8 from UCS4
inline void
UTF8Put(UTF8*& cp, UCS4 ch)
{
	if (UCS4IsIllegal(ch))
	{
		if (ch != UCS4_NONE)
			*cp++ = (UTF8)(ch & 0xFF);	// Restore the original byte
		return;
	}
	if (!UCS4IsUnicode(ch))
		ch = UCS4_REPLACEMENT;

	switch (UTF8Len(ch))
	{
	case 1:
		*cp++ = (UTF8)ch;
		return;

	case 2:		// 5 data bits in 1st byte, 6 in next
		*cp++ = 0xC0 | (UTF8)((ch >>  6) & 0x1F);
		*cp++ = 0x80 | (UTF8)((ch >>  0) & 0x3F);
		return;

	case 3:		// 4 data bits in 1st byte, 6 in each of 2 more
		*cp++ = 0xE0 | (UTF8)((ch >> 12) & 0x0F);
		*cp++ = 0x80 | (UTF8)((ch >>  6) & 0x3F);
		*cp++ = 0x80 | (UTF8)((ch >>  0) & 0x3F);
		return;

	default:	// 3 data bits in 1st byte, 6 in each of 3 more
		*cp++ = 0xF0 | (UTF8)((ch >> 18) & 0x07);
		*cp++ = 0x80 | (UTF8)((ch >> 12) & 0x3F);
		*cp++ = 0x80 | (UTF8)((ch >>  6) & 0x3F);
		*cp++ = 0x80 | (UTF8)((ch >>  0) & 0x3F);
		return;
	}
}

#endif
