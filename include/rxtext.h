#if !defined(RXTEXT_H)
#define RXTEXT_H
/*
 * Regular expression target text.
 *
 * The UTF-8 input is decoded once into UCS4 characters. All match offsets
 * are character (code point) numbers, and slices copy the original bytes,
 * so illegal UTF-8 bytes pass through slicing unchanged.
 *
 * (c) Copyright Clifford Heath 2022. See LICENSE file for usage rights.
 */
#include	<string>
#include	<vector>
#include	<char_encoding.h>

typedef	int32_t		CharNum;	// Index of a character in the text
typedef	int32_t		CharBytes;	// Byte offset or count in UTF-8

class RxText
{
public:
	RxText(const std::string& utf8);

	const std::string&	source() const { return utf8; }
	CharNum		length() const { return (CharNum)chars.size(); }

	// A character, or UCS4_NONE for offsets outside the text
	UCS4		operator[](CharNum i) const
			{ return i >= 0 && i < length() ? chars[i] : UCS4_NONE; }

	CharBytes	byteOffset(CharNum i) const;
	std::string	substr(CharNum start, CharNum len = -1) const;
	std::string	slice(CharNum start, CharNum end) const
			{ return substr(start, end-start); }

private:
	std::string		utf8;
	std::vector<UCS4>	chars;
	std::vector<CharBytes>	offsets;	// Byte offset of each character, plus one for the end
};

#endif	// RXTEXT_H
