/*
 * Regular expression target text: decoding and slicing
 *
 * (c) Copyright Clifford Heath 2022. See LICENSE file for usage rights.
 */
#include	<rxtext.h>

RxText::RxText(const std::string& _utf8)
: utf8(_utf8)
{
	const UTF8*	bp = utf8.data();
	const UTF8*	cp = bp;
	const UTF8*	ep = bp+utf8.size();

	chars.reserve(utf8.size());
	offsets.reserve(utf8.size()+1);
	while (cp < ep)
	{
		offsets.push_back((CharBytes)(cp-bp));
		chars.push_back(UTF8Get(cp, ep));
	}
	offsets.push_back((CharBytes)(cp-bp));
}

CharBytes
RxText::byteOffset(CharNum i) const
{
	if (i <= 0)
		return 0;
	if (i >= length())
		return offsets.back();
	return offsets[i];
}

std::string
RxText::substr(CharNum start, CharNum len) const
{
	if (start < 0)
		start = 0;
	if (start > length())
		start = length();
	CharNum	end = len < 0 || len > length()-start ? length() : start+len;

	CharBytes	first = byteOffset(start);
	return utf8.substr(first, byteOffset(end)-first);
}
