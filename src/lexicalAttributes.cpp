/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "lexicalAttributes.hpp"
#include "strus/base/utf8.hpp"
#include "strus/base/stdint.h"
#include "unicode/uchar.h"
#include <vector>
#include <cstring>

using namespace tokmatch;

static std::vector<int32_t> decodeText( const std::string& text)
{
	std::vector<int32_t> rt;
	rt.reserve( text.size());
	std::size_t pos = 0;
	while (pos < text.size())
	{
		unsigned int chlen = strus::utf8charlen( text[ pos]);
		if (chlen == 0 || pos + chlen > text.size())
		{
			// invalid UTF-8: take the byte as Latin-1 character
			rt.push_back( (unsigned char)text[ pos]);
			++pos;
			continue;
		}
		rt.push_back( strus::utf8decode( text.c_str() + pos, chlen));
		pos += chlen;
	}
	return rt;
}

enum CharCase {Uncased, LowerCase, UpperCase, TitleCase};

static CharCase charCase( int32_t ch)
{
	if (u_isUUppercase( ch)) return UpperCase;
	if (u_isULowercase( ch)) return LowerCase;
	if (u_istitle( ch)) return TitleCase;
	return Uncased;
}

static int32_t toLowerChar( int32_t ch)
{
	return u_tolower( ch);
}

static bool isDigitChar( int32_t ch)
{
	return u_isdigit( ch);
}

static bool isSpaceChar( int32_t ch)
{
	return u_isUWhiteSpace( ch);
}

static bool isPunctChar( int32_t ch)
{
	return u_ispunct( ch);
}

static bool isAlphaChar( int32_t ch)
{
	return u_isalpha( ch);
}

unsigned int lexical::length( const std::string& text)
{
	return decodeText( text).size();
}

std::string lexical::lower( const std::string& text)
{
	std::string rt;
	rt.reserve( text.size());
	std::vector<int32_t> chars = decodeText( text);
	std::vector<int32_t>::const_iterator ci = chars.begin(), ce = chars.end();
	for (; ci != ce; ++ci)
	{
		char buf[ 8];
		unsigned int len = strus::utf8encode( buf, toLowerChar( *ci));
		rt.append( buf, len);
	}
	return rt;
}

std::string lexical::shape( const std::string& text)
{
	std::string rt;
	std::vector<int32_t> chars = decodeText( text);
	std::vector<int32_t>::const_iterator ci = chars.begin(), ce = chars.end();
	int32_t lastch = -1;
	int seqlen = 0;
	for (; ci != ce; ++ci)
	{
		int32_t shapech;
		switch (charCase( *ci))
		{
			case UpperCase:
			case TitleCase: shapech = 'X'; break;
			case LowerCase: shapech = 'x'; break;
			default: shapech = isDigitChar( *ci) ? 'd' : (isAlphaChar( *ci) ? 'x' : *ci);
		}
		if (shapech == lastch)
		{
			++seqlen;
		}
		else
		{
			lastch = shapech;
			seqlen = 1;
		}
		if (seqlen <= 4)
		{
			char buf[ 8];
			unsigned int len = strus::utf8encode( buf, shapech);
			rt.append( buf, len);
		}
	}
	return rt;
}

bool lexical::isAlpha( const std::string& text)
{
	std::vector<int32_t> chars = decodeText( text);
	if (chars.empty()) return false;
	std::vector<int32_t>::const_iterator ci = chars.begin(), ce = chars.end();
	for (; ci != ce; ++ci)
	{
		if (!isAlphaChar( *ci)) return false;
	}
	return true;
}

bool lexical::isAscii( const std::string& text)
{
	std::string::const_iterator ci = text.begin(), ce = text.end();
	for (; ci != ce; ++ci)
	{
		if ((unsigned char)*ci >= 128) return false;
	}
	return true;
}

bool lexical::isDigit( const std::string& text)
{
	std::vector<int32_t> chars = decodeText( text);
	if (chars.empty()) return false;
	std::vector<int32_t>::const_iterator ci = chars.begin(), ce = chars.end();
	for (; ci != ce; ++ci)
	{
		if (!isDigitChar( *ci)) return false;
	}
	return true;
}

static bool isSingleCase( const std::string& text, CharCase expected)
{
	std::vector<int32_t> chars = decodeText( text);
	bool hasCased = false;
	std::vector<int32_t>::const_iterator ci = chars.begin(), ce = chars.end();
	for (; ci != ce; ++ci)
	{
		CharCase cs = charCase( *ci);
		if (cs == Uncased) continue;
		if (cs != expected) return false;
		hasCased = true;
	}
	return hasCased;
}

bool lexical::isLower( const std::string& text)
{
	return isSingleCase( text, LowerCase);
}

bool lexical::isUpper( const std::string& text)
{
	return isSingleCase( text, UpperCase);
}

bool lexical::isTitle( const std::string& text)
{
	std::vector<int32_t> chars = decodeText( text);
	bool hasCased = false;
	bool prevCased = false;
	std::vector<int32_t>::const_iterator ci = chars.begin(), ce = chars.end();
	for (; ci != ce; ++ci)
	{
		CharCase cs = charCase( *ci);
		if (cs == UpperCase || cs == TitleCase)
		{
			if (prevCased) return false;
			prevCased = true;
			hasCased = true;
		}
		else if (cs == LowerCase)
		{
			if (!prevCased) return false;
			prevCased = true;
			hasCased = true;
		}
		else
		{
			prevCased = false;
		}
	}
	return hasCased;
}

bool lexical::isPunct( const std::string& text)
{
	std::vector<int32_t> chars = decodeText( text);
	if (chars.empty()) return false;
	std::vector<int32_t>::const_iterator ci = chars.begin(), ce = chars.end();
	for (; ci != ce; ++ci)
	{
		if (!isPunctChar( *ci)) return false;
	}
	return true;
}

bool lexical::isSpace( const std::string& text)
{
	std::vector<int32_t> chars = decodeText( text);
	if (chars.empty()) return false;
	std::vector<int32_t>::const_iterator ci = chars.begin(), ce = chars.end();
	for (; ci != ce; ++ci)
	{
		if (!isSpaceChar( *ci)) return false;
	}
	return true;
}

static const char* g_numberWords[] = {
	"zero","one","two","three","four","five","six","seven","eight","nine","ten",
	"eleven","twelve","thirteen","fourteen","fifteen","sixteen","seventeen","eighteen","nineteen",
	"twenty","thirty","forty","fifty","sixty","seventy","eighty","ninety",
	"hundred","thousand","million","billion","trillion","quadrillion","gajillion","bazillion",0};

bool lexical::likeNum( const std::string& text)
{
	std::string::const_iterator ti = text.begin(), te = text.end();
	if (ti != te && (*ti == '+' || *ti == '-' || *ti == '~')) ++ti;
	else if (te - ti >= 2 && (unsigned char)ti[0] == 0xC2 && (unsigned char)ti[1] == 0xB1) ti += 2;

	std::string digits;
	for (; ti != te; ++ti)
	{
		if (*ti != ',' && *ti != '.') digits.push_back( *ti);
	}
	if (isDigit( digits)) return true;

	std::size_t slash = digits.find( '/');
	if (slash != std::string::npos && slash == digits.rfind( '/'))
	{
		if (isDigit( digits.substr( 0, slash)) && isDigit( digits.substr( slash+1))) return true;
	}
	std::string lw = lower( text);
	for (int wi=0; g_numberWords[wi]; ++wi)
	{
		if (lw == g_numberWords[wi]) return true;
	}
	return false;
}

static bool startsWith( const std::string& text, const char* prefix)
{
	std::size_t len = std::strlen( prefix);
	return text.size() > len && 0==std::memcmp( text.c_str(), prefix, len);
}

static bool isHostChar( char ch)
{
	return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || (ch >= '0' && ch <= '9') || ch == '-' || ch == '.';
}

static bool isTopLevelDomain( const std::string& host)
{
	std::size_t dot = host.rfind( '.');
	if (dot == std::string::npos || dot == 0) return false;
	std::string tld = host.substr( dot+1);
	if (tld.size() < 2 || tld.size() > 6) return false;
	std::string::const_iterator ci = tld.begin(), ce = tld.end();
	for (; ci != ce; ++ci)
	{
		if (*ci < 'a' || *ci > 'z') return false;
	}
	return true;
}

bool lexical::likeUrl( const std::string& text)
{
	if (text.empty()) return false;
	if (startsWith( text, "http://") || startsWith( text, "https://") || startsWith( text, "ftp://") || startsWith( text, "www.")) return true;
	if (text.find( '@') != std::string::npos) return false;
	std::size_t hostend = text.find_first_of( "/:?#");
	std::string host = text.substr( 0, hostend);
	if (host.empty() || host[0] == '.' || host[0] == '-') return false;
	std::string::const_iterator ci = host.begin(), ce = host.end();
	for (; ci != ce; ++ci)
	{
		if (!isHostChar( *ci)) return false;
	}
	return isTopLevelDomain( host);
}

bool lexical::likeEmail( const std::string& text)
{
	std::size_t at = text.find( '@');
	if (at == std::string::npos || at == 0 || text.find( '@', at+1) != std::string::npos) return false;
	std::string::const_iterator ci = text.begin(), ce = text.begin() + at;
	for (; ci != ce; ++ci)
	{
		if (!isHostChar( *ci) && *ci != '_' && *ci != '%' && *ci != '+') return false;
	}
	std::string host = text.substr( at+1);
	if (host.empty() || host[0] == '.' || host[0] == '-') return false;
	ci = host.begin(), ce = host.end();
	for (; ci != ce; ++ci)
	{
		if (!isHostChar( *ci)) return false;
	}
	return isTopLevelDomain( lower( host));
}

