/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "lexems.hpp"
#include "errorUtils.hpp"
#include "internationalization.hpp"
#include <limits>

using namespace tokmatch;
using namespace tokmatch::parser;

bool parser::is_UNSIGNED( const char* src)
{
	char const* cc = src;
	if (!isDigit( *cc)) return false;
	for (++cc; isDigit( *cc); ++cc){}
	if (*cc == '.' || isAlnum(*cc)) return false;
	return true;
}

bool parser::isEqual( const std::string& id, const char* idstr)
{
	char const* si = id.c_str();
	char const* di = idstr;
	for (; *si && *di && ((*si|32) == (*di|32)); ++si,++di){}
	return !*si && !*di;
}

std::string parser::parse_IDENTIFIER( char const*& src)
{
	std::string rt;
	while (isAlnum( *src)) rt.push_back( *src++);
	skipSpaces( src);
	return rt;
}

std::string parser::parse_STRING( char const*& src)
{
	std::string rt;
	char eb = *src++;
	while (*src != eb)
	{
		if (*src == '\0' || *src == '\n') throw syntax_error( string_format( _TXT("unterminated string %c...%c"), eb, eb));
		if (*src == '\\')
		{
			src++;
			if (*src == '\0' || *src == '\n') throw syntax_error( string_format( _TXT("unterminated string %c...%c"), eb, eb));
		}
		rt.push_back( *src++);
	}
	++src;
	skipSpaces( src);
	return rt;
}

unsigned int parser::parse_UNSIGNED( char const*& src)
{
	unsigned int rt = 0;
	while (isDigit( *src))
	{
		unsigned int digit = *src - '0';
		if (rt > (std::numeric_limits<unsigned int>::max() - digit) / 10) throw syntax_error( _TXT("number out of range"));
		rt = (rt * 10) + digit;
		++src;
	}
	skipSpaces( src);
	return rt;
}

char parser::parse_OPERATOR( char const*& src)
{
	char rt = *src++;
	skipSpaces( src);
	return rt;
}

