/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "internationalization.hpp"
#include <cstdarg>
#include <cstdio>

using namespace tokmatch;

static std::string formatMessage( const char* format, va_list args)
{
	char msgbuf[ 4096];
	int len = ::vsnprintf( msgbuf, sizeof(msgbuf), format, args);
	if (len < 0) return std::string( format);
	if ((std::size_t)len >= sizeof(msgbuf))
	{
		len = sizeof(msgbuf)-1;
	}
	return std::string( msgbuf, len);
}

std::runtime_error tokmatch::runtime_error( const char* format, ...)
{
	va_list args;
	va_start( args, format);
	std::string msg = formatMessage( format, args);
	va_end( args);
	return std::runtime_error( msg);
}

std::logic_error tokmatch::logic_error( const char* format, ...)
{
	va_list args;
	va_start( args, format);
	std::string msg = formatMessage( format, args);
	va_end( args);
	return std::logic_error( msg);
}

std::string tokmatch::string_format( const char* format, ...)
{
	va_list args;
	va_start( args, format);
	std::string rt = formatMessage( format, args);
	va_end( args);
	return rt;
}

void tokmatch::initMessageTextDomain()
{
	::bindtextdomain( TOKMATCH_GETTEXT_PACKAGE, TOKMATCH_GETTEXT_LOCALEDIR);
}

