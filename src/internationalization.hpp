/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Message texts and exceptions with printf style formatted messages
/// \file "internationalization.hpp"
#ifndef _TOKMATCH_INTERNATIONALIZATION_HPP_INCLUDED
#define _TOKMATCH_INTERNATIONALIZATION_HPP_INCLUDED
#include <libintl.h>
#include <stdexcept>
#include <string>

#define _TXT(STRING) dgettext( TOKMATCH_GETTEXT_PACKAGE, STRING)

namespace tokmatch
{

/// \brief Create a runtime error exception with a printf style formatted message
std::runtime_error runtime_error( const char* format, ...)
#ifdef __GNUC__
	__attribute__ ((format (printf, 1, 2)))
#endif
	;

/// \brief Create a logic error exception (internal error) with a printf style formatted message
std::logic_error logic_error( const char* format, ...)
#ifdef __GNUC__
	__attribute__ ((format (printf, 1, 2)))
#endif
	;

/// \brief Format a string printf style
std::string string_format( const char* format, ...)
#ifdef __GNUC__
	__attribute__ ((format (printf, 1, 2)))
#endif
	;

/// \brief Bind the message text domain of the library
void initMessageTextDomain();

}//namespace
#endif

