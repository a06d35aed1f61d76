/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Functions deriving the lexical attributes of a token from its UTF-8 text
/// \file "lexicalAttributes.hpp"
#ifndef _TOKMATCH_LEXICAL_ATTRIBUTES_HPP_INCLUDED
#define _TOKMATCH_LEXICAL_ATTRIBUTES_HPP_INCLUDED
#include <string>

namespace tokmatch {
namespace lexical {

/// \brief Lowercase form with the simple case mapping of each character
std::string lower( const std::string& text);
/// \brief Orthographic shape: uppercase and titlecase letters to 'X', lowercase letters to 'x', digits to 'd', other characters unchanged, runs of the same shape character cut to 4
std::string shape( const std::string& text);
/// \brief Number of characters (code points)
unsigned int length( const std::string& text);

bool isAlpha( const std::string& text);
bool isAscii( const std::string& text);
bool isDigit( const std::string& text);
/// \brief At least one cased character and all cased characters lowercase
bool isLower( const std::string& text);
/// \brief At least one cased character and all cased characters uppercase
bool isUpper( const std::string& text);
/// \brief Uppercase characters only after uncased ones and lowercase characters only after cased ones
bool isTitle( const std::string& text);
bool isPunct( const std::string& text);
bool isSpace( const std::string& text);

/// \brief Looks like a number: digits with optional sign and separators, a fraction or a number word ("ten", "million")
bool likeNum( const std::string& text);
/// \brief Looks like an URL: a scheme or "www." prefix or a host name with a lowercase top level domain
bool likeUrl( const std::string& text);
/// \brief Looks like an email address
bool likeEmail( const std::string& text);

}}//namespace
#endif

