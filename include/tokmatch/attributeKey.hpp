/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Identifiers of the token attributes a pattern can refer to
/// \file "attributeKey.hpp"
#ifndef _TOKMATCH_ATTRIBUTE_KEY_HPP_INCLUDED
#define _TOKMATCH_ATTRIBUTE_KEY_HPP_INCLUDED
#include "strus/base/stdint.h"

namespace tokmatch
{

/// \brief Built-in token attributes
enum AttributeKey
{
	AttrText,		///< exact text of the token (symbol)
	AttrLower,		///< lowercase form of the text (symbol)
	AttrLength,		///< length of the text in bytes (unsigned integer)
	AttrIsAlpha,		///< text consists of alphabetic characters (boolean)
	AttrIsAscii,		///< text consists of ASCII characters (boolean)
	AttrIsDigit,		///< text consists of digits (boolean)
	AttrIsLower,		///< text is in lowercase (boolean)
	AttrIsUpper,		///< text is in uppercase (boolean)
	AttrIsTitle,		///< text is in titlecase (boolean)
	AttrIsPunct,		///< text is punctuation (boolean)
	AttrIsSpace,		///< text consists of whitespace characters (boolean)
	AttrIsStop,		///< token is a stop word (boolean)
	AttrLikeNum,		///< text looks like a number (boolean)
	AttrLikeUrl,		///< text looks like an URL (boolean)
	AttrLikeEmail,		///< text looks like an email address (boolean)
	AttrPos,		///< coarse grained part of speech (symbol)
	AttrTag,		///< fine grained part of speech tag (symbol)
	AttrDep,		///< dependency label (symbol)
	AttrLemma,		///< lemma (symbol)
	AttrShape,		///< orthographic shape, e.g. "Xxxx" (symbol)
	AttrEntType		///< named entity type (symbol)
};
enum {NofAttributeKeys=AttrEntType+1};

/// \brief Attribute identifiers starting from this value refer to dynamically registered flags
enum {FlagAttributeBase=0x10000};

/// \brief Value type of an attribute: a symbol identifier, an unsigned integer or 0/1 for booleans
typedef uint32_t AttributeValue;

/// \brief Classification of attribute values
enum AttributeType
{
	AttributeSymbol,	///< value is a symbol identifier of the vocabulary
	AttributeNumber,	///< value is an unsigned integer
	AttributeBoolean	///< value is 0 or 1
};

/// \brief Get the type of the values of a built-in attribute
AttributeType attributeType( AttributeKey key);

/// \brief Get the name of a built-in attribute as used in pattern literals (e.g. "LOWER")
const char* attributeKeyName( AttributeKey key);

/// \brief Find a built-in attribute by name (case insensitive, "ORTH" is an alias of "TEXT")
/// \param[in] name name of the attribute
/// \param[out] key the attribute found
/// \return true if found, false if not
bool findAttributeKey( const char* name, AttributeKey& key);

/// \brief Get the attribute identifier of a dynamically registered flag
/// \param[in] flagid identifier of the flag returned by VocabularyInterface::addFlag
inline uint32_t flagAttribute( unsigned int flagid)
{
	return FlagAttributeBase + flagid;
}

}//namespace
#endif

