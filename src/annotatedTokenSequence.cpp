/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Token sequence built from token texts with the lexical attributes derived from the text
/// \file "annotatedTokenSequence.cpp"
#include "tokmatch/annotatedTokenSequence.hpp"
#include "tokmatch/vocabularyInterface.hpp"
#include "lexicalAttributes.hpp"
#include "internationalization.hpp"
#include <cstring>

using namespace tokmatch;

#define ATTRBIT( key)	((uint32_t)1 << (key))

/// \brief Attributes that are not derived from the text
static const uint32_t g_explicitAttributeMask
	= ATTRBIT(AttrIsStop) | ATTRBIT(AttrPos) | ATTRBIT(AttrTag)
	| ATTRBIT(AttrDep) | ATTRBIT(AttrLemma) | ATTRBIT(AttrEntType);

AnnotatedTokenSequence::Token::Token()
	:text(),spaceAfter(false),definedMask(0)
{
	std::memset( values, 0, sizeof(values));
}

AnnotatedTokenSequence::Token::Token( const Token& o)
	:text(o.text),spaceAfter(o.spaceAfter),definedMask(o.definedMask)
{
	std::memcpy( values, o.values, sizeof(values));
}

AnnotatedTokenSequence::Token& AnnotatedTokenSequence::Token::operator=( const Token& o)
{
	text = o.text;
	spaceAfter = o.spaceAfter;
	definedMask = o.definedMask;
	std::memcpy( values, o.values, sizeof(values));
	return *this;
}

static uint32_t getSymbol( VocabularyInterface* vocabulary, const std::string& str)
{
	uint32_t rt = vocabulary->getOrCreateSymbol( str);
	if (!rt) throw tokmatch::runtime_error( _TXT("failed to map string '%s' to a symbol of the vocabulary"), str.c_str());
	return rt;
}

void AnnotatedTokenSequence::initToken( Token& token, const std::string& text_, bool spaceAfter_) const
{
	token.text = text_;
	token.spaceAfter = spaceAfter_;
	token.definedMask &= g_explicitAttributeMask;

	token.values[ AttrText] = getSymbol( m_vocabulary, text_);
	token.values[ AttrLower] = getSymbol( m_vocabulary, lexical::lower( text_));
	token.values[ AttrShape] = getSymbol( m_vocabulary, lexical::shape( text_));
	token.values[ AttrLength] = lexical::length( text_);
	token.values[ AttrIsAlpha] = lexical::isAlpha( text_);
	token.values[ AttrIsAscii] = lexical::isAscii( text_);
	token.values[ AttrIsDigit] = lexical::isDigit( text_);
	token.values[ AttrIsLower] = lexical::isLower( text_);
	token.values[ AttrIsUpper] = lexical::isUpper( text_);
	token.values[ AttrIsTitle] = lexical::isTitle( text_);
	token.values[ AttrIsPunct] = lexical::isPunct( text_);
	token.values[ AttrIsSpace] = lexical::isSpace( text_);
	token.values[ AttrLikeNum] = lexical::likeNum( text_);
	token.values[ AttrLikeUrl] = lexical::likeUrl( text_);
	token.values[ AttrLikeEmail] = lexical::likeEmail( text_);

	token.definedMask |= ~g_explicitAttributeMask & (ATTRBIT(NofAttributeKeys)-1);
	if (0==(token.definedMask & ATTRBIT(AttrIsStop)))
	{
		token.values[ AttrIsStop] = 0;
		token.definedMask |= ATTRBIT(AttrIsStop);
	}
}

void AnnotatedTokenSequence::checkPosition( std::size_t pos) const
{
	if (pos >= m_tokens.size())
	{
		throw tokmatch::runtime_error( _TXT("token position %u out of range (size %u)"), (unsigned int)pos, (unsigned int)m_tokens.size());
	}
}

void AnnotatedTokenSequence::addToken( const std::string& text_, bool spaceAfter_)
{
	Token token;
	initToken( token, text_, spaceAfter_);
	m_tokens.push_back( token);
}

void AnnotatedTokenSequence::setAttribute( std::size_t pos, AttributeKey key, AttributeValue value)
{
	checkPosition( pos);
	if ((unsigned int)key >= (unsigned int)NofAttributeKeys)
	{
		throw tokmatch::runtime_error( _TXT("unknown attribute key %u"), (unsigned int)key);
	}
	if (attributeType( key) == AttributeBoolean && value > 1)
	{
		throw tokmatch::runtime_error( _TXT("value %u of boolean attribute %s is not 0 or 1"), value, attributeKeyName( key));
	}
	m_tokens[ pos].values[ key] = value;
	m_tokens[ pos].definedMask |= ATTRBIT(key);
}

void AnnotatedTokenSequence::setStringAttribute( std::size_t pos, AttributeKey key, const std::string& value)
{
	if ((unsigned int)key >= (unsigned int)NofAttributeKeys || attributeType( key) != AttributeSymbol)
	{
		throw tokmatch::runtime_error( _TXT("attribute %u is not a symbolic attribute"), (unsigned int)key);
	}
	setAttribute( pos, key, getSymbol( m_vocabulary, value));
}

void AnnotatedTokenSequence::resetAttribute( std::size_t pos, AttributeKey key)
{
	checkPosition( pos);
	if ((unsigned int)key >= (unsigned int)NofAttributeKeys)
	{
		throw tokmatch::runtime_error( _TXT("unknown attribute key %u"), (unsigned int)key);
	}
	m_tokens[ pos].values[ key] = 0;
	m_tokens[ pos].definedMask &= ~ATTRBIT(key);
}

void AnnotatedTokenSequence::merge( std::size_t start, std::size_t end)
{
	if (start >= end || end > m_tokens.size())
	{
		throw tokmatch::runtime_error( _TXT("invalid span [%u,%u) to merge (size %u)"), (unsigned int)start, (unsigned int)end, (unsigned int)m_tokens.size());
	}
	if (end - start == 1) return;

	Token merged( m_tokens[ start]);
	initToken( merged, spanText( start, end), m_tokens[ end-1].spaceAfter);
	m_tokens[ start] = merged;
	m_tokens.erase( m_tokens.begin() + start + 1, m_tokens.begin() + end);
}

const std::string& AnnotatedTokenSequence::text( std::size_t pos) const
{
	checkPosition( pos);
	return m_tokens[ pos].text;
}

bool AnnotatedTokenSequence::spaceAfter( std::size_t pos) const
{
	checkPosition( pos);
	return m_tokens[ pos].spaceAfter;
}

std::string AnnotatedTokenSequence::spanText( std::size_t start, std::size_t end) const
{
	if (start > end || end > m_tokens.size())
	{
		throw tokmatch::runtime_error( _TXT("invalid span [%u,%u) (size %u)"), (unsigned int)start, (unsigned int)end, (unsigned int)m_tokens.size());
	}
	std::string rt;
	for (std::size_t pos=start; pos < end; ++pos)
	{
		rt.append( m_tokens[ pos].text);
		if (pos+1 < end && m_tokens[ pos].spaceAfter)
		{
			rt.push_back( ' ');
		}
	}
	return rt;
}

bool AnnotatedTokenSequence::getAttribute( std::size_t pos, AttributeKey key, AttributeValue& value) const
{
	if (pos >= m_tokens.size() || (unsigned int)key >= (unsigned int)NofAttributeKeys) return false;
	const Token& token = m_tokens[ pos];
	if (0==(token.definedMask & ATTRBIT(key))) return false;
	value = token.values[ key];
	return true;
}

