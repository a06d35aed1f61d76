/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Token sequence built from token texts with the lexical attributes derived from the text
/// \file "annotatedTokenSequence.hpp"
#ifndef _TOKMATCH_ANNOTATED_TOKEN_SEQUENCE_HPP_INCLUDED
#define _TOKMATCH_ANNOTATED_TOKEN_SEQUENCE_HPP_INCLUDED
#include "tokmatch/tokenSequenceInterface.hpp"
#include <vector>
#include <string>

namespace tokmatch
{

/// \brief Forward declaration
class VocabularyInterface;

/// \brief Token sequence built from token texts
/// \note TEXT, LOWER, LENGTH, SHAPE and the lexical booleans (IS_ALPHA, IS_DIGIT, LIKE_NUM, etc.) are derived from the text,
///	IS_STOP is false unless set, POS, TAG, DEP, LEMMA and ENT_TYPE are undefined unless set.
/// \remark Methods throw std::runtime_error or std::bad_alloc on error
class AnnotatedTokenSequence
	:public TokenSequenceInterface
{
public:
	/// \brief Constructor
	/// \param[in] vocabulary_ vocabulary for mapping strings to symbols (not owned, must outlive this)
	explicit AnnotatedTokenSequence( VocabularyInterface* vocabulary_)
		:m_vocabulary(vocabulary_),m_tokens(){}
	/// \brief Copy constructor
	AnnotatedTokenSequence( const AnnotatedTokenSequence& o)
		:TokenSequenceInterface(),m_vocabulary(o.m_vocabulary),m_tokens(o.m_tokens){}
	/// \brief Destructor
	virtual ~AnnotatedTokenSequence(){}

	/// \brief Append a token
	/// \param[in] text text of the token
	/// \param[in] spaceAfter true, if the token is followed by whitespace in the original text
	void addToken( const std::string& text, bool spaceAfter=true);

	/// \brief Set the value of an attribute of a token
	void setAttribute( std::size_t pos, AttributeKey key, AttributeValue value);
	/// \brief Set the value of a symbolic attribute of a token from a string
	void setStringAttribute( std::size_t pos, AttributeKey key, const std::string& value);
	/// \brief Remove the value of an attribute of a token
	void resetAttribute( std::size_t pos, AttributeKey key);

	/// \brief Join the tokens of a span into one token
	/// \param[in] start position of the first token of the span
	/// \param[in] end position after the last token of the span
	/// \note The attributes set explicitly are inherited from the first token of the span
	void merge( std::size_t start, std::size_t end);

	/// \brief Text of a token
	const std::string& text( std::size_t pos) const;
	/// \brief Test if a token is followed by whitespace
	bool spaceAfter( std::size_t pos) const;
	/// \brief Text of a span of tokens joined with the whitespace between them
	std::string spanText( std::size_t start, std::size_t end) const;

	/// \brief Get the vocabulary the symbols of this sequence are defined in
	const VocabularyInterface* vocabulary() const
	{
		return m_vocabulary;
	}

	virtual std::size_t size() const
	{
		return m_tokens.size();
	}
	virtual bool getAttribute( std::size_t pos, AttributeKey key, AttributeValue& value) const;

private:
	struct Token
	{
		std::string text;
		bool spaceAfter;
		uint32_t definedMask;
		AttributeValue values[ NofAttributeKeys];

		Token();
		Token( const Token& o);
		Token& operator=( const Token& o);
	};

	void initToken( Token& token, const std::string& text, bool spaceAfter) const;
	void checkPosition( std::size_t pos) const;

private:
	VocabularyInterface* m_vocabulary;
	std::vector<Token> m_tokens;
};

}//namespace
#endif

