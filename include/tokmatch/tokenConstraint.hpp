/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Structures describing the constraints on tokens a pattern is built of
/// \file "tokenConstraint.hpp"
#ifndef _TOKMATCH_TOKEN_CONSTRAINT_HPP_INCLUDED
#define _TOKMATCH_TOKEN_CONSTRAINT_HPP_INCLUDED
#include "tokmatch/attributeKey.hpp"
#include <vector>

namespace tokmatch
{

/// \brief Constraint on one attribute of a token
class AttributePredicate
{
public:
	/// \brief Constructor
	/// \param[in] attribute_ a built-in attribute key or the result of flagAttribute(flagid) for a flag
	/// \param[in] value_ expected value (symbol identifier, number or 0/1 for booleans and flags)
	AttributePredicate( uint32_t attribute_, AttributeValue value_)
		:m_attribute(attribute_),m_value(value_){}
	/// \brief Copy constructor
	AttributePredicate( const AttributePredicate& o)
		:m_attribute(o.m_attribute),m_value(o.m_value){}

	/// \brief Attribute identifier
	uint32_t attribute() const		{return m_attribute;}
	/// \brief Expected value
	AttributeValue value() const		{return m_value;}

	/// \brief Test if the predicate refers to a dynamically registered flag
	bool isFlag() const			{return m_attribute >= (uint32_t)FlagAttributeBase;}
	/// \brief Identifier of the flag referred to (only defined if isFlag())
	unsigned int flagid() const		{return m_attribute - FlagAttributeBase;}

	bool operator<( const AttributePredicate& o) const
	{
		return (m_attribute == o.m_attribute) ? (m_value < o.m_value) : (m_attribute < o.m_attribute);
	}
	bool operator==( const AttributePredicate& o) const
	{
		return m_attribute == o.m_attribute && m_value == o.m_value;
	}

private:
	uint32_t m_attribute;
	AttributeValue m_value;
};

/// \brief Constraint on one token of a pattern: a conjunction of attribute predicates with a quantifier
class TokenConstraintSet
{
public:
	/// \brief Quantifier of a constraint set
	enum Quantifier
	{
		Exactly1,	///< default, exactly one token
		ZeroOrOne,	///< "?", optional
		OneOrMore,	///< "+", one or more tokens
		ZeroOrMore,	///< "*", zero or more tokens
		Exactly0	///< "!", no token satisfying the constraints at this position
	};
	enum {NofQuantifiers=Exactly0+1};

	/// \brief Get the quantifier operator string ("", "?", "+", "*", "!")
	static const char* quantifierName( Quantifier q);
	/// \brief Find a quantifier by its operator string
	/// \return true if found
	static bool findQuantifier( const char* name, Quantifier& q);

	/// \brief Default constructor, defines a wildcard matching any token
	explicit TokenConstraintSet( Quantifier quantifier_=Exactly1)
		:m_predicates(),m_quantifier(quantifier_){}
	/// \brief Copy constructor
	TokenConstraintSet( const TokenConstraintSet& o)
		:m_predicates(o.m_predicates),m_quantifier(o.m_quantifier){}

	/// \brief Add a predicate
	/// \param[in] attribute a built-in attribute key or the result of flagAttribute(flagid) for a flag
	/// \param[in] value expected value
	TokenConstraintSet& operator()( uint32_t attribute, AttributeValue value)
	{
		m_predicates.push_back( AttributePredicate( attribute, value));
		return *this;
	}
	/// \brief Add a predicate
	TokenConstraintSet& operator()( const AttributePredicate& predicate)
	{
		m_predicates.push_back( predicate);
		return *this;
	}

	/// \brief Set the quantifier
	void setQuantifier( Quantifier quantifier_)
	{
		m_quantifier = quantifier_;
	}

	const std::vector<AttributePredicate>& predicates() const	{return m_predicates;}
	Quantifier quantifier() const					{return m_quantifier;}
	/// \brief Test if this constraint set matches any token
	bool isWildcard() const						{return m_predicates.empty();}

private:
	std::vector<AttributePredicate> m_predicates;
	Quantifier m_quantifier;
};

/// \brief A pattern: sequence of token constraints matched against contiguous tokens
typedef std::vector<TokenConstraintSet> Pattern;

}//namespace
#endif

