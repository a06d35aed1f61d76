/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Interface for accessing the attributes of a sequence of annotated tokens
/// \file "tokenSequenceInterface.hpp"
#ifndef _TOKMATCH_TOKEN_SEQUENCE_INTERFACE_HPP_INCLUDED
#define _TOKMATCH_TOKEN_SEQUENCE_INTERFACE_HPP_INCLUDED
#include "tokmatch/attributeKey.hpp"
#include <cstddef>

namespace tokmatch
{

/// \brief Interface for accessing the attributes of a sequence of annotated tokens (a document)
/// \note The matchers only read a token sequence. It must not be modified during a match.
class TokenSequenceInterface
{
public:
	/// \brief Destructor
	virtual ~TokenSequenceInterface(){}

	/// \brief Get the number of tokens in the sequence
	virtual std::size_t size() const=0;

	/// \brief Get the value of an attribute of a token
	/// \param[in] pos position of the token (0 .. size()-1)
	/// \param[in] key identifier of the attribute
	/// \param[out] value the value of the attribute
	/// \return true if the attribute is defined for the token, false if not
	virtual bool getAttribute( std::size_t pos, AttributeKey key, AttributeValue& value) const=0;
};

}//namespace
#endif

