/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Interface for a custom boolean token attribute (flag)
/// \file "tokenFlagPredicateInterface.hpp"
#ifndef _TOKMATCH_TOKEN_FLAG_PREDICATE_INTERFACE_HPP_INCLUDED
#define _TOKMATCH_TOKEN_FLAG_PREDICATE_INTERFACE_HPP_INCLUDED
#include <cstddef>

namespace tokmatch
{

/// \brief Forward declaration
class TokenSequenceInterface;

/// \brief Interface for a custom boolean token attribute (flag) evaluated on demand
/// \remark Implementations must be free of side effects, they are evaluated speculatively and from several threads
class TokenFlagPredicateInterface
{
public:
	/// \brief Destructor
	virtual ~TokenFlagPredicateInterface(){}

	/// \brief Evaluate the flag for a token
	/// \param[in] seq token sequence
	/// \param[in] pos position of the token in seq
	/// \return true, if the flag is set for the token
	virtual bool match( const TokenSequenceInterface& seq, std::size_t pos) const=0;
};

}//namespace
#endif

