/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Interface for a source of token sequences to scan
/// \file "tokenSequenceSourceInterface.hpp"
#ifndef _TOKMATCH_TOKEN_SEQUENCE_SOURCE_INTERFACE_HPP_INCLUDED
#define _TOKMATCH_TOKEN_SEQUENCE_SOURCE_INTERFACE_HPP_INCLUDED

namespace tokmatch
{

/// \brief Forward declaration
class TokenSequenceInterface;

/// \brief Interface for a source of token sequences to scan
class TokenSequenceSourceInterface
{
public:
	/// \brief Destructor
	virtual ~TokenSequenceSourceInterface(){}

	/// \brief Fetch the next token sequence
	/// \return the sequence (ownership passed) or NULL at the end of the source
	/// \note Called only from the thread iterating on the scan stream
	virtual TokenSequenceInterface* fetch()=0;
};

}//namespace
#endif

