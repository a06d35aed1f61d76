/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Interface of the engine matching patterns of token constraints with quantifiers
/// \file "matchEngineInterface.hpp"
#ifndef _TOKMATCH_MATCH_ENGINE_INTERFACE_HPP_INCLUDED
#define _TOKMATCH_MATCH_ENGINE_INTERFACE_HPP_INCLUDED
#include "tokmatch/tokenMatcherInterface.hpp"
#include "tokmatch/tokenConstraint.hpp"
#include <vector>
#include <string>

namespace tokmatch
{

/// \brief Forward declaration
class MatchCallbackInterface;

/// \brief Interface of the engine matching patterns of token constraints with quantifiers
class MatchEngineInterface
	:public TokenMatcherInterface
{
public:
	/// \brief Destructor
	virtual ~MatchEngineInterface(){}

	/// \brief Register a list of alternative patterns under a pattern identifier
	/// \param[in] name pattern identifier
	/// \param[in] callback function called for each match (ownership passed, may be NULL)
	/// \param[in] patterns alternative patterns (not empty)
	/// \return true on success, false on a configuration error (registration has no effect)
	/// \note Replaces the patterns and the callback registered before under the same identifier
	virtual bool definePatterns( const std::string& name, MatchCallbackInterface* callback, const std::vector<Pattern>& patterns)=0;

	/// \brief Remove the registration of a pattern identifier
	/// \param[in] name pattern identifier
	/// \return true on success, false if not defined (error reported)
	virtual bool removePatterns( const std::string& name)=0;
};

}//namespace
#endif

