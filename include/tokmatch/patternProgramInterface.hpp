/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Interface for loading pattern definitions from source text
/// \file "patternProgramInterface.hpp"
#ifndef _TOKMATCH_PATTERN_PROGRAM_INTERFACE_HPP_INCLUDED
#define _TOKMATCH_PATTERN_PROGRAM_INTERFACE_HPP_INCLUDED
#include "tokmatch/tokenConstraint.hpp"
#include <string>

namespace tokmatch
{

/// \brief Forward declaration
class MatchCallbackInterface;

/// \brief Interface for loading pattern definitions from source text into a match engine
/// \note Source syntax:
///	# comment until end of line
///	NAME = [ {KEY: value, ..., OP: "?"}, ... ] | [ ... ] ;
///	KEY is an attribute name (e.g. LOWER), a flag name or FLAG<n>, value a quoted string, an unsigned integer, true or false.
///	OP is one of "?", "+", "*", "!", "1". {} is the wildcard token.
class PatternProgramInterface
{
public:
	/// \brief Destructor
	virtual ~PatternProgramInterface(){}

	/// \brief Bind a callback to the pattern identifier with the name given for the rules loaded afterwards
	/// \param[in] name pattern identifier
	/// \param[in] callback function called for each match (ownership passed)
	/// \return true on success, false on error
	virtual bool defineCallback( const std::string& name, MatchCallbackInterface* callback)=0;

	/// \brief Load the rules of a source and register them in the match engine
	/// \param[in] source source text
	/// \return true on success, false on error (nothing registered)
	virtual bool load( const std::string& source)=0;

	/// \brief Parse a single pattern literal, e.g. [{LOWER: "hello"}, {IS_PUNCT: true, OP: "?"}]
	/// \param[in] source source text
	/// \param[out] result the pattern parsed
	/// \return true on success, false on error
	virtual bool parsePattern( const std::string& source, Pattern& result) const=0;
};

}//namespace
#endif

