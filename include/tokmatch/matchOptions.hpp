/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Structure with options for processing token sequences with a matcher
/// \file "matchOptions.hpp"
#ifndef _TOKMATCH_MATCH_OPTIONS_HPP_INCLUDED
#define _TOKMATCH_MATCH_OPTIONS_HPP_INCLUDED
#include <vector>
#include <string>

namespace tokmatch
{

/// \brief Structure with options for processing token sequences with a matcher
class MatchOptions
{
public:
	///\brief Default constructor
	MatchOptions(){}
	///\brief Copy constructor
	MatchOptions( const MatchOptions& o)
		:m_opts(o.m_opts){}

	/// \brief Add an option definition
	/// \note The options of a scan stream are:
	///		"threads"	: number of worker threads matching the sequences of a batch (0 = match in the calling thread)
	///		"batchSize"	: number of sequences fetched from the source and matched together
	MatchOptions& operator()( const std::string& opt, double value)
	{
		m_opts.push_back( OptionDef( opt, value));
		return *this;
	}

	typedef std::pair<std::string,double> OptionDef;
	typedef std::vector<OptionDef>::const_iterator const_iterator;

	/// \brief Get iterator at first element of the option list
	const_iterator begin() const	{return m_opts.begin();}
	/// \brief Get iterator marking the end of the option list
	const_iterator end() const	{return m_opts.end();}

private:
	std::vector<OptionDef> m_opts;	///< list of option definitions
};

}//namespace
#endif

