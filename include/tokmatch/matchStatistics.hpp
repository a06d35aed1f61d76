/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Object describing the size of the automaton of a matcher
/// \file "matchStatistics.hpp"
#ifndef _TOKMATCH_MATCH_STATISTICS_HPP_INCLUDED
#define _TOKMATCH_MATCH_STATISTICS_HPP_INCLUDED
#include <vector>

namespace tokmatch
{

/// \brief Some statistics about the automaton of a matcher
class MatchStatistics
{
public:
	/// \brief Statistics item
	class Item
	{
	public:
		/// \brief Name of the item
		const char* name() const	{return m_name;}
		/// \brief Value of the item
		double value() const		{return m_value;}

		/// \brief Constructor
		Item( const char* name_, double value_)
			:m_name(name_),m_value(value_){}
		/// \brief Copy constructor
		Item( const Item& o)
			:m_name(o.m_name),m_value(o.m_value){}

	private:
		const char* m_name;
		double m_value;
	};
	/// \brief Constructor
	MatchStatistics(){}
	/// \brief Copy constructor
	MatchStatistics( const MatchStatistics& o)
		:m_items(o.m_items){}

	/// \brief Define statistics item
	/// \param[in] name name of the statistics item (static string)
	/// \param[in] value value of the statistics item
	void define( const char* name, double value)
	{
		m_items.push_back( Item( name, value));
	}

	/// \brief Get all statistics items defined
	const std::vector<Item>& items() const	{return m_items;}

private:
	std::vector<Item> m_items;
};

}//namespace
#endif

