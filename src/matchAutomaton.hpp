/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Automaton for matching patterns of token constraints with quantifiers
/// \file "matchAutomaton.hpp"
#ifndef _TOKMATCH_MATCH_AUTOMATON_HPP_INCLUDED
#define _TOKMATCH_MATCH_AUTOMATON_HPP_INCLUDED
#include "tokmatch/tokenConstraint.hpp"
#include "tokmatch/matchRecord.hpp"
#include "matchSnapshot.hpp"
#include <boost/unordered_map.hpp>
#include <vector>
#include <string>

namespace tokmatch
{

/// \brief Forward declaration
class VocabularyInterface;
/// \brief Forward declaration
class TokenFlagPredicateInterface;

/// \brief Table of the distinct constraint sets of a program
class ConstraintTable
{
public:
	explicit ConstraintTable( const VocabularyInterface* vocabulary_)
		:m_vocabulary(vocabulary_){}

	/// \brief Get the index of a constraint set, define it if it does not exist yet
	/// \note Throws configuration_error on an invalid predicate
	uint32_t getOrCreate( const TokenConstraintSet& constraints);

	/// \brief Evaluate a constraint set on the token at a position
	bool match( uint32_t idx, const TokenSequenceInterface& seq, std::size_t pos) const;

	std::size_t size() const
	{
		return m_ar.size();
	}

private:
	struct Predicate
	{
		uint32_t attribute;
		AttributeValue value;
		const TokenFlagPredicateInterface* flag;

		Predicate( uint32_t attribute_, AttributeValue value_, const TokenFlagPredicateInterface* flag_)
			:attribute(attribute_),value(value_),flag(flag_){}
		Predicate( const Predicate& o)
			:attribute(o.attribute),value(o.value),flag(o.flag){}
	};
	typedef std::vector<Predicate> Constraint;

	Predicate compilePredicate( const AttributePredicate& pred) const;

private:
	const VocabularyInterface* m_vocabulary;
	std::vector<Constraint> m_ar;
	typedef boost::unordered_map<std::string,uint32_t> KeyMap;
	KeyMap m_keymap;
};

/// \brief State of the automaton
struct ProgramState
{
	enum Op
	{
		Consume,	///< consume a token matching 'constraint' and continue with 'next'
		Split,		///< continue with both 'next' and 'next2'
		AssertNot,	///< continue with 'next' without consuming if there is no token matching 'constraint' at the current position
		Accept		///< alternative 'next' matched
	};
	Op op;
	uint32_t constraint;
	uint32_t next;
	uint32_t next2;

	ProgramState( Op op_, uint32_t constraint_, uint32_t next_, uint32_t next2_)
		:op(op_),constraint(constraint_),next(next_),next2(next2_){}
	ProgramState( const ProgramState& o)
		:op(o.op),constraint(o.constraint),next(o.next),next2(o.next2){}
};

/// \brief One pattern of a registration compiled into the program
struct ProgramAlternative
{
	uint32_t patternid;
	const char* name;
	uint32_t startstate;

	ProgramAlternative( uint32_t patternid_, const char* name_, uint32_t startstate_)
		:patternid(patternid_),name(name_),startstate(startstate_){}
	ProgramAlternative( const ProgramAlternative& o)
		:patternid(o.patternid),name(o.name),startstate(o.startstate){}
};

/// \brief Immutable program compiled from all registered patterns
class MatchProgram
	:public MatchSnapshot
{
public:
	explicit MatchProgram( const VocabularyInterface* vocabulary_)
		:m_constraintTable(vocabulary_),m_nofPatternIds(0){}
	virtual ~MatchProgram(){}

	/// \brief Add the patterns of a registration
	/// \note Registrations have to be added in ascending order of their pattern identifier handles, matches of the same start are reported in that order
	void definePatterns( uint32_t patternid, const char* name, const std::vector<Pattern>& patterns);

	virtual void match( std::vector<MatchRecord>& result, const TokenSequenceInterface& seq, strus::DebugTraceContextInterface* debugtrace) const;

	const ConstraintTable& constraintTable() const			{return m_constraintTable;}
	const ProgramState& state( uint32_t idx) const			{return m_states[ idx];}
	const std::vector<ProgramAlternative>& alternatives() const	{return m_alternatives;}
	std::size_t nofStates() const					{return m_states.size();}
	unsigned int nofPatternIds() const				{return m_nofPatternIds;}

private:
	uint32_t addState( ProgramState::Op op, uint32_t constraint, uint32_t next, uint32_t next2);
	uint32_t compilePattern( const Pattern& pattern, uint32_t altidx);

private:
	ConstraintTable m_constraintTable;
	std::vector<ProgramState> m_states;
	std::vector<ProgramAlternative> m_alternatives;
	unsigned int m_nofPatternIds;
};

/// \brief Per scan state for running a program on a token sequence
class StateMachine
{
public:
	StateMachine( const MatchProgram* program_, strus::DebugTraceContextInterface* debugtrace_);

	/// \brief Append the longest match of every alternative at every start position to a list
	void run( const TokenSequenceInterface& seq, std::vector<MatchRecord>& result);

private:
	void runFrom( const TokenSequenceInterface& seq, std::size_t startpos);
	/// \brief Calculate the closure of the states on the stack at a position and collect the consuming states reached
	void closure( const TokenSequenceInterface& seq, std::size_t startpos, std::size_t pos, std::vector<uint32_t>& active);
	bool matchConstraint( uint32_t constraint, const TokenSequenceInterface& seq, std::size_t pos);

private:
	strus::DebugTraceContextInterface* m_debugtrace;
	const MatchProgram* m_program;
	std::vector<uint32_t> m_stateMark;		///< generation a state was visited last
	uint32_t m_generation;
	std::vector<uint32_t> m_stack;
	std::vector<uint32_t> m_active;
	std::vector<uint32_t> m_follow;
	std::vector<std::size_t> m_lastEnd;		///< end of the longest match per alternative for the current start
	std::vector<uint32_t> m_accepted;		///< alternatives with a match for the current start
	std::vector<std::size_t> m_constraintPos;	///< position + 1 the constraint result is cached for
	std::vector<char> m_constraintResult;
};

}//namespace
#endif

