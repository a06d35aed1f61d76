/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Automaton for matching patterns of token constraints with quantifiers
/// \file "matchAutomaton.cpp"
#include "matchAutomaton.hpp"
#include "tokmatch/tokenSequenceInterface.hpp"
#include "tokmatch/tokenFlagPredicateInterface.hpp"
#include "tokmatch/vocabularyInterface.hpp"
#include "errorUtils.hpp"
#include "internationalization.hpp"
#include "strus/debugTraceInterface.hpp"
#include <algorithm>
#include <limits>
#include <iostream>

#undef TOKMATCH_LOWLEVEL_DEBUG

using namespace tokmatch;

#define DEBUG_OPEN( NAME) if (m_debugtrace) m_debugtrace->open( NAME);
#define DEBUG_CLOSE() if (m_debugtrace) m_debugtrace->close();
#define DEBUG_EVENT2( NAME, FMT, X1, X2)		if (m_debugtrace) m_debugtrace->event( NAME, FMT, X1, X2);
#define DEBUG_EVENT3( NAME, FMT, X1, X2, X3)		if (m_debugtrace) m_debugtrace->event( NAME, FMT, X1, X2, X3);

static const std::size_t NoMatch = std::numeric_limits<std::size_t>::max();

static void appendKeyValue( std::string& key, uint32_t value)
{
	key.push_back( (char)(value >> 24));
	key.push_back( (char)((value >> 16) & 0xff));
	key.push_back( (char)((value >> 8) & 0xff));
	key.push_back( (char)(value & 0xff));
}

ConstraintTable::Predicate ConstraintTable::compilePredicate( const AttributePredicate& pred) const
{
	if (pred.isFlag())
	{
		const TokenFlagPredicateInterface* flag = m_vocabulary ? m_vocabulary->getFlag( pred.flagid()) : 0;
		if (!flag)
		{
			throw configuration_error( string_format( _TXT("unknown flag identifier %u"), pred.flagid()));
		}
		if (pred.value() > 1)
		{
			throw configuration_error( string_format( _TXT("value %u of flag %u is not a boolean"), pred.value(), pred.flagid()));
		}
		return Predicate( pred.attribute(), pred.value(), flag);
	}
	if (pred.attribute() >= (uint32_t)NofAttributeKeys)
	{
		throw configuration_error( string_format( _TXT("unknown attribute key %u"), pred.attribute()));
	}
	AttributeKey key = (AttributeKey)pred.attribute();
	if (attributeType( key) == AttributeBoolean && pred.value() > 1)
	{
		throw configuration_error( string_format( _TXT("value %u of boolean attribute %s is not a boolean"), pred.value(), attributeKeyName( key)));
	}
	return Predicate( pred.attribute(), pred.value(), 0);
}

uint32_t ConstraintTable::getOrCreate( const TokenConstraintSet& constraints)
{
	std::vector<AttributePredicate> predicates( constraints.predicates());
	std::sort( predicates.begin(), predicates.end());
	predicates.erase( std::unique( predicates.begin(), predicates.end()), predicates.end());

	std::string key;
	std::vector<AttributePredicate>::const_iterator pi = predicates.begin(), pe = predicates.end();
	for (; pi != pe; ++pi)
	{
		appendKeyValue( key, pi->attribute());
		appendKeyValue( key, pi->value());
	}
	KeyMap::const_iterator ki = m_keymap.find( key);
	if (ki != m_keymap.end()) return ki->second;

	Constraint constraint;
	for (pi = predicates.begin(); pi != pe; ++pi)
	{
		constraint.push_back( compilePredicate( *pi));
	}
	uint32_t rt = m_ar.size();
	m_ar.push_back( constraint);
	m_keymap[ key] = rt;
	return rt;
}

bool ConstraintTable::match( uint32_t idx, const TokenSequenceInterface& seq, std::size_t pos) const
{
	const Constraint& constraint = m_ar[ idx];
	Constraint::const_iterator ci = constraint.begin(), ce = constraint.end();
	for (; ci != ce; ++ci)
	{
		if (ci->flag)
		{
			if (ci->flag->match( seq, pos) != (ci->value != 0)) return false;
		}
		else
		{
			AttributeValue value;
			if (!seq.getAttribute( pos, (AttributeKey)ci->attribute, value)) return false;
			if (value != ci->value) return false;
		}
	}
	return true;
}

uint32_t MatchProgram::addState( ProgramState::Op op, uint32_t constraint, uint32_t next, uint32_t next2)
{
	if (m_states.size() >= (std::size_t)std::numeric_limits<int32_t>::max())
	{
		throw std::bad_alloc();
	}
	m_states.push_back( ProgramState( op, constraint, next, next2));
	return m_states.size()-1;
}

uint32_t MatchProgram::compilePattern( const Pattern& pattern, uint32_t altidx)
{
	uint32_t next = addState( ProgramState::Accept, 0, altidx, 0);
	Pattern::const_reverse_iterator pi = pattern.rbegin(), pe = pattern.rend();
	for (; pi != pe; ++pi)
	{
		uint32_t constraint = m_constraintTable.getOrCreate( *pi);
		switch (pi->quantifier())
		{
			case TokenConstraintSet::Exactly1:
				next = addState( ProgramState::Consume, constraint, next, 0);
				break;
			case TokenConstraintSet::ZeroOrOne:
			{
				uint32_t consume = addState( ProgramState::Consume, constraint, next, 0);
				next = addState( ProgramState::Split, 0, consume, next);
				break;
			}
			case TokenConstraintSet::ZeroOrMore:
			{
				uint32_t loop = addState( ProgramState::Split, 0, 0, next);
				m_states[ loop].next = addState( ProgramState::Consume, constraint, loop, 0);
				next = loop;
				break;
			}
			case TokenConstraintSet::OneOrMore:
			{
				uint32_t loop = addState( ProgramState::Split, 0, 0, next);
				m_states[ loop].next = addState( ProgramState::Consume, constraint, loop, 0);
				next = m_states[ loop].next;
				break;
			}
			case TokenConstraintSet::Exactly0:
				next = addState( ProgramState::AssertNot, constraint, next, 0);
				break;
			default:
				throw configuration_error( string_format( _TXT("unknown quantifier %d"), (int)pi->quantifier()));
		}
	}
	return next;
}

void MatchProgram::definePatterns( uint32_t patternid, const char* name, const std::vector<Pattern>& patterns)
{
	if (!m_alternatives.empty() && m_alternatives.back().patternid >= patternid)
	{
		throw tokmatch::logic_error( _TXT("patterns not defined in ascending order of their identifiers"));
	}
	if (patterns.empty())
	{
		throw configuration_error( string_format( _TXT("empty list of patterns for '%s'"), name));
	}
	std::vector<Pattern>::const_iterator pi = patterns.begin(), pe = patterns.end();
	for (; pi != pe; ++pi)
	{
		if (pi->empty())
		{
			throw configuration_error( string_format( _TXT("empty pattern %u for '%s'"), (unsigned int)(pi - patterns.begin()), name));
		}
		uint32_t altidx = m_alternatives.size();
		uint32_t startstate = compilePattern( *pi, altidx);
		m_alternatives.push_back( ProgramAlternative( patternid, name, startstate));
	}
	++m_nofPatternIds;
}

void MatchProgram::match( std::vector<MatchRecord>& result, const TokenSequenceInterface& seq, strus::DebugTraceContextInterface* debugtrace) const
{
	StateMachine statemachine( this, debugtrace);
	statemachine.run( seq, result);
}

StateMachine::StateMachine( const MatchProgram* program_, strus::DebugTraceContextInterface* debugtrace_)
	:m_debugtrace(debugtrace_)
	,m_program(program_)
	,m_stateMark( program_->nofStates(), 0)
	,m_generation(0)
	,m_lastEnd( program_->alternatives().size(), NoMatch)
	,m_constraintPos( program_->constraintTable().size(), 0)
	,m_constraintResult( program_->constraintTable().size(), 0)
{}

bool StateMachine::matchConstraint( uint32_t constraint, const TokenSequenceInterface& seq, std::size_t pos)
{
	if (m_constraintPos[ constraint] != pos+1)
	{
		m_constraintResult[ constraint] = m_program->constraintTable().match( constraint, seq, pos) ? 1:0;
		m_constraintPos[ constraint] = pos+1;
	}
	return m_constraintResult[ constraint] != 0;
}

void StateMachine::closure( const TokenSequenceInterface& seq, std::size_t startpos, std::size_t pos, std::vector<uint32_t>& active)
{
	if (++m_generation == 0)
	{
		std::fill( m_stateMark.begin(), m_stateMark.end(), 0);
		m_generation = 1;
	}
	while (!m_stack.empty())
	{
		uint32_t si = m_stack.back();
		m_stack.pop_back();
		if (m_stateMark[ si] == m_generation) continue;
		m_stateMark[ si] = m_generation;

		const ProgramState& st = m_program->state( si);
		switch (st.op)
		{
			case ProgramState::Consume:
				if (pos < seq.size()) active.push_back( si);
				break;
			case ProgramState::Split:
				m_stack.push_back( st.next2);
				m_stack.push_back( st.next);
				break;
			case ProgramState::AssertNot:
				if (pos >= seq.size() || !matchConstraint( st.constraint, seq, pos))
				{
					m_stack.push_back( st.next);
				}
				break;
			case ProgramState::Accept:
				if (pos > startpos)
				{
					if (m_lastEnd[ st.next] == NoMatch) m_accepted.push_back( st.next);
					m_lastEnd[ st.next] = pos;
				}
				break;
		}
	}
}

void StateMachine::runFrom( const TokenSequenceInterface& seq, std::size_t startpos)
{
	const std::vector<ProgramAlternative>& alternatives = m_program->alternatives();
	std::vector<ProgramAlternative>::const_reverse_iterator ai = alternatives.rbegin(), ae = alternatives.rend();
	for (; ai != ae; ++ai)
	{
		m_stack.push_back( ai->startstate);
	}
	m_active.clear();
	closure( seq, startpos, startpos, m_active);

	std::size_t pos = startpos;
	while (!m_active.empty() && pos < seq.size())
	{
		std::vector<uint32_t>::const_iterator si = m_active.begin(), se = m_active.end();
		for (; si != se; ++si)
		{
			const ProgramState& st = m_program->state( *si);
			if (matchConstraint( st.constraint, seq, pos))
			{
				m_stack.push_back( st.next);
			}
		}
		++pos;
		m_follow.clear();
		closure( seq, startpos, pos, m_follow);
		m_active.swap( m_follow);
#ifdef TOKMATCH_LOWLEVEL_DEBUG
		std::cerr << "start " << startpos << " pos " << pos << " active states " << m_active.size() << std::endl;
#endif
	}
}

void StateMachine::run( const TokenSequenceInterface& seq, std::vector<MatchRecord>& result)
{
	DEBUG_OPEN( "scan")
	const std::vector<ProgramAlternative>& alternatives = m_program->alternatives();
	std::size_t nofTokens = seq.size();
	for (std::size_t startpos = 0; startpos < nofTokens; ++startpos)
	{
		runFrom( seq, startpos);
		if (m_accepted.empty()) continue;

		std::sort( m_accepted.begin(), m_accepted.end());
		std::vector<uint32_t>::const_iterator ai = m_accepted.begin(), ae = m_accepted.end();
		for (; ai != ae; ++ai)
		{
			const ProgramAlternative& alt = alternatives[ *ai];
			result.push_back( MatchRecord( alt.patternid, alt.name, startpos, m_lastEnd[ *ai]));
			DEBUG_EVENT3( "match", "name=%s start=%u end=%u", alt.name, (unsigned int)startpos, (unsigned int)m_lastEnd[ *ai])
			m_lastEnd[ *ai] = NoMatch;
		}
		m_accepted.clear();
	}
	DEBUG_EVENT2( "result", "tokens=%u matches=%u", (unsigned int)nofTokens, (unsigned int)result.size())
	DEBUG_CLOSE()
}

