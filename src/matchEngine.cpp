/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Engine matching patterns of token constraints with quantifiers
/// \file "matchEngine.cpp"
#include "matchEngine.hpp"
#include "tokmatch/matchCallbackInterface.hpp"
#include "errorUtils.hpp"
#include "internationalization.hpp"

using namespace tokmatch;

#define DEBUG_EVENT2( NAME, FMT, X1, X2)	if (debugtrace) debugtrace->event( NAME, FMT, X1, X2);
#define DEBUG_EVENT1( NAME, FMT, X1)		if (debugtrace) debugtrace->event( NAME, FMT, X1);

MatchEngine::MatchEngine( const VocabularyInterface* vocabulary_, strus::ErrorBufferInterface* errorhnd_)
	:TokenMatcherImpl<MatchEngineInterface>(errorhnd_),m_vocabulary(vocabulary_),m_registrations()
{
	m_snapshot.reset( new MatchProgram( m_vocabulary));
}

MatchProgram* MatchEngine::buildProgram( const RegistrationMap& registrations) const
{
	boost::scoped_ptr<MatchProgram> program( new MatchProgram( m_vocabulary));
	RegistrationMap::const_iterator ri = registrations.begin(), re = registrations.end();
	for (; ri != re; ++ri)
	{
		program->definePatterns( ri->first, getPatternName( ri->first), ri->second.patterns);
		if (ri->second.callback.get())
		{
			program->defineCallback( ri->first, ri->second.callback);
		}
	}
	return program.release();
}

bool MatchEngine::definePatterns( const std::string& name, MatchCallbackInterface* callback, const std::vector<Pattern>& patterns)
{
	MatchCallbackRef callbackRef;
	try
	{
		callbackRef.reset( callback);
		if (name.empty())
		{
			throw configuration_error( _TXT("empty pattern identifier"));
		}
		if (patterns.empty())
		{
			throw configuration_error( string_format( _TXT("empty list of patterns for '%s'"), name.c_str()));
		}
		boost::scoped_ptr<strus::DebugTraceContextInterface> debugtrace( createDebugTrace());
		utils::UniqueLock lock( m_mutex);

		uint32_t patternid = getOrCreatePatternId( name);
		RegistrationMap registrations( m_registrations);
		registrations[ patternid] = Registration( patterns, callbackRef);

		MatchSnapshotRef program( buildProgram( registrations));
		m_registrations.swap( registrations);
		m_snapshot = program;
		setDefined( patternid, true);

		DEBUG_EVENT2( "define", "name=%s patterns=%u", name.c_str(), (unsigned int)patterns.size())
		return true;
	}
	CATCH_ERROR_MAP_RETURN( _TXT("failed to define patterns: %s"), *m_errorhnd, false);
}

bool MatchEngine::removePatterns( const std::string& name)
{
	try
	{
		boost::scoped_ptr<strus::DebugTraceContextInterface> debugtrace( createDebugTrace());
		utils::UniqueLock lock( m_mutex);

		uint32_t patternid = getPatternId( name);
		if (!patternid || m_registrations.find( patternid) == m_registrations.end())
		{
			throw lookup_error( string_format( _TXT("undefined pattern identifier '%s'"), name.c_str()));
		}
		RegistrationMap registrations( m_registrations);
		registrations.erase( patternid);

		MatchSnapshotRef program( buildProgram( registrations));
		m_registrations.swap( registrations);
		m_snapshot = program;
		setDefined( patternid, false);

		DEBUG_EVENT1( "remove", "name=%s", name.c_str())
		return true;
	}
	CATCH_ERROR_MAP_RETURN( _TXT("failed to remove patterns: %s"), *m_errorhnd, false);
}

MatchStatistics MatchEngine::getStatistics() const
{
	try
	{
		MatchSnapshotRef snap = snapshot();
		const MatchProgram* program = static_cast<const MatchProgram*>( snap.get());
		MatchStatistics rt;
		rt.define( "nofPatternIds", program->nofPatternIds());
		rt.define( "nofPatterns", program->alternatives().size());
		rt.define( "nofStates", program->nofStates());
		rt.define( "nofConstraints", program->constraintTable().size());
		return rt;
	}
	CATCH_ERROR_MAP_RETURN( _TXT("error getting match engine statistics: %s"), *m_errorhnd, MatchStatistics());
}

