/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Index matching fixed multi token phrases
/// \file "phraseIndex.cpp"
#include "phraseIndex.hpp"
#include "tokmatch/vocabularyInterface.hpp"
#include "tokmatch/matchCallbackInterface.hpp"
#include "errorUtils.hpp"
#include "internationalization.hpp"

using namespace tokmatch;

#define DEBUG_EVENT2( NAME, FMT, X1, X2)	if (debugtrace) debugtrace->event( NAME, FMT, X1, X2);
#define DEBUG_EVENT1( NAME, FMT, X1)		if (debugtrace) debugtrace->event( NAME, FMT, X1);

PhraseIndex::PhraseIndex( VocabularyInterface* vocabulary_, AttributeKey keyAttribute_, strus::ErrorBufferInterface* errorhnd_)
	:TokenMatcherImpl<PhraseIndexInterface>(errorhnd_),m_vocabulary(vocabulary_),m_keyAttribute(keyAttribute_),m_registrations()
{
	if (!m_vocabulary)
	{
		throw configuration_error( _TXT("no vocabulary defined for phrase index"));
	}
	if ((unsigned int)m_keyAttribute >= (unsigned int)NofAttributeKeys || attributeType( m_keyAttribute) != AttributeSymbol)
	{
		throw configuration_error( string_format( _TXT("attribute %u cannot be used as phrase key, only symbolic attributes can"), (unsigned int)m_keyAttribute));
	}
	m_snapshot.reset( new PhraseProgram( m_keyAttribute));
}

PhraseProgram* PhraseIndex::buildProgram( const RegistrationMap& registrations) const
{
	boost::scoped_ptr<PhraseProgram> program( new PhraseProgram( m_keyAttribute));
	RegistrationMap::const_iterator ri = registrations.begin(), re = registrations.end();
	for (; ri != re; ++ri)
	{
		program->definePhrases( ri->first, getPatternName( ri->first), ri->second.phrases);
		if (ri->second.callback.get())
		{
			program->defineCallback( ri->first, ri->second.callback);
		}
	}
	return program.release();
}

void PhraseIndex::defineKeyPhrases( const std::string& name, const MatchCallbackRef& callback, const PhraseList& phrases)
{
	if (name.empty())
	{
		throw configuration_error( _TXT("empty pattern identifier"));
	}
	boost::scoped_ptr<strus::DebugTraceContextInterface> debugtrace( createDebugTrace());
	utils::UniqueLock lock( m_mutex);

	uint32_t patternid = getOrCreatePatternId( name);
	RegistrationMap registrations( m_registrations);
	registrations[ patternid] = Registration( phrases, callback);

	MatchSnapshotRef program( buildProgram( registrations));
	m_registrations.swap( registrations);
	m_snapshot = program;
	setDefined( patternid, true);

	DEBUG_EVENT2( "define", "name=%s phrases=%u", name.c_str(), (unsigned int)phrases.size())
}

bool PhraseIndex::definePhrases( const std::string& name, MatchCallbackInterface* callback, const std::vector<std::vector<std::string> >& phrases)
{
	MatchCallbackRef callbackRef;
	try
	{
		callbackRef.reset( callback);
		if (phrases.empty())
		{
			throw configuration_error( string_format( _TXT("empty list of phrases for '%s'"), name.c_str()));
		}
		PhraseList keyphrases;
		std::vector<std::vector<std::string> >::const_iterator pi = phrases.begin(), pe = phrases.end();
		for (; pi != pe; ++pi)
		{
			if (pi->empty())
			{
				throw configuration_error( string_format( _TXT("empty phrase %u for '%s'"), (unsigned int)(pi - phrases.begin()), name.c_str()));
			}
			keyphrases.push_back( std::vector<uint32_t>());
			std::vector<std::string>::const_iterator ki = pi->begin(), ke = pi->end();
			for (; ki != ke; ++ki)
			{
				uint32_t symid = m_vocabulary->getOrCreateSymbol( *ki);
				if (!symid) throw tokmatch::runtime_error( _TXT("failed to map phrase key '%s' to a symbol"), ki->c_str());
				keyphrases.back().push_back( symid);
			}
		}
		defineKeyPhrases( name, callbackRef, keyphrases);
		return true;
	}
	CATCH_ERROR_MAP_RETURN( _TXT("failed to define phrases: %s"), *m_errorhnd, false);
}

bool PhraseIndex::definePhraseSequences( const std::string& name, MatchCallbackInterface* callback, const std::vector<const TokenSequenceInterface*>& phrases)
{
	MatchCallbackRef callbackRef;
	try
	{
		callbackRef.reset( callback);
		if (phrases.empty())
		{
			throw configuration_error( string_format( _TXT("empty list of phrases for '%s'"), name.c_str()));
		}
		PhraseList keyphrases;
		std::vector<const TokenSequenceInterface*>::const_iterator pi = phrases.begin(), pe = phrases.end();
		for (; pi != pe; ++pi)
		{
			unsigned int phraseidx = pi - phrases.begin();
			if (!*pi || (*pi)->size() == 0)
			{
				throw configuration_error( string_format( _TXT("empty phrase %u for '%s'"), phraseidx, name.c_str()));
			}
			keyphrases.push_back( std::vector<uint32_t>());
			for (std::size_t pos=0; pos < (*pi)->size(); ++pos)
			{
				AttributeValue key;
				if (!(*pi)->getAttribute( pos, m_keyAttribute, key))
				{
					throw configuration_error( string_format( _TXT("token %u of phrase %u for '%s' has no attribute %s"), (unsigned int)pos, phraseidx, name.c_str(), attributeKeyName( m_keyAttribute)));
				}
				keyphrases.back().push_back( key);
			}
		}
		defineKeyPhrases( name, callbackRef, keyphrases);
		return true;
	}
	CATCH_ERROR_MAP_RETURN( _TXT("failed to define phrases: %s"), *m_errorhnd, false);
}

bool PhraseIndex::removePhrases( const std::string& name)
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
	CATCH_ERROR_MAP_RETURN( _TXT("failed to remove phrases: %s"), *m_errorhnd, false);
}

MatchStatistics PhraseIndex::getStatistics() const
{
	try
	{
		MatchSnapshotRef snap = snapshot();
		const PhraseProgram* program = static_cast<const PhraseProgram*>( snap.get());
		MatchStatistics rt;
		rt.define( "nofPatternIds", program->nofPatternIds());
		rt.define( "nofPhrases", program->nofPhrases());
		rt.define( "nofNodes", program->nofNodes());
		return rt;
	}
	CATCH_ERROR_MAP_RETURN( _TXT("error getting phrase index statistics: %s"), *m_errorhnd, MatchStatistics());
}

