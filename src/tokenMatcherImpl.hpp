/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Implementation of the methods common to the match engine and the phrase index
/// \file "tokenMatcherImpl.hpp"
#ifndef _TOKMATCH_TOKEN_MATCHER_IMPL_HPP_INCLUDED
#define _TOKMATCH_TOKEN_MATCHER_IMPL_HPP_INCLUDED
#include "tokmatch/tokenMatcherInterface.hpp"
#include "tokmatch/tokenSequenceInterface.hpp"
#include "tokmatch/tokenSequenceSourceInterface.hpp"
#include "tokmatch/scanStreamInterface.hpp"
#include "matchSnapshot.hpp"
#include "scanStream.hpp"
#include "symbolTable.hpp"
#include "utils.hpp"
#include "errorUtils.hpp"
#include "internationalization.hpp"
#include "strus/errorBufferInterface.hpp"
#include "strus/debugTraceInterface.hpp"
#include <boost/scoped_ptr.hpp>
#include <vector>
#include <string>

#define TOKMATCH_DBGTRACE_COMPONENT_NAME "tokmatch"

namespace tokmatch
{

/// \brief Implementation of the methods common to the match engine and the phrase index
/// \note Registrations are copied on write: every change builds a new snapshot, scans work on the snapshot current at their start
template <class Interface>
class TokenMatcherImpl
	:public Interface
{
public:
	explicit TokenMatcherImpl( strus::ErrorBufferInterface* errorhnd_)
		:m_errorhnd(errorhnd_){}
	virtual ~TokenMatcherImpl(){}

	virtual bool isDefined( const std::string& name) const
	{
		utils::SharedLock lock( m_mutex);
		uint32_t patternid = m_patternNames.get( name);
		return patternid && m_defined[ patternid-1];
	}

	virtual unsigned int nofPatternIds() const
	{
		utils::SharedLock lock( m_mutex);
		return m_patternNames.size();
	}

	virtual const char* patternName( uint32_t patternid) const
	{
		utils::SharedLock lock( m_mutex);
		return m_patternNames.key( patternid);
	}

	virtual std::vector<MatchRecord> match( const TokenSequenceInterface& seq) const
	{
		try
		{
			MatchSnapshotRef snap = snapshot();
			boost::scoped_ptr<strus::DebugTraceContextInterface> debugtrace( createDebugTrace());
			std::vector<MatchRecord> rt;
			snap->match( rt, seq, debugtrace.get());
			return rt;
		}
		CATCH_ERROR_MAP_RETURN( _TXT("error matching token sequence: %s"), *m_errorhnd, std::vector<MatchRecord>());
	}

	virtual bool dispatch( TokenSequenceInterface& seq, const std::vector<MatchRecord>& matches) const
	{
		try
		{
			MatchSnapshotRef snap = snapshot();
			boost::scoped_ptr<strus::DebugTraceContextInterface> debugtrace( createDebugTrace());
			return snap->dispatch( *this, seq, matches, m_errorhnd, debugtrace.get());
		}
		CATCH_ERROR_MAP_RETURN( _TXT("error calling match callbacks: %s"), *m_errorhnd, false);
	}

	virtual std::vector<MatchRecord> scan( TokenSequenceInterface& seq) const
	{
		try
		{
			MatchSnapshotRef snap = snapshot();
			boost::scoped_ptr<strus::DebugTraceContextInterface> debugtrace( createDebugTrace());
			std::vector<MatchRecord> rt;
			snap->match( rt, seq, debugtrace.get());
			if (!snap->dispatch( *this, seq, rt, m_errorhnd, debugtrace.get()))
			{
				return std::vector<MatchRecord>();
			}
			return rt;
		}
		CATCH_ERROR_MAP_RETURN( _TXT("error scanning token sequence: %s"), *m_errorhnd, std::vector<MatchRecord>());
	}

	virtual ScanStreamInterface* createScanStream( TokenSequenceSourceInterface* source, const MatchOptions& options) const
	{
		try
		{
			if (!source) throw configuration_error( _TXT("no token sequence source defined"));
			ScanStreamConfig config( options);
			return new ScanStream( this, snapshot(), source, config, m_errorhnd);
		}
		catch (const std::bad_alloc&)
		{
			m_errorhnd->report( strus::ErrorCodeOutOfMem, _TXT("memory allocation error"));
		}
		catch (const configuration_error& err)
		{
			m_errorhnd->report( strus::ErrorCodeInvalidArgument, _TXT("error creating scan stream: %s"), err.what());
		}
		catch (const std::exception& err)
		{
			m_errorhnd->report( strus::ErrorCodeRuntimeError, _TXT("error creating scan stream: %s"), err.what());
		}
		delete source;
		return 0;
	}

	virtual std::vector<std::string> getScanStreamOptions() const
	{
		try
		{
			return ScanStreamConfig::optionNames();
		}
		CATCH_ERROR_MAP_RETURN( _TXT("error getting scan stream options: %s"), *m_errorhnd, std::vector<std::string>());
	}

protected:
	/// \brief Get the current snapshot
	MatchSnapshotRef snapshot() const
	{
		utils::SharedLock lock( m_mutex);
		return m_snapshot;
	}

	/// \brief Get the handle of a pattern identifier, assign a new one if it does not have one yet
	/// \note Call with the unique lock held
	uint32_t getOrCreatePatternId( const std::string& name)
	{
		m_defined.reserve( m_patternNames.size()+1);
		uint32_t rt = m_patternNames.getOrCreate( name);
		if (rt > m_defined.size()) m_defined.push_back( false);
		return rt;
	}

	/// \brief Get the handle of a pattern identifier or 0 if it has none
	/// \note Call with the lock held
	uint32_t getPatternId( const std::string& name) const
	{
		return m_patternNames.get( name);
	}

	/// \brief Get the name of a pattern identifier handle with stable storage
	/// \note Call with the lock held
	const char* getPatternName( uint32_t patternid) const
	{
		return m_patternNames.key( patternid);
	}

	/// \brief Mark a pattern identifier as defined or removed
	/// \note Call with the unique lock held
	void setDefined( uint32_t patternid, bool value)
	{
		m_defined[ patternid-1] = value;
	}

	/// \brief Create a debug trace context if debug tracing is enabled for this thread
	/// \return the context (ownership passed) or NULL
	strus::DebugTraceContextInterface* createDebugTrace() const
	{
		strus::DebugTraceInterface* dbgi = m_errorhnd->debugTrace();
		return dbgi ? dbgi->createTraceContext( TOKMATCH_DBGTRACE_COMPONENT_NAME) : 0;
	}

private:
	TokenMatcherImpl( const TokenMatcherImpl&){}		///> non copyable
	void operator=( const TokenMatcherImpl&){}		///> non copyable

protected:
	strus::ErrorBufferInterface* m_errorhnd;
	mutable utils::SharedMutex m_mutex;
	MatchSnapshotRef m_snapshot;

private:
	SymbolTable m_patternNames;
	std::vector<bool> m_defined;
};

}//namespace
#endif

