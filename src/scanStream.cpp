/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Stream scanning the token sequences of a source in batches matched by a group of worker threads
/// \file "scanStream.cpp"
#include "scanStream.hpp"
#include "tokmatch/matchOptions.hpp"
#include "tokmatch/tokenSequenceInterface.hpp"
#include "tokmatch/tokenSequenceSourceInterface.hpp"
#include "tokmatch/tokenMatcherInterface.hpp"
#include "errorUtils.hpp"
#include "internationalization.hpp"
#include "strus/errorBufferInterface.hpp"
#include "strus/base/string_conv.hpp"
#include <boost/thread.hpp>
#include <boost/bind.hpp>
#include <cmath>

using namespace tokmatch;

static unsigned int getUnsignedOptionValue( const std::string& name, double value, unsigned int minvalue)
{
	if (value < (double)minvalue || value > 1e6 || std::floor( value) != value)
	{
		throw configuration_error( string_format( _TXT("illegal value %g of option '%s'"), value, name.c_str()));
	}
	return (unsigned int)value;
}

ScanStreamConfig::ScanStreamConfig( const MatchOptions& options)
	:threads(0),batchSize(0)
{
	MatchOptions::const_iterator oi = options.begin(), oe = options.end();
	for (; oi != oe; ++oi)
	{
		if (strus::caseInsensitiveEquals( oi->first, "threads"))
		{
			threads = getUnsignedOptionValue( oi->first, oi->second, 0);
		}
		else if (strus::caseInsensitiveEquals( oi->first, "batchSize"))
		{
			batchSize = getUnsignedOptionValue( oi->first, oi->second, 1);
		}
		else
		{
			throw configuration_error( string_format( _TXT("unknown scan stream option '%s'"), oi->first.c_str()));
		}
	}
	if (!batchSize)
	{
		batchSize = threads ? threads * 16 : 1;
	}
}

std::vector<std::string> ScanStreamConfig::optionNames()
{
	std::vector<std::string> rt;
	rt.push_back( "threads");
	rt.push_back( "batchSize");
	return rt;
}

ScanStreamItem* ScanBatchContext::fetchItem()
{
	utils::ScopedLock lock( m_mutex);
	if (m_nextidx < m_items->size())
	{
		return &(*m_items)[ m_nextidx++];
	}
	return 0;
}

void ScanBatchContext::pushError( const std::string& msg)
{
	utils::ScopedLock lock( m_mutex);
	m_errors.push_back( msg);
}

void ScanThreadContext::run()
{
	try
	{
		ScanStreamItem* item = m_batch->fetchItem();
		for (; item; item = m_batch->fetchItem())
		{
			m_batch->snapshot()->match( item->matches, *item->seq, 0);
		}
	}
	catch (const std::bad_alloc&)
	{
		m_batch->pushError( _TXT("memory allocation error"));
	}
	catch (const std::exception& err)
	{
		m_batch->pushError( err.what());
	}
}

ScanStream::ScanStream(
		const TokenMatcherInterface* matcher_,
		const MatchSnapshotRef& snapshot_,
		TokenSequenceSourceInterface* source_,
		const ScanStreamConfig& config_,
		strus::ErrorBufferInterface* errorhnd_)
	:m_errorhnd(errorhnd_)
	,m_matcher(matcher_)
	,m_snapshot(snapshot_)
	,m_source(source_)
	,m_config(config_)
	,m_batch()
	,m_batchidx(0)
	,m_batchMatched(false)
	,m_eof(false)
{}

ScanStream::~ScanStream()
{
	clearBatch();
	delete m_source;
}

void ScanStream::clearBatch()
{
	for (; m_batchidx < m_batch.size(); ++m_batchidx)
	{
		delete m_batch[ m_batchidx].seq;
	}
	m_batch.clear();
	m_batchidx = 0;
}

bool ScanStream::fetchBatch()
{
	clearBatch();
	m_batch.reserve( m_config.batchSize);
	while (!m_eof && m_batch.size() < m_config.batchSize)
	{
		TokenSequenceInterface* seq = m_source->fetch();
		if (!seq)
		{
			m_eof = true;
			break;
		}
		m_batch.push_back( ScanStreamItem());
		m_batch.back().seq = seq;
	}
	return !m_batch.empty();
}

void ScanStream::matchBatch()
{
	ScanBatchContext batchContext( m_snapshot.get(), &m_batch);
	unsigned int nofThreads = m_config.threads;
	if (nofThreads > m_batch.size()) nofThreads = m_batch.size();
	if (nofThreads > 1)
	{
		std::vector<ScanThreadContext> ctxar( nofThreads, ScanThreadContext( &batchContext));
		boost::thread_group tgroup;
		for (unsigned int ti=0; ti<nofThreads; ++ti)
		{
			tgroup.create_thread( boost::bind( &ScanThreadContext::run, &ctxar[ti]));
		}
		tgroup.join_all();
	}
	else
	{
		ScanThreadContext ctx( &batchContext);
		ctx.run();
	}
	if (!batchContext.errors().empty())
	{
		throw tokmatch::runtime_error( _TXT("error in thread matching a batch: %s"), batchContext.errors()[0].c_str());
	}
}

bool ScanStream::next( TokenSequenceInterface*& seq, std::vector<MatchRecord>& matches)
{
	try
	{
		seq = 0;
		matches.clear();
		if (m_batchidx >= m_batch.size() || !m_batchMatched)
		{
			m_batchMatched = false;
			if (!fetchBatch()) return false;
			matchBatch();
			m_batchMatched = true;
		}
		ScanStreamItem& item = m_batch[ m_batchidx++];
		seq = item.seq;
		item.seq = 0;
		matches.swap( item.matches);
		if (!m_snapshot->dispatch( *m_matcher, *seq, matches, m_errorhnd, 0))
		{
			delete seq;
			seq = 0;
			matches.clear();
			return false;
		}
		return true;
	}
	CATCH_ERROR_MAP_RETURN( _TXT("error in scan stream: %s"), *m_errorhnd, false);
}

