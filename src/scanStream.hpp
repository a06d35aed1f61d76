/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Stream scanning the token sequences of a source in batches matched by a group of worker threads
/// \file "scanStream.hpp"
#ifndef _TOKMATCH_SCAN_STREAM_HPP_INCLUDED
#define _TOKMATCH_SCAN_STREAM_HPP_INCLUDED
#include "tokmatch/scanStreamInterface.hpp"
#include "tokmatch/matchRecord.hpp"
#include "matchSnapshot.hpp"
#include "utils.hpp"
#include <vector>
#include <string>

namespace strus
{
/// \brief Forward declaration
class ErrorBufferInterface;
}

namespace tokmatch
{

/// \brief Forward declaration
class TokenMatcherInterface;
/// \brief Forward declaration
class TokenSequenceSourceInterface;
/// \brief Forward declaration
class TokenSequenceInterface;
/// \brief Forward declaration
class MatchOptions;

/// \brief Configuration of a scan stream
struct ScanStreamConfig
{
	unsigned int threads;		///< number of worker threads, 0 for matching in the calling thread
	unsigned int batchSize;		///< number of sequences fetched and matched together

	ScanStreamConfig()
		:threads(0),batchSize(1){}
	ScanStreamConfig( const ScanStreamConfig& o)
		:threads(o.threads),batchSize(o.batchSize){}

	/// \brief Parse the options of a scan stream
	/// \note Throws configuration_error on an unknown option or an invalid value
	explicit ScanStreamConfig( const MatchOptions& options);

	/// \brief Names of the options recognized
	static std::vector<std::string> optionNames();
};

/// \brief Sequence of a batch with its matches
struct ScanStreamItem
{
	TokenSequenceInterface* seq;
	std::vector<MatchRecord> matches;

	ScanStreamItem()
		:seq(0),matches(){}
	explicit ScanStreamItem( TokenSequenceInterface* seq_)
		:seq(seq_),matches(){}
	ScanStreamItem( const ScanStreamItem& o)
		:seq(o.seq),matches(o.matches){}
};

/// \brief Batch of sequences shared by the worker threads matching it
class ScanBatchContext
{
public:
	ScanBatchContext( const MatchSnapshot* snapshot_, std::vector<ScanStreamItem>* items_)
		:m_snapshot(snapshot_),m_items(items_),m_nextidx(0){}

	/// \brief Get the next item to match or NULL if all items are taken
	ScanStreamItem* fetchItem();
	void pushError( const std::string& msg);

	const MatchSnapshot* snapshot() const			{return m_snapshot;}
	const std::vector<std::string>& errors() const		{return m_errors;}

private:
	utils::Mutex m_mutex;
	const MatchSnapshot* m_snapshot;
	std::vector<ScanStreamItem>* m_items;
	std::size_t m_nextidx;
	std::vector<std::string> m_errors;
};

/// \brief Worker thread matching the items of a batch
class ScanThreadContext
{
public:
	explicit ScanThreadContext( ScanBatchContext* batch_)
		:m_batch(batch_){}
	ScanThreadContext( const ScanThreadContext& o)
		:m_batch(o.m_batch){}

	void run();

private:
	ScanBatchContext* m_batch;
};

/// \brief Stream scanning the token sequences of a source
/// \note The stream works on the snapshot of the registrations of the matcher taken at its creation
class ScanStream
	:public ScanStreamInterface
{
public:
	ScanStream(
			const TokenMatcherInterface* matcher_,
			const MatchSnapshotRef& snapshot_,
			TokenSequenceSourceInterface* source_,
			const ScanStreamConfig& config_,
			strus::ErrorBufferInterface* errorhnd_);
	virtual ~ScanStream();

	virtual bool next( TokenSequenceInterface*& seq, std::vector<MatchRecord>& matches);

private:
	bool fetchBatch();
	void matchBatch();
	void clearBatch();

	ScanStream( const ScanStream&){}		///> non copyable
	void operator=( const ScanStream&){}		///> non copyable

private:
	strus::ErrorBufferInterface* m_errorhnd;
	const TokenMatcherInterface* m_matcher;
	MatchSnapshotRef m_snapshot;
	TokenSequenceSourceInterface* m_source;
	ScanStreamConfig m_config;
	std::vector<ScanStreamItem> m_batch;
	std::size_t m_batchidx;
	bool m_batchMatched;		///< false if matching the current batch failed
	bool m_eof;
};

}//namespace
#endif

