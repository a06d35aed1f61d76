/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Interface of the common part of the pattern matcher and the phrase index
/// \file "tokenMatcherInterface.hpp"
#ifndef _TOKMATCH_TOKEN_MATCHER_INTERFACE_HPP_INCLUDED
#define _TOKMATCH_TOKEN_MATCHER_INTERFACE_HPP_INCLUDED
#include "tokmatch/matchRecord.hpp"
#include "tokmatch/matchOptions.hpp"
#include "tokmatch/matchStatistics.hpp"
#include <vector>
#include <string>

namespace tokmatch
{

/// \brief Forward declaration
class TokenSequenceInterface;
/// \brief Forward declaration
class TokenSequenceSourceInterface;
/// \brief Forward declaration
class ScanStreamInterface;

/// \brief Interface for scanning token sequences for the patterns registered in a matcher
/// \remark All methods are thread safe. Scans run on a snapshot of the registrations taken at their start.
class TokenMatcherInterface
{
public:
	/// \brief Destructor
	virtual ~TokenMatcherInterface(){}

	/// \brief Test if a pattern identifier is currently registered
	/// \param[in] name pattern identifier
	virtual bool isDefined( const std::string& name) const=0;

	/// \brief Get the number of pattern identifiers ever assigned a handle (removed ones included)
	virtual unsigned int nofPatternIds() const=0;

	/// \brief Get the name of a pattern identifier by its handle
	/// \param[in] patternid handle of the pattern identifier (MatchRecord::patternid())
	/// \return the name or NULL if the handle is not assigned
	virtual const char* patternName( uint32_t patternid) const=0;

	/// \brief Find all matches in a token sequence without calling any callbacks
	/// \param[in] seq token sequence to scan
	/// \return the matches ordered by start, then registration order of the pattern identifier, then alternative, then end
	virtual std::vector<MatchRecord> match( const TokenSequenceInterface& seq) const=0;

	/// \brief Call the callbacks registered for the matches of a list
	/// \param[in,out] seq token sequence the matches were found in
	/// \param[in] matches the list returned by match(seq)
	/// \return true on success, false if a callback failed (error reported to the error buffer)
	virtual bool dispatch( TokenSequenceInterface& seq, const std::vector<MatchRecord>& matches) const=0;

	/// \brief Find all matches in a token sequence and call the callbacks registered for them
	/// \param[in,out] seq token sequence to scan
	/// \return the matches, an empty list if a callback failed (error reported to the error buffer)
	virtual std::vector<MatchRecord> scan( TokenSequenceInterface& seq) const=0;

	/// \brief Create a stream scanning the token sequences fetched from a source
	/// \param[in] source the source of token sequences (ownership passed)
	/// \param[in] options options of the stream (see getScanStreamOptions())
	/// \return the stream or NULL on error
	virtual ScanStreamInterface* createScanStream( TokenSequenceSourceInterface* source, const MatchOptions& options) const=0;

	/// \brief Get the names of the options recognized by createScanStream
	virtual std::vector<std::string> getScanStreamOptions() const=0;

	/// \brief Get some statistics about the compiled structures
	virtual MatchStatistics getStatistics() const=0;
};

}//namespace
#endif

