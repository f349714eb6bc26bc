// MINTGATE - Call Journal Replay
// Copyright (c) 2024 MINTGATE Developers
// MIT License
//
// Replays a text journal of calls against a collection, one call per line:
//
//   <timestamp> <caller> <command> [args...] [value=<amount>]
//
// Commands:
//   ogmint <amount> <proof>        wlmint <amount> <proof>
//   mint <amount>                  operatormint <recipient> <amount>
//   submit <to> <value> [data]     confirm <index>
//   revoke <index>                 execute <index>
//   set <parameter> <value>        relay <amount> <proof>
//   grant <role> <account>         revokerole <role> <account>
//   renounce <role>
//
// Proofs use the FormatProof() form. Blank lines and '#' comments are ignored.

#ifndef MINTGATE_COLLECTION_JOURNAL_H
#define MINTGATE_COLLECTION_JOURNAL_H

#include <mintgate/collection/collection.h>
#include <mintgate/collection/relayer.h>
#include <mintgate/core/status.h>
#include <mintgate/core/types.h>

#include <istream>
#include <ostream>
#include <string>
#include <vector>

namespace mintgate {
namespace collection {

struct JournalCall {
    int line{0};
    Timestamp timestamp{0};
    Address caller;
    Amount value{0};
    std::string command;
    std::vector<std::string> args;

    /// True for blank and comment lines
    bool IsEmpty() const { return command.empty(); }
};

/// Parse one journal line. InvalidArgument on a malformed header.
Status ParseJournalLine(const std::string& text, int line, JournalCall* call);

/**
 * Apply one call.
 *
 * @param relayer Target for "relay"; may be null
 * @param detail If non-null, receives a short description of the result
 *               (new token ids, withdrawal index)
 */
Status ApplyJournalCall(Collection& collection, Relayer* relayer,
                        const JournalCall& call, std::string* detail);

struct ReplaySummary {
    size_t calls{0};
    size_t failures{0};
    Timestamp lastTimestamp{0};
};

/// Replay every line of `in`, writing one result line per call to `out`.
/// Malformed lines are reported and counted as failures.
ReplaySummary ReplayJournal(Collection& collection, Relayer* relayer,
                            std::istream& in, std::ostream& out);

} // namespace collection
} // namespace mintgate

#endif // MINTGATE_COLLECTION_JOURNAL_H
