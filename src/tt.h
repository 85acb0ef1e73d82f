/*
  Ryufish, a USI shogi search core derived from Stockfish
  Copyright (C) 2004-2025 The Stockfish developers (see AUTHORS file)

  Ryufish is free software: you can redistribute it and/or modify
  it under the terms of the GNU General Public License as published by
  the Free Software Foundation, either version 3 of the License, or
  (at your option) any later version.

  Ryufish is distributed in the hope that it will be useful,
  but WITHOUT ANY WARRANTY; without even the implied warranty of
  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
  GNU General Public License for more details.

  You should have received a copy of the GNU General Public License
  along with this program.  If not, see <http://www.gnu.org/licenses/>.
*/

#ifndef TT_H_INCLUDED
#define TT_H_INCLUDED

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <tuple>

#include "types.h"

namespace Ryufish {

class Position;
struct TTEntry;
struct Cluster;

// There is only one hash table for the engine and all its threads, shared through a std::shared_ptr. We allow racy
// updates between threads to and from the TT, as taking the time to synchronize access would cost thinking time and
// thus elo. Lost updates are tolerated: the table is a cache, a missing or overwritten entry only costs search effort.
//
// `probe` is the primary method: given a board position, we lookup its entry in the table, and return a tuple of:
//   1) whether the entry already has this position
//   2) a copy of the prior data (if any) (may be inconsistent due to read races)
//   3) a writer object to this entry
// The copied data and the writer are separated to maintain clear boundaries between local vs global objects.


// A copy of the data already in the entry (possibly collided). `probe` may be racy, resulting in inconsistent data.
struct TTData {
    Move  move;
    Value value, eval;
    Depth depth;
    Bound bound;
    bool  is_pv;

    TTData() = delete;

    // clang-format off
    TTData(Move m, Value v, Value ev, Depth d, Bound b, bool pv) :
        move(m),
        value(v),
        eval(ev),
        depth(d),
        bound(b),
        is_pv(pv) {};
    // clang-format on
};


// This is used to make racy writes to the global TT. It only lives between a
// probe and the matching write and must never be stored.
struct TTWriter {
   public:
    void write(Key k, Value v, bool pv, Bound b, Depth d, Move m, Value ev, uint8_t generation8);

   private:
    friend class TranspositionTable;
    TTEntry* entry;
    TTWriter(TTEntry* tte);
};


class TranspositionTable {

   public:
    // Allocation failure is fatal, there is no smaller fallback size
    explicit TranspositionTable(size_t mbSize);
    ~TranspositionTable();

    TranspositionTable(const TranspositionTable&)            = delete;
    TranspositionTable& operator=(const TranspositionTable&) = delete;

    void resize(size_t mbSize);  // Set TT size
    void clear();                // Re-initialize memory, multithreaded
    int  hashfull(int maxAge = 0) const;  // Approximate what fraction of entries (permille) have been written to
                                          // during this root search

    void    new_search();  // This must be called at the beginning of each root search to track entry aging
    uint8_t generation() const;  // The current age, used when writing new data to the TT
    std::tuple<bool, TTData, TTWriter>
    probe(const Key key, const Position& pos) const;  // The main method, whose retvals separate local vs global objects
    void prefetch(const Key key, Color us) const;  // Hint only, issued before the move leading to key is made

    size_t cluster_count() const { return clusterCount; }

   private:
    Cluster* cluster_of(const Key key, Color us) const;

    size_t   clusterCount = 0;
    Cluster* table        = nullptr;

    std::atomic<uint8_t> generation8{0};  // Size must be not bigger than TTEntry::genBound8
};

}  // namespace Ryufish

#endif  // #ifndef TT_H_INCLUDED
