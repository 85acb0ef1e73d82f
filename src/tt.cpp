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

#include "tt.h"

#include <algorithm>
#include <cassert>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <thread>
#include <vector>

#include "memory.h"
#include "misc.h"
#include "position.h"

namespace Ryufish {


// TTEntry struct is the 16 bytes transposition table entry, defined as below:
//
// key        64 bit
// move       16 bit
// value      16 bit
// evaluation 16 bit
// depth       8 bit
// generation  5 bit
// pv node     1 bit
// bound type  2 bit
//
// Shogi keys collide too often for a 16 bit partial key, so the full key is
// stored and a cluster holds three entries instead of Stockfish's ten.

struct TTEntry {

    // Convert internal bitfields to external types
    TTData read() const {
        return TTData{Move(move16),           Value(value16),
                      Value(eval16),          Depth(depth8 + DEPTH_ENTRY_OFFSET),
                      Bound(genBound8 & 0x3), bool(genBound8 & 0x4)};
    }

    bool is_occupied() const;
    void save(Key k, Value v, bool pv, Bound b, Depth d, Move m, Value ev, uint8_t generation8);
    // The returned age is a multiple of TranspositionTable::GENERATION_DELTA
    uint8_t relative_age(const uint8_t generation8) const;

   private:
    friend class TranspositionTable;

    Key      key64;
    uint16_t move16;
    int16_t  value16;
    int16_t  eval16;
    uint8_t  depth8;
    uint8_t  genBound8;
};

static_assert(sizeof(TTEntry) == 16, "Unexpected TTEntry size");

// `genBound8` is where most of the details are. We use the following constants to manipulate 5 leading generation bits
// and 3 trailing miscellaneous bits.

// These bits are reserved for other things.
static constexpr unsigned GENERATION_BITS = 3;
// increment for generation field
static constexpr int GENERATION_DELTA = (1 << GENERATION_BITS);
// cycle length
static constexpr int GENERATION_CYCLE = 255 + GENERATION_DELTA;
// mask to pull out generation number
static constexpr int GENERATION_MASK = (0xFF << GENERATION_BITS) & 0xFF;

// DEPTH_ENTRY_OFFSET exists because 1) we use `bool(depth8)` as the occupancy check, but
// 2) we need to store negative depths for QS. (`depth8` is the only field with "spare bits":
// we sacrifice the ability to store depths greater than 1<<8 less the offset, as asserted in `save`.)
bool TTEntry::is_occupied() const { return bool(depth8); }

// Populates the TTEntry with a new node's data, possibly
// overwriting an old position. The update is not atomic and can be racy.
void TTEntry::save(
  Key k, Value v, bool pv, Bound b, Depth d, Move m, Value ev, uint8_t generation8) {

    // Preserve the old ttmove if we don't have a new one
    if (m || k != key64)
        move16 = m.raw();

    // Overwrite less valuable entries (cheapest checks first)
    if (b == BOUND_EXACT || k != key64 || d - DEPTH_ENTRY_OFFSET + 2 * pv > depth8 - 4
        || relative_age(generation8))
    {
        assert(d > DEPTH_ENTRY_OFFSET);
        assert(d < 256 + DEPTH_ENTRY_OFFSET);

        key64     = k;
        depth8    = uint8_t(d - DEPTH_ENTRY_OFFSET);
        genBound8 = uint8_t(generation8 | uint8_t(pv) << 2 | b);
        value16   = int16_t(v);
        eval16    = int16_t(ev);
    }
}


uint8_t TTEntry::relative_age(const uint8_t generation8) const {
    // Due to our packed storage format for generation and its cyclic
    // nature we add GENERATION_CYCLE (256 is the modulus, plus what
    // is needed to keep the unrelated lowest n bits from affecting
    // the result) to calculate the entry age correctly even after
    // generation8 overflows into the next cycle.
    return (GENERATION_CYCLE + generation8 - genBound8) & GENERATION_MASK;
}


// TTWriter is but a very thin wrapper around the pointer
TTWriter::TTWriter(TTEntry* tte) :
    entry(tte) {}

void TTWriter::write(
  Key k, Value v, bool pv, Bound b, Depth d, Move m, Value ev, uint8_t generation8) {
    entry->save(k, v, pv, b, d, m, ev, generation8);
}


// A TranspositionTable is an array of Cluster, of size clusterCount. Each cluster consists of ClusterSize number
// of TTEntry. Each non-empty TTEntry contains information on exactly one position. A cluster is exactly one
// cache line so that a probe touches a single line, which prefetch() loads ahead of time.

static constexpr int ClusterSize = 3;

struct alignas(64) Cluster {
    TTEntry entry[ClusterSize];
    char    padding[16];  // Pad to 64 bytes
};

static_assert(sizeof(Cluster) == 64, "Cluster must be one cache line");


TranspositionTable::TranspositionTable(size_t mbSize) { resize(mbSize); }

TranspositionTable::~TranspositionTable() { aligned_large_pages_free(table); }


// Sets the size of the transposition table,
// measured in megabytes. Transposition table consists
// of clusters and each cluster consists of ClusterSize number of TTEntry.
// The cluster count is kept even, since bit 0 of the index is the side to move.
void TranspositionTable::resize(size_t mbSize) {

    const size_t newCount = std::max<size_t>((mbSize * 1024 * 1024 / sizeof(Cluster)) & ~size_t(1), 2);

    if (newCount != clusterCount || !table)
    {
        aligned_large_pages_free(table);

        clusterCount = newCount;
        table = static_cast<Cluster*>(aligned_large_pages_alloc(clusterCount * sizeof(Cluster)));

        if (!table)
        {
            std::cerr << "Failed to allocate " << mbSize << "MB for transposition table." << std::endl;
            exit(EXIT_FAILURE);
        }
    }

    clear();
}


// Initializes the entire transposition table to zero. Big tables are
// zeroed by one helper thread per hardware thread, each on its own slice.
void TranspositionTable::clear() {
    generation8 = 0;

    const size_t threadCount = std::max(1u, std::thread::hardware_concurrency());

    if (threadCount == 1 || clusterCount < threadCount * 1024)
    {
        std::memset(static_cast<void*>(table), 0, clusterCount * sizeof(Cluster));
        return;
    }

    std::vector<std::thread> threads;
    threads.reserve(threadCount);

    for (size_t i = 0; i < threadCount; ++i)
    {
        threads.emplace_back([this, i, threadCount]() {
            // Each thread will zero its part of the hash table
            const size_t stride = clusterCount / threadCount;
            const size_t start  = stride * i;
            const size_t len    = i + 1 != threadCount ? stride : clusterCount - start;

            std::memset(static_cast<void*>(&table[start]), 0, len * sizeof(Cluster));
        });
    }

    for (auto& th : threads)
        th.join();
}


// Returns an approximation of the hashtable
// occupation during a search. The hash is x permill full, as per USI protocol.
// Only counts entries which are at most maxAge generations old.
int TranspositionTable::hashfull(int maxAge) const {

    const int     maxAgeInternal = maxAge << GENERATION_BITS;
    const uint8_t gen8           = generation();
    const size_t  samples        = std::min<size_t>(1000, clusterCount);

    int cnt = 0;
    for (size_t i = 0; i < samples; ++i)
        for (int j = 0; j < ClusterSize; ++j)
            cnt += table[i].entry[j].is_occupied()
                && table[i].entry[j].relative_age(gen8) <= maxAgeInternal;

    return int(cnt * 1000 / (samples * ClusterSize));
}


void TranspositionTable::new_search() {
    // increment by delta to keep lower bits as is
    generation8.fetch_add(GENERATION_DELTA, std::memory_order_relaxed);
}


uint8_t TranspositionTable::generation() const { return generation8.load(std::memory_order_relaxed); }


// Looks up the current position in the transposition
// table. It returns true if the position is found.
// Otherwise, it returns false and a pointer to an empty or least valuable TTEntry
// to be replaced later. The replace value of an entry is calculated as its depth
// minus its relative age. TTEntry t1 is considered more valuable than
// TTEntry t2 if its replace value is greater than that of t2.
std::tuple<bool, TTData, TTWriter> TranspositionTable::probe(const Key key, const Position& pos) const {

    TTEntry* const tte = &cluster_of(key, pos.side_to_move())->entry[0];

    for (int i = 0; i < ClusterSize; ++i)
        if (tte[i].key64 == key)
        {
            // This gap is the main place for read races.
            // After `read()` completes that copy is final, but may be self-inconsistent.
            TTData data = tte[i].read();

            // A move written by the search of another position must never
            // reach the caller, only the move field is dropped.
            if (data.move)
                data.move = pos.to_move(data.move);

            return {tte[i].is_occupied(), data, TTWriter(&tte[i])};
        }

    // Find an entry to be replaced according to the replacement strategy
    const uint8_t gen8    = generation();
    TTEntry*      replace = tte;
    for (int i = 1; i < ClusterSize; ++i)
        if (replace->depth8 - replace->relative_age(gen8)
            > tte[i].depth8 - tte[i].relative_age(gen8))
            replace = &tte[i];

    return {false,
            TTData{Move::none(), VALUE_NONE, VALUE_NONE, DEPTH_ENTRY_OFFSET, BOUND_NONE, false},
            TTWriter(replace)};
}


void TranspositionTable::prefetch(const Key key, Color us) const { Ryufish::prefetch(cluster_of(key, us)); }


// The index is key * clusterCount / 2^64 with bit 0 forced to the side to
// move, so the two sides never share a cluster.
Cluster* TranspositionTable::cluster_of(const Key key, Color us) const {
    return &table[(mul_hi64(key, clusterCount) & ~size_t(1)) | size_t(us)];
}

}  // namespace Ryufish
