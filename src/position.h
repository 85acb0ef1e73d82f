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

#ifndef POSITION_H_INCLUDED
#define POSITION_H_INCLUDED

#include <memory>
#include <string>

#include "misc.h"
#include "types.h"

namespace Ryufish {

using MoveList = ValueList<Move, MAX_MOVES>;

enum GenType {
    CAPTURES,  // Moves that change material, used by quiescence search
    LEGAL
};

// Position is the board the search runs on. Board representation, move
// generation and legality live behind this interface; the search core only
// needs hashing, make/unmake and a way to revalidate moves that were stored
// in the transposition table by a search of another position.
//
// Each worker owns its own Position (see Position::clone()), positions are
// never shared between threads.
class Position {
   public:
    virtual ~Position() = default;

    virtual Key   key() const          = 0;
    virtual Color side_to_move() const = 0;
    virtual int   game_ply() const     = 0;
    virtual bool  in_check() const     = 0;

    // Converts a 16 bit move read from the transposition table into a move
    // that is pseudo legal in this position, or Move::none() if the move does
    // not belong to this position (hash collision or stale entry).
    virtual Move to_move(Move m) const = 0;

    virtual void generate(MoveList& moves, GenType type) const = 0;
    virtual bool is_capture(Move m) const                     = 0;

    virtual void do_move(Move m)   = 0;
    virtual void undo_move(Move m) = 0;

    // Key of the position after m, used to prefetch the child's cluster
    // before the move is made.
    virtual Key key_after(Move m) const = 0;

    virtual bool is_draw(int ply) const = 0;

    virtual std::unique_ptr<Position> clone() const = 0;

    virtual std::string move_to_string(Move m) const = 0;
};

}  // namespace Ryufish

#endif  // #ifndef POSITION_H_INCLUDED
