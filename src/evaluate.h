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

#ifndef EVALUATE_H_INCLUDED
#define EVALUATE_H_INCLUDED

#include "types.h"

namespace Ryufish {

class Position;

namespace Eval {

// Static evaluation from the point of view of the side to move. Must be
// pure and safe to call from several threads at once.
class Evaluator {
   public:
    virtual ~Evaluator() = default;

    virtual Value evaluate(const Position& pos) const = 0;
};

}  // namespace Eval

}  // namespace Ryufish

#endif  // #ifndef EVALUATE_H_INCLUDED
