#pragma once

#include "Game.hpp"
#include "Move.hpp"
#include "ParseError.hpp"
#include "Position.hpp"

#include <string>
#include <string_view>
#include <utility>
#include <vector>


// CSA game records. A move token is a side sign, origin and destination
// squares as file/rank digits and the CSA code of the piece after moving:
//
//   +7776FU   Sente pawn 7g to 7f
//   -0055KA   Gote drops a bishop on 5e ("00" origin)
//   +8822UM   bishop 8h takes on 2b and promotes
//   %TORYO    the side to move resigns
namespace Record {

// Decodes one token against the position it is played in. Promotion is
// inferred from the origin face and the code. Throws ParseError for a
// malformed token, a sign that is not the side to move, or an origin that
// does not hold the mover's matching piece. Legality is not checked.
[[nodiscard]] Move decode_move(const Position& before, std::string_view token);

[[nodiscard]] std::string encode_move(const Move& move);

struct GameRecord {
    std::string version;
    std::string sente_name;
    std::string gote_name;
    std::vector<std::pair<std::string, std::string>> metadata; // "$KEY:VALUE" lines, in order
    std::vector<std::string> comments;
    Game game;
};

// Parses a whole record from the even-game start ("PI"), replaying every move
// through Game::play. Throws ParseError, with offsets into `text`, on a
// malformed line or a move the game does not accept.
[[nodiscard]] GameRecord parse(std::string_view text);

[[nodiscard]] std::string encode(const GameRecord& record);

}
