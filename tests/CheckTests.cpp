#include <gtest/gtest.h>
#include "Check.hpp"
#include "Executor.hpp"
#include "TestHelpers.hpp"

TEST(CheckTest, OpenFileIsCheck) {
    Layout s;
    add_piece(s, Square::SQ51, Side::Gote, PieceFace::King);
    add_piece(s, Square::SQ59, Side::Sente, PieceFace::Rook);
    EXPECT_TRUE(Check::is_check(build(s), Side::Sente));
    EXPECT_FALSE(Check::is_check(build(s), Side::Gote));

    add_piece(s, Square::SQ55, Side::Gote, PieceFace::Pawn);
    EXPECT_FALSE(Check::is_check(build(s), Side::Sente));
}

TEST(CheckTest, NoKingNoCheck) {
    Layout s;
    add_piece(s, Square::SQ59, Side::Sente, PieceFace::Rook);
    EXPECT_FALSE(Check::is_check(build(s), Side::Sente));
    EXPECT_FALSE(Check::is_checkmate(build(s)));
}

TEST(CheckTest, KingLeftEnPriseAddsTerminal) {
    Layout s;
    add_piece(s, Square::SQ51, Side::Gote, PieceFace::King);
    add_piece(s, Square::SQ59, Side::Sente, PieceFace::Rook);
    const Position pos = build(s);

    const auto moves = Check::moves_with_terminals(pos);
    const Move capture = Move::terminal(TerminalReason::KingLeftInCheck, Side::Sente);
    EXPECT_TRUE(contains(moves, capture));
    EXPECT_EQ(moves.back(), capture);
    EXPECT_EQ(Check::king_capture_moves(pos, Side::Sente).size(), 1u);
    EXPECT_TRUE(Check::king_capture_moves(pos, Side::Gote).empty());

    EXPECT_EQ(Check::moves_with_terminals(Position::startpos()).size(), 30u);
}

TEST(CheckTest, CheckingMoves) {
    Layout s;
    add_piece(s, Square::SQ51, Side::Gote, PieceFace::King);
    add_piece(s, Square::SQ29, Side::Sente, PieceFace::Rook);
    const Position pos = build(s);

    const auto checks = Check::checking_moves(pos);
    EXPECT_EQ(checks.size(), 3u);
    EXPECT_TRUE(contains(checks, Move::normal(Side::Sente, Square::SQ29, Square::SQ59, PieceFace::Rook, false)));
    EXPECT_TRUE(contains(checks, Move::normal(Side::Sente, Square::SQ29, Square::SQ21, PieceFace::Rook, true)));
    for (const Move& m : checks) {
        EXPECT_TRUE(Check::is_check(*Executor::apply(pos, m), Side::Sente)) << m;
    }
}

TEST(CheckTest, PinnedGoldMayOnlyStayOnTheFile) {
    Layout s;
    add_piece(s, Square::SQ59, Side::Sente, PieceFace::King);
    add_piece(s, Square::SQ58, Side::Sente, PieceFace::Gold);
    add_piece(s, Square::SQ51, Side::Gote, PieceFace::Rook);
    const Position pos = build(s);

    const auto gold_moves = moves_from(Check::king_safe_moves(pos), Square::SQ58);
    ASSERT_EQ(gold_moves.size(), 1u);
    EXPECT_EQ(gold_moves[0].to(), Square::SQ57);
}

TEST(CheckTest, CornerMate) {
    Layout s;
    s.to_move = Side::Gote;
    add_piece(s, Square::SQ11, Side::Gote, PieceFace::King);
    add_piece(s, Square::SQ29, Side::Sente, PieceFace::Rook);
    add_piece(s, Square::SQ13, Side::Sente, PieceFace::Gold);
    EXPECT_TRUE(Check::is_checkmate(build(s)));

    // Without the gold 12 is free.
    Layout escape = s;
    escape.board[static_cast<size_t>(Square::SQ13)] = SquareContent();
    EXPECT_FALSE(Check::is_checkmate(build(escape)));
}

TEST(CheckTest, DefendedSquaresCountAsUnsafe) {
    Layout s;
    s.to_move = Side::Gote;
    add_piece(s, Square::SQ11, Side::Gote, PieceFace::King);
    add_piece(s, Square::SQ12, Side::Sente, PieceFace::Gold);
    add_piece(s, Square::SQ13, Side::Sente, PieceFace::Pawn);
    add_piece(s, Square::SQ29, Side::Sente, PieceFace::Rook);
    // The pawn defends the gold on 12.
    EXPECT_TRUE(Check::is_checkmate(build(s)));

    Layout undefended = s;
    undefended.board[static_cast<size_t>(Square::SQ13)] = SquareContent();
    EXPECT_FALSE(Check::is_checkmate(build(undefended)));
}

// Only king mobility is examined: a king boxed in by its own pieces is
// reported as mated even with no attacker on the board.
TEST(CheckTest, SmotheredKingIsReportedAsMate) {
    Layout s;
    s.to_move = Side::Gote;
    add_piece(s, Square::SQ11, Side::Gote, PieceFace::King);
    add_piece(s, Square::SQ21, Side::Gote, PieceFace::Knight);
    add_piece(s, Square::SQ12, Side::Gote, PieceFace::Lance);
    add_piece(s, Square::SQ22, Side::Gote, PieceFace::Gold);
    EXPECT_TRUE(Check::is_checkmate(build(s)));
}
