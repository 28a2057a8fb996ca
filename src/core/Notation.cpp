#include "Notation.hpp"
#include "Piece.hpp"

#include <algorithm>
#include <array>
#include <string>
#include <utility>
#include <vector>


ParseError::ParseError(std::string expected, std::size_t offset, std::string remainder)
    : std::runtime_error("expected " + expected + " at offset " + std::to_string(offset) + ". ^" + remainder),
      expected_(std::move(expected)),
      offset_(offset),
      remainder_(std::move(remainder)) {}

namespace {

constexpr std::array<std::string_view, PIECE_FACE_NB> FACE_SYMBOLS{
    "歩", "香", "桂", "銀", "金", "角", "飛", "玉",
    "と", "杏", "圭", "全", "馬", "竜"
};

constexpr std::string_view HAND_LABEL = "持駒:";
constexpr std::string_view NONE_WORD = "なし";
constexpr std::string_view TURN_LABEL = "手番:";
constexpr std::string_view EMPTY_MARKER = "・";
constexpr std::string_view EMPTY_CELL = "　・";
constexpr std::string_view IDEOGRAPHIC_SPACE = "\xE3\x80\x80";

constexpr int MAX_HAND_COUNT = 18;

enum class TokenKind {
    HandLabel, NoneWord, TurnLabel, SideName, SideMarker, Piece, Empty, Pipe, Number, Newline, End, Invalid
};

struct Token {
    TokenKind kind = TokenKind::Invalid;
    std::size_t offset = 0;
    Side side = Side::Sente;
    PieceFace face = PieceFace::None;
    int number = 0;
};

struct Lexeme {
    std::string_view text;
    TokenKind kind;
    Side side = Side::Sente;
    PieceFace face = PieceFace::None;
};

const std::vector<Lexeme>& lexemes() {
    static const std::vector<Lexeme> table = [] {
        std::vector<Lexeme> t{
            {HAND_LABEL, TokenKind::HandLabel},
            {NONE_WORD, TokenKind::NoneWord},
            {TURN_LABEL, TokenKind::TurnLabel},
            {"先手", TokenKind::SideName, Side::Sente},
            {"後手", TokenKind::SideName, Side::Gote},
            {"▲", TokenKind::SideMarker, Side::Sente},
            {"▽", TokenKind::SideMarker, Side::Gote},
            {"△", TokenKind::SideMarker, Side::Gote},
            {EMPTY_MARKER, TokenKind::Empty},
            {"|", TokenKind::Pipe},
        };
        for (int f = 0; f < PIECE_FACE_NB; ++f) {
            t.push_back({FACE_SYMBOLS[f], TokenKind::Piece, Side::Sente, static_cast<PieceFace>(f)});
        }
        return t;
    }();
    return table;
}

class Lexer {
public:
    explicit Lexer(std::string_view text) : text_(text) {}

    Token next() {
        skip_blanks();

        Token tok;
        tok.offset = pos_;

        if (pos_ >= text_.size()) {
            tok.kind = TokenKind::End;
            return tok;
        }

        const char c = text_[pos_];

        // Consecutive line breaks and blank lines collapse into one token.
        if (c == '\r' || c == '\n') {
            while (pos_ < text_.size() && (text_[pos_] == '\r' || text_[pos_] == '\n')) {
                ++pos_;
                skip_blanks();
            }
            tok.kind = TokenKind::Newline;
            return tok;
        }

        if (c >= '0' && c <= '9') {
            int value = 0;
            while (pos_ < text_.size() && text_[pos_] >= '0' && text_[pos_] <= '9') {
                if (value < 1000) value = value * 10 + (text_[pos_] - '0');
                ++pos_;
            }
            tok.kind = TokenKind::Number;
            tok.number = value;
            return tok;
        }

        const std::string_view rest = text_.substr(pos_);
        for (const Lexeme& lx : lexemes()) {
            if (rest.starts_with(lx.text)) {
                pos_ += lx.text.size();
                tok.kind = lx.kind;
                tok.side = lx.side;
                tok.face = lx.face;
                return tok;
            }
        }

        tok.kind = TokenKind::Invalid;
        return tok;
    }

private:
    void skip_blanks() {
        while (pos_ < text_.size()) {
            if (text_[pos_] == ' ' || text_[pos_] == '\t') {
                ++pos_;
            } else if (text_.substr(pos_).starts_with(IDEOGRAPHIC_SPACE)) {
                pos_ += IDEOGRAPHIC_SPACE.size();
            } else {
                break;
            }
        }
    }

    std::string_view text_;
    std::size_t pos_ = 0;
};

class DiagramParser {
public:
    explicit DiagramParser(std::string_view text) : text_(text), lexer_(text) {
        advance();
    }

    Position parse() {
        if (current_.kind == TokenKind::Newline) advance();

        Hand gote = parse_hand();

        Position::Board board{};
        for (int r = 0; r < RANK_NB; ++r) {
            parse_row(r, board);
        }

        Hand sente = parse_hand();
        Side turn = parse_turn();

        return Position(board, sente, gote, turn);
    }

private:
    void advance() { current_ = lexer_.next(); }

    [[noreturn]] void fail(const std::string& expected) const {
        const std::size_t at = std::min(current_.offset, text_.size());
        throw ParseError(expected, at, std::string(text_.substr(at)));
    }

    void expect(TokenKind kind, const std::string& expected) {
        if (current_.kind != kind) fail(expected);
        advance();
    }

    Hand parse_hand() {
        expect(TokenKind::HandLabel, std::string(HAND_LABEL));

        Hand hand;
        if (current_.kind == TokenKind::NoneWord) {
            advance();
        } else {
            if (current_.kind != TokenKind::Piece) fail("hand piece or なし");

            while (current_.kind == TokenKind::Piece) {
                const PieceFace face = current_.face;
                if (is_promoted(face)) fail("unpromoted hand piece");
                advance();

                int count = 1;
                if (current_.kind == TokenKind::Number) {
                    count = current_.number;
                    if (count < 1 || count > MAX_HAND_COUNT) fail("hand count between 1 and 18");
                    advance();
                }

                const PieceType pt = base_type(face);
                const int total = hand.count(pt) + count;
                if (total > MAX_HAND_COUNT) fail("hand count between 1 and 18");
                hand.set(pt, total);
            }
        }

        expect(TokenKind::Newline, "end of line");
        return hand;
    }

    void parse_row(int rank_idx, Position::Board& board) {
        for (int f = 0; f < FILE_NB; ++f) {
            expect(TokenKind::Pipe, "|");
            board[rank_idx * FILE_NB + f] = parse_cell();
        }
        if (current_.kind == TokenKind::Pipe) advance();
        expect(TokenKind::Newline, "end of row");
    }

    SquareContent parse_cell() {
        if (current_.kind == TokenKind::Empty) {
            advance();
            return SquareContent();
        }
        if (current_.kind == TokenKind::SideMarker) {
            const Side side = current_.side;
            advance();
            if (current_.kind != TokenKind::Piece) fail("piece symbol");
            const PieceFace face = current_.face;
            advance();
            return SquareContent(side, face);
        }
        fail("square symbol");
    }

    Side parse_turn() {
        expect(TokenKind::TurnLabel, std::string(TURN_LABEL));
        if (current_.kind != TokenKind::SideName) fail("先手 or 後手");
        const Side side = current_.side;
        advance();

        if (current_.kind == TokenKind::Newline) advance();
        if (current_.kind != TokenKind::End) fail("end of input");
        return side;
    }

    std::string_view text_;
    Lexer lexer_;
    Token current_;
};

}

namespace Notation {

Position decode(std::string_view text) {
    return DiagramParser(text).parse();
}

std::string encode_hand(const Hand& hand) {
    std::string out(HAND_LABEL);
    out += ' ';

    bool any = false;
    for (int pt = PIECE_TYPE_NB - 1; pt >= 0; --pt) {
        const int n = hand.count(static_cast<PieceType>(pt));
        if (n == 0) continue;
        out += FACE_SYMBOLS[pt];
        if (n > 1) out += std::to_string(n);
        any = true;
    }
    if (!any) out += NONE_WORD;
    return out;
}

std::string encode(const Position& pos) {
    std::string out = encode_hand(pos.hand(Side::Gote));
    out += '\n';

    for (int r = 0; r < RANK_NB; ++r) {
        out += '|';
        for (int f = 0; f < FILE_NB; ++f) {
            const SquareContent& c = pos[static_cast<Square>(r * FILE_NB + f)];
            if (c.empty()) {
                out += EMPTY_CELL;
            } else {
                out += side_marker(c.side);
                out += face_symbol(c.face);
            }
            out += '|';
        }
        out += '\n';
    }

    out += encode_hand(pos.hand(Side::Sente));
    out += '\n';
    out += TURN_LABEL;
    out += ' ';
    out += side_name(pos.side_to_move());
    out += '\n';
    return out;
}

std::string_view face_symbol(PieceFace face) {
    if (face == PieceFace::None) return EMPTY_MARKER;
    return FACE_SYMBOLS[static_cast<size_t>(face)];
}

std::string_view side_marker(Side side) {
    return side == Side::Sente ? "▲" : "▽";
}

std::string_view side_name(Side side) {
    return side == Side::Sente ? "先手" : "後手";
}

}

std::ostream& operator<<(std::ostream& os, const Position& pos) {
    return os << Notation::encode(pos);
}
