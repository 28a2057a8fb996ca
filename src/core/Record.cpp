#include "Record.hpp"
#include "Piece.hpp"

#include <algorithm>
#include <array>
#include <cstddef>


namespace {

struct TerminalCode {
    std::string_view code;
    TerminalReason reason;
};

constexpr std::array<TerminalCode, 4> TERMINAL_CODES{{
    {"%TORYO", TerminalReason::Resignation},
    {"%TSUMI", TerminalReason::Checkmate},
    {"%ILLEGAL_MOVE", TerminalReason::KingLeftInCheck},
    {"%SENNICHITE", TerminalReason::Repetition},
}};

constexpr std::string_view EVEN_GAME = "PI";
constexpr std::string_view VERSION_PREFIX = "V";

[[noreturn]] void fail(std::string_view text, std::size_t at, const std::string& expected) {
    at = std::min(at, text.size());
    throw ParseError(expected, at, std::string(text.substr(at)));
}

int digit_at(std::string_view token, std::size_t at) {
    if (at >= token.size() || token[at] < '0' || token[at] > '9') fail(token, at, "digit");
    return token[at] - '0';
}

Square square_at(std::string_view token, std::size_t at) {
    const int file = digit_at(token, at);
    const int rank = digit_at(token, at + 1);
    const Square sq = make_square(file, rank);
    if (sq == Square::None) fail(token, at, "square between 11 and 99");
    return sq;
}

Move decode_terminal(const Position& before, std::string_view token) {
    for (const TerminalCode& tc : TERMINAL_CODES) {
        if (token != tc.code) continue;

        switch (tc.reason) {
        case TerminalReason::Repetition:
            return Move::terminal(tc.reason, std::nullopt);
        case TerminalReason::KingLeftInCheck:
            // The previous mover broke the rules, so the side to move wins.
            return Move::terminal(tc.reason, before.side_to_move());
        default:
            return Move::terminal(tc.reason, opposite(before.side_to_move()));
        }
    }
    fail(token, 0, "%TORYO, %TSUMI, %ILLEGAL_MOVE or %SENNICHITE");
}

std::string_view trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r')) s.remove_suffix(1);
    return s;
}

// Rebases a ParseError raised on a slice of the record onto the whole text.
[[noreturn]] void rethrow_at(std::string_view text, std::size_t base, const ParseError& e) {
    fail(text, base + e.offset(), e.expected());
}

class RecordParser {
public:
    explicit RecordParser(std::string_view text) : text_(text) {}

    Record::GameRecord parse() {
        std::size_t line_start = 0;
        while (line_start <= text_.size()) {
            std::size_t line_end = text_.find('\n', line_start);
            if (line_end == std::string_view::npos) line_end = text_.size();

            parse_line(line_start, text_.substr(line_start, line_end - line_start));
            line_start = line_end + 1;
        }
        if (!started_) fail(text_, text_.size(), std::string(EVEN_GAME));
        return std::move(record_);
    }

private:
    void parse_line(std::size_t base, std::string_view line) {
        // Comments may contain commas, so they are taken whole.
        const std::string_view whole = trim(line);
        if (whole.starts_with('\'')) {
            record_.comments.emplace_back(whole.substr(1));
            return;
        }

        std::size_t start = 0;
        while (start <= line.size()) {
            std::size_t end = line.find(',', start);
            if (end == std::string_view::npos) end = line.size();

            const std::string_view raw = line.substr(start, end - start);
            const std::size_t lead = raw.find_first_not_of(" \t");
            const std::string_view statement = trim(raw);
            if (!statement.empty()) parse_statement(base + start + lead, statement);
            start = end + 1;
        }
    }

    void parse_statement(std::size_t at, std::string_view s) {
        if (s.starts_with(VERSION_PREFIX)) {
            record_.version = std::string(s.substr(VERSION_PREFIX.size()));
        } else if (s.starts_with("N+")) {
            record_.sente_name = std::string(s.substr(2));
        } else if (s.starts_with("N-")) {
            record_.gote_name = std::string(s.substr(2));
        } else if (s.starts_with('$')) {
            const std::size_t colon = s.find(':');
            if (colon == std::string_view::npos) fail(text_, at + s.size(), ":");
            record_.metadata.emplace_back(std::string(s.substr(1, colon - 1)), std::string(s.substr(colon + 1)));
        } else if (s.starts_with('T')) {
            // Elapsed time for the previous move.
        } else if (s == EVEN_GAME) {
            if (started_) fail(text_, at, "a single PI line");
            record_.game = Game(Position::startpos());
            started_ = true;
        } else if (s == "+" || s == "-") {
            set_first_mover(at, s == "+" ? Side::Sente : Side::Gote);
        } else if (s.starts_with('+') || s.starts_with('-') || s.starts_with('%')) {
            play(at, s);
        } else {
            fail(text_, at, "record line");
        }
    }

    void set_first_mover(std::size_t at, Side side) {
        if (!started_) fail(text_, at, std::string(EVEN_GAME));
        if (!record_.game.moves().empty()) fail(text_, at, "move");

        const Position& start = record_.game.start();
        record_.game = Game(Position(start.board(), start.hand(Side::Sente), start.hand(Side::Gote), side));
    }

    void play(std::size_t at, std::string_view token) {
        if (!started_) fail(text_, at, std::string(EVEN_GAME));

        if (!record_.game.play(decode(at, token))) fail(text_, at, "legal move");
    }

    Move decode(std::size_t at, std::string_view token) const {
        try {
            return Record::decode_move(record_.game.position(), token);
        } catch (const ParseError& e) {
            rethrow_at(text_, at, e);
        }
    }

    std::string_view text_;
    Record::GameRecord record_;
    bool started_ = false;
};

}

namespace Record {

Move decode_move(const Position& before, std::string_view token) {
    if (token.starts_with('%')) return decode_terminal(before, token);

    if (token.empty() || (token[0] != '+' && token[0] != '-')) fail(token, 0, "+ or -");
    const Side side = token[0] == '+' ? Side::Sente : Side::Gote;
    if (side != before.side_to_move()) fail(token, 0, token[0] == '+' ? "-" : "+");

    const bool is_drop = digit_at(token, 1) == 0 && digit_at(token, 2) == 0;
    const Square from = is_drop ? Square::None : square_at(token, 1);
    const Square to = square_at(token, 3);

    if (token.size() < 7) fail(token, 5, "piece code");
    const PieceFace face = face_from_code(token.substr(5, 2));
    if (face == PieceFace::None) fail(token, 5, "piece code");
    if (token.size() > 7) fail(token, 7, "end of move");

    if (is_drop) {
        if (is_promoted(face)) fail(token, 5, "unpromoted piece for a drop");
        return Move::drop(side, to, base_type(face));
    }

    const SquareContent& origin = before[from];
    if (!origin.belongs_to(side) || base_type(origin.face) != base_type(face)) {
        fail(token, 1, "origin holding the mover's piece");
    }

    const bool promote = origin.face != face;
    if (promote && promoted_face(origin.face) != face) fail(token, 5, "piece code matching the origin");
    return Move::normal(side, from, to, origin.face, promote);
}

std::string encode_move(const Move& move) {
    if (move.is_terminal()) {
        for (const TerminalCode& tc : TERMINAL_CODES) {
            if (tc.reason == move.reason()) return std::string(tc.code);
        }
        return {};
    }

    std::string out(1, move.side() == Side::Sente ? '+' : '-');
    if (move.is_drop()) {
        out += "00";
    } else {
        out += static_cast<char>('0' + file_of(move.from()));
        out += static_cast<char>('0' + rank_of(move.from()));
    }
    out += static_cast<char>('0' + file_of(move.to()));
    out += static_cast<char>('0' + rank_of(move.to()));
    out += face_code(move.placed_face());
    return out;
}

GameRecord parse(std::string_view text) {
    return RecordParser(text).parse();
}

std::string encode(const GameRecord& record) {
    std::string out;
    if (!record.version.empty()) out += std::string(VERSION_PREFIX) + record.version + "\n";
    if (!record.sente_name.empty()) out += "N+" + record.sente_name + "\n";
    if (!record.gote_name.empty()) out += "N-" + record.gote_name + "\n";
    for (const auto& [key, value] : record.metadata) {
        out += "$" + key + ":" + value + "\n";
    }
    for (const std::string& comment : record.comments) {
        out += "'" + comment + "\n";
    }

    out += std::string(EVEN_GAME) + "\n";
    out += record.game.start().side_to_move() == Side::Sente ? "+\n" : "-\n";

    for (const Move& move : record.game.moves()) {
        out += encode_move(move) + "\n";
    }
    return out;
}

}
