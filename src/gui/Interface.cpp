#include "Interface.hpp"
#include "imgui.h"
#include "imgui-SFML.h"
#include <SFML/Graphics.hpp>
#include <algorithm>
#include <array>
#include <atomic>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "Check.hpp"
#include "Explorer.hpp"
#include "Game.hpp"
#include "Notation.hpp"
#include "Record.hpp"

const int TILE_SIZE = 64;
const int BOARD_PADDING = 30;
const int PANEL_WIDTH = 360;
const int BOARD_PIXEL_SIZE = FILE_NB * TILE_SIZE;
const int OFFSET_X = BOARD_PADDING;
const int OFFSET_Y = BOARD_PADDING;
const int WIN_WIDTH = BOARD_PIXEL_SIZE + (2 * BOARD_PADDING) + PANEL_WIDTH;
const int WIN_HEIGHT = BOARD_PIXEL_SIZE + (2 * BOARD_PADDING);

const size_t TEXT_BUFFER_SIZE = 8192;

struct Assets {
    sf::Font font;
    bool has_font = false;
    void load() {
        if (font.loadFromFile("assets/font.TTF")) has_font = true;
    }
};

Square get_square_at(int mouse_x, int mouse_y, bool flipped) {
    int x = mouse_x - OFFSET_X;
    int y = mouse_y - OFFSET_Y;
    if (x < 0 || x >= BOARD_PIXEL_SIZE || y < 0 || y >= BOARD_PIXEL_SIZE) return Square::None;
    int col = x / TILE_SIZE; int row = y / TILE_SIZE;
    int file_idx = flipped ? (FILE_NB - 1 - col) : col;
    int rank_idx = flipped ? (RANK_NB - 1 - row) : row;
    return square_from_index(rank_idx * FILE_NB + file_idx);
}

sf::Vector2f tile_origin(Square sq, bool flipped) {
    int col = flipped ? (FILE_NB - 1 - file_index(sq)) : file_index(sq);
    int row = flipped ? (RANK_NB - 1 - rank_index(sq)) : rank_index(sq);
    return sf::Vector2f(OFFSET_X + col * TILE_SIZE, OFFSET_Y + row * TILE_SIZE);
}

Position load_start_position(const std::string& path) {
    if (path.empty()) return Position::startpos();

    std::ifstream in(path);
    if (!in) {
        std::cerr << "Cannot open " << path << ", using the standard layout" << std::endl;
        return Position::startpos();
    }
    std::stringstream ss;
    ss << in.rdbuf();

    try {
        return Notation::decode(ss.str());
    } catch (const ParseError& e) {
        std::cerr << path << ": " << e.what() << std::endl;
        return Position::startpos();
    }
}

void copy_to_buffer(std::array<char, TEXT_BUFFER_SIZE>& buffer, const std::string& text) {
    size_t n = std::min(text.size(), buffer.size() - 1);
    std::copy(text.begin(), text.begin() + n, buffer.begin());
    buffer[n] = '\0';
}

std::string describe_result(const Move& result) {
    std::ostringstream os;
    os << result.reason();
    if (result.winner()) os << " - " << *result.winner() << " wins";
    else os << " - draw";
    return os.str();
}

namespace GUI {
    void Launch(const std::string& start_diagram_path) {
        sf::RenderWindow window(sf::VideoMode(WIN_WIDTH, WIN_HEIGHT), "Shogi");
        window.setFramerateLimit(60);
        ImGui::SFML::Init(window);

        const Position start = load_start_position(start_diagram_path);
        Game game(start);

        Assets assets; assets.load();
        Square selected_sq = Square::None;
        PieceType selected_drop = PieceType::None;
        std::vector<Move> valid_moves;
        sf::Clock deltaClock;

        // Both promotion choices for the pending destination.
        std::vector<Move> promotion_choices;
        bool view_flipped = false;

        std::array<char, TEXT_BUFFER_SIZE> text_buffer{};
        std::string text_error;

        // --- PERFT THREAD STATE ---
        std::thread perft_thread;
        std::atomic<bool> is_counting(false);
        std::atomic<bool> stop_counting(false);
        int perft_depth = 3;
        int perft_threads = 1;
        Explorer::ExploreStats perft_result;
        Explorer::ExploreStats last_perft;

        auto clear_selection = [&]() {
            selected_sq = Square::None;
            selected_drop = PieceType::None;
            valid_moves.clear();
            promotion_choices.clear();
        };

        auto select = [&](Square from, PieceType drop) {
            clear_selection();
            selected_sq = from;
            selected_drop = drop;
            for (const Move& m : Check::king_safe_moves(game.position())) {
                bool match = (drop == PieceType::None)
                    ? (m.is_normal() && m.from() == from)
                    : (m.is_drop() && m.piece() == drop);
                if (match) valid_moves.push_back(m);
            }
        };

        auto play = [&](const Move& m) {
            if (!game.play(m)) std::cerr << "Rejected move " << m << std::endl;
            clear_selection();
        };

        auto on_board_click = [&](Square clicked) {
            std::vector<Move> targets;
            for (const Move& m : valid_moves) {
                if (m.to() == clicked) targets.push_back(m);
            }
            if (targets.size() == 1) { play(targets.front()); return; }
            if (targets.size() > 1) { promotion_choices = targets; return; }

            const SquareContent& c = game.position()[clicked];
            if (!c.empty() && c.belongs_to(game.position().side_to_move())) select(clicked, PieceType::None);
            else clear_selection();
        };

        auto render_board = [&]() {
            sf::RectangleShape tile(sf::Vector2f(TILE_SIZE - 2, TILE_SIZE - 2));
            tile.setOutlineThickness(1);
            tile.setOutlineColor(sf::Color(60, 40, 20));
            for (int i = 0; i < SQUARE_NB; ++i) {
                Square sq = square_from_index(i);
                sf::Vector2f p = tile_origin(sq, view_flipped);
                tile.setPosition(p.x + 1, p.y + 1);
                tile.setFillColor(sf::Color(222, 184, 135));
                window.draw(tile);
            }

            auto draw_hl = [&](Square sq, sf::Color c) {
                sf::Vector2f p = tile_origin(sq, view_flipped);
                tile.setPosition(p.x + 1, p.y + 1); tile.setFillColor(c); window.draw(tile);
            };
            if (selected_sq != Square::None) draw_hl(selected_sq, sf::Color(255, 255, 0, 100));
            for (const auto& m : valid_moves) draw_hl(m.to(), sf::Color(100, 255, 100, 100));

            if (!assets.has_font) return;

            for (int i = 0; i < SQUARE_NB; ++i) {
                Square sq = square_from_index(i);
                const SquareContent& c = game.position()[sq];
                if (c.empty()) continue;

                std::ostringstream code;
                code << c.face;
                sf::Text text(code.str(), assets.font, TILE_SIZE / 3);
                text.setFillColor(is_promoted(c.face) ? sf::Color(180, 0, 0) : sf::Color::Black);
                sf::FloatRect b = text.getLocalBounds();
                text.setOrigin(b.left + b.width / 2.0f, b.top + b.height / 2.0f);

                // Pieces face the opponent; Gote's are upside down in Sente's view.
                bool upside_down = (c.side == Side::Gote) != view_flipped;
                text.setRotation(upside_down ? 180.f : 0.f);

                sf::Vector2f p = tile_origin(sq, view_flipped);
                text.setPosition(p.x + TILE_SIZE / 2.0f, p.y + TILE_SIZE / 2.0f);
                window.draw(text);
            }
        };

        auto hand_buttons = [&](Side side) {
            const Hand& hand = game.position().hand(side);
            bool can_drop = side == game.position().side_to_move() && !game.is_over() && !is_counting;
            bool any = false;
            for (int pt = PIECE_TYPE_NB - 1; pt >= 0; --pt) {
                PieceType type = static_cast<PieceType>(pt);
                int n = hand.count(type);
                if (n == 0) continue;
                any = true;

                std::ostringstream label;
                if (can_drop && selected_drop == type) label << "> ";
                label << type << " x" << n << "##" << static_cast<int>(side) << pt;
                ImGui::SameLine();
                if (!can_drop) ImGui::BeginDisabled();
                if (ImGui::Button(label.str().c_str())) select(Square::None, type);
                if (!can_drop) ImGui::EndDisabled();
            }
            if (!any) { ImGui::SameLine(); ImGui::Text("-"); }
        };

        while (window.isOpen()) {
            sf::Event event;
            while (window.pollEvent(event)) {
                ImGui::SFML::ProcessEvent(window, event);
                if (event.type == sf::Event::Closed) {
                    stop_counting = true;
                    window.close();
                }

                if (game.is_over() || is_counting || !promotion_choices.empty()) continue;

                if (event.type == sf::Event::MouseButtonPressed && event.mouseButton.button == sf::Mouse::Left) {
                    if (ImGui::GetIO().WantCaptureMouse) continue;
                    Square clicked = get_square_at(event.mouseButton.x, event.mouseButton.y, view_flipped);
                    if (clicked != Square::None) on_board_click(clicked);
                }
            }

            ImGui::SFML::Update(window, deltaClock.restart());

            // --- SIDEBAR UI ---
            ImGui::SetNextWindowPos(sf::Vector2f(WIN_WIDTH - PANEL_WIDTH, 0));
            ImGui::SetNextWindowSize(sf::Vector2f(PANEL_WIDTH, WIN_HEIGHT));
            ImGui::Begin("Controls", nullptr, ImGuiWindowFlags_NoDecoration);

            const Position& pos = game.position();
            Side stm = pos.side_to_move();

            if (auto result = game.result()) {
                ImGui::TextColored(ImVec4(1, 0, 0, 1), "GAME OVER");
                ImGui::TextColored(ImVec4(0, 1, 0, 1), "%s", describe_result(*result).c_str());
                ImGui::Separator();
            }

            ImGui::TextColored(ImVec4(1,1,0,1), "GAME STATUS");
            ImGui::Separator();
            ImGui::Text("Turn: %s", stm == Side::Sente ? "Sente" : "Gote");
            ImGui::Text("Move #: %d", static_cast<int>(game.moves().size()) + 1);
            if (!game.is_over()) {
                if (Check::is_checkmate(pos)) ImGui::TextColored(ImVec4(1,0,0,1), "Checkmate");
                else if (Check::is_check(pos, opposite(stm))) ImGui::TextColored(ImVec4(1,0.5f,0,1), "Check");
            }

            ImGui::Spacing();
            ImGui::TextColored(ImVec4(0,1,1,1), "HANDS");
            ImGui::Separator();
            ImGui::Text("Gote:"); hand_buttons(Side::Gote);
            ImGui::Text("Sente:"); hand_buttons(Side::Sente);

            ImGui::Spacing();
            ImGui::Checkbox("Flip Board", &view_flipped);

            bool busy = is_counting;
            if (busy) ImGui::BeginDisabled();
            if (ImGui::Button("Undo", ImVec2(80, 30))) { game.undo(); clear_selection(); }
            ImGui::SameLine();
            if (ImGui::Button("Resign", ImVec2(80, 30))) { game.resign(); clear_selection(); }
            ImGui::SameLine();
            if (ImGui::Button("Reset", ImVec2(80, 30))) { game = Game(start); clear_selection(); }
            if (busy) ImGui::EndDisabled();

            ImGui::Spacing();
            ImGui::TextColored(ImVec4(0,1,0,1), "PERFT");
            ImGui::Separator();
            ImGui::SliderInt("Depth", &perft_depth, 1, 6);
            ImGui::SliderInt("Threads", &perft_threads, 1, 16);
            if (!is_counting) {
                if (ImGui::Button("Count", ImVec2(100, 30)) && !perft_thread.joinable()) {
                    is_counting = true;
                    stop_counting = false;
                    Explorer::ExploreParams params;
                    params.depth = perft_depth;
                    params.threads = static_cast<unsigned>(perft_threads);
                    params.stop = &stop_counting;
                    Position root = game.position();

                    perft_thread = std::thread([root, params, &perft_result, &is_counting]() {
                        perft_result = Explorer::explore(root, params);
                        is_counting = false;
                    });
                }
            } else {
                ImGui::TextColored(ImVec4(0,1,1,1), "Status: COUNTING...");
                if (ImGui::Button("Cancel", ImVec2(100, 30))) stop_counting = true;
            }
            if (!last_perft.nodes_per_depth.empty()) {
                for (size_t ply = 1; ply < last_perft.nodes_per_depth.size(); ++ply) {
                    ImGui::Text("ply %d: %llu", static_cast<int>(ply),
                                static_cast<unsigned long long>(last_perft.nodes_per_depth[ply]));
                }
                if (last_perft.cancelled) ImGui::Text("(cancelled)");
            }

            ImGui::Spacing();
            ImGui::TextColored(ImVec4(1,0,1,1), "DIAGRAM / RECORD");
            ImGui::Separator();
            if (ImGui::Button("Show Diagram")) { copy_to_buffer(text_buffer, Notation::encode(game.position())); text_error.clear(); }
            ImGui::SameLine();
            if (ImGui::Button("Show Record")) {
                Record::GameRecord record;
                record.game = game;
                if (game.start() == Position::startpos()) copy_to_buffer(text_buffer, Record::encode(record));
                else text_error = "Records start from the standard layout";
            }
            ImGui::InputTextMultiline("##text", text_buffer.data(), text_buffer.size(), ImVec2(PANEL_WIDTH - 20, 220));
            if (busy) ImGui::BeginDisabled();
            if (ImGui::Button("Load Diagram")) {
                try {
                    game = Game(Notation::decode(text_buffer.data()));
                    text_error.clear();
                    clear_selection();
                } catch (const ParseError& e) {
                    text_error = e.what();
                }
            }
            ImGui::SameLine();
            if (ImGui::Button("Load Record")) {
                try {
                    game = Record::parse(text_buffer.data()).game;
                    text_error.clear();
                    clear_selection();
                } catch (const ParseError& e) {
                    text_error = e.what();
                }
            }
            if (busy) ImGui::EndDisabled();
            if (!text_error.empty()) ImGui::TextWrapped("%s", text_error.c_str());

            ImGui::End();

            // --- PROMOTION CHOICE ---
            if (!promotion_choices.empty()) ImGui::OpenPopup("Promote?");
            if (ImGui::BeginPopupModal("Promote?", nullptr, ImGuiWindowFlags_AlwaysAutoResize)) {
                for (const Move& m : promotion_choices) {
                    std::ostringstream label;
                    label << m.placed_face();
                    if (ImGui::Button(label.str().c_str(), ImVec2(80, 40))) {
                        Move chosen = m;
                        play(chosen);
                        ImGui::CloseCurrentPopup();
                        break;
                    }
                    ImGui::SameLine();
                }
                ImGui::EndPopup();
            }

            if (!is_counting && perft_thread.joinable()) {
                perft_thread.join();
                last_perft = perft_result;
            }

            window.clear(sf::Color(30, 30, 30));
            render_board();
            ImGui::SFML::Render(window);
            window.display();
        }

        if (perft_thread.joinable()) perft_thread.join();
        ImGui::SFML::Shutdown();
    }
}
