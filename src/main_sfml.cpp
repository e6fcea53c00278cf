#ifdef PEG_SFML_FRONTEND
#include "Game.hpp"
#include "Coord.hpp"
#include "Render.hpp"
#include <SFML/Graphics.hpp>
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <string>

// ======== Layout =========
struct Layout
{
    float spacing;
    sf::Vector2f apex; // centre of hole 1
};

static Layout layoutFor(int rows, sf::Vector2u size)
{
    float byHeight = (size.y - 140.f) / std::max(1, rows);
    float byWidth = (size.x - 80.f) / std::max(1, rows);
    float spacing = std::min(110.f, std::min(byHeight, byWidth));
    return {spacing, {size.x / 2.f, 90.f + spacing / 2.f}};
}

static sf::Vector2f holeCenter(int pos, const Layout &L)
{
    Coord c = coord_of(pos);
    float dx = (c.col - (c.row + 1) / 2.f) * L.spacing;
    float dy = (c.row - 1) * L.spacing * 0.866f;
    return {L.apex.x + dx, L.apex.y + dy};
}

// 0 if the click is not on a hole
static int holeAt(const Board &b, sf::Vector2i mp, const Layout &L)
{
    int row = (int)std::lround((mp.y - L.apex.y) / (L.spacing * 0.866f)) + 1;
    int col = (int)std::lround((mp.x - L.apex.x) / L.spacing + (row + 1) / 2.f);
    int pos = pos_at(row, col);
    if (!b.contains(pos))
        return 0;
    sf::Vector2f c = holeCenter(pos, L);
    float dx = mp.x - c.x, dy = mp.y - c.y;
    float r = L.spacing * 0.4f;
    return dx * dx + dy * dy <= r * r ? pos : 0;
}

// Labels and HUD share one font: PEG_FONT_PATH, else a bold sans from the usual places.
static bool setupText(sf::Font &font, sf::Text &hud)
{
    bool loaded = false;
    if (const char *env = std::getenv("PEG_FONT_PATH"))
        loaded = font.loadFromFile(env);
    const char *bold[] = {
        "/usr/share/fonts/truetype/dejavu/DejaVuSans-Bold.ttf",
        "/usr/share/fonts/truetype/liberation/LiberationSans-Bold.ttf",
        "/usr/share/fonts/TTF/DejaVuSans-Bold.ttf",
        "C:/Windows/Fonts/arialbd.ttf",
        "/System/Library/Fonts/Supplemental/Arial Bold.ttf"};
    for (auto p : bold)
    {
        if (loaded)
            break;
        loaded = font.loadFromFile(p);
    }
    if (!loaded)
        return false;
    hud.setFont(font);
    hud.setCharacterSize(16);
    hud.setFillColor(sf::Color(160, 170, 180));
    return true;
}

// hole: dark ring; peg: filled disc on top
static void drawHole(sf::RenderTarget &win, sf::Vector2f center, float spacing, bool pegged, sf::Color ring)
{
    float rHole = spacing * 0.36f;
    sf::CircleShape hole(rHole);
    hole.setOrigin(rHole, rHole);
    hole.setPosition(center);
    hole.setFillColor(sf::Color(45, 38, 32));
    hole.setOutlineThickness(3.f);
    hole.setOutlineColor(ring);
    win.draw(hole);
    if (!pegged)
        return;
    float rPeg = spacing * 0.26f;
    sf::CircleShape peg(rPeg);
    peg.setOrigin(rPeg, rPeg);
    peg.setPosition(center);
    peg.setFillColor(sf::Color(220, 170, 70));
    win.draw(peg);
}

int main()
{
    sf::RenderWindow win(sf::VideoMode(900, 800), "Peg Thing (SFML)");
    win.setFramerateLimit(60);

    Game g;
    Layout L = layoutFor(g.rows(), win.getSize());

    sf::Font font;
    sf::Text hud;
    bool haveFont = setupText(font, hud);

    int selected = 0;
    int flashFrames = 0;
    auto restart = [&](int rows)
    {
        g.reset(rows);
        selected = 0;
        flashFrames = 0;
        L = layoutFor(g.rows(), win.getSize());
    };

    auto click = [&](int pos)
    {
        if (pos == 0)
            return;
        if (g.phase == Phase::AwaitingEmptyHole)
        {
            g.choose_empty_hole(pos);
            return;
        }
        if (g.phase != Phase::Playing)
            return;
        if (selected == 0 || g.board.is_pegged(pos))
        {
            // (re)select a source peg
            selected = g.board.is_pegged(pos) ? pos : 0;
            return;
        }
        if (!g.try_move(selected, pos))
            flashFrames = 30;
        selected = 0;
    };

    while (win.isOpen())
    {
        sf::Event ev;
        while (win.pollEvent(ev))
        {
            if (ev.type == sf::Event::Closed)
                win.close();
            if (ev.type == sf::Event::Resized)
            {
                win.setView(sf::View(sf::FloatRect(0.f, 0.f, (float)ev.size.width, (float)ev.size.height)));
                L = layoutFor(g.rows(), win.getSize());
            }
            if (ev.type == sf::Event::KeyPressed)
            {
                if (ev.key.code == sf::Keyboard::Escape)
                    win.close();
                if (ev.key.code == sf::Keyboard::R)
                    restart(g.rows());
                if (ev.key.code == sf::Keyboard::LBracket && g.rows() > 1)
                    restart(g.rows() - 1);
                if (ev.key.code == sf::Keyboard::RBracket && g.rows() < MAX_ROWS)
                    restart(g.rows() + 1);
            }
            if (ev.type == sf::Event::MouseButtonPressed && ev.mouseButton.button == sf::Mouse::Left)
                click(holeAt(g.board, {ev.mouseButton.x, ev.mouseButton.y}, L));
            if (ev.type == sf::Event::MouseButtonPressed && ev.mouseButton.button == sf::Mouse::Right)
                selected = 0;
        }

        win.clear(sf::Color(25, 25, 28));

        Connections targets;
        if (selected != 0)
            targets = g.board.valid_moves(selected);

        for (int pos = 1; pos <= g.board.max_pos(); ++pos)
        {
            sf::Color ring(90, 80, 70);
            if (pos == selected)
                ring = sf::Color(250, 200, 60);
            else if (targets.count(pos))
                ring = sf::Color(80, 200, 120);
            auto c = holeCenter(pos, L);
            drawHole(win, c, L.spacing, g.board.is_pegged(pos), ring);
            if (haveFont)
            {
                sf::Text label(std::string(1, pos_letter(pos)), font, (unsigned)(L.spacing * 0.22f));
                label.setFillColor(sf::Color(30, 30, 30));
                auto bounds = label.getLocalBounds();
                label.setOrigin(bounds.left + bounds.width / 2.f, bounds.top + bounds.height / 2.f);
                label.setPosition(c);
                win.draw(label);
            }
        }

        // HUD
        if (haveFont)
        {
            hud.setString("Rows " + std::to_string(g.rows()) + "    " + g.phase_name() + "    Pegs " +
                          std::to_string(g.score()) + "   [ [/] rows, R restart, RMB deselect ]");
            hud.setPosition(8.f, 6.f);
            win.draw(hud);
            if (g.over())
            {
                sf::Text t("Game over! You had " + std::to_string(g.score()) + " pegs left.   Press R to play again",
                           font, 24);
                t.setFillColor(sf::Color(240, 240, 240));
                t.setPosition(16.f, (float)win.getSize().y - 40.f);
                win.draw(t);
            }
        }

        // red border after an invalid move
        if (flashFrames > 0)
        {
            sf::RectangleShape border(sf::Vector2f((float)win.getSize().x - 8, (float)win.getSize().y - 8));
            border.setPosition(4, 4);
            border.setFillColor(sf::Color::Transparent);
            border.setOutlineThickness(4);
            border.setOutlineColor(sf::Color(220, 70, 70, 180));
            win.draw(border);
            --flashFrames;
        }

        win.display();
    }
    return 0;
}
#endif
