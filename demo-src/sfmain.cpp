/****************************************************************************

    MIT License

    Copyright (c) 2021 Aria Janke

    Permission is hereby granted, free of charge, to any person obtaining a copy
    of this software and associated documentation files (the "Software"), to deal
    in the Software without restriction, including without limitation the rights
    to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
    copies of the Software, and to permit persons to whom the Software is
    furnished to do so, subject to the following conditions:

    The above copyright notice and this permission notice shall be included in all
    copies or substantial portions of the Software.

    THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
    IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
    FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
    AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
    LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
    OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
    SOFTWARE.

*****************************************************************************/

#include "DemoDriver.hpp"

#include <SFML/Graphics/RenderWindow.hpp>
#include <SFML/Window/Event.hpp>

#include <common/sf/DrawText.hpp>
#include <common/sf/DrawRectangle.hpp>

#include <iostream>

using cul::convert_to, cul::BitmapFont, cul::SfBitmapFont, cul::DrawRectangle, cul::DrawText;

constexpr const int k_window_height = 700;
constexpr const int k_window_width  = (k_window_height * 11) / 6;
// the window is capped at this rate, so each frame advances by a fixed step
constexpr const Real k_frame_time   = 1. / 60.;

constexpr const auto k_jump_key      = sf::Keyboard::W;
constexpr const auto k_left_key      = sf::Keyboard::A;
constexpr const auto k_right_key     = sf::Keyboard::D;
constexpr const auto k_frame_advance = sf::Keyboard::Q;
constexpr const auto k_pause_key     = sf::Keyboard::Return;
constexpr const auto k_restart_key   = sf::Keyboard::Num0;

Key to_impl_key(sf::Keyboard::Key k) {
    switch (k) {
    case k_jump_key     : return Key::jump;
    case sf::Keyboard::Space: return Key::jump;
    case k_left_key     : return Key::left;
    case k_right_key    : return Key::right;
    case k_pause_key    : return Key::pause;
    case k_frame_advance: return Key::frame_advance;
    case k_restart_key  : return Key::restart;
    default             : return Key::none;
    }
}

class DrawInterfaceImpl final : public DrawInterface {
public:
    DrawInterfaceImpl(sf::RenderTarget & target):
        m_target(target)
    {
        m_text_brush.assign_font(m_font);
    }

    void draw_string_top_left(const std::string & string, Vector top_left) final {
        m_text_brush.set_text_top_left(convert_to<sf::Vector2f>(top_left), string);
        m_target.draw(m_text_brush);
    }

    void draw_rectangle(const Rectangle & rect, Color color) final {
        DrawRectangle drect(float(rect.left), float(rect.top), float(rect.width),
                            float(rect.height), sf::Color(color.r, color.g, color.b));
        m_target.draw(drect);
    }

private:
    sf::RenderTarget & m_target;
    const SfBitmapFont & m_font = SfBitmapFont::load_builtin_font(BitmapFont::k_8x8_highlighted_font);
    DrawText m_text_brush;
};

int main() {
    DemoDriver driver;
    driver.load_scene();

    sf::RenderWindow window(sf::VideoMode(k_window_width, k_window_height), "map collider demo");

    window.setFramerateLimit(60u);
    {
    auto view = window.getView();
    view.setSize(k_window_width / 2, k_window_height / 2);
    view.setCenter(0, 0);
    window.setView(view);
    }
    DrawInterfaceImpl draw_intf{window};
    while (window.isOpen()) {
        sf::Event event;
        while (window.pollEvent(event)) {
            switch (event.type) {
            case sf::Event::KeyPressed:
                if (event.key.code == sf::Keyboard::Escape) {
                    window.close();
                    break;
                }
                driver.on_press(to_impl_key(event.key.code));
                break;
            case sf::Event::KeyReleased:
                driver.on_release(to_impl_key(event.key.code));
                break;
            case sf::Event::Closed:
                window.close();
                break;
            default: break;
            }
        }
        window.clear();
        driver.on_update(k_frame_time);
        if (!driver.status_change().empty()) {
            std::cout << driver.status_change() << std::endl;
        }
        auto view = window.getView();
        view.setCenter(convert_to<sf::Vector2f>(driver.camera_center()));
        window.setView(view);
        driver.on_draw_field(draw_intf);

        view.setCenter(view.getSize().x / 2, view.getSize().y / 2);
        window.setView(view);
        driver.on_draw_hud(draw_intf);

        window.display();
    }
}
