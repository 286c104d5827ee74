#include <gtest/gtest.h>
#include "ui/main_screen.hpp"

#include <ftxui/component/event.hpp>
#include <ftxui/dom/elements.hpp>
#include <ftxui/screen/screen.hpp>

using namespace ftxui;

class MainScreenTest : public ::testing::Test {
protected:
    MainScreen screen;
    int quits = 0;
    int backs = 0;
    bool content_eats_x = true;

    void SetUp() override {
        MainScreen::Callbacks cb;
        cb.on_quit = [this]() { quits++; };
        cb.on_back = [this]() { backs++; };
        screen.set_callbacks(cb);

        auto content = Renderer([](bool) { return text("content"); }) | CatchEvent([this](Event e) {
            return content_eats_x && e == Event::Character('x');
        });
        screen.set_content(content);
        screen.set_status_bar(Renderer([] { return text("status"); }));
    }
};

TEST_F(MainScreenTest, QuitAndBack) {
    auto comp = screen.component();
    EXPECT_TRUE(comp->OnEvent(Event::Character('q')));
    EXPECT_TRUE(comp->OnEvent(Event::Escape));
    EXPECT_EQ(quits, 1);
    EXPECT_EQ(backs, 1);
}

TEST_F(MainScreenTest, PanelKeysWinOverGlobalOnes) {
    auto comp = screen.component();
    EXPECT_TRUE(comp->OnEvent(Event::Character('x')));
    EXPECT_FALSE(comp->OnEvent(Event::Character('z')));
    EXPECT_EQ(quits, 0);
}

TEST_F(MainScreenTest, HeaderShowsBackendAndDaemon) {
    screen.set_backend_mode("session");
    screen.set_daemon_connected(true);

    auto out = Screen::Create(Dimension::Fixed(120), Dimension::Fixed(10));
    Render(out, screen.component()->Render());
    std::string rendered = out.ToString();
    EXPECT_NE(rendered.find("session"), std::string::npos);
    EXPECT_NE(rendered.find("daemon"), std::string::npos);
    EXPECT_NE(rendered.find("content"), std::string::npos);
}
