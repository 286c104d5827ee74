#include <gtest/gtest.h>
#include "ui/site_panel.hpp"

#include <ftxui/component/event.hpp>

using ftxui::Event;

static SiteStatus make_status(const std::string& name, bool running) {
    SiteStatus st;
    st.name = name;
    st.state = running ? RunState::Running : RunState::Stopped;
    st.cmd = "sleep 30";
    return st;
}

class SitePanelTest : public ::testing::Test {
protected:
    SitePanel panel;
    ftxui::Component comp;
    std::vector<std::pair<std::string, std::string>> actions;
    std::vector<std::string> opened;

    void SetUp() override {
        SitePanel::Callbacks cb;
        cb.on_action = [this](const std::string& name, const std::string& op) {
            actions.emplace_back(name, op);
        };
        cb.on_open_log = [this](const std::string& name) { opened.push_back(name); };
        panel.set_callbacks(cb);
        comp = panel.component();
        panel.set_sites({make_status("alpha", true), make_status("beta", false), make_status("gamma", false)});
    }
};

TEST_F(SitePanelTest, SelectionMovesAndClamps) {
    EXPECT_EQ(panel.selected_name(), "alpha");
    comp->OnEvent(Event::ArrowUp);
    EXPECT_EQ(panel.selected_name(), "alpha");

    comp->OnEvent(Event::ArrowDown);
    EXPECT_EQ(panel.selected_name(), "beta");
    comp->OnEvent(Event::Character('j'));
    comp->OnEvent(Event::Character('j'));
    EXPECT_EQ(panel.selected_name(), "gamma");
    comp->OnEvent(Event::Character('k'));
    EXPECT_EQ(panel.selected_name(), "beta");
}

TEST_F(SitePanelTest, SelectionFollowsNameAcrossRefresh) {
    comp->OnEvent(Event::ArrowDown);
    ASSERT_EQ(panel.selected_name(), "beta");

    panel.set_sites({make_status("beta", true), make_status("gamma", false)});
    EXPECT_EQ(panel.selected_name(), "beta");

    // Selected site removed: clamp into range
    panel.set_sites({make_status("alpha", true)});
    EXPECT_EQ(panel.selected_name(), "alpha");

    panel.set_sites({});
    EXPECT_EQ(panel.selected_name(), "");
}

TEST_F(SitePanelTest, ActionKeys) {
    comp->OnEvent(Event::ArrowDown);
    EXPECT_TRUE(comp->OnEvent(Event::Character('s')));
    EXPECT_TRUE(comp->OnEvent(Event::Character('X')));
    EXPECT_TRUE(comp->OnEvent(Event::Character('r')));

    ASSERT_EQ(actions.size(), 3u);
    EXPECT_EQ(actions[0], std::make_pair(std::string("beta"), std::string("start")));
    EXPECT_EQ(actions[1].second, "stop");
    EXPECT_EQ(actions[2].second, "restart");
}

TEST_F(SitePanelTest, EnterOpensLog) {
    EXPECT_TRUE(comp->OnEvent(Event::Return));
    ASSERT_EQ(opened.size(), 1u);
    EXPECT_EQ(opened[0], "alpha");
}

TEST_F(SitePanelTest, NoSitesIgnoresActions) {
    panel.set_sites({});
    EXPECT_FALSE(comp->OnEvent(Event::Character('s')));
    EXPECT_FALSE(comp->OnEvent(Event::Return));
    EXPECT_TRUE(actions.empty());
    EXPECT_TRUE(opened.empty());
}
