#include "ui/main_screen.hpp"

#include <ftxui/dom/elements.hpp>
#include <ftxui/component/event.hpp>
#include <ftxui/component/component_base.hpp>

#include <atomic>
#include <mutex>

using namespace ftxui;

struct MainScreen::Impl {
    Callbacks callbacks;
    std::mutex mutex;
    std::string mode = "-";
    std::atomic<bool> connected{false};

    Component content = Renderer([] { return text("Loading..."); });
    Component status_bar = Renderer([] { return text(""); });

    // Custom component: handles global shortcuts AFTER child gets first chance.
    class ScreenComponent : public ComponentBase {
    public:
        explicit ScreenComponent(Impl* impl) : impl_(impl) {}

        bool Focusable() const override {
            for (auto& child : children_) {
                if (child->Focusable()) return true;
            }
            return false;
        }

        Element OnRender() override {
            std::string mode;
            {
                std::lock_guard<std::mutex> lock(impl_->mutex);
                mode = impl_->mode;
            }

            auto header = hbox({
                text(" pisite-cpp ") | bold | color(Color::Cyan),
                separator(),
                text(" backend: ") | dim,
                text(mode) | bold,
                filler(),
                impl_->connected.load()
                    ? text("● daemon") | color(Color::Green)
                    : text("○ no daemon (local)") | color(Color::Yellow),
                text(" "),
            });

            auto footer = hbox({
                text(" [S]") | bold,
                text("Start"),
                text("  [X]") | bold,
                text("Stop"),
                text("  [R]") | bold,
                text("Restart"),
                text("  [Enter/L]") | bold,
                text("Logs"),
                text("  [Esc]") | bold,
                text("Back"),
                text("  [Q]") | bold,
                text("Quit"),
                text("  "),
            }) | dim;

            return vbox({
                header,
                separator(),
                impl_->content->Render() | flex,
                separator(),
                impl_->status_bar->Render(),
                footer,
            });
        }

        bool OnEvent(Event event) override {
            // Let child components (content/Tab → active panel) handle first
            if (ComponentBase::OnEvent(event)) {
                return true;
            }

            // Fallback global shortcuts (panel didn't handle)
            if (event.is_character()) {
                auto ch = event.character();
                if (ch == "q" || ch == "Q") {
                    if (impl_->callbacks.on_quit) impl_->callbacks.on_quit();
                    return true;
                }
            }
            if (event == Event::Escape) {
                if (impl_->callbacks.on_back) impl_->callbacks.on_back();
                return true;
            }
            return false;
        }

    private:
        Impl* impl_;
    };
};

MainScreen::MainScreen() : impl_(std::make_unique<Impl>()) {}
MainScreen::~MainScreen() = default;

void MainScreen::set_callbacks(Callbacks cb) { impl_->callbacks = std::move(cb); }

void MainScreen::set_backend_mode(const std::string& mode) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->mode = mode;
}

void MainScreen::set_daemon_connected(bool connected) { impl_->connected.store(connected); }
void MainScreen::set_content(Component content) { impl_->content = std::move(content); }
void MainScreen::set_status_bar(Component status_bar) { impl_->status_bar = std::move(status_bar); }

Component MainScreen::component() {
    auto comp = Make<Impl::ScreenComponent>(impl_.get());
    comp->Add(impl_->content);
    return comp;
}
