// Panel Demo
// Drives a terminal panel headlessly with a scripted session backend.
//
// This example shows:
// - Loading PanelConfig and applying its log level
// - Creating tabs and splits, and moving panes between tabs
// - Pumping the TaskScheduler for the deferred initial cd
// - Printing each tab's split layout

#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <termpane/logger.hpp>
#include <termpane/session.hpp>
#include <thread>

#include "core/session_id.hpp"
#include "core/task_scheduler.hpp"
#include "ui/panel_config.hpp"
#include "ui/panel_coordinator.hpp"

using namespace termpane;

// Session that prints whatever would be written to the shell.
class EchoSession : public TerminalSession
{
   public:
    explicit EchoSession(const SessionOptions& options)
        : TerminalSession(generate_session_id()),
          title_(default_session_title(options.working_directory))
    {
    }

    std::string title() const override { return title_; }
    bool        is_running() const override { return running_; }

    void start() override
    {
        running_ = true;
        notify_changed();
    }

    void terminate() override
    {
        running_ = false;
        title_   = ENDED_SESSION_TITLE;
        notify_changed();
    }

    void send(const std::string& text) override
    {
        std::cout << "  [" << short_session_id(id()) << "] <- " << text;
    }

    void change_directory(const std::string& path) override
    {
        send(change_directory_command(path));
    }

   private:
    std::string title_;
    bool        running_ = false;
};

class EchoSessionFactory : public SessionFactory
{
   public:
    std::unique_ptr<TerminalSession> create(const SessionOptions& options) override
    {
        return std::make_unique<EchoSession>(options);
    }
};

static void print_layout(const PanelCoordinator& panel)
{
    for (const auto& tab : panel.tab_bar().tabs())
    {
        const SplitContainer* container = panel.container_for_tab(tab.id);
        bool selected = panel.selected_tab() == tab.id;
        std::cout << (selected ? " * " : "   ") << short_session_id(tab.id) << " \"" << tab.title
                  << "\"  " << (container && container->root() ? container->root()->describe() : "-")
                  << "\n";
    }
}

int main()
{
    PanelConfig config = PanelConfig::from_environment();
    if (!config.load(PanelConfig::default_path()))
    {
        std::cout << "No readable " << PanelConfig::default_path() << ", using defaults\n";
    }
    if (!config.working_directory)
    {
        config.working_directory = "/tmp";
    }

    Logger::instance().set_level(config.log_level);
    Logger::instance().add_sink(sinks::console_sink());
    Logger::instance().set_category_level("drag", LogLevel::Info);

    EchoSessionFactory factory;
    TaskScheduler      scheduler;
    PanelCoordinator   panel(factory, scheduler, config);
    panel.set_content_bounds(Rect{0, 0, 1200, 700});

    std::cout << "Creating two tabs and a split\n";
    SessionId first  = panel.create_tab();
    auto      right  = panel.create_split(first, DropZone::Right);
    SessionId second = panel.create_tab();
    print_layout(panel);

    // Let the deferred cd fire.
    std::this_thread::sleep_for(std::chrono::milliseconds(config.initial_directory_delay_ms + 20));
    scheduler.run_due();

    std::cout << "Moving the second tab's pane under the split\n";
    if (right)
    {
        panel.handle_drop(second, DropZone::Bottom, *right);
    }
    print_layout(panel);

    std::cout << "Dragging the first pane onto the right edge\n";
    DragGesture gesture = panel.begin_drag(first);
    panel.update_drag(gesture, Point{1190, 350});
    panel.end_drag(gesture);
    print_layout(panel);

    std::cout << "Closing every pane of the tab\n";
    while (auto selected = panel.selected_tab())
    {
        SplitContainer* container = panel.container_for_tab(*selected);
        if (!container || container->pane_count() <= 1)
            break;
        panel.close_session(container->first_session()->id());
    }
    print_layout(panel);

    return 0;
}
