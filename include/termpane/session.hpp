#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <termpane/fwd.hpp>
#include <termpane/geometry.hpp>
#include <vector>

namespace termpane
{

// ─── Shell configuration ─────────────────────────────────────────────────────

struct ShellConfig
{
    std::string                        path = "/bin/zsh";
    std::vector<std::string>           args{"-l"};
    std::map<std::string, std::string> environment{{"TERM", "xterm-256color"},
                                                   {"LANG", "en_US.UTF-8"}};
};

struct SessionOptions
{
    std::optional<std::string> working_directory;
    ShellConfig                shell;
};

// ─── SessionSurface ──────────────────────────────────────────────────────────
// Display placement of one session. Owned by the session, never by the
// split tree: a tree node only attaches, moves and detaches it.

class SessionSurface
{
   public:
    using HostId = uint64_t;

    static constexpr HostId NO_HOST = 0;

    // Attach under the given host node at the given frame. An attached
    // surface is implicitly detached from its previous host first.
    void attach(HostId host, const Rect& frame)
    {
        host_     = host;
        frame_    = frame;
        attached_ = true;
        ++attach_count_;
    }

    void detach()
    {
        host_     = NO_HOST;
        attached_ = false;
    }

    void set_frame(const Rect& frame) { frame_ = frame; }
    void set_visible(bool visible) { visible_ = visible; }

    bool   is_attached() const { return attached_; }
    HostId host_id() const { return host_; }
    Rect   frame() const { return frame_; }
    bool   is_visible() const { return visible_; }

    // Number of attach() calls over the surface lifetime.
    size_t attach_count() const { return attach_count_; }

   private:
    HostId host_         = NO_HOST;
    Rect   frame_{};
    bool   attached_     = false;
    bool   visible_      = true;
    size_t attach_count_ = 0;
};

// ─── TerminalSession ─────────────────────────────────────────────────────────
// One terminal process as seen by the pane engine. start/terminate/send and
// change_directory are fire-and-forget requests; completion is observed
// through title()/is_running() and the changed callback.

class TerminalSession
{
   public:
    using ChangedCallback = std::function<void(TerminalSession&)>;

    virtual ~TerminalSession() = default;

    TerminalSession(const TerminalSession&)            = delete;
    TerminalSession& operator=(const TerminalSession&) = delete;

    const SessionId& id() const { return id_; }

    virtual std::string title() const      = 0;
    virtual bool        is_running() const = 0;

    virtual void start()                                  = 0;
    virtual void terminate()                              = 0;
    virtual void send(const std::string& text)            = 0;
    virtual void change_directory(const std::string& path) = 0;

    SessionSurface&       surface() { return surface_; }
    const SessionSurface& surface() const { return surface_; }

    // Fired whenever title or running state changes.
    void set_on_changed(ChangedCallback cb) { on_changed_ = std::move(cb); }

   protected:
    explicit TerminalSession(SessionId id) : id_(std::move(id)) {}

    void notify_changed()
    {
        if (on_changed_)
            on_changed_(*this);
    }

   private:
    SessionId       id_;
    SessionSurface  surface_;
    ChangedCallback on_changed_;
};

// ─── SessionFactory ──────────────────────────────────────────────────────────

class SessionFactory
{
   public:
    virtual ~SessionFactory() = default;

    virtual std::unique_ptr<TerminalSession> create(const SessionOptions& options) = 0;
};

// Title a session shows before its process publishes one: the last path
// component of the working directory, or "Terminal".
std::string default_session_title(const std::optional<std::string>& working_directory);

inline constexpr const char* ENDED_SESSION_TITLE = "Terminal (ended)";

// Single-quote path for a POSIX shell; embedded quotes become '\''.
std::string shell_quote(const std::string& path);

// "cd '<path>' && clear\n", the line sent to move a shell to path.
std::string change_directory_command(const std::string& path);

}   // namespace termpane
