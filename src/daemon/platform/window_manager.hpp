#pragma once

#include <expected>
#include <memory>
#include <string>
#include <vector>

struct WindowSpec {
    std::string label;
    std::string url;
    std::string title;
    int width = 1000;
    int height = 700;
    int min_width = 600;
    int min_height = 400;
    bool resizable = true;
    bool maximizable = true;
    bool minimizable = true;
    bool visible = true;
    bool decorations = true;
    bool center = false;
};

// Lightweight handle to a window owned by the host. Handles are looked up
// fresh for every call; holding one does not keep the window alive.
class HostWindow {
public:
    virtual ~HostWindow() = default;
    virtual const std::string& label() const = 0;
    virtual std::expected<void, std::string> set_focus() = 0;
    virtual std::expected<void, std::string> close() = 0;
    virtual std::expected<void, std::string> emit(const std::string& event,
                                                  const std::string& payload) = 0;
    // HWND on Windows, nullptr where the host exposes none.
    virtual void* native_handle() const = 0;
};

struct WindowEvent {
    // CreateFailed ends a pending create_window; `error` says why.
    enum class Change { Created, CreateFailed, Closed, Focused };
    Change change = Change::Created;
    std::string label;
    std::string error;
};

class WindowManager {
public:
    virtual ~WindowManager() = default;
    virtual bool connect() = 0;

    // nullptr when no window carries this label; an error when the host
    // could not be queried.
    virtual std::expected<std::unique_ptr<HostWindow>, std::string>
    get_window(const std::string& label) = 0;
    // Every open window of this application, session or not.
    virtual std::expected<std::vector<std::unique_ptr<HostWindow>>, std::string> windows() = 0;

    // A null handle means the window is still mapping. The host then reports
    // Created or CreateFailed for spec.label through read_event/expire_pending.
    virtual std::expected<std::unique_ptr<HostWindow>, std::string>
    create_window(const WindowSpec& spec) = 0;

    virtual int event_fd() const = 0;
    virtual bool read_event(WindowEvent& event) = 0;

    // Milliseconds until the next pending create times out, -1 when none.
    virtual int poll_timeout_ms() const { return -1; }
    virtual std::vector<WindowEvent> expire_pending() { return {}; }
};
