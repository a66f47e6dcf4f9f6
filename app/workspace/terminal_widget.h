/*---------------------------------------------------------*/
/*                                                         */
/*   terminal_widget.h - Render widget seam                */
/*                                                         */
/*   A widget renders one session's output onto a pane     */
/*   surface and reports the bytes the user types. The     */
/*   emulator behind it is replaceable; the lifecycle      */
/*   manager only sees this interface.                     */
/*                                                         */
/*---------------------------------------------------------*/

#pragma once

#include <functional>
#include <memory>
#include <string>

// Bounded transcript of everything a session printed. Replaying it into a
// fresh emulator restores text and colours.
class TerminalRenderState {
public:
    static constexpr size_t kDefaultLimit = 256 * 1024;

    explicit TerminalRenderState(size_t limit = kDefaultLimit) : limit_(limit ? limit : 1) {}

    void append(const std::string& bytes);
    void assign(const std::string& bytes);
    const std::string& bytes() const { return bytes_; }
    bool empty() const { return bytes_.empty(); }
    void clear() { bytes_.clear(); }
    size_t limit() const { return limit_; }

private:
    std::string bytes_;
    size_t limit_;

    void trim();
};

// View-layer element a widget draws into.
class PaneSurface {
public:
    virtual ~PaneSurface() = default;
    // Character grid available to the terminal.
    virtual void surfaceSize(int& rows, int& cols) const = 0;
};

class TerminalWidget {
public:
    using InputHandler = std::function<void(const std::string& bytes)>;

    virtual ~TerminalWidget() = default;

    // Session output, in arrival order.
    virtual void feed(const std::string& bytes) = 0;
    // Everything shown so far, formatting included, in a replayable form.
    virtual std::string captureScrollback() const = 0;
    virtual void gridSize(int& rows, int& cols) const = 0;

    void setInputHandler(InputHandler handler) { inputHandler_ = std::move(handler); }

protected:
    void emitInput(const std::string& bytes) {
        if (inputHandler_) inputHandler_(bytes);
    }

private:
    InputHandler inputHandler_;
};

class TerminalWidgetFactory {
public:
    virtual ~TerminalWidgetFactory() = default;
    virtual std::unique_ptr<TerminalWidget> create(PaneSurface& surface, size_t scrollbackLimit) = 0;
};
