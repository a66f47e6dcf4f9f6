#ifndef TERM_WIDGET_H
#define TERM_WIDGET_H

#define Uses_TEvent
#define Uses_TPoint
#include <tvision/tv.h>

#include <tvterm/termemu.h>
#include <tvterm/vtermemu.h>

#include "workspace/terminal_widget.h"

#include <memory>
#include <string>

class TTerminalPaneView;

// Terminal emulator bound to one pane view. Bytes from the session go through
// feed(); keys typed into the pane come back out through the input handler.
class TTermWidget : public TerminalWidget, private tvterm::Writer
{
public:
    TTermWidget(TTerminalPaneView &view, tvterm::TerminalEmulatorFactory &factory,
                size_t scrollbackLimit);
    ~TTermWidget();

    void feed(const std::string &bytes) override;
    std::string captureScrollback() const override { return transcript.bytes(); }
    void gridSize(int &rows, int &cols) const override;

    void handleKey(const KeyDownEvent &key);
    void resize(TPoint newSize);
    // Draws the emulator surface into rows [top, view.size.y) of the view.
    void paint(TTerminalPaneView &target, int top);
    bool cursorVisible() const { return state.cursorVisible; }
    TPoint cursorPos() const { return state.cursorPos; }

    // The view is going away before the widget.
    void surfaceGone() { view = nullptr; }

private:
    TTerminalPaneView *view;
    std::unique_ptr<tvterm::TerminalEmulator> emulator;
    tvterm::TerminalState state;
    TerminalRenderState transcript;
    TPoint size;
    std::string pendingInput;

    void write(TSpan<const char> data) noexcept override;
    void flushInput();
    void refresh();
};

class TTermWidgetFactory : public TerminalWidgetFactory
{
public:
    std::unique_ptr<TerminalWidget> create(PaneSurface &surface, size_t scrollbackLimit) override;

private:
    tvterm::VTermEmulatorFactory emulators;
};

#endif // TERM_WIDGET_H
