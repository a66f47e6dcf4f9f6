#define Uses_TEvent
#define Uses_TKeys
#define Uses_TPoint
#define Uses_TScreenCell
#include <tvision/tv.h>

#include "term_widget.h"
#include "pane_views.h"

#include <algorithm>
#include <cstdio>

TTermWidget::TTermWidget(TTerminalPaneView &aView, tvterm::TerminalEmulatorFactory &factory,
                         size_t scrollbackLimit) :
    view(&aView),
    transcript(scrollbackLimit)
{
    size = aView.terminalSize();
    size.x = std::max(size.x, 1);
    size.y = std::max(size.y, 1);
    // The factory hands over ownership of the emulator it allocates.
    emulator.reset(&factory.create(size, *this));
    emulator->updateState(state);
    aView.attachWidget(this);
}

TTermWidget::~TTermWidget()
{
    if (view)
        view->detachWidget(this);
}

void TTermWidget::feed(const std::string &bytes)
{
    if (bytes.empty())
        return;
    transcript.append(bytes);

    tvterm::TerminalEvent termEvent;
    termEvent.type = tvterm::TerminalEventType::ClientDataRead;
    termEvent.clientDataRead = {bytes.data(), bytes.size()};
    emulator->handleEvent(termEvent);
    refresh();
    // Replies to terminal queries (device attributes and the like).
    flushInput();
}

void TTermWidget::gridSize(int &rows, int &cols) const
{
    rows = size.y;
    cols = size.x;
}

void TTermWidget::handleKey(const KeyDownEvent &key)
{
    tvterm::TerminalEvent termEvent;
    termEvent.type = tvterm::TerminalEventType::KeyDown;
    termEvent.keyDown = key;
    emulator->handleEvent(termEvent);
    flushInput();
}

void TTermWidget::resize(TPoint newSize)
{
    newSize.x = std::max(newSize.x, 1);
    newSize.y = std::max(newSize.y, 1);
    if (newSize == size)
        return;
    size = newSize;
    tvterm::TerminalEvent termEvent;
    termEvent.type = tvterm::TerminalEventType::ViewportResize;
    termEvent.viewportResize = {size.x, size.y};
    emulator->handleEvent(termEvent);
    refresh();
}

void TTermWidget::paint(TTerminalPaneView &target, int top)
{
    int rows = std::min<int>(state.surface.size.y, target.size.y - top);
    int cols = std::min<int>(state.surface.size.x, target.size.x);
    for (int y = 0; y < rows; ++y)
        target.writeBuf(0, top + y, cols, 1, &state.surface.at(y, 0));
}

void TTermWidget::write(TSpan<const char> data) noexcept
{
    // Collected here and forwarded once the emulator call has returned.
    pendingInput.append(data.data(), data.size());
}

void TTermWidget::flushInput()
{
    if (pendingInput.empty())
        return;
    std::string bytes;
    bytes.swap(pendingInput);
    emitInput(bytes);
}

void TTermWidget::refresh()
{
    emulator->updateState(state);
    if (view)
        view->drawView();
}

std::unique_ptr<TerminalWidget> TTermWidgetFactory::create(PaneSurface &surface,
                                                           size_t scrollbackLimit)
{
    auto *view = dynamic_cast<TTerminalPaneView *>(&surface);
    if (!view)
    {
        fprintf(stderr, "[workspace] surface is not a terminal pane view\n");
        return nullptr;
    }
    return std::unique_ptr<TerminalWidget>(new TTermWidget(*view, emulators, scrollbackLimit));
}
