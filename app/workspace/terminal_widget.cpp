#include "terminal_widget.h"

void TerminalRenderState::append(const std::string& bytes)
{
    bytes_ += bytes;
    trim();
}

void TerminalRenderState::assign(const std::string& bytes)
{
    bytes_ = bytes;
    trim();
}

void TerminalRenderState::trim()
{
    if (bytes_.size() <= limit_)
        return;
    size_t cut = bytes_.size() - limit_;
    // Resume at a line start so no escape sequence is cut in half.
    size_t nl = bytes_.find('\n', cut);
    if (nl != std::string::npos && nl + 1 < bytes_.size())
        cut = nl + 1;
    bytes_.erase(0, cut);
}
