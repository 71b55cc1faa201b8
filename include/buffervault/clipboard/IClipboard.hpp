#ifndef INCLUDE_BUFFERVAULT_CLIPBOARD_ICLIPBOARD_HPP
#define INCLUDE_BUFFERVAULT_CLIPBOARD_ICLIPBOARD_HPP

#include <stdexcept>
#include <string>
#include <string_view>

namespace buffervault::clipboard
{

// The system clipboard could not be read or written. Usually transient.
class ClipboardError final : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

class IClipboard
{
public:
    IClipboard() = default;
    IClipboard(const IClipboard&) = delete;
    IClipboard& operator=(const IClipboard&) = delete;
    IClipboard(IClipboard&&) = delete;
    IClipboard& operator=(IClipboard&&) = delete;
    virtual ~IClipboard() = default;

    // Current clipboard text; empty when the clipboard holds no text. Throws ClipboardError.
    [[nodiscard]] virtual std::string read() = 0;

    // Throws ClipboardError.
    virtual void write(std::string_view text) = 0;
};

} // namespace buffervault::clipboard

#endif // INCLUDE_BUFFERVAULT_CLIPBOARD_ICLIPBOARD_HPP
