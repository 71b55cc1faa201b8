#ifndef INCLUDE_BUFFERVAULT_CLIPBOARD_QT_QTCLIPBOARDFACTORY_HPP
#define INCLUDE_BUFFERVAULT_CLIPBOARD_QT_QTCLIPBOARDFACTORY_HPP

#include "buffervault/clipboard/IClipboard.hpp"
#include <chrono>
#include <memory>

namespace buffervault::clipboard::qt
{

inline constexpr std::chrono::milliseconds g_kDefaultMarshalTimeout{ 1000 };

// Requires a QGuiApplication. Calls from other threads are posted to the GUI thread and fail with
// ClipboardError when it does not answer within `marshalTimeout`.
[[nodiscard]] std::unique_ptr<buffervault::clipboard::IClipboard>
makeQtClipboard(std::chrono::milliseconds marshalTimeout = g_kDefaultMarshalTimeout);

} // namespace buffervault::clipboard::qt

#endif // INCLUDE_BUFFERVAULT_CLIPBOARD_QT_QTCLIPBOARDFACTORY_HPP
