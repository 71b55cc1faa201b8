#include "buffervault/clipboard/qt/QtClipboardFactory.hpp"

#include "buffervault/LoggingCategories.hpp"
#include <QClipboard>
#include <QCoreApplication>
#include <QGuiApplication>
#include <QMetaObject>
#include <QString>
#include <QThread>
#include <exception>
#include <future>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

namespace buffervault::clipboard::qt
{
namespace
{

using buffervault::log::lcClipboard;

[[nodiscard]] QClipboard& systemClipboard()
{
    if (qobject_cast<QGuiApplication*>(QCoreApplication::instance()) == nullptr)
    {
        throw ClipboardError("clipboard: no QGuiApplication");
    }
    QClipboard* clipboard{ QGuiApplication::clipboard() };
    if (clipboard == nullptr)
    {
        throw ClipboardError("clipboard: not available");
    }
    return *clipboard;
}

class QtClipboard final : public buffervault::clipboard::IClipboard
{
public:
    explicit QtClipboard(std::chrono::milliseconds marshalTimeout) : m_timeout{ marshalTimeout }
    {
    }

    [[nodiscard]] std::string read() override
    {
        return onGuiThread<std::string>([] { return systemClipboard().text().toStdString(); });
    }

    void write(std::string_view text) override
    {
        onGuiThread<bool>(
            [copy = std::string{ text }]
            {
                systemClipboard().setText(QString::fromStdString(copy));
                return true;
            });
    }

private:
    template <class T, class Fn> T onGuiThread(Fn fn)
    {
        QCoreApplication* app{ QCoreApplication::instance() };
        if (app == nullptr)
        {
            throw ClipboardError("clipboard: no QGuiApplication");
        }
        if (QThread::currentThread() == app->thread())
        {
            return fn();
        }

        auto promise{ std::make_shared<std::promise<T>>() };
        auto future{ promise->get_future() };
        const bool posted{ QMetaObject::invokeMethod(
            app,
            [promise, fn = std::move(fn)]
            {
                try
                {
                    promise->set_value(fn());
                }
                catch (const std::exception&)
                {
                    promise->set_exception(std::current_exception());
                }
            },
            Qt::QueuedConnection) };
        if (!posted)
        {
            throw ClipboardError("clipboard: failed to reach the GUI thread");
        }

        if (future.wait_for(m_timeout) != std::future_status::ready)
        {
            qCWarning(lcClipboard) << "GUI thread did not answer within" << m_timeout.count() << "ms";
            throw ClipboardError("clipboard: timed out waiting for the GUI thread");
        }
        return future.get();
    }

    std::chrono::milliseconds m_timeout;
};

} // namespace

[[nodiscard]] std::unique_ptr<buffervault::clipboard::IClipboard> makeQtClipboard(std::chrono::milliseconds marshalTimeout)
{
    return std::make_unique<QtClipboard>(marshalTimeout);
}

} // namespace buffervault::clipboard::qt
