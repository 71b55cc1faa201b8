#ifndef INTERNAL_INCLUDE_BUFFERVAULT_LOGGINGCATEGORIES_HPP
#define INTERNAL_INCLUDE_BUFFERVAULT_LOGGINGCATEGORIES_HPP

#include <QLoggingCategory>

// Enable with QT_LOGGING_RULES="buffervault.*.debug=true".
// Clipboard content is never logged; sizes and indices only.
namespace buffervault::log
{

Q_DECLARE_LOGGING_CATEGORY(lcStore)
Q_DECLARE_LOGGING_CATEGORY(lcStorage)
Q_DECLARE_LOGGING_CATEGORY(lcCrypto)
Q_DECLARE_LOGGING_CATEGORY(lcMonitor)
Q_DECLARE_LOGGING_CATEGORY(lcClipboard)
Q_DECLARE_LOGGING_CATEGORY(lcConfig)
Q_DECLARE_LOGGING_CATEGORY(lcCli)

} // namespace buffervault::log

#endif // INTERNAL_INCLUDE_BUFFERVAULT_LOGGINGCATEGORIES_HPP
