#include "buffervault/LoggingCategories.hpp"

namespace buffervault::log
{

Q_LOGGING_CATEGORY(lcStore, "buffervault.store")
Q_LOGGING_CATEGORY(lcStorage, "buffervault.storage")
Q_LOGGING_CATEGORY(lcCrypto, "buffervault.crypto")
Q_LOGGING_CATEGORY(lcMonitor, "buffervault.monitor")
Q_LOGGING_CATEGORY(lcClipboard, "buffervault.clipboard")
Q_LOGGING_CATEGORY(lcConfig, "buffervault.config")
Q_LOGGING_CATEGORY(lcCli, "buffervault.cli")

} // namespace buffervault::log
