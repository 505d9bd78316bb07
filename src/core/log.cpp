#include "core/log.hpp"

// Debug output is off unless enabled with --debug or LANLINK_DEBUG.
Q_LOGGING_CATEGORY(lcDiscovery, "lanlink.discovery", QtInfoMsg)
Q_LOGGING_CATEGORY(lcTransfer, "lanlink.transfer", QtInfoMsg)
Q_LOGGING_CATEGORY(lcChat, "lanlink.chat", QtInfoMsg)
Q_LOGGING_CATEGORY(lcClipboard, "lanlink.clipboard", QtInfoMsg)
Q_LOGGING_CATEGORY(lcNode, "lanlink.node", QtInfoMsg)
