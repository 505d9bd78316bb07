#include "platform/clipboard.hpp"

#include <QClipboard>
#include <QGuiApplication>

namespace lanlink::platform {

Result<QString, Error> SystemClipboard::text() const {
    if (auto* clipboard = QGuiApplication::clipboard()) {
        return Result<QString, Error>::ok(clipboard->text());
    }
    return Result<QString, Error>::err(Error{ErrorKind::Unknown, "no clipboard available"});
}

Result<void, Error> SystemClipboard::setText(const QString& text) {
    if (auto* clipboard = QGuiApplication::clipboard()) {
        clipboard->setText(text);
        return Result<void, Error>::ok();
    }
    return Result<void, Error>::err(Error{ErrorKind::Unknown, "no clipboard available"});
}

} // namespace lanlink::platform
