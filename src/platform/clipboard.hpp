#pragma once

#include "core/result.hpp"

#include <QString>

namespace lanlink::platform {

/**
 * Text clipboard of the local machine.
 */
class ClipboardAccess {
public:
    virtual ~ClipboardAccess() = default;

    virtual Result<QString, Error> text() const = 0;
    virtual Result<void, Error> setText(const QString& text) = 0;
};

/**
 * The desktop clipboard via QGuiApplication. Requires a QGuiApplication.
 */
class SystemClipboard final : public ClipboardAccess {
public:
    Result<QString, Error> text() const override;
    Result<void, Error> setText(const QString& text) override;
};

} // namespace lanlink::platform
