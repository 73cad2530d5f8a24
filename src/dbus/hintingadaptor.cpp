// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "hintingadaptor.h"
#include "../core/constants.h"
#include "../core/hintingoverlay.h"
#include "../core/logging.h"
#include "../core/types.h"
#include <QRectF>
#include <cmath>

namespace DropHint {

HintingAdaptor::HintingAdaptor(HintingOverlay* overlay, QObject* parent)
    : QDBusAbstractAdaptor(parent)
    , m_overlay(overlay)
{
    // Debug-only assertion for development
    Q_ASSERT(overlay);

    // Runtime null check for release builds - log warning but don't crash
    if (!overlay) {
        qCWarning(lcDbus) << "HintingAdaptor created without an overlay, all calls will be ignored";
        return;
    }

    connect(m_overlay, &HintingOverlay::hintingResultChanged, this, [this](HintResult result) {
        Q_EMIT hintingResultChanged(hintResultToString(result));
    });
}

void HintingAdaptor::show()
{
    if (!m_overlay) {
        return;
    }
    qCDebug(lcDbus) << "show";
    m_overlay->show();
}

void HintingAdaptor::hide()
{
    if (!m_overlay) {
        return;
    }
    qCDebug(lcDbus) << "hide";
    m_overlay->hide();
}

QString HintingAdaptor::update(double x, double y, double width, double height)
{
    if (!m_overlay) {
        return QString(HintNames::None);
    }
    if (!std::isfinite(x) || !std::isfinite(y) || !std::isfinite(width) || !std::isfinite(height)) {
        qCWarning(lcDbus) << "Ignoring non-finite drag rectangle" << x << y << width << height;
        return hintingResult();
    }
    return hintResultToString(m_overlay->update(QRectF(x, y, width, height)));
}

QString HintingAdaptor::hintingResult() const
{
    if (!m_overlay) {
        return QString(HintNames::None);
    }
    return hintResultToString(m_overlay->hintingResult());
}

} // namespace DropHint
