// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "types.h"
#include "constants.h"

namespace DropHint {

ConfigChanges DisplayConfiguration::diff(const DisplayConfiguration& other) const
{
    ConfigChanges changes;
    if (displaySize != other.displaySize) {
        changes |= ConfigChange::SizeChanged;
    }
    if (orientation != other.orientation) {
        changes |= ConfigChange::OrientationChanged;
    }
    if (uiMode != other.uiMode) {
        changes |= ConfigChange::UiModeChanged;
    }
    if (assetsSeq != other.assetsSeq) {
        changes |= ConfigChange::AssetsChanged;
    }
    return changes;
}

QString hintResultToString(HintResult result)
{
    switch (result) {
    case HintResult::Left:
        return QString(HintNames::Left);
    case HintResult::Right:
        return QString(HintNames::Right);
    case HintResult::None:
        break;
    }
    return QString(HintNames::None);
}

} // namespace DropHint
